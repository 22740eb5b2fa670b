#include <OrderedJson/parser.hpp>
#include <OrderedJson/serializer.hpp>
#include <OrderedJson/value.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "test_helpers.hpp"

using namespace OrderedJson;
using namespace OrderedJson::options;
using TestHelpers::Check;
using TestHelpers::RoundTripEquals;

struct Witness {
    Annotated<std::vector<std::uint8_t>, key<"invocation">> Invocation;
    Annotated<std::vector<std::uint8_t>, key<"verification">> Verification;
};

struct Signer {
    Annotated<std::string, key<"account">> Account;
    Annotated<std::string, key<"scopes">> Scopes;
    Annotated<std::optional<std::vector<std::string>>, key<"allowedcontracts">, omitempty> AllowedContracts;
};

struct Transaction {
    Annotated<std::string, key<"hash">> Hash;
    Annotated<int, key<"size">> Size;
    Annotated<std::uint8_t, key<"version">> Version;
    Annotated<std::uint32_t, key<"nonce">> Nonce;
    Annotated<std::int64_t, key<"sysfee">, as_string> SystemFee;
    Annotated<std::int64_t, key<"netfee">, as_string> NetworkFee;
    Annotated<std::vector<Signer>, key<"signers">> Signers;
    Annotated<Object, key<"attributes">> Attributes;
    Annotated<std::vector<Witness>, key<"witnesses">> Scripts;
};

struct Header {
    Annotated<std::string, key<"hash">> Hash;
    Annotated<std::uint32_t, key<"index">> Index;
    Annotated<double, key<"weight">, omitempty> Weight;
};

struct Block {
    Annotated<Header, embedded> header;
    Annotated<std::vector<Transaction>, key<"tx">> Transactions;
    Annotated<std::unique_ptr<Header>, key<"prev">, omitempty> Prev;
    Annotated<RawValue, key<"extra">, omitempty> Extra;
};

void test_records() {
    Check(RoundTripEquals<Witness>(R"({"invocation":"DEAA","verification":""})"));
    Check(RoundTripEquals<Signer>(R"({"account":"0xcadb","scopes":"CalledByEntry"})"));
    Check(RoundTripEquals<Signer>(R"({"account":"0x01","scopes":"CustomContracts","allowedcontracts":["0x02","0x03"]})"));

    Check(RoundTripEquals<Transaction>(
        R"({"hash":"0xabc","size":252,"version":0,"nonce":4294967295,"sysfee":"9007199254740993","netfee":"-1",)"
        R"("signers":[{"account":"0xcadb","scopes":"None"}],"attributes":{"z":1,"a":[true,null]},)"
        R"("witnesses":[{"invocation":"DEAA","verification":"EQ=="}]})"));
}

void test_embedded_and_optional_members() {
    Check(RoundTripEquals<Block>(R"({"hash":"0x1","index":7,"tx":[]})"));
    Check(RoundTripEquals<Block>(
        R"({"hash":"0x2","index":8,"weight":0.25,"tx":[],"prev":{"hash":"0x1","index":7},"extra":{"any":["thing"]}})"));
}

void test_value_model_documents() {
    Check(RoundTripEquals<Value>(R"({"b":1,"a":{"d":[1.50,-0,1e400],"c":"x"},"b":null})"));
    Check(RoundTripEquals<Value>(R"([])"));
    Check(RoundTripEquals<Value>(R"("plain text")"));
    Check(RoundTripEquals<std::map<std::string, Value>>(R"({"a":{"y":1,"x":2},"b":[]})"));
}

void test_decode_then_reencode_normalizes() {
    // input order of struct members is not kept; declaration order is
    Header h;
    Check(TestHelpers::DecodeSucceeds(h, R"({ "index" : 3, "HASH" : "0x9" })"));
    Check(TestHelpers::EncodesTo(h, R"({"hash":"0x9","index":3})"));

    // map keys come back sorted
    std::map<std::string, int> m;
    Check(TestHelpers::DecodeSucceeds(m, R"({"b":1,"a":2})"));
    Check(TestHelpers::EncodesTo(m, R"({"a":2,"b":1})"));

    // escapes are rewritten in the HTML-safe form
    std::string s;
    Check(TestHelpers::DecodeSucceeds(s, R"("<\/>")"));
    Check(TestHelpers::EncodesTo(s, "\"\\u003C/\\u003E\""));
}

int main() {
    test_records();
    test_embedded_and_optional_members();
    test_value_model_documents();
    test_decode_then_reencode_normalizes();
    return TestHelpers::Report("test_roundtrip");
}
