#include <OrderedJson/serializer.hpp>
#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "test_helpers.hpp"

using namespace OrderedJson;
using TestHelpers::Check;
using TestHelpers::EncodesTo;
using TestHelpers::EncodeFailsWith;

// Static hook: also called for an empty pointer
struct Ref {
    int v = 0;
    static bool marshal_json(const Ref *, std::string & out) {
        out = "\"ref\"";
        return true;
    }
};

struct Val {
    int v = 0;
    bool marshal_json(std::string & out) const {
        out = "\"val\"";
        return true;
    }
};

struct RefText {
    int v = 0;
    bool marshal_text(std::string & out) const {
        out = "\"ref\"";
        return true;
    }
};

struct ValText {
    int v = 0;
    bool marshal_text(std::string & out) const {
        out = "\"val\"";
        return true;
    }
};

// ============================================================================
// Hook selection
// ============================================================================

void test_hooks_on_values_and_pointers() {
    struct S {
        Ref R0;
        std::unique_ptr<Ref> R1;
        RefText R2;
        std::unique_ptr<RefText> R3;
        Val V0;
        std::unique_ptr<Val> V1;
        ValText V2;
        std::unique_ptr<ValText> V3;
    };
    S s{Ref{12}, std::make_unique<Ref>(), RefText{14}, std::make_unique<RefText>(),
        Val{13}, std::make_unique<Val>(), ValText{15}, std::make_unique<ValText>()};
    Check(EncodesTo(s,
        "{\"R0\":\"ref\",\"R1\":\"ref\",\"R2\":\"\\u0022ref\\u0022\",\"R3\":\"\\u0022ref\\u0022\","
        "\"V0\":\"val\",\"V1\":\"val\",\"V2\":\"\\u0022val\\u0022\",\"V3\":\"\\u0022val\\u0022\"}"));

    // only the static form sees an empty pointer
    S empty{};
    Check(EncodesTo(empty,
        "{\"R0\":\"ref\",\"R1\":\"ref\",\"R2\":\"\\u0022ref\\u0022\",\"R3\":null,"
        "\"V0\":\"val\",\"V1\":null,\"V2\":\"\\u0022val\\u0022\",\"V3\":null}"));
}

struct NilMarshaler {
    std::string s;

    static bool marshal_json(const NilMarshaler * self, std::string & out) {
        if(self == nullptr) {
            return static_cast<bool>(Encode(std::string("0zenil0"), out));
        }
        return static_cast<bool>(Encode("zenil:" + self->s, out));
    }
};

void test_nil_marshaler() {
    struct Holder {
        std::unique_ptr<NilMarshaler> M;
    };
    Check(EncodesTo(Holder{}, R"({"M":"0zenil0"})"));
    Check(EncodesTo(Holder{std::make_unique<NilMarshaler>(NilMarshaler{"x"})}, R"({"M":"zenil:x"})"));
}

// ============================================================================
// Hook output is compacted and escaped
// ============================================================================

struct C {
    bool marshal_json(std::string & out) const {
        out = "\"<&>\"";
        return true;
    }
};

struct CText {
    bool marshal_text(std::string & out) const {
        out = "\"<&>\"";
        return true;
    }
};

struct Spacious {
    bool marshal_json(std::string & out) const {
        out = " { \"b\" : [ 1, 2 ] , \"a\" : \"\xc3\xa9\" } ";
        return true;
    }
};

void test_marshaler_escaping() {
    Check(EncodesTo(C{}, "\"\\u003C\\u0026\\u003E\""));
    Check(EncodesTo(CText{}, "\"\\u0022\\u003C\\u0026\\u003E\\u0022\""));

    // member order from the hook is kept
    Check(EncodesTo(Spacious{}, "{\"b\":[1,2],\"a\":\"\xc3\xa9\"}"));
    Check(EncodesTo(C{}, "\"<&>\"", EncodeOptions{false}));
}

// ============================================================================
// Byte-like kinds
// ============================================================================

struct ByteText {
    std::uint8_t b = 0;
    bool marshal_text(std::string & out) const {
        out = std::format("Z{:02X}", static_cast<int>(b));
        return true;
    }
};

struct ByteJson {
    std::uint8_t b = 0;
    bool marshal_json(std::string & out) const {
        out = std::format("\"Z{:02X}\"", static_cast<int>(b));
        return true;
    }
};

void test_bytekind() {
    Check(EncodesTo(std::uint8_t{'a'}, "97"));
    Check(EncodesTo(std::vector<std::uint8_t>{'a'}, "\"YQ==\""));
    Check(EncodesTo(ByteText{'a'}, "\"Z61\""));
    Check(EncodesTo(ByteJson{'a'}, "\"Z61\""));
    Check(EncodesTo(std::vector<ByteText>{{'a'}, {'b'}}, R"(["Z61","Z62"])"));
    Check(EncodesTo(std::vector<ByteJson>{{'a'}}, R"(["Z61"])"));
    Check(EncodesTo(std::vector<std::int8_t>{-1, 2}, "[-1,2]"));
}

// ============================================================================
// Text keys
// ============================================================================

struct TextKey {
    std::string A;
    std::string B;

    bool marshal_text(std::string & out) const {
        out = A + ":" + B;
        return true;
    }
    bool operator<(const TextKey & o) const {
        return A < o.A || (A == o.A && B < o.B);
    }
};

void test_text_marshaler_map_keys_sorted() {
    std::map<TextKey, int> m{
        {{"x", "y"}, 1},
        {{"y", "x"}, 2},
        {{"a", "z"}, 3},
        {{"z", "a"}, 4},
    };
    Check(EncodesTo(m, R"({"a:z":3,"x:y":1,"y:x":2,"z:a":4})"));
}

// ============================================================================
// Failures
// ============================================================================

struct Failing {
    bool marshal_json(std::string &) const {
        return false;
    }
};

struct Broken {
    bool marshal_json(std::string & out) const {
        out = "{\"a\":";
        return true;
    }
};

struct FailingText {
    bool marshal_text(std::string &) const {
        return false;
    }
    bool operator<(const FailingText &) const {
        return false;
    }
};

void test_hook_failures() {
    Check(EncodeFailsWith(Failing{}, EncodeError::MARSHALER_FAILED));
    Check(EncodeFailsWith(std::vector<Failing>(2), EncodeError::MARSHALER_FAILED));
    Check(EncodeFailsWith(FailingText{}, EncodeError::TEXT_MARSHALER_FAILED));
    Check(EncodeFailsWith(std::map<FailingText, int>{{FailingText{}, 1}}, EncodeError::TEXT_MARSHALER_FAILED));

    std::string out;
    EncodeResult res = Encode(Broken{}, out);
    Check(!res && res.error() == EncodeError::MARSHALER_INVALID_OUTPUT);
    Check(res.kind() == ErrorKind::Marshaler);
    Check(res.detail() == "{\"a\":", res.detail());
    Check(out.empty());
}

int main() {
    test_hooks_on_values_and_pointers();
    test_nil_marshaler();
    test_marshaler_escaping();
    test_bytekind();
    test_text_marshaler_map_keys_sorted();
    test_hook_failures();
    return TestHelpers::Report("test_hooks");
}
