#include <OrderedJson/parser.hpp>
#include <OrderedJson/error_formatting.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "test_helpers.hpp"

using namespace OrderedJson;
using TestHelpers::Check;
using TestHelpers::DecodeFailsAt;
using TestHelpers::DecodeFailsWith;

struct Point {
    int X = 0;
    int Y = 0;
};

struct Inner {
    std::vector<int> list;
    std::int8_t small = 0;
};

struct Outer {
    Inner in;
    std::string name;
};

// ============================================================================
// Syntax errors
// ============================================================================

void test_syntax_error_offsets() {
    Point p;
    Check(DecodeFailsAt(p, "", DecodeError::UNEXPECTED_END_OF_DATA, 0));
    Check(DecodeFailsAt(p, "   ", DecodeError::UNEXPECTED_END_OF_DATA, 3));
    Check(DecodeFailsAt(p, R"({"X":})", DecodeError::INVALID_CHARACTER, 5));
    Check(DecodeFailsAt(p, R"({"X" 1})", DecodeError::ILLFORMED_OBJECT, 5));
    Check(DecodeFailsAt(p, R"({"X":1 "Y":2})", DecodeError::ILLFORMED_OBJECT, 7));
    Check(DecodeFailsAt(p, R"({"X":1,})", DecodeError::ILLFORMED_OBJECT, 7));
    Check(DecodeFailsAt(p, R"({"X":tru})", DecodeError::ILLFORMED_LITERAL, 8));
    Check(DecodeFailsAt(p, R"({"X":01})", DecodeError::ILLFORMED_OBJECT, 6));
    Check(DecodeFailsAt(p, R"({"X":-})", DecodeError::ILLFORMED_NUMBER, 6));
    Check(DecodeFailsAt(p, "{} x", DecodeError::EXCESS_CHARACTERS, 3));
    Check(DecodeFailsAt(p, R"({"X":1)", DecodeError::UNEXPECTED_END_OF_DATA, 6));

    std::vector<int> v;
    Check(DecodeFailsAt(v, "[1,]", DecodeError::INVALID_CHARACTER, 3));
    Check(DecodeFailsAt(v, "[1 2]", DecodeError::ILLFORMED_ARRAY, 3));

    std::string s;
    Check(DecodeFailsAt(s, "\"a\tb\"", DecodeError::ILLFORMED_STRING, 2));
    Check(DecodeFailsAt(s, R"("\x")", DecodeError::ILLFORMED_STRING, 2));
    Check(DecodeFailsAt(s, "\"abc", DecodeError::UNEXPECTED_END_OF_DATA, 4));
}

void test_syntax_error_leaves_target_untouched() {
    Point p{1, 2};
    DecodeResult res = Decode(p, R"({"X":5,"Y":6,)");
    Check(!res);
    Check(res.kind() == ErrorKind::Syntax);
    Check(p.X == 1 && p.Y == 2);

    std::vector<int> v{1};
    Check(DecodeFailsWith(v, "[2,3", DecodeError::UNEXPECTED_END_OF_DATA));
    Check(v == std::vector<int>{1});
}

void test_nesting_depth() {
    std::vector<int> v;
    const std::string deep = std::string(MaxNestingDepth + 1, '[') + std::string(MaxNestingDepth + 1, ']');
    Check(DecodeFailsAt(v, deep, DecodeError::NESTING_TOO_DEEP, MaxNestingDepth));
}

// ============================================================================
// Type errors
// ============================================================================

void test_first_type_error_wins() {
    Point p{1, 2};
    DecodeResult res = Decode(p, R"({"X":"x","Y":true})");
    Check(!res);
    Check(res.error() == DecodeError::WRONG_JSON_TYPE);
    Check(res.kind() == ErrorKind::UnmarshalType);
    Check(res.offset() == 8);
    Check(res.field() == "X", res.field());
    Check(res.detail() == "string", res.detail());
    Check(p.X == 1 && p.Y == 2);

    // later members are still applied
    res = Decode(p, R"({"X":[1],"Y":7})");
    Check(!res && res.offset() == 8 && res.detail() == "array");
    Check(p.Y == 7);
}

void test_field_paths() {
    Outer o;
    DecodeResult res = Decode(o, R"({"in":{"list":[1,"two"]},"name":"n"})");
    Check(res.error() == DecodeError::WRONG_JSON_TYPE);
    Check(res.field() == "in.list", res.field());
    Check(res.offset() == 22);
    Check(o.in.list == std::vector<int>{1, 0});
    Check(o.name == "n");

    res = Decode(o, R"({"in":{"small":300}})");
    Check(res.error() == DecodeError::NUMBER_OUT_OF_RANGE);
    Check(res.field() == "in.small");
    Check(res.detail() == "number 300", res.detail());

    // case-folded keys are reported by field name
    res = Decode(o, R"({"IN":{"SMALL":1.5}})");
    Check(res.error() == DecodeError::NON_INTEGRAL_NUMBER);
    Check(res.field() == "in.small", res.field());

    int top = 0;
    res = Decode(top, R"("s")");
    Check(res.error() == DecodeError::WRONG_JSON_TYPE && res.offset() == 3 && res.field().empty());
}

void test_value_kinds_in_messages() {
    std::string s;
    Check(Decode(s, "12").detail() == "number");
    Check(Decode(s, "{}").detail() == "object");
    Check(Decode(s, "false").detail() == "bool");
    bool b = false;
    Check(Decode(b, "\"true\"").detail() == "string");

    std::vector<std::uint8_t> bytes;
    DecodeResult res = Decode(bytes, "\"@@\"");
    Check(res.error() == DecodeError::INVALID_BASE64);
    Check(res.detail() == "@@");
}

// ============================================================================
// Formatting
// ============================================================================

void test_result_to_string() {
    struct A {
        int a = 0;
    };
    A a;
    const std::string_view json = R"({"a":"x"})";
    DecodeResult res = Decode(a, json);
    Check(DecodeResultToString(res, json) ==
          R"(UnmarshalTypeError at offset 8 when decoding $.a, error 'WRONG_JSON_TYPE' (string): '...{"a":"x"<|>}...')",
          DecodeResultToString(res, json));
    Check(DecodeResultToString(res) ==
          "UnmarshalTypeError at offset 8 when decoding $.a, error 'WRONG_JSON_TYPE' (string)");

    const std::string_view broken = R"({"a":})";
    res = Decode(a, broken);
    Check(DecodeResultToString(res, broken) ==
          R"(SyntaxError at offset 5 when decoding $, error 'INVALID_CHARACTER': '...{"a":<|>}...')",
          DecodeResultToString(res, broken));

    const std::string longInput = std::string(100, ' ') + "x";
    res = Decode(a, longInput);
    Check(DecodeResultToString(res, longInput, 10) ==
          "SyntaxError at offset 100 when decoding $, error 'INVALID_CHARACTER': '...<|>x...'",
          DecodeResultToString(res, longInput, 10));

    Check(DecodeResultToString(DecodeResult{}) == "ok");
}

int main() {
    test_syntax_error_offsets();
    test_syntax_error_leaves_target_untouched();
    test_nesting_depth();
    test_first_type_error_wins();
    test_field_paths();
    test_value_kinds_in_messages();
    test_result_to_string();
    return TestHelpers::Report("test_decode_errors");
}
