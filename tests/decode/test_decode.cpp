#include <OrderedJson/parser.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "test_helpers.hpp"

using namespace OrderedJson;
using namespace OrderedJson::options;
using TestHelpers::Check;
using TestHelpers::DecodeSucceeds;
using TestHelpers::DecodeFailsWith;
using TestHelpers::DecodeAndVerify;

// ============================================================================
// Member matching
// ============================================================================

struct Point {
    int X = 0;
    int Y = 0;
};

void test_case_insensitive_match() {
    Point p;
    Check(DecodeSucceeds(p, R"({"x":1,"Y":2})"));
    Check(p.X == 1 && p.Y == 2);

    struct TwoCases {
        Annotated<int, key<"aa">> lower;
        Annotated<int, key<"AA">> upper;
    };
    TwoCases t;
    Check(DecodeSucceeds(t, R"({"AA":2})"));
    Check(t.lower.value == 0 && t.upper.value == 2);
    Check(DecodeSucceeds(t, R"({"Aa":3})"));
    Check(t.lower.value == 3);

    // folding is ASCII only
    struct Accented {
        Annotated<int, key<"\xc3\xa9">> e;
    };
    Accented a;
    Check(DecodeSucceeds(a, R"({"É":1})"));
    Check(a.e.value == 0);
}

void test_unknown_and_skipped_fields() {
    struct Partial {
        int A = 0;
        Annotated<int, skip> B;
        Annotated<int, unexported> c;
    };
    Partial p;
    Check(DecodeSucceeds(p, R"({"Z":{"deep":[1,{"x":null}]},"A":5,"B":6,"c":7})"));
    Check(p.A == 5 && p.B.value == 0 && p.c.value == 0);
}

void test_last_duplicate_wins() {
    Point p;
    Check(DecodeSucceeds(p, R"({"X":1,"X":2,"x":3})"));
    Check(p.X == 3);
}

// ============================================================================
// Scalars and strings
// ============================================================================

void test_scalars() {
    Check(DecodeAndVerify<bool>("true", [](bool b) { return b; }));
    Check(DecodeAndVerify<std::int8_t>("-128", [](std::int8_t v) { return v == -128; }));
    Check(DecodeAndVerify<std::uint64_t>("18446744073709551615",
        [](std::uint64_t v) { return v == 18446744073709551615ull; }));
    Check(DecodeAndVerify<double>("-1.5e-3", [](double v) { return v == -1.5e-3; }));
    Check(DecodeAndVerify<float>("0.1", [](float v) { return v == 0.1f; }));
    Check(DecodeAndVerify<std::string>(R"("a\tb\n\"c\"\/")", [](const std::string & s) {
        return s == "a\tb\n\"c\"/";
    }));
}

void test_unicode_unquoting() {
    Check(DecodeAndVerify<std::string>("\"\\u00e9\\u4e2d\"", [](const std::string & s) {
        return s == "\xc3\xa9\xe4\xb8\xad";
    }));
    Check(DecodeAndVerify<std::string>("\"\\ud83d\\ude00\"", [](const std::string & s) {
        return s == "\xf0\x9f\x98\x80";
    }));
    // unpaired surrogates and bad UTF-8 become U+FFFD
    Check(DecodeAndVerify<std::string>("\"\\ud800x\"", [](const std::string & s) {
        return s == "\xef\xbf\xbdx";
    }));
    Check(DecodeAndVerify<std::string>("\"\\ude00\"", [](const std::string & s) {
        return s == "\xef\xbf\xbd";
    }));
    Check(DecodeAndVerify<std::string>("\"a\xff" "b\"", [](const std::string & s) {
        return s == "a\xef\xbf\xbd" "b";
    }));
    Check(DecodeAndVerify<std::string>("\"\\u0000\"", [](const std::string & s) {
        return s == std::string(1, '\0');
    }));
}

// ============================================================================
// Containers
// ============================================================================

void test_sequences_are_replaced() {
    std::vector<int> v{9, 9, 9};
    Check(DecodeSucceeds(v, "[1]"));
    Check(v == std::vector<int>{1});
    Check(DecodeSucceeds(v, "null"));
    Check(v == std::vector<int>{1});
    Check(DecodeSucceeds(v, "[]"));
    Check(v.empty());

    std::array<int, 3> a{7, 7, 7};
    Check(DecodeSucceeds(a, "[1,2]"));
    Check(a == std::array<int, 3>{1, 2, 0});
    Check(DecodeSucceeds(a, "[4,5,6,{\"extra\":true}]"));
    Check(a == std::array<int, 3>{4, 5, 6});

    std::vector<std::vector<std::string>> nested;
    Check(DecodeSucceeds(nested, R"([["a"],[],["b","c"]])"));
    Check(nested.size() == 3 && nested[2][1] == "c");
}

void test_bytes_from_arrays() {
    std::vector<std::uint8_t> b{9, 9};
    Check(DecodeSucceeds(b, "[1,2,255]"));
    Check(b == std::vector<std::uint8_t>{1, 2, 255});
    Check(DecodeSucceeds(b, R"("AQI=")"));
    Check(b == std::vector<std::uint8_t>{1, 2});
    Check(DecodeSucceeds(b, "[]"));
    Check(b.empty());

    std::vector<std::byte> raw;
    Check(DecodeSucceeds(raw, "[0, 16]"));
    Check(raw == std::vector<std::byte>{std::byte{0}, std::byte{16}});

    // a bad element is left zero and the rest still decode
    Check(TestHelpers::DecodeFailsAt(b, "[1,256,3]", DecodeError::NUMBER_OUT_OF_RANGE, 6));
    Check(b == std::vector<std::uint8_t>{1, 0, 3});
    Check(DecodeFailsWith(b, R"([1,"x"])", DecodeError::WRONG_JSON_TYPE));
    Check(DecodeFailsWith(b, "{}", DecodeError::WRONG_JSON_TYPE));
}

void test_maps_are_merged() {
    std::map<std::string, int> m{{"a", 1}, {"b", 1}};
    Check(DecodeSucceeds(m, R"({"b":2,"c":3})"));
    Check(m == std::map<std::string, int>{{"a", 1}, {"b", 2}, {"c", 3}});

    std::map<int, std::string> byId;
    Check(DecodeSucceeds(byId, R"({"1":"x","-2":"y"})"));
    Check(byId.size() == 2 && byId[1] == "x" && byId[-2] == "y");

    // a bad key is reported and its entry left out
    std::map<int, std::string> partial;
    Check(DecodeFailsWith(partial, R"({"x":"bad","3":"ok","1.5":"bad"})", DecodeError::INVALID_MAP_KEY));
    Check(partial.size() == 1 && partial[3] == "ok");

    std::map<std::uint8_t, int> small;
    Check(DecodeFailsWith(small, R"({"256":1})", DecodeError::INVALID_MAP_KEY));
    Check(small.empty());

    std::map<double, int> unsupported;
    Check(DecodeFailsWith(unsupported, R"({"1":1})", DecodeError::INVALID_MAP_KEY));
}

struct Upper {
    std::string s;
    bool unmarshal_text(std::string_view text) {
        s.clear();
        for(char c : text) {
            s.push_back(c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c);
        }
        return true;
    }
    bool operator<(const Upper & o) const {
        return s < o.s;
    }
};

void test_text_unmarshaler_keys() {
    std::map<Upper, int> m;
    Check(DecodeSucceeds(m, R"({"ab":1,"cd":2})"));
    Check(m.size() == 2 && m.begin()->first.s == "AB");
}

// ============================================================================
// Nulls and pointers
// ============================================================================

struct Nested {
    std::string name;
};

struct Holder {
    int n = 5;
    std::string s = "keep";
    std::optional<int> opt = 1;
    std::unique_ptr<Nested> ptr;
    std::shared_ptr<int> shared;
};

void test_null_handling() {
    Holder h;
    h.ptr = std::make_unique<Nested>(Nested{"x"});
    Check(DecodeSucceeds(h, R"({"n":null,"s":null,"opt":null,"ptr":null})"));
    Check(h.n == 5 && h.s == "keep");
    Check(!h.opt.has_value());
    Check(h.ptr == nullptr);

    Check(DecodeSucceeds(h, R"({"opt":3,"ptr":{"name":"y"},"shared":4})"));
    Check(h.opt == 3);
    Check(h.ptr != nullptr && h.ptr->name == "y");
    Check(h.shared != nullptr && *h.shared == 4);

    // an existing target is decoded into, not replaced
    Nested * before = h.ptr.get();
    Check(DecodeSucceeds(h, R"({"ptr":{}})"));
    Check(h.ptr.get() == before && h.ptr->name == "y");
}

// ============================================================================
// Field options
// ============================================================================

struct Quoted {
    Annotated<int, key<"n">, as_string> n;
    Annotated<bool, key<"b">, as_string> b;
    Annotated<std::string, key<"s">, as_string> s;
    Annotated<double, key<"f">, as_string> f;
    Annotated<std::optional<int>, key<"o">, as_string> o;
    Annotated<std::vector<int>, key<"v">, as_string> v;
};

void test_as_string() {
    Quoted q;
    Check(DecodeSucceeds(q, R"({"n":"42","b":"true","s":"\"abc\"","f":"1.5","o":"7","v":[1]})"));
    Check(q.n.value == 42 && q.b.value && q.s.value == "abc" && q.f.value == 1.5);
    Check(q.o.value == 7);
    // as_string has no effect on sequences
    Check(q.v.value == std::vector<int>{1});

    Check(DecodeSucceeds(q, R"({"o":"null"})"));
    Check(!q.o.value.has_value());
    Check(DecodeSucceeds(q, R"({"n":null})"));
    Check(q.n.value == 42);

    Quoted bad;
    Check(DecodeFailsWith(bad, R"({"n":42})", DecodeError::INVALID_STRING_OPTION));
    Check(DecodeFailsWith(bad, R"({"n":"x"})", DecodeError::INVALID_STRING_OPTION));
    Check(DecodeFailsWith(bad, R"({"n":"1.5"})", DecodeError::INVALID_STRING_OPTION));
    Check(DecodeFailsWith(bad, R"({"b":"yes"})", DecodeError::INVALID_STRING_OPTION));
    Check(DecodeFailsWith(bad, R"({"s":"abc"})", DecodeError::INVALID_STRING_OPTION));
}

// ============================================================================
// Hooks
// ============================================================================

struct Captured {
    std::string raw;
    bool unmarshal_json(std::string_view json) {
        raw.assign(json);
        return true;
    }
};

struct Refusing {
    bool unmarshal_json(std::string_view) {
        return false;
    }
};

struct Color {
    std::string name;
    bool unmarshal_text(std::string_view text) {
        if(text != "red" && text != "blue") {
            return false;
        }
        name.assign(text);
        return true;
    }
};

void test_hooks() {
    struct Doc {
        Captured c;
        Color color;
    };
    Doc d;
    Check(DecodeSucceeds(d, R"({"c": [ 1, {"a" : 2} ] ,"color":"red"})"));
    Check(d.c.raw == R"([ 1, {"a" : 2} ])", d.c.raw);
    Check(d.color.name == "red");

    Check(DecodeSucceeds(d, R"({"c":null,"color":null})"));
    Check(d.c.raw == "null");
    Check(d.color.name == "red");

    Check(DecodeFailsWith(d, R"({"color":"green"})", DecodeError::TEXT_UNMARSHALER_FAILED));
    Check(DecodeFailsWith(d, R"({"color":1})", DecodeError::WRONG_JSON_TYPE));

    Refusing r;
    Check(DecodeFailsWith(r, "{}", DecodeError::UNMARSHALER_FAILED));
}

// ============================================================================
// Options
// ============================================================================

void test_integral_exponent_option() {
    Point p;
    Check(DecodeFailsWith(p, R"({"X":1e2})", DecodeError::NON_INTEGRAL_NUMBER));
    DecodeOptions opts;
    opts.allow_integral_exponent = true;
    Check(DecodeSucceeds(p, R"({"X":1e2,"Y":-2.0})", opts));
    Check(p.X == 100 && p.Y == -2);
    Check(DecodeFailsWith(p, R"({"X":1.5})", DecodeError::NON_INTEGRAL_NUMBER, opts));
}

void test_disallow_unknown_fields() {
    DecodeOptions opts;
    opts.disallow_unknown_fields = true;
    Point p;
    Check(DecodeSucceeds(p, R"({"X":1})", opts));
    Check(DecodeFailsWith(p, R"({"X":2,"Z":3,"Y":4})", DecodeError::UNKNOWN_FIELD, opts));
    // the rest of the input is still applied
    Check(p.X == 2 && p.Y == 4);

    auto res = Decode(p, R"({"Z":3})", opts);
    Check(res.detail() == "Z", res.detail());
}

int main() {
    test_case_insensitive_match();
    test_unknown_and_skipped_fields();
    test_last_duplicate_wins();
    test_scalars();
    test_unicode_unquoting();
    test_sequences_are_replaced();
    test_bytes_from_arrays();
    test_maps_are_merged();
    test_text_unmarshaler_keys();
    test_null_handling();
    test_as_string();
    test_hooks();
    test_integral_exponent_option();
    test_disallow_unknown_fields();
    return TestHelpers::Report("test_decode");
}
