#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "result.hpp"

namespace OrderedJson {

namespace error_formatting_detail {

inline constexpr std::string_view ws = " \t\n\r\f\v";

inline std::string_view trim(std::string_view s) {
    const auto b = s.find_first_not_of(ws);
    if(b == std::string_view::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // namespace error_formatting_detail

inline std::string EncodeResultToString(const EncodeResult & res) {
    if(res) {
        return "ok";
    }
    if(res.detail().empty()) {
        return std::format("{}: encoding error '{}'", kind_to_string(res.kind()), error_to_string(res.error()));
    }
    return std::format("{}: encoding error '{}' ({})", kind_to_string(res.kind()), error_to_string(res.error()), res.detail());
}

// Pass the decoded input to get a window of text around the error offset
inline std::string DecodeResultToString(const DecodeResult & res, std::string_view input = {}, std::size_t window = 40) {
    if(res) {
        return "ok";
    }
    std::string jsonPath = "$";
    if(!res.field().empty()) {
        jsonPath += "." + res.field();
    }
    std::string detail;
    if(!res.detail().empty()) {
        detail = std::format(" ({})", res.detail());
    }
    std::string fragment;
    if(!input.empty()) {
        const std::size_t pos = std::min(res.offset(), input.size());
        const std::size_t from = pos >= window ? pos - window : 0;
        const std::string_view before = error_formatting_detail::trim(input.substr(from, pos - from));
        const std::string_view after = error_formatting_detail::trim(input.substr(pos, window));
        fragment = std::format(": '...{}<|>{}...'", before, after);
    }
    return std::format("{} at offset {} when decoding {}, error '{}'{}{}",
                       kind_to_string(res.kind()), res.offset(), jsonPath,
                       error_to_string(res.error()), detail, fragment);
}

} // namespace OrderedJson
