#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace OrderedJson {

template <typename CharT, std::size_t N> struct ConstString
{
    // Field names may not hold control characters, quotes, backslashes or commas
    constexpr bool check()  const {
        for(std::size_t i = 0; i < N; i ++) {
            const auto c = std::uint8_t(m_data[i]);
            if(c < 32 || c == '"' || c == '\\' || c == ',') return false;
        }
        return true;
    }
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

} // namespace OrderedJson
