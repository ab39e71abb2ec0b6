#pragma once
#include <cstddef>
#include <string_view>

namespace JsonMend {

// String literal carried as a template argument, e.g. key<"zip_code">.
template <std::size_t N>
struct ConstString {
    char m_data[N + 1]{};
    static constexpr std::size_t Length = N;

    constexpr ConstString(const char (&str)[N + 1]) {
        for (std::size_t i = 0; i <= N; i ++) {
            m_data[i] = str[i];
        }
    }

    constexpr std::string_view view() const {
        return {m_data, Length};
    }

    // Usable both as a JSON property name and as a path segment:
    // no control characters and none of the path separators.
    constexpr bool is_path_safe() const {
        if (Length == 0) return false;
        for (std::size_t i = 0; i < Length; i ++) {
            const unsigned char c = static_cast<unsigned char>(m_data[i]);
            if (c < 0x20 || c == '.' || c == '[' || c == ']') return false;
        }
        return true;
    }
};

template <std::size_t N>
ConstString(const char (&)[N]) -> ConstString<N - 1>;

} // namespace JsonMend
