#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// NO. LOCALES.
char toLower(char c);

bool ciEqual(std::string_view a, std::string_view b);

bool isHttpWhitespace(char c);

std::string_view httpTrim(std::string_view str);

bool startsWith(std::string_view str, std::string_view start);

// Quoted JSON string literal with everything escaped that RFC 8259 requires
std::string jsonString(std::string_view str);

template <typename T = uint64_t>
std::optional<T> parseInt(std::string_view str, int base = 10)
{
    const auto first = str.data();
    const auto last = first + str.size();
    T value;
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc() && res.ptr == last) {
        return value;
    } else {
        return std::nullopt;
    }
}

template <typename Container>
std::string join(const Container& container, std::string_view delim = ", ")
{
    std::string ret;
    bool first = true;
    for (const auto& elem : container) {
        if (!first) {
            ret.append(delim);
        }
        first = false;
        ret.append(elem);
    }
    return ret;
}
