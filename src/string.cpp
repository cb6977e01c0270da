#include "string.hpp"

#include <array>
#include <cassert>

namespace {
constexpr std::array<char, 256> getToLowerTable()
{
    std::array<char, 256> table = {};
    for (size_t i = 0; i < 256; ++i) {
        table[i] = static_cast<char>(static_cast<uint8_t>(i));
        if (i >= 'A' && i <= 'Z') {
            table[i] = static_cast<char>(i - 'A' + 'a');
        }
    }
    return table;
}
}

char toLower(char c)
{
    static constexpr auto table = getToLowerTable();
    return table[static_cast<uint8_t>(c)];
}

bool ciEqual(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) {
            return false;
        }
    }
    return true;
}

bool isHttpWhitespace(char c)
{
    return c == ' ' || c == '\t';
}

std::string_view httpTrim(std::string_view str)
{
    size_t start = 0;
    while (start < str.size() && isHttpWhitespace(str[start])) {
        start++;
    }
    if (start == str.size()) {
        return str.substr(start, 0);
    }

    auto end = str.size() - 1;
    while (end > start && isHttpWhitespace(str[end])) {
        end--;
    }
    assert(end >= start);

    return str.substr(start, end + 1 - start);
}

bool startsWith(std::string_view str, std::string_view start)
{
    return str.substr(0, start.size()) == start;
}

std::string jsonString(std::string_view str)
{
    static constexpr char hexDigits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(str.size() + 2);
    ret.push_back('"');
    for (const auto ch : str) {
        switch (ch) {
        case '"':
            ret.append("\\\"");
            break;
        case '\\':
            ret.append("\\\\");
            break;
        case '\n':
            ret.append("\\n");
            break;
        case '\r':
            ret.append("\\r");
            break;
        case '\t':
            ret.append("\\t");
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                ret.append("\\u00");
                ret.push_back(hexDigits[(ch >> 4) & 0xf]);
                ret.push_back(hexDigits[ch & 0xf]);
            } else {
                ret.push_back(ch);
            }
        }
    }
    ret.push_back('"');
    return ret;
}
