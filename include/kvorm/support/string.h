/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <string>
#include <sstream>
#include <charconv>
#include <cstdlib>
#include <cerrno>

#include <fmt/format.h>

#include <kvorm/support/types.h>
#include <kvorm/support/exception.h>

namespace kvorm {

inline
std::string int_to_str(Int v) {
    char buf[24];
    auto result = std::to_chars(buf, buf + sizeof(buf), v);
    ASSERT(result.ec == std::errc());
    return {buf, (size_t)(result.ptr - buf)};
}

inline
std::string int_to_str(UInt v) {
    char buf[24];
    auto result = std::to_chars(buf, buf + sizeof(buf), v);
    ASSERT(result.ec == std::errc());
    return {buf, (size_t)(result.ptr - buf)};
}

inline
std::string float_to_str(Float v) {
    // shortest representation that parses back to the same double
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), v);
    ASSERT(result.ec == std::errc());
    std::string str{buf, (size_t)(result.ptr - buf)};
    if (str.find_first_of(".eEn") == str.npos) str += ".0";
    return str;
}

inline
bool str_to_bool(const StringView& str) {
    return (str == "true" || str == "1");
}

inline
Int str_to_int(const StringView& str) {
    Int value;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    if (result.ec != std::errc() || result.ptr != end)
        throw KvormException(fmt::format("invalid integer: '{}'", str));
    return value;
}

inline
UInt str_to_uint(const StringView& str) {
    UInt value;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    if (result.ec != std::errc() || result.ptr != end)
        throw KvormException(fmt::format("invalid unsigned integer: '{}'", str));
    return value;
}

inline
Float str_to_float(const StringView& str) {
    std::string copy{str};
    char* end = nullptr;
    errno = 0;
    Float value = std::strtod(copy.c_str(), &end);
    if (errno != 0 || end != copy.c_str() + copy.size())
        throw KvormException(fmt::format("invalid float: '{}'", str));
    return value;
}

/// Quote a string for JSON output.
inline
std::string json_quoted(const StringView& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    out += fmt::format("\\u{:04x}", (unsigned)c);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

} // kvorm namespace
