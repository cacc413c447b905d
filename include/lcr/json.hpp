#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Appends `s` as a quoted JSON string, escaping quotes, backslashes and
// control characters (RFC 8259 section 7).
inline void append_string(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

// Appends `"key":` (key is trusted, never escaped)
inline void append_key(std::string& out, std::string_view key) {
    out += '"';
    out.append(key.data(), key.size());
    out += "\":";
}

// Fast unsigned integer formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);
    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);
    out.append(p, static_cast<std::size_t>(buf + sizeof(buf) - p));
}

inline void append_bool(std::string& out, bool value) {
    out += value ? "true" : "false";
}

} // namespace json
} // namespace lcr
