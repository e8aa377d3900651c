#pragma once

// UTF-8 <-> SQLWCHAR (UTF-16) conversion for wide-character binds and reads.
// On Windows SQLWCHAR == wchar_t; on Linux/macOS it is unsigned short while
// wchar_t is 4 bytes, so L"..." literals cannot be used portably.

#include <sql.h>
#include <sqlext.h>
#include <string>
#include <string_view>
#include <vector>

namespace mssql_mcp::core {

// Null-terminated UTF-16 copy of a UTF-8 string. Malformed bytes become U+FFFD.
inline std::vector<SQLWCHAR> to_sqlwchar(std::string_view utf8) {
    std::vector<SQLWCHAR> result;
    result.reserve(utf8.size() + 1);
    std::size_t i = 0;
    while (i < utf8.size()) {
        unsigned char lead = static_cast<unsigned char>(utf8[i]);
        char32_t cp = 0xFFFD;
        std::size_t extra = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        }
        ++i;
        for (std::size_t k = 0; k < extra; ++k, ++i) {
            if (i >= utf8.size() || (static_cast<unsigned char>(utf8[i]) & 0xC0) != 0x80) {
                cp = 0xFFFD;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(utf8[i]) & 0x3F);
        }
        if (cp >= 0x10000) {
            cp -= 0x10000;
            result.push_back(static_cast<SQLWCHAR>(0xD800 + (cp >> 10)));
            result.push_back(static_cast<SQLWCHAR>(0xDC00 + (cp & 0x3FF)));
        } else {
            result.push_back(static_cast<SQLWCHAR>(cp));
        }
    }
    result.push_back(0);  // null terminator
    return result;
}

// UTF-8 copy of `count` UTF-16 code units
inline std::string from_sqlwchar(const SQLWCHAR* data, std::size_t count) {
    std::string result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        char32_t cp = data[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < count &&
            data[i + 1] >= 0xDC00 && data[i + 1] <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (data[i + 1] - 0xDC00);
            ++i;
        }
        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return result;
}

} // namespace mssql_mcp::core
