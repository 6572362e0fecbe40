#include "common/text_utils.h"

#include <fmt/format.h>
#include <cstdint>

namespace ocrlayer {
namespace text {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// Decode one code point starting at pos. Returns the number of bytes consumed
// (at least 1); cp is U+FFFD for malformed input.
size_t DecodeOne(const std::string& s, size_t pos, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t len;
    char32_t min;
    if ((b0 & 0xE0) == 0xC0) {
        len = 2; cp = b0 & 0x1F; min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; cp = b0 & 0x0F; min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; cp = b0 & 0x07; min = 0x10000;
    } else {
        cp = kReplacementChar;
        return 1;
    }

    if (pos + len > s.size()) {
        cp = kReplacementChar;
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80) {
            cp = kReplacementChar;
            return 1;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // overlong forms, surrogates and out-of-range values
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = kReplacementChar;
        return 1;
    }
    return len;
}

bool IsControl(char32_t cp) {
    return cp < 0x20 && cp != '\t' && cp != '\n' && cp != '\r';
}

} // namespace

std::vector<char32_t> DecodeUtf8(const std::string& input) {
    std::vector<char32_t> out;
    out.reserve(input.size());
    for (size_t pos = 0; pos < input.size();) {
        char32_t cp;
        pos += DecodeOne(input, pos, cp);
        out.push_back(cp);
    }
    return out;
}

std::string EncodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

bool IsValidUtf8(const std::string& input) {
    for (size_t pos = 0; pos < input.size();) {
        char32_t cp;
        size_t n = DecodeOne(input, pos, cp);
        // a literal U+FFFD in the input is 3 bytes long, a decoding error is 1
        if (cp == kReplacementChar && n == 1) {
            return false;
        }
        pos += n;
    }
    return true;
}

std::string SanitizeUtf8(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t pos = 0; pos < input.size();) {
        char32_t cp;
        pos += DecodeOne(input, pos, cp);
        if (IsControl(cp)) {
            cp = kReplacementChar;
        }
        out += EncodeUtf8(cp);
    }
    return out;
}

std::vector<unsigned short> Utf8ToUtf16(const std::string& input) {
    std::vector<unsigned short> out;
    out.reserve(input.size() + 1);
    for (char32_t cp : DecodeUtf8(input)) {
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<unsigned short>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<unsigned short>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<unsigned short>(cp));
        }
    }
    out.push_back(0);
    return out;
}

std::string Utf16LeToUtf8(const void* data, size_t bytes) {
    const auto* p = static_cast<const unsigned char*>(data);
    std::string out;
    size_t units = bytes / 2;
    for (size_t i = 0; i < units; ++i) {
        char32_t u = p[2 * i] | (p[2 * i + 1] << 8);
        if (u == 0) {
            break;
        }
        if (u >= 0xD800 && u <= 0xDBFF && i + 1 < units) {
            char32_t lo = p[2 * (i + 1)] | (p[2 * (i + 1) + 1] << 8);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                u = 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            } else {
                u = kReplacementChar;
            }
        } else if (u >= 0xD800 && u <= 0xDFFF) {
            u = kReplacementChar;
        }
        out += EncodeUtf8(u);
    }
    return out;
}

std::string QuoteScriptString(const std::string& input) {
    std::string out = "\"";
    for (char c : input) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (uc < 0x20 || uc == 0x7F) {
            out += fmt::format("\\{:03o}", uc);
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string SmartRepr(const std::string& input) {
    std::string out = "'";
    for (char32_t cp : DecodeUtf8(input)) {
        if (cp == '\'' || cp == '"' || cp == '\\') {
            out += '\\';
            out += static_cast<char>(cp);
        } else if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) {
            out += fmt::format("\\x{:02x}", static_cast<uint32_t>(cp));
        } else {
            out += EncodeUtf8(cp);
        }
    }
    out += '\'';
    return out;
}

std::string Trim(const std::string& input) {
    const char* ws = " \t\r\n\f\v";
    auto begin = input.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = input.find_last_not_of(ws);
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> Split(const std::string& input, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = input.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(input.substr(start));
            break;
        }
        parts.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace text
} // namespace ocrlayer
