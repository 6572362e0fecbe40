#pragma once

#include <string>
#include <vector>

namespace ocrlayer {
namespace text {

/**
 * @brief Replace invalid UTF-8 sequences and control characters
 *        (except TAB, LF, CR) with U+FFFD
 */
std::string SanitizeUtf8(const std::string& input);

/// True if input is well-formed UTF-8
bool IsValidUtf8(const std::string& input);

/**
 * @brief Decode UTF-8 into code points (invalid bytes become U+FFFD)
 */
std::vector<char32_t> DecodeUtf8(const std::string& input);

std::string EncodeUtf8(char32_t codepoint);

/**
 * @brief UTF-8 to UTF-16LE code units, NUL terminated (PDFium FPDF_WIDESTRING)
 */
std::vector<unsigned short> Utf8ToUtf16(const std::string& input);

/**
 * @brief UTF-16LE bytes (as returned by PDFium getters) to UTF-8
 * @param data buffer holding little-endian code units, optionally NUL terminated
 * @param bytes buffer length in bytes
 */
std::string Utf16LeToUtf8(const void* data, size_t bytes);

/**
 * @brief Quote a string for the transcript script: "..." with C-style escapes
 *
 * Backslash and double quote are escaped, other ASCII control characters are
 * written as octal escapes, non-ASCII UTF-8 is kept as-is.
 */
std::string QuoteScriptString(const std::string& input);

/**
 * @brief Printable repr for log messages, e.g. 'file\x01.pdf'
 */
std::string SmartRepr(const std::string& input);

std::string Trim(const std::string& input);

std::vector<std::string> Split(const std::string& input, char separator);

} // namespace text
} // namespace ocrlayer
