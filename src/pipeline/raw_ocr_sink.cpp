#include "pipeline/raw_ocr_sink.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <filesystem>
#include <stdexcept>

namespace ocrlayer {

namespace {

std::string StripExtension(const std::string& identifier) {
    const size_t slash = identifier.rfind('/');
    const size_t start = slash == std::string::npos ? 0 : slash + 1;
    const size_t dot = identifier.rfind('.');
    if (dot == std::string::npos || dot <= start) {
        return identifier;
    }
    // Leading dots belong to the stem (".hidden" has no extension)
    if (identifier.find_first_not_of('.', start) >= dot) {
        return identifier;
    }
    return identifier.substr(0, dot);
}

std::string FormatField(const std::string& field, const std::string& formatSpec, int pageNumber,
                        const std::string& identifier) {
    const std::string pattern = formatSpec.empty() ? "{}" : "{:" + formatSpec + "}";

    if (field == "id") {
        return fmt::format(fmt::runtime(pattern), identifier);
    }
    if (field == "id-ext") {
        return fmt::format(fmt::runtime(pattern), StripExtension(identifier));
    }
    if (field == "page") {
        return fmt::format(fmt::runtime(pattern), pageNumber);
    }

    // page+N, page-N
    const size_t sign = field.find_first_of("+-");
    if (sign != std::string::npos && field.compare(0, sign, "page") == 0 && sign + 1 < field.size()) {
        const std::string digits = field.substr(sign + 1);
        if (digits.find_first_not_of("0123456789") == std::string::npos) {
            int offset = std::stoi(digits);
            int value = field[sign] == '+' ? pageNumber + offset : pageNumber - offset;
            return fmt::format(fmt::runtime(pattern), value);
        }
    }
    throw std::invalid_argument("unknown template field: " + field);
}

} // namespace

std::string ExpandTemplate(const std::string& filenameTemplate, int pageNumber,
                           const std::string& identifier) {
    std::string result;
    size_t i = 0;
    const size_t n = filenameTemplate.size();

    while (i < n) {
        const char c = filenameTemplate[i];
        if (c == '{' && i + 1 < n && filenameTemplate[i + 1] == '{') {
            result += '{';
            i += 2;
        } else if (c == '}' && i + 1 < n && filenameTemplate[i + 1] == '}') {
            result += '}';
            i += 2;
        } else if (c == '{') {
            const size_t close = filenameTemplate.find('}', i);
            if (close == std::string::npos) {
                throw std::invalid_argument("unbalanced '{' in template: " + filenameTemplate);
            }
            std::string field = filenameTemplate.substr(i + 1, close - i - 1);
            std::string formatSpec;
            const size_t colon = field.find(':');
            if (colon != std::string::npos) {
                formatSpec = field.substr(colon + 1);
                field.resize(colon);
            }
            result += FormatField(field, formatSpec, pageNumber, identifier);
            i = close + 1;
        } else if (c == '}') {
            throw std::invalid_argument("single '}' in template: " + filenameTemplate);
        } else {
            result += c;
            ++i;
        }
    }
    return result;
}

bool RawOcrConfig::Validate(std::string& error_msg) const {
    if (!enabled()) {
        return true;
    }
    if (filenameTemplate.empty()) {
        error_msg = "raw OCR filename template must not be empty";
        return false;
    }
    try {
        ExpandTemplate(filenameTemplate, 1, "p1.pdf");
    } catch (const std::exception& e) {
        error_msg = fmt::format("invalid raw OCR filename template '{}': {}", filenameTemplate, e.what());
        return false;
    }
    return true;
}

RawOcrSink::RawOcrSink(const RawOcrConfig& config) : config_(config) {}

void RawOcrSink::Save(const PageDescriptor& page, const RawOutput& output) const {
    if (!config_.enabled()) {
        return;
    }
    try {
        std::string name = ExpandTemplate(config_.filenameTemplate, page.pageNumber(), page.identifier);
        std::string prefix = (std::filesystem::path(config_.directory) / name).string();
        output.Save(prefix);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot save raw OCR output of page {}: {}", page.pageNumber(), e.what());
    }
}

} // namespace ocrlayer
