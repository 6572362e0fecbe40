#pragma once

#include "document/page_source.h"
#include "engine/ocr_engine.h"
#include <string>

namespace ocrlayer {

/**
 * @brief Raw OCR output side channel (--save-raw-ocr)
 */
struct RawOcrConfig {
    std::string directory;                     // empty: disabled
    std::string filenameTemplate = "{id-ext}";

    bool enabled() const { return !directory.empty(); }
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Expand a raw-OCR file name template
 *
 * Fields: {page} (1-based page number), {id} (page identifier), {id-ext}
 * (identifier without extension), {page+N} and {page-N}. A format spec may
 * follow a colon, e.g. {page:04}. "{{" and "}}" stand for literal braces.
 *
 * @throws std::invalid_argument for unknown fields or unbalanced braces
 * @throws fmt::format_error for a bad format spec
 */
std::string ExpandTemplate(const std::string& filenameTemplate, int pageNumber,
                           const std::string& identifier);

/**
 * @brief Writes each page's raw engine output to the configured directory
 *
 * Failures are logged and otherwise ignored; they never affect the run.
 */
class RawOcrSink {
public:
    explicit RawOcrSink(const RawOcrConfig& config);

    void Save(const PageDescriptor& page, const RawOutput& output) const;

private:
    RawOcrConfig config_;
};

} // namespace ocrlayer
