#pragma once

#include "zones/text_zone.h"
#include <opencv2/core.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Raster format an engine expects as input
 */
struct ImageFormat {
    std::string extension;       // file extension without dot, e.g. "tif"
    int bitsPerPixel = 24;       // 1 (bilevel), 8 (gray) or 24 (BGR)
    std::vector<int> writeParams;  // cv::imwrite parameters
};

/**
 * @brief Raw engine output of one page
 *
 * The engine's scratch files are gone by the time this object exists; only
 * the output text is kept, for extraction and the raw-OCR side channel.
 */
class RawOutput {
public:
    RawOutput(std::string text, std::string extension)
        : text_(std::move(text)), extension_(std::move(extension)) {}

    const std::string& text() const { return text_; }
    const std::string& extension() const { return extension_; }

    /**
     * @brief Write the raw output to "<prefix>.<extension>"
     * @throws std::system_error on I/O failure
     */
    void Save(const std::string& prefix) const;

private:
    std::string text_;
    std::string extension_;
};

/**
 * @brief Parameters of the raw output -> zone conversion
 */
struct ExtractSettings {
    int rotation = 0;                            // page rotation in degrees
    TextDetails details = TextDetails::Words;
    cv::Size pageSize;                           // upright raster size
};

/**
 * @brief Capability contract of an OCR back-end
 *
 * Implementations are immutable after construction and must be safe to use
 * from several worker threads at once.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    virtual std::string Name() const = 0;

    /**
     * @brief Languages the back-end can recognise
     * @throws UnknownLanguageListError if they cannot be enumerated
     */
    virtual std::vector<std::string> ListLanguages() const = 0;

    virtual std::string DefaultLanguage() const = 0;

    /**
     * @throws InvalidLanguageIdError, MissingLanguagePackError,
     *         UnknownLanguageListError
     */
    virtual void CheckLanguage(const std::string& language) const = 0;

    virtual ImageFormat GetImageFormat(int bitsPerPixel) const = 0;

    /**
     * @brief Run recognition on an image file
     * @throws SubprocessError, CalledProcessError, CalledProcessInterrupted,
     *         EngineOutputError
     */
    virtual std::unique_ptr<RawOutput> Recognize(const std::string& imagePath,
                                                 const std::string& language,
                                                 TextDetails details) const = 0;

    /**
     * @brief Convert raw output into the page's zone tree, rotation applied
     * @throws EngineOutputError
     */
    virtual TextZone ExtractText(const std::string& rawOutput,
                                 const ExtractSettings& settings) const = 0;
};

/// Engine-specific properties from -X KEY=VALUE
using EngineProperties = std::map<std::string, std::string>;

} // namespace ocrlayer
