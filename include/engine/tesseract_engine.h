#pragma once

#include "engine/ocr_engine.h"
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Tesseract settings, taken from -X KEY=VALUE engine properties
 */
struct TesseractConfig {
    std::string executable = "tesseract";
    std::string tessdataDir;   // empty: Tesseract's built-in default
    int psm = -1;              // page segmentation mode 0..13, -1: default
    int oem = -1;              // OCR engine mode 0..3, -1: default

    /**
     * @brief Build from engine properties
     * @throws EngineConfigError for unknown keys or non-numeric psm/oem
     */
    static TesseractConfig FromProperties(const EngineProperties& properties);

    bool Validate(std::string& error_msg) const;
    void Show() const;
};

/**
 * @brief OCR back-end driving the tesseract command line tool
 *
 * Each Recognize() call runs one tesseract process with TSV output in its
 * own scratch directory, so concurrent calls do not interfere.
 */
class TesseractEngine : public OcrEngine {
public:
    /**
     * @throws EngineNotFoundError if "tesseract --version" cannot be run
     * @throws EngineConfigError if the configuration is invalid
     */
    explicit TesseractEngine(const TesseractConfig& config = TesseractConfig());

    std::string Name() const override { return "tesseract"; }
    std::vector<std::string> ListLanguages() const override;
    std::string DefaultLanguage() const override;
    void CheckLanguage(const std::string& language) const override;
    ImageFormat GetImageFormat(int bitsPerPixel) const override;

    std::unique_ptr<RawOutput> Recognize(const std::string& imagePath,
                                         const std::string& language,
                                         TextDetails details) const override;

    TextZone ExtractText(const std::string& rawOutput,
                         const ExtractSettings& settings) const override;

    const std::string& version() const { return version_; }

    /// True for "eng", "chi_sim", "deu+fra" and the like
    static bool IsValidLanguageId(const std::string& language);

private:
    std::vector<std::string> CommonArgs() const;

    TesseractConfig config_;
    std::string version_;
};

} // namespace ocrlayer
