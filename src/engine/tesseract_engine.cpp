#include "engine/tesseract_engine.h"
#include "engine/tesseract_tsv.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/subprocess.h"
#include "common/temp_dir.h"
#include "common/text_utils.h"

#include <fmt/format.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace ocrlayer {

namespace {

const std::regex& LanguagePartPattern() {
    static const std::regex pattern("^[a-z]{3}(_[a-z]+)*$");
    return pattern;
}

int ParseIntProperty(const std::string& key, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw EngineConfigError(fmt::format("invalid value for engine property {}: '{}'", key, value));
    }
    return result;
}

std::string ReadFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw EngineOutputError("tesseract produced no output file " + path);
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

} // namespace

// ==================== TesseractConfig ====================

TesseractConfig TesseractConfig::FromProperties(const EngineProperties& properties) {
    TesseractConfig config;
    for (const auto& kv : properties) {
        if (kv.first == "executable") {
            config.executable = kv.second;
        } else if (kv.first == "tessdata-dir") {
            config.tessdataDir = kv.second;
        } else if (kv.first == "psm") {
            config.psm = ParseIntProperty(kv.first, kv.second);
        } else if (kv.first == "oem") {
            config.oem = ParseIntProperty(kv.first, kv.second);
        } else {
            throw EngineConfigError("unknown property for the tesseract engine: " + kv.first);
        }
    }
    return config;
}

bool TesseractConfig::Validate(std::string& error_msg) const {
    if (executable.empty()) {
        error_msg = "executable must not be empty";
        return false;
    }
    if (psm < -1 || psm > 13) {
        error_msg = "psm must be between 0 and 13";
        return false;
    }
    if (oem < -1 || oem > 3) {
        error_msg = "oem must be between 0 and 3";
        return false;
    }
    return true;
}

void TesseractConfig::Show() const {
    LOG_INFO("Tesseract Config:");
    LOG_INFO("  executable: {}", executable);
    LOG_INFO("  tessdata dir: {}", tessdataDir.empty() ? "(default)" : tessdataDir);
    LOG_INFO("  psm: {}", psm < 0 ? std::string("(default)") : std::to_string(psm));
    LOG_INFO("  oem: {}", oem < 0 ? std::string("(default)") : std::to_string(oem));
}

// ==================== TesseractEngine ====================

TesseractEngine::TesseractEngine(const TesseractConfig& config) : config_(config) {
    std::string error_msg;
    if (!config_.Validate(error_msg)) {
        throw EngineConfigError("invalid tesseract configuration: " + error_msg);
    }

    try {
        auto result = RunSubprocess({config_.executable, "--version"});
        // Tesseract 3 prints the banner on stderr, later versions on stdout
        const std::string& banner = result.stdoutText.empty() ? result.stderrText : result.stdoutText;
        version_ = text::Trim(banner.substr(0, banner.find('\n')));
    } catch (const SubprocessError& e) {
        LOG_DEBUG("{}", e.what());
        throw EngineNotFoundError(Name());
    } catch (const CalledProcessError& e) {
        LOG_DEBUG("{}", e.what());
        throw EngineNotFoundError(Name());
    }
    LOG_DEBUG("Using {}", version_);
}

std::vector<std::string> TesseractEngine::CommonArgs() const {
    std::vector<std::string> args;
    if (!config_.tessdataDir.empty()) {
        args.push_back("--tessdata-dir");
        args.push_back(config_.tessdataDir);
    }
    return args;
}

std::vector<std::string> TesseractEngine::ListLanguages() const {
    std::vector<std::string> argv = {config_.executable};
    auto common = CommonArgs();
    argv.insert(argv.end(), common.begin(), common.end());
    argv.push_back("--list-langs");

    SubprocessResult result;
    try {
        result = RunSubprocess(argv);
    } catch (const CalledProcessInterrupted&) {
        throw;
    } catch (const Error& e) {
        LOG_DEBUG("{}", e.what());
        throw UnknownLanguageListError();
    }

    std::vector<std::string> languages;
    bool listing = false;
    std::istringstream in(result.stdoutText + result.stderrText);
    std::string line;
    while (std::getline(in, line)) {
        line = text::Trim(line);
        if (line.compare(0, 28, "List of available languages ") == 0) {
            listing = true;
            continue;
        }
        if (listing && std::regex_match(line, LanguagePartPattern())) {
            languages.push_back(line);
        }
    }
    if (!listing) {
        throw UnknownLanguageListError();
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}

std::string TesseractEngine::DefaultLanguage() const {
    const char* env = std::getenv("tesslanguage");
    if (env != nullptr && *env != '\0') {
        return env;
    }
    return "eng";
}

bool TesseractEngine::IsValidLanguageId(const std::string& language) {
    if (language.empty()) {
        return false;
    }
    for (const auto& part : text::Split(language, '+')) {
        if (!std::regex_match(part, LanguagePartPattern())) {
            return false;
        }
    }
    return true;
}

void TesseractEngine::CheckLanguage(const std::string& language) const {
    if (!IsValidLanguageId(language)) {
        throw InvalidLanguageIdError(language);
    }
    auto available = ListLanguages();
    for (const auto& part : text::Split(language, '+')) {
        if (!std::binary_search(available.begin(), available.end(), part)) {
            throw MissingLanguagePackError(part);
        }
    }
}

ImageFormat TesseractEngine::GetImageFormat(int bitsPerPixel) const {
    ImageFormat format;
    format.extension = "tif";
    format.bitsPerPixel = bitsPerPixel == 1 ? 1 : (bitsPerPixel == 8 ? 8 : 24);
    return format;
}

std::unique_ptr<RawOutput> TesseractEngine::Recognize(const std::string& imagePath,
                                                      const std::string& language,
                                                      TextDetails details) const {
    TempDir scratch("ocrlayer-tesseract.");
    const std::string outputBase = scratch.File("out");

    std::vector<std::string> argv = {config_.executable, imagePath, outputBase, "-l", language};
    auto common = CommonArgs();
    argv.insert(argv.end(), common.begin(), common.end());
    if (config_.psm >= 0) {
        argv.push_back("--psm");
        argv.push_back(std::to_string(config_.psm));
    }
    if (config_.oem >= 0) {
        argv.push_back("--oem");
        argv.push_back(std::to_string(config_.oem));
    }
    argv.push_back("tsv");

    // TSV always carries word boxes; coarser details are cut in ExtractText
    LOG_TRACE("Recognizing {} ({} details)", imagePath, TextDetailsName(details));
    RunSubprocess(argv);

    return std::make_unique<RawOutput>(ReadFile(outputBase + ".tsv"), "tsv");
}

TextZone TesseractEngine::ExtractText(const std::string& rawOutput,
                                      const ExtractSettings& settings) const {
    TextZone page = ParseTesseractTsv(rawOutput, settings.pageSize);
    const cv::Size upright(page.bbox().width(), page.bbox().height());
    page.ApplyDetails(settings.details);
    page.Prune();
    page.Rotate(settings.rotation, upright);
    return page;
}

} // namespace ocrlayer
