#pragma once

/**
 * @file cli_options.h
 * @brief Command line grammar of the ocrlayer tool
 */

#include "common/errors.h"
#include "common/logger.hpp"
#include "engine/ocr_engine.h"
#include "persistence/saver.h"
#include "pipeline/ocr_pipeline.h"
#include <memory>
#include <string>

namespace ocrlayer {

/// Bad command line; reported with exit code 2
class UsageError : public Error {
public:
    using Error::Error;
};

enum class OutputMode {
    None,
    Bundled,
    Indirect,
    Script,
    InPlace,
    DryRun,
};

/**
 * @brief Parsed command line
 */
struct CliOptions {
    std::string inputPath;

    OutputMode output = OutputMode::None;
    std::string outputPath;        // Bundled, Indirect, Script
    bool ocrOnly = false;          // keep only the requested pages

    std::string engine;            // empty: DEFAULT_ENGINE
    EngineProperties engineProperties;
    std::string pages;             // empty: every page

    PipelineConfig pipeline;
    LoggerConfig logger;

    bool listEngines = false;
    bool listLanguages = false;
    bool showHelp = false;
    bool showVersion = false;

    void Show() const;
};

/**
 * @brief Parse argv
 *
 * Informational options (--help, --version, --list-*) short-circuit the
 * checks on output options and the input file.
 *
 * @throws UsageError
 */
CliOptions ParseCommandLine(int argc, char* argv[]);

std::string UsageText(const std::string& program);

/**
 * @brief Persistence strategy for the selected output option
 */
std::unique_ptr<Saver> CreateSaver(const CliOptions& options);

} // namespace ocrlayer
