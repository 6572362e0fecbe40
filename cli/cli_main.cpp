#include "cli_options.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/page_range.h"
#include "document/pdf_document.h"
#include "engine/engine_registry.h"
#include "pipeline/ocr_pipeline.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#ifndef OCRLAYER_VERSION
#define OCRLAYER_VERSION "0.0.0"
#endif

using namespace ocrlayer;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void SignalHandler(int) {
    g_stop_requested = 1;
}

/**
 * @brief Forwards SIGINT/SIGTERM to the pipeline
 *
 * The handler only sets a flag; this thread polls it and calls
 * OCRPipeline::Interrupt() outside of signal context.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(OCRPipeline& pipeline) : pipeline_(pipeline) {
        std::signal(SIGINT, SignalHandler);
        std::signal(SIGTERM, SignalHandler);
        thread_ = std::thread([this]() {
            while (!done_.load()) {
                if (g_stop_requested) {
                    pipeline_.Interrupt();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~InterruptWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    OCRPipeline& pipeline_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int ListEngines() {
    for (const auto& name : ListEngineNames()) {
        try {
            CreateEngine(name);
        } catch (const Error& e) {
            LOG_DEBUG("Engine {} unavailable: {}", name, e.what());
            continue;
        }
        std::cout << name << "\n";
    }
    return ExitCode::SUCCESS;
}

int ListLanguages(const OcrEngine& engine) {
    for (const auto& language : engine.ListLanguages()) {
        std::cout << language << "\n";
    }
    return ExitCode::SUCCESS;
}

std::vector<int> SelectPages(const std::string& pages, int pageCount) {
    if (pageCount == 0) {
        throw UsageError("the document has no pages");
    }
    if (pages.empty()) {
        std::vector<int> all(pageCount);
        std::iota(all.begin(), all.end(), 1);
        return all;
    }
    try {
        return ValidatePageNumbers(ParsePageNumbers(pages), pageCount);
    } catch (const std::out_of_range& e) {
        throw UsageError(e.what());
    }
}

int Process(const CliOptions& options) {
    const std::string engineName = options.engine.empty() ? DEFAULT_ENGINE : options.engine;
    auto engine = CreateEngine(engineName, options.engineProperties);

    if (options.listLanguages) {
        return ListLanguages(*engine);
    }

    options.Show();
    OCRPipeline pipeline(*engine, options.pipeline);
    LOG_INFO("Engine: {}, language: {}", engine->Name(), pipeline.language());

    auto saver = CreateSaver(options);
    auto document = std::make_unique<PdfDocument>(options.inputPath, options.pipeline.render);
    std::vector<int> pageNumbers = SelectPages(options.pages, document->PageCount());

    auto transcript = pipeline.OpenTranscript();
    PipelineStats stats;
    {
        InterruptWatcher watcher(pipeline);
        stats = pipeline.Run(*document, pageNumbers, *transcript);
    }
    transcript->Close();

    std::vector<int> pagesToSave;
    if (options.ocrOnly) {
        pagesToSave = transcript->DocumentIndices();
    }
    if (saver->InPlace()) {
        // The input file is rewritten; release PDFium's view of it first
        document->Close();
    }
    try {
        saver->Save(options.inputPath, *transcript, pagesToSave);
    } catch (const std::exception&) {
        // The transcript stays available for a manual retry
        pipeline.RetainWorkDir();
        throw;
    }
    LOG_INFO("Results saved ({})", saver->Name());

    stats.Show();
    return ExitCode::SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ParseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << argv[0] << ": error: " << e.what() << "\n"
                  << "Use -h or --help for usage information\n";
        return ExitCode::USAGE_ERROR;
    }

    if (options.showHelp) {
        std::cout << UsageText(argv[0]);
        return ExitCode::SUCCESS;
    }
    if (options.showVersion) {
        std::cout << "ocrlayer " << OCRLAYER_VERSION << "\n";
        return ExitCode::SUCCESS;
    }

    try {
        InitLogger(options.logger);
    } catch (const std::exception& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << "\n";
        return ExitCode::FAILURE;
    }

    int exitCode = ExitCode::FAILURE;
    try {
        exitCode = options.listEngines ? ListEngines() : Process(options);
    } catch (const UsageError& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::USAGE_ERROR;
    } catch (const EngineConfigError& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::USAGE_ERROR;
    } catch (const InvalidLanguageIdError& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::USAGE_ERROR;
    } catch (const MissingLanguagePackError& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::USAGE_ERROR;
    } catch (const InterruptedError&) {
        LOG_ERROR("Interrupted by user.");
        exitCode = ExitCode::FAILURE;
    } catch (const PipelineAbortedError& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::FAILURE;
    } catch (const Error& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::FAILURE;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("{}", e.what());
        exitCode = ExitCode::USAGE_ERROR;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: {}", e.what());
        exitCode = ExitCode::FAILURE;
    }

    ShutdownLogger();
    return exitCode;
}
