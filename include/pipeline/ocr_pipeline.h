#pragma once

#include "common/temp_dir.h"
#include "document/page_source.h"
#include "document/pdf_document.h"
#include "engine/ocr_engine.h"
#include "pipeline/cancellation.h"
#include "pipeline/raw_ocr_sink.h"
#include "pipeline/transcript.h"
#include "pipeline/worker_pool.h"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief OCR pipeline configuration
 */
struct PipelineConfig {
    int numJobs = 1;                          // worker threads; <= 0: number of CPUs
    ErrorPolicy onError = ErrorPolicy::Abort;
    std::string language;                     // empty: engine default
    TextDetails details = TextDetails::Words;
    RenderConfig render;
    bool debug = false;                       // keep the working directory and raw output
    bool clearText = false;                   // remove existing hidden text first
    RawOcrConfig rawOcr;

    bool Validate(std::string& error_msg) const;
    void Show() const;
};

/**
 * @brief Statistics of one document run
 */
struct PipelineStats {
    int requestedPages = 0;
    int pagesWithText = 0;
    int pagesWithoutText = 0;
    int workers = 0;
    double totalTime = 0.0;   // ms

    void Show() const;
};

/**
 * @brief Document run: fan pages out to a worker pool, fan results back in
 *        page order
 *
 * Owns the working directory (page images, debug output, transcript
 * script). The directory is removed when the pipeline is destroyed, unless
 * the run failed or debug mode is on.
 */
class OCRPipeline {
public:
    /**
     * @brief Resolve and check the recognition language
     * @throws InvalidLanguageIdError, MissingLanguagePackError
     * @throws std::invalid_argument if the configuration is invalid
     */
    OCRPipeline(const OcrEngine& engine, const PipelineConfig& config);
    ~OCRPipeline();

    OCRPipeline(const OCRPipeline&) = delete;
    OCRPipeline& operator=(const OCRPipeline&) = delete;

    /**
     * @brief Create the transcript in the working directory
     */
    std::unique_ptr<Transcript> OpenTranscript() const;

    /**
     * @brief Process the requested pages into the transcript
     *
     * @param pageNumbers 1-based, validated against the source
     * @throws PipelineAbortedError, InterruptedError, DocumentError
     */
    PipelineStats Run(PageSource& source, const std::vector<int>& pageNumbers,
                      Transcript& transcript);

    /**
     * @brief Interrupt the current or next run; safe from any thread
     */
    void Interrupt();

    /**
     * @brief Keep the working directory after destruction
     */
    void RetainWorkDir() { workDir_.Retain(); }

    const std::string& workDir() const { return workDir_.path(); }
    const std::string& language() const { return language_; }
    const PipelineConfig& config() const { return config_; }

private:
    struct RunState;

    std::shared_ptr<const TextZone> ProcessPage(PageSource& source, const PageDescriptor& page);

    const OcrEngine& engine_;
    PipelineConfig config_;
    std::string language_;
    ImageFormat imageFormat_;
    TempDir workDir_;
    RawOcrSink rawSink_;

    std::atomic<bool> interrupted_{false};
    std::shared_ptr<RunState> activeRun_;   // set while Run() is active; atomic_load/atomic_store only
};

} // namespace ocrlayer
