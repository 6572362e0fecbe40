#include "pipeline/ocr_pipeline.h"
#include "pipeline/ordered_assembler.h"
#include "pipeline/result_store.h"
#include "document/image_io.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace ocrlayer {

// ==================== PipelineConfig ====================

bool PipelineConfig::Validate(std::string& error_msg) const {
    if (!render.Validate(error_msg)) {
        return false;
    }
    if (!rawOcr.Validate(error_msg)) {
        return false;
    }
    return true;
}

void PipelineConfig::Show() const {
    LOG_INFO("========== OCR Pipeline Configuration ==========");
    LOG_INFO("  Jobs: {}", numJobs > 0 ? std::to_string(numJobs) : std::string("auto"));
    LOG_INFO("  On error: {}", ErrorPolicyName(onError));
    LOG_INFO("  Language: {}", language.empty() ? std::string("(engine default)") : language);
    LOG_INFO("  Details: {}", TextDetailsName(details));
    LOG_INFO("  Render: {} @ {} dpi", RenderModeName(render.mode), render.dpi);
    LOG_INFO("  Clear text: {}", clearText ? "true" : "false");
    LOG_INFO("  Debug: {}", debug ? "true" : "false");
    if (rawOcr.enabled()) {
        LOG_INFO("  Raw OCR: {}/{}", rawOcr.directory, rawOcr.filenameTemplate);
    }
    LOG_INFO("===============================================");
}

void PipelineStats::Show() const {
    LOG_INFO("========== OCR Pipeline Statistics ==========");
    LOG_INFO("  Pages: {} ({} with text, {} without)", requestedPages, pagesWithText,
             pagesWithoutText);
    LOG_INFO("  Workers: {}", workers);
    LOG_INFO("  Total: {:.2f} ms ({:.2f} ms/page)", totalTime,
             requestedPages > 0 ? totalTime / requestedPages : 0.0);
    LOG_INFO("=============================================");
}

// ==================== OCRPipeline ====================

namespace {

/// Removes a file when it goes out of scope
class ScopedFile {
public:
    ScopedFile(std::string path, bool keep) : path_(std::move(path)), keep_(keep) {}
    ~ScopedFile() {
        if (keep_) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool keep_;
};

} // namespace

/// Result slots and cancellation of one run, shared with Interrupt()
struct OCRPipeline::RunState {
    explicit RunState(size_t pageCount) : store(pageCount), cancellation(store) {}

    ResultStore store;
    CancellationController cancellation;
};

OCRPipeline::OCRPipeline(const OcrEngine& engine, const PipelineConfig& config)
    : engine_(engine), config_(config), workDir_("ocrlayer."), rawSink_(config.rawOcr) {
    std::string error_msg;
    if (!config_.Validate(error_msg)) {
        throw std::invalid_argument(error_msg);
    }
    if (config_.debug) {
        workDir_.Retain();
    }

    language_ = config_.language.empty() ? engine_.DefaultLanguage() : config_.language;
    try {
        engine_.CheckLanguage(language_);
    } catch (const UnknownLanguageListError& e) {
        // Assume the language pack is installed
        LOG_WARN("{}", e.what());
    }

    imageFormat_ = engine_.GetImageFormat(RenderBitsPerPixel(config_.render.mode));
    LOG_DEBUG("Engine {} expects {} bpp .{} images", engine_.Name(), imageFormat_.bitsPerPixel,
              imageFormat_.extension);
}

OCRPipeline::~OCRPipeline() = default;

std::unique_ptr<Transcript> OCRPipeline::OpenTranscript() const {
    return std::make_unique<Transcript>(workDir_.File("ocrlayer.script"), config_.clearText);
}

void OCRPipeline::Interrupt() {
    interrupted_.store(true);
    // The copy keeps the run state alive even if Run() returns meanwhile
    std::shared_ptr<RunState> run = std::atomic_load(&activeRun_);
    if (run) {
        run->cancellation.Interrupt();
    }
}

std::shared_ptr<const TextZone> OCRPipeline::ProcessPage(PageSource& source,
                                                         const PageDescriptor& page) {
    cv::Mat image = source.Render(page);
    if (image.empty()) {
        throw NoImageError("No image suitable for OCR.");
    }

    ScopedFile imageFile(
        workDir_.File(fmt::format("{:06d}.{}", page.documentIndex, imageFormat_.extension)),
        config_.debug);
    WriteImage(image, imageFile.path(), imageFormat_);

    auto raw = engine_.Recognize(imageFile.path(), language_, config_.details);
    if (config_.debug) {
        raw->Save(workDir_.File(fmt::format("{:06d}", page.documentIndex)));
    }
    rawSink_.Save(page, *raw);

    ExtractSettings settings;
    settings.rotation = page.rotation;
    settings.details = config_.details;
    settings.pageSize = image.size();
    return std::make_shared<const TextZone>(engine_.ExtractText(raw->text(), settings));
}

PipelineStats OCRPipeline::Run(PageSource& source, const std::vector<int>& pageNumbers,
                               Transcript& transcript) {
    auto startTime = std::chrono::high_resolution_clock::now();
    PipelineStats stats;
    stats.requestedPages = static_cast<int>(pageNumbers.size());

    std::vector<PageDescriptor> pages = source.Describe(pageNumbers);
    auto run = std::make_shared<RunState>(pages.size());
    ResultStore& store = run->store;
    CancellationController& cancellation = run->cancellation;

    // Published before the flag is read, so an Interrupt() racing with this
    // sees the run or is seen by it
    std::atomic_store(&activeRun_, run);
    if (interrupted_.load()) {
        cancellation.Interrupt();
    }

    WorkerPool workers(
        store, pages,
        [this, &source](const PageDescriptor& page) { return ProcessPage(source, page); },
        config_.onError, config_.numJobs);
    stats.workers = workers.size();

    OrderedAssembler assembler(store, cancellation, workers, pages, transcript);
    try {
        workers.Start();
        AssemblyStats assembled = assembler.Drain();
        stats.pagesWithText = assembled.pagesWithText;
        stats.pagesWithoutText = assembled.pagesWithoutText;
    } catch (const std::exception&) {
        // The transcript and page images are kept for diagnosis
        workDir_.Retain();
        cancellation.CancelRemaining(0);
        workers.Join();
        std::atomic_store(&activeRun_, std::shared_ptr<RunState>());
        throw;
    }
    std::atomic_store(&activeRun_, std::shared_ptr<RunState>());

    auto endTime = std::chrono::high_resolution_clock::now();
    stats.totalTime = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    return stats;
}

} // namespace ocrlayer
