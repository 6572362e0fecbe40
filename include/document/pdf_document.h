#pragma once

/**
 * @file pdf_document.h
 * @brief PDF page source - renders pages to cv::Mat with PDFium
 */

#include "document/page_source.h"
#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ocrlayer {

// ==================== Document error codes ====================

/**
 * @brief Document error codes (mapped from PDFium FPDF_ERR_*)
 */
namespace DocumentErrorCode {
    constexpr int SUCCESS = 0;

    // File / format errors (1002-1007)
    constexpr int FILE_ERROR = 1002;          // file cannot be opened
    constexpr int FORMAT_ERROR = 1003;        // not a PDF or corrupted
    constexpr int PASSWORD_REQUIRED = 1004;   // encrypted document
    constexpr int SECURITY_ERROR = 1005;      // unsupported security handler
    constexpr int PAGE_ERROR = 1006;          // page cannot be loaded
    constexpr int PAGE_SIZE_ERROR = 1007;     // raster exceeds the pixel limit

    // Runtime errors (2001-2004)
    constexpr int UNKNOWN_ERROR = 2001;
    constexpr int MEMORY_ERROR = 2002;        // bitmap allocation failed
    constexpr int WRITE_ERROR = 2004;         // saving failed
}

/// Map a PDFium FPDF_ERR_* value to a DocumentErrorCode
int MapPdfiumError(unsigned long pdfiumError);

std::string GetErrorMessage(int errorCode);

// ==================== Configuration ====================

enum class RenderMode {
    Mono,    // 1 bpp for the engine
    Color,   // 24 bpp BGR
};

/// Parse "mono" or "color"; throws std::invalid_argument
RenderMode ParseRenderMode(const std::string& name);
const char* RenderModeName(RenderMode mode);
int RenderBitsPerPixel(RenderMode mode);

/**
 * @brief PDF rendering configuration
 */
struct RenderConfig {
    int dpi = 300;
    RenderMode mode = RenderMode::Color;
    int64_t maxPixelsPerPage = 200000000;   // guard against absurd page sizes

    bool Validate(std::string& error_msg) const;
};

// ==================== PdfDocument ====================

/**
 * @brief PDF page source backed by PDFium
 *
 * The whole file is read into memory and loaded with FPDF_LoadMemDocument,
 * so the path may be rewritten once Close() has been called. PDFium is not
 * thread-safe; page loading and rendering are serialised with a mutex.
 */
class PdfDocument : public PageSource {
public:
    /**
     * @throws DocumentError if the file cannot be read or parsed
     */
    PdfDocument(const std::string& path, const RenderConfig& config = RenderConfig());
    ~PdfDocument() override;

    PdfDocument(const PdfDocument&) = delete;
    PdfDocument& operator=(const PdfDocument&) = delete;

    int PageCount() const override { return pageCount_; }
    std::vector<PageDescriptor> Describe(const std::vector<int>& pageNumbers) override;
    cv::Mat Render(const PageDescriptor& page) override;
    void Close() override;

    const std::string& path() const { return path_; }
    const RenderConfig& config() const { return config_; }

    /**
     * @brief Initialise the PDFium library (once per process)
     */
    static void InitializePdfium();

    /**
     * @brief Read a whole file into memory
     * @throws DocumentError(FILE_ERROR)
     */
    static std::vector<uint8_t> ReadFile(const std::string& path);

private:
    std::string PageLabel(int documentIndex) const;

    static std::once_flag init_flag_;
    static std::atomic<bool> initialized_;

    std::string path_;
    RenderConfig config_;
    std::vector<uint8_t> data_;   // must outlive doc_
    void* doc_ = nullptr;
    int pageCount_ = 0;

    // PDFium page loading and rendering are not thread-safe
    mutable std::mutex page_load_mutex_;
};

} // namespace ocrlayer
