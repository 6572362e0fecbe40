#include "document/pdf_document.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/text_utils.h"

#include <fpdfview.h>
#include <fpdf_doc.h>
#include <fpdf_edit.h>
#include <opencv2/imgproc.hpp>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace ocrlayer {

namespace {

using ScopedPage = std::unique_ptr<std::remove_pointer<FPDF_PAGE>::type, decltype(&FPDF_ClosePage)>;
using ScopedBitmap = std::unique_ptr<std::remove_pointer<FPDF_BITMAP>::type, decltype(&FPDFBitmap_Destroy)>;

} // namespace

// ==================== Error handling ====================

int MapPdfiumError(unsigned long pdfiumError) {
    switch (pdfiumError) {
        case FPDF_ERR_SUCCESS:  return DocumentErrorCode::SUCCESS;
        case FPDF_ERR_FILE:     return DocumentErrorCode::FILE_ERROR;
        case FPDF_ERR_FORMAT:   return DocumentErrorCode::FORMAT_ERROR;
        case FPDF_ERR_PASSWORD: return DocumentErrorCode::PASSWORD_REQUIRED;
        case FPDF_ERR_SECURITY: return DocumentErrorCode::SECURITY_ERROR;
        case FPDF_ERR_PAGE:     return DocumentErrorCode::PAGE_ERROR;
        default:                return DocumentErrorCode::UNKNOWN_ERROR;
    }
}

std::string GetErrorMessage(int errorCode) {
    switch (errorCode) {
        case DocumentErrorCode::SUCCESS:
            return "Success";
        case DocumentErrorCode::FILE_ERROR:
            return "PDF file cannot be opened";
        case DocumentErrorCode::FORMAT_ERROR:
            return "Invalid PDF format or corrupted file";
        case DocumentErrorCode::PASSWORD_REQUIRED:
            return "PDF is password protected";
        case DocumentErrorCode::SECURITY_ERROR:
            return "PDF security policy not supported";
        case DocumentErrorCode::PAGE_ERROR:
            return "PDF page not found";
        case DocumentErrorCode::PAGE_SIZE_ERROR:
            return "PDF page size exceeds maximum limit";
        case DocumentErrorCode::MEMORY_ERROR:
            return "Memory allocation failed during PDF rendering";
        case DocumentErrorCode::WRITE_ERROR:
            return "PDF file cannot be written";
        case DocumentErrorCode::UNKNOWN_ERROR:
        default:
            return "Unknown PDF processing error";
    }
}

// ==================== RenderConfig ====================

RenderMode ParseRenderMode(const std::string& name) {
    if (name == "mono") return RenderMode::Mono;
    if (name == "color") return RenderMode::Color;
    throw std::invalid_argument("render mode must be one of: mono, color");
}

const char* RenderModeName(RenderMode mode) {
    return mode == RenderMode::Mono ? "mono" : "color";
}

int RenderBitsPerPixel(RenderMode mode) {
    return mode == RenderMode::Mono ? 1 : 24;
}

bool RenderConfig::Validate(std::string& error_msg) const {
    if (dpi < 72 || dpi > 600) {
        error_msg = "dpi must be in range [72, 600]";
        return false;
    }
    if (maxPixelsPerPage <= 0) {
        error_msg = "maxPixelsPerPage must be positive";
        return false;
    }
    return true;
}

// ==================== PdfDocument ====================

std::once_flag PdfDocument::init_flag_;
std::atomic<bool> PdfDocument::initialized_{false};

void PdfDocument::InitializePdfium() {
    std::call_once(init_flag_, []() {
        LOG_DEBUG("Initializing PDFium library...");
        FPDF_InitLibrary();
        initialized_.store(true);
    });
}

std::vector<uint8_t> PdfDocument::ReadFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw DocumentError(DocumentErrorCode::FILE_ERROR,
                            fmt::format("{}: {}", GetErrorMessage(DocumentErrorCode::FILE_ERROR),
                                        text::SmartRepr(path)));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                              std::istreambuf_iterator<char>());
    return data;
}

PdfDocument::PdfDocument(const std::string& path, const RenderConfig& config)
    : path_(path), config_(config) {
    std::string error_msg;
    if (!config_.Validate(error_msg)) {
        throw std::invalid_argument("invalid render configuration: " + error_msg);
    }

    InitializePdfium();
    data_ = ReadFile(path_);

    std::lock_guard<std::mutex> lock(page_load_mutex_);
    FPDF_DOCUMENT doc = FPDF_LoadMemDocument(data_.data(), static_cast<int>(data_.size()), nullptr);
    if (!doc) {
        unsigned long pdfiumError = FPDF_GetLastError();
        int code = MapPdfiumError(pdfiumError);
        LOG_ERROR("Failed to load PDF: {} (PDFium error: {})", GetErrorMessage(code), pdfiumError);
        throw DocumentError(code, fmt::format("{}: {}", GetErrorMessage(code), text::SmartRepr(path_)));
    }
    doc_ = doc;
    pageCount_ = FPDF_GetPageCount(doc);
    LOG_INFO("PDF loaded: {} ({} pages)", path_, pageCount_);
}

PdfDocument::~PdfDocument() {
    Close();
}

void PdfDocument::Close() {
    std::lock_guard<std::mutex> lock(page_load_mutex_);
    if (doc_) {
        FPDF_CloseDocument(static_cast<FPDF_DOCUMENT>(doc_));
        doc_ = nullptr;
        LOG_DEBUG("PDF closed: {}", path_);
    }
    data_.clear();
    data_.shrink_to_fit();
}

std::string PdfDocument::PageLabel(int documentIndex) const {
    FPDF_DOCUMENT doc = static_cast<FPDF_DOCUMENT>(doc_);
    unsigned long bytes = FPDF_GetPageLabel(doc, documentIndex, nullptr, 0);
    if (bytes <= 2) {
        return std::string();
    }
    std::vector<unsigned char> buffer(bytes);
    FPDF_GetPageLabel(doc, documentIndex, buffer.data(), bytes);
    return text::Utf16LeToUtf8(buffer.data(), bytes);
}

std::vector<PageDescriptor> PdfDocument::Describe(const std::vector<int>& pageNumbers) {
    std::vector<PageDescriptor> pages;
    pages.reserve(pageNumbers.size());
    std::set<std::string> seen;

    std::lock_guard<std::mutex> lock(page_load_mutex_);
    if (!doc_) {
        throw DocumentError(DocumentErrorCode::UNKNOWN_ERROR, "PDF document is closed");
    }
    FPDF_DOCUMENT doc = static_cast<FPDF_DOCUMENT>(doc_);
    const double scale = config_.dpi / 72.0;

    for (size_t i = 0; i < pageNumbers.size(); ++i) {
        const int documentIndex = pageNumbers[i] - 1;
        FPDF_PAGE page = FPDF_LoadPage(doc, documentIndex);
        if (!page) {
            throw DocumentError(DocumentErrorCode::PAGE_ERROR,
                                fmt::format("Failed to load page {}", pageNumbers[i]));
        }

        PageDescriptor desc;
        desc.index = static_cast<int>(i);
        desc.documentIndex = documentIndex;
        const int quarterTurns = FPDFPage_GetRotation(page);
        desc.rotation = quarterTurns > 0 ? (quarterTurns % 4) * 90 : 0;
        desc.pixelSize = cv::Size(static_cast<int>(FPDF_GetPageWidth(page) * scale),
                                  static_cast<int>(FPDF_GetPageHeight(page) * scale));
        FPDF_ClosePage(page);

        // Labels are optional and may repeat; identifiers must not
        desc.identifier = PageLabel(documentIndex);
        if (desc.identifier.empty() || seen.count(desc.identifier)) {
            desc.identifier = fmt::format("p{}", desc.pageNumber());
        }
        seen.insert(desc.identifier);

        LOG_TRACE("Page {}: id={} rotation={} size={}x{}", desc.pageNumber(), desc.identifier,
                  desc.rotation, desc.pixelSize.width, desc.pixelSize.height);
        pages.push_back(std::move(desc));
    }
    return pages;
}

cv::Mat PdfDocument::Render(const PageDescriptor& desc) {
    const int width = desc.pixelSize.width;
    const int height = desc.pixelSize.height;
    if (width <= 0 || height <= 0) {
        throw NoImageError(fmt::format("page {} has an empty media box", desc.pageNumber()));
    }
    const int64_t totalPixels = static_cast<int64_t>(width) * height;
    if (totalPixels > config_.maxPixelsPerPage) {
        throw DocumentError(DocumentErrorCode::PAGE_SIZE_ERROR,
                            fmt::format("Page {} size {}x{} ({} pixels) exceeds limit {}",
                                        desc.pageNumber(), width, height, totalPixels,
                                        config_.maxPixelsPerPage));
    }

    auto startTime = std::chrono::high_resolution_clock::now();
    cv::Mat image;
    {
        // PDFium rendering is not thread-safe; the whole sequence is locked
        std::lock_guard<std::mutex> lock(page_load_mutex_);
        if (!doc_) {
            throw DocumentError(DocumentErrorCode::UNKNOWN_ERROR, "PDF document is closed");
        }

        ScopedPage page(FPDF_LoadPage(static_cast<FPDF_DOCUMENT>(doc_), desc.documentIndex),
                        &FPDF_ClosePage);
        if (!page) {
            throw DocumentError(DocumentErrorCode::PAGE_ERROR,
                                fmt::format("Failed to load page {}", desc.pageNumber()));
        }

        ScopedBitmap bitmap(FPDFBitmap_Create(width, height, 0), &FPDFBitmap_Destroy);
        if (!bitmap) {
            throw DocumentError(DocumentErrorCode::MEMORY_ERROR,
                                fmt::format("Failed to allocate bitmap for page {} ({}x{})",
                                            desc.pageNumber(), width, height));
        }

        FPDFBitmap_FillRect(bitmap.get(), 0, 0, width, height, 0xFFFFFFFF);
        FPDF_RenderPageBitmap(bitmap.get(), page.get(), 0, 0, width, height, 0, 0);

        // PDFium produces BGRA; convert before the bitmap is released
        cv::Mat bgraImage(height, width, CV_8UC4, FPDFBitmap_GetBuffer(bitmap.get()),
                          FPDFBitmap_GetStride(bitmap.get()));
        if (config_.mode == RenderMode::Mono) {
            cv::cvtColor(bgraImage, image, cv::COLOR_BGRA2GRAY);
        } else {
            cv::cvtColor(bgraImage, image, cv::COLOR_BGRA2BGR);
        }
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    LOG_DEBUG("Rendered page {}: {}x{} in {:.2f}ms", desc.pageNumber(), width, height,
              std::chrono::duration<double, std::milli>(endTime - startTime).count());
    return image;
}

} // namespace ocrlayer
