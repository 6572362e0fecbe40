#include "persistence/pdf_text_layer.h"
#include "document/pdf_document.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/text_utils.h"

#include <fpdfview.h>
#include <fpdf_edit.h>
#include <fpdf_ppo.h>
#include <fpdf_save.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <type_traits>

namespace ocrlayer {

namespace {

using ScopedPage = std::unique_ptr<std::remove_pointer<FPDF_PAGE>::type, decltype(&FPDF_ClosePage)>;

/// FPDF_FILEWRITE that streams into a file
struct FileWriter : FPDF_FILEWRITE {
    std::ofstream out;

    explicit FileWriter(const std::string& path) : out(path, std::ios::binary | std::ios::trunc) {
        version = 1;
        WriteBlock = &FileWriter::WriteBlockCallback;
    }

    static int WriteBlockCallback(FPDF_FILEWRITE* self, const void* data, unsigned long size) {
        auto* writer = static_cast<FileWriter*>(self);
        writer->out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
        return writer->out ? 1 : 0;
    }
};

void WriteDocument(FPDF_DOCUMENT doc, const std::string& path) {
    const std::string tmpPath = path + ".tmp";
    {
        FileWriter writer(tmpPath);
        if (!writer.out) {
            throw PersistenceError(fmt::format("{}: {}",
                                               GetErrorMessage(DocumentErrorCode::WRITE_ERROR), tmpPath));
        }
        bool saved = FPDF_SaveAsCopy(doc, &writer, FPDF_NO_INCREMENTAL);
        writer.out.close();
        if (!saved || writer.out.fail()) {
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            throw PersistenceError(fmt::format("{}: {}",
                                               GetErrorMessage(DocumentErrorCode::WRITE_ERROR), path));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        throw PersistenceError(fmt::format("cannot replace {}: {}", path, ec.message()));
    }
    LOG_DEBUG("Saved {}", path);
}

std::string PageRange(const std::vector<int>& documentIndices) {
    std::string range;
    for (int index : documentIndices) {
        if (!range.empty()) {
            range += ',';
        }
        range += std::to_string(index + 1);
    }
    return range;
}

/// Maps a zone box (raster pixels, stored frame) to PDF user space
struct PageGeometry {
    float left = 0;
    float bottom = 0;
    float scaleX = 1;
    float scaleY = 1;
};

PageGeometry ComputeGeometry(FPDF_PAGE page, const cv::Size& pixelSize, int rotation) {
    const bool swapped = rotation % 180 != 0;
    float l = 0, b = 0, r = 0, t = 0;
    if (!FPDFPage_GetCropBox(page, &l, &b, &r, &t) && !FPDFPage_GetMediaBox(page, &l, &b, &r, &t)) {
        // Page sizes from FPDF_GetPage* already include the rotation
        l = 0;
        b = 0;
        r = static_cast<float>(swapped ? FPDF_GetPageHeight(page) : FPDF_GetPageWidth(page));
        t = static_cast<float>(swapped ? FPDF_GetPageWidth(page) : FPDF_GetPageHeight(page));
    }

    const int storedWidth = swapped ? pixelSize.height : pixelSize.width;
    const int storedHeight = swapped ? pixelSize.width : pixelSize.height;

    PageGeometry geometry;
    geometry.left = l;
    geometry.bottom = b;
    geometry.scaleX = storedWidth > 0 ? (r - l) / storedWidth : 1.0f;
    geometry.scaleY = storedHeight > 0 ? (t - b) / storedHeight : 1.0f;
    return geometry;
}

/**
 * Scale the unit text object to fill the box along the reading direction,
 * then turn it so it reads upright once the page rotation is applied.
 */
bool PlaceText(FPDF_PAGEOBJECT text, const BBox& box, const PageGeometry& geometry, int rotation) {
    float ol = 0, ob = 0, orr = 0, ot = 0;
    if (!FPDFPageObj_GetBounds(text, &ol, &ob, &orr, &ot) || orr <= ol || ot <= ob) {
        return false;
    }

    const float x0 = geometry.left + box.x0 * geometry.scaleX;
    const float y0 = geometry.bottom + box.y0 * geometry.scaleY;
    const float x1 = geometry.left + box.x1 * geometry.scaleX;
    const float y1 = geometry.bottom + box.y1 * geometry.scaleY;

    const bool swapped = rotation % 180 != 0;
    const float along = swapped ? y1 - y0 : x1 - x0;
    const float across = swapped ? x1 - x0 : y1 - y0;
    const float sx = along / (orr - ol);
    const float sy = across / (ot - ob);
    FPDFPageObj_Transform(text, sx, 0, 0, sy, -ol * sx, -ob * sy);

    switch (rotation) {
        case 90:
            FPDFPageObj_Transform(text, 0, 1, -1, 0, x1, y0);
            break;
        case 180:
            FPDFPageObj_Transform(text, -1, 0, 0, -1, x1, y1);
            break;
        case 270:
            FPDFPageObj_Transform(text, 0, -1, 1, 0, x0, y1);
            break;
        default:
            FPDFPageObj_Transform(text, 1, 0, 0, 1, x0, y0);
            break;
    }
    return true;
}

} // namespace

// ==================== PdfWriter ====================

PdfWriter::PdfWriter(const std::string& path) : path_(path) {
    PdfDocument::InitializePdfium();
    data_ = PdfDocument::ReadFile(path_);

    FPDF_DOCUMENT doc = FPDF_LoadMemDocument(data_.data(), static_cast<int>(data_.size()), nullptr);
    if (!doc) {
        int code = MapPdfiumError(FPDF_GetLastError());
        throw DocumentError(code, fmt::format("{}: {}", GetErrorMessage(code), text::SmartRepr(path_)));
    }
    doc_ = doc;
}

PdfWriter::~PdfWriter() {
    if (doc_) {
        FPDF_CloseDocument(static_cast<FPDF_DOCUMENT>(doc_));
    }
}

int PdfWriter::PageCount() const {
    return FPDF_GetPageCount(static_cast<FPDF_DOCUMENT>(doc_));
}

int PdfWriter::RemoveHiddenText(int documentIndex) {
    ScopedPage page(FPDF_LoadPage(static_cast<FPDF_DOCUMENT>(doc_), documentIndex), &FPDF_ClosePage);
    if (!page) {
        throw DocumentError(DocumentErrorCode::PAGE_ERROR,
                            fmt::format("Failed to load page {}", documentIndex + 1));
    }

    int removed = 0;
    for (int i = FPDFPage_CountObjects(page.get()) - 1; i >= 0; --i) {
        FPDF_PAGEOBJECT object = FPDFPage_GetObject(page.get(), i);
        if (FPDFPageObj_GetType(object) != FPDF_PAGEOBJ_TEXT ||
            FPDFTextObj_GetTextRenderMode(object) != FPDF_TEXTRENDERMODE_INVISIBLE) {
            continue;
        }
        if (FPDFPage_RemoveObject(page.get(), object)) {
            FPDFPageObj_Destroy(object);
            ++removed;
        }
    }

    if (removed > 0 && !FPDFPage_GenerateContent(page.get())) {
        throw PersistenceError(fmt::format("cannot update page {}", documentIndex + 1));
    }
    if (removed > 0) {
        LOG_DEBUG("Removed {} hidden text object(s) from page {}", removed, documentIndex + 1);
    }
    return removed;
}

int PdfWriter::AddTextLayer(int documentIndex, const TextZone& zone, const cv::Size& pixelSize,
                            int rotation) {
    FPDF_DOCUMENT doc = static_cast<FPDF_DOCUMENT>(doc_);
    ScopedPage page(FPDF_LoadPage(doc, documentIndex), &FPDF_ClosePage);
    if (!page) {
        throw DocumentError(DocumentErrorCode::PAGE_ERROR,
                            fmt::format("Failed to load page {}", documentIndex + 1));
    }

    const PageGeometry geometry = ComputeGeometry(page.get(), pixelSize, rotation);
    int added = 0;

    for (const TextZone* leaf : zone.Leaves()) {
        if (leaf->bbox().empty() || text::Trim(leaf->text()).empty()) {
            continue;
        }
        auto utf16 = text::Utf8ToUtf16(leaf->text());
        FPDF_PAGEOBJECT object = FPDFPageObj_NewTextObj(doc, "Helvetica", 1.0f);
        if (!object) {
            throw PersistenceError("cannot create a text object");
        }
        FPDFText_SetText(object, utf16.data());
        FPDFTextObj_SetTextRenderMode(object, FPDF_TEXTRENDERMODE_INVISIBLE);

        if (!PlaceText(object, leaf->bbox(), geometry, rotation)) {
            FPDFPageObj_Destroy(object);
            continue;
        }
        // The page owns the object from here on
        FPDFPage_InsertObject(page.get(), object);
        ++added;
    }

    if (added > 0 && !FPDFPage_GenerateContent(page.get())) {
        throw PersistenceError(fmt::format("cannot update page {}", documentIndex + 1));
    }
    LOG_TRACE("Page {}: {} text object(s)", documentIndex + 1, added);
    return added;
}

int PdfWriter::ApplyTranscript(const Transcript& transcript) {
    if (transcript.clearText()) {
        // remove-txt applies to every page, not only the processed ones
        for (int i = 0; i < PageCount(); ++i) {
            RemoveHiddenText(i);
        }
    }

    int pages = 0;
    for (const auto& entry : transcript.entries()) {
        // set-txt replaces the page's layer, an entry without zones empties it
        if (!transcript.clearText()) {
            RemoveHiddenText(entry.page.documentIndex);
        }
        if (!entry.zone) {
            continue;
        }
        AddTextLayer(entry.page.documentIndex, *entry.zone, entry.page.pixelSize, entry.page.rotation);
        ++pages;
    }
    return pages;
}

void PdfWriter::SaveAs(const std::string& path, const std::vector<int>& documentIndices) const {
    FPDF_DOCUMENT doc = static_cast<FPDF_DOCUMENT>(doc_);
    if (documentIndices.empty()) {
        WriteDocument(doc, path);
        return;
    }

    FPDF_DOCUMENT subset = FPDF_CreateNewDocument();
    if (!subset) {
        throw PersistenceError("cannot create a PDF document");
    }
    const std::string range = PageRange(documentIndices);
    if (!FPDF_ImportPages(subset, doc, range.c_str(), 0)) {
        FPDF_CloseDocument(subset);
        throw PersistenceError(fmt::format("cannot copy pages {} of {}", range, path_));
    }
    try {
        WriteDocument(subset, path);
    } catch (const PersistenceError&) {
        FPDF_CloseDocument(subset);
        throw;
    }
    FPDF_CloseDocument(subset);
}

} // namespace ocrlayer
