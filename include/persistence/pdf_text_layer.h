#pragma once

/**
 * @file pdf_text_layer.h
 * @brief Writes OCR zones into PDF pages as invisible text (PDFium edit API)
 */

#include "pipeline/transcript.h"
#include "zones/text_zone.h"
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Editable in-memory copy of a PDF file
 */
class PdfWriter {
public:
    /**
     * @throws DocumentError if the file cannot be read or parsed
     */
    explicit PdfWriter(const std::string& path);
    ~PdfWriter();

    PdfWriter(const PdfWriter&) = delete;
    PdfWriter& operator=(const PdfWriter&) = delete;

    int PageCount() const;

    /**
     * @brief Remove invisible text objects from a page
     * @return number of objects removed
     */
    int RemoveHiddenText(int documentIndex);

    /**
     * @brief Add one invisible text object per leaf zone
     *
     * @param zone page zone tree, in raster pixels of the page's stored frame
     * @param pixelSize size of the upright raster the zones were extracted from
     * @param rotation page rotation in degrees
     * @return number of text objects added
     */
    int AddTextLayer(int documentIndex, const TextZone& zone, const cv::Size& pixelSize,
                     int rotation);

    /**
     * @brief Apply a whole transcript
     *
     * Every page with an entry loses its existing hidden text, with or
     * without zones to replace it. clearText extends the removal to all pages.
     *
     * @return number of pages that received a text layer
     */
    int ApplyTranscript(const Transcript& transcript);

    /**
     * @brief Write the document, or a subset of its pages, to path
     *
     * The file is written next to its destination and renamed into place.
     *
     * @param documentIndices 0-based pages to keep, in output order; empty: all
     * @throws PersistenceError
     */
    void SaveAs(const std::string& path, const std::vector<int>& documentIndices = {}) const;

private:
    std::string path_;
    std::vector<uint8_t> data_;   // must outlive doc_
    void* doc_ = nullptr;
};

} // namespace ocrlayer
