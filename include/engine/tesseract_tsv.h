#pragma once

#include "zones/text_zone.h"
#include <opencv2/core.hpp>
#include <string>

namespace ocrlayer {

/**
 * @brief Build a zone tree from Tesseract's TSV output
 *
 * Rows are "level page_num block_num par_num line_num word_num left top width
 * height conf text" with levels 1 (page) to 5 (word). Blocks become Region
 * zones, paragraphs Paragraph zones. Coordinates are converted to a
 * bottom-left origin using pageSize; the tree is neither pruned nor rotated.
 *
 * @param tsv raw TSV text, header line optional
 * @param pageSize raster size; if empty the page row's size is used
 * @throws EngineOutputError on malformed rows
 */
TextZone ParseTesseractTsv(const std::string& tsv, cv::Size pageSize);

} // namespace ocrlayer
