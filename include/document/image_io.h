#pragma once

#include "engine/ocr_engine.h"
#include <opencv2/core.hpp>
#include <string>

namespace ocrlayer {

/**
 * @brief Convert a raster to the engine's pixel format
 *
 * 1 bpp: Otsu-thresholded 8-bit image (0 or 255). 8 bpp: grayscale.
 * 24 bpp: BGR.
 */
cv::Mat ConvertForEngine(const cv::Mat& image, int bitsPerPixel);

/**
 * @brief Write a raster in the engine's input format
 * @throws Error if the file cannot be written
 */
void WriteImage(const cv::Mat& image, const std::string& path, const ImageFormat& format);

} // namespace ocrlayer
