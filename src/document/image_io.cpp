#include "document/image_io.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace ocrlayer {

namespace {

cv::Mat ToGray(const cv::Mat& image) {
    if (image.channels() == 1) {
        return image;
    }
    cv::Mat gray;
    cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return gray;
}

} // namespace

cv::Mat ConvertForEngine(const cv::Mat& image, int bitsPerPixel) {
    if (image.empty()) {
        throw Error("cannot convert an empty image");
    }
    switch (bitsPerPixel) {
        case 1: {
            cv::Mat binary;
            cv::threshold(ToGray(image), binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
            return binary;
        }
        case 8:
            return ToGray(image);
        default: {
            if (image.channels() == 3) {
                return image;
            }
            cv::Mat bgr;
            cv::cvtColor(image, bgr, image.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
            return bgr;
        }
    }
}

void WriteImage(const cv::Mat& image, const std::string& path, const ImageFormat& format) {
    cv::Mat converted = ConvertForEngine(image, format.bitsPerPixel);
    if (!cv::imwrite(path, converted, format.writeParams)) {
        throw Error("cannot write image " + path);
    }
    LOG_TRACE("Wrote {} ({}x{}, {} bpp)", path, converted.cols, converted.rows, format.bitsPerPixel);
}

} // namespace ocrlayer
