#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Immutable description of one page of the work set
 */
struct PageDescriptor {
    int index = 0;           // 0-based position in the work set
    int documentIndex = 0;   // 0-based position in the document
    std::string identifier;  // document-scoped, UTF-8
    int rotation = 0;        // 0, 90, 180 or 270
    cv::Size pixelSize;      // size of the rendered (upright) raster

    int pageNumber() const { return documentIndex + 1; }
};

/**
 * @brief Source of page descriptors and page rasters
 *
 * Render() may be called from several worker threads at once.
 */
class PageSource {
public:
    virtual ~PageSource() = default;

    virtual int PageCount() const = 0;

    /**
     * @brief Describe the requested pages
     * @param pageNumbers 1-based, already validated against PageCount()
     * @return one descriptor per number, index i for pageNumbers[i]
     */
    virtual std::vector<PageDescriptor> Describe(const std::vector<int>& pageNumbers) = 0;

    /**
     * @brief Render a page
     * @throws NoImageError if the page has nothing to recognise
     * @throws DocumentError if the page cannot be rendered
     */
    virtual cv::Mat Render(const PageDescriptor& page) = 0;

    /// Release the underlying document; further calls are invalid
    virtual void Close() = 0;
};

} // namespace ocrlayer
