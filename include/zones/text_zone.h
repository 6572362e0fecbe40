#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Granularity of the extracted text
 */
enum class TextDetails {
    Lines,
    Words,
    Chars,
};

/**
 * @brief Hidden-text zone types, outermost first
 */
enum class ZoneType {
    Page,
    Column,
    Region,
    Paragraph,
    Line,
    Word,
    Character,
};

const char* ZoneTypeName(ZoneType type);

/// Parse "lines", "words" or "chars"; throws std::invalid_argument
TextDetails ParseTextDetails(const std::string& name);
const char* TextDetailsName(TextDetails details);

/**
 * @brief Integer bounding box, bottom-left origin, x1/y1 exclusive
 */
struct BBox {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    BBox() = default;
    BBox(int x0_, int y0_, int x1_, int y1_) : x0(x0_), y0(y0_), x1(x1_), y1(y1_) {}

    int width() const { return x1 - x0; }
    int height() const { return y1 - y0; }
    bool empty() const { return x1 <= x0 || y1 <= y0; }

    /// Grow to cover other
    void Update(const BBox& other);

    /**
     * @brief Map from the upright raster frame to the page's stored frame
     * @param rotation page rotation in degrees (0, 90, 180, 270)
     * @param pageSize size of the upright raster
     */
    BBox Rotated(int rotation, const cv::Size& pageSize) const;

    /**
     * @brief Convert a top-left origin rectangle into a bottom-left origin box
     */
    static BBox FromTopLeft(int left, int top, int width, int height, int pageHeight);

    bool operator==(const BBox& other) const {
        return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
    }
};

/**
 * @brief Node of the structured OCR result of a page
 *
 * A zone holds either text (leaf) or child zones. The root is a Page zone
 * covering the whole page.
 */
class TextZone {
public:
    TextZone() = default;
    TextZone(ZoneType type, const BBox& bbox) : type_(type), bbox_(bbox) {}
    TextZone(ZoneType type, const BBox& bbox, std::string text)
        : type_(type), bbox_(bbox), text_(std::move(text)) {}

    ZoneType type() const { return type_; }
    const BBox& bbox() const { return bbox_; }
    const std::string& text() const { return text_; }
    const std::vector<TextZone>& children() const { return children_; }
    bool isLeaf() const { return children_.empty(); }

    void SetText(std::string text) { text_ = std::move(text); }
    TextZone& AddChild(TextZone child);

    /**
     * @brief Apply the page rotation to this zone and all descendants
     * @param rotation 0, 90, 180 or 270; other values throw std::invalid_argument
     * @param pageSize size of the upright raster the coordinates refer to
     */
    void Rotate(int rotation, const cv::Size& pageSize);

    /**
     * @brief Cut the tree at the requested granularity
     *
     * Lines: words are folded into their line's text. Words: unchanged.
     * Chars: words are split into equal-width character zones.
     */
    void ApplyDetails(TextDetails details);

    /// Remove subtrees that carry no text
    void Prune();

    /// Plain text, lines separated by newlines
    std::string PlainText() const;

    /// Leaf zones in document order
    std::vector<const TextZone*> Leaves() const;

    /**
     * @brief Render as an S-expression: (page 0 0 w h (line ... "text"))
     */
    std::string ToSexpr() const;

private:
    void WriteSexpr(std::string& out, int depth) const;
    void CollectText(std::string& out) const;

    ZoneType type_ = ZoneType::Page;
    BBox bbox_;
    std::string text_;
    std::vector<TextZone> children_;
};

} // namespace ocrlayer
