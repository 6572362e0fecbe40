#include "zones/text_zone.h"
#include "common/text_utils.h"

#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace ocrlayer {

// ==================== Names ====================

const char* ZoneTypeName(ZoneType type) {
    switch (type) {
        case ZoneType::Page:      return "page";
        case ZoneType::Column:    return "column";
        case ZoneType::Region:    return "region";
        case ZoneType::Paragraph: return "para";
        case ZoneType::Line:      return "line";
        case ZoneType::Word:      return "word";
        case ZoneType::Character: return "char";
    }
    return "page";
}

TextDetails ParseTextDetails(const std::string& name) {
    if (name == "lines") return TextDetails::Lines;
    if (name == "words") return TextDetails::Words;
    if (name == "chars") return TextDetails::Chars;
    throw std::invalid_argument("details must be one of: lines, words, chars");
}

const char* TextDetailsName(TextDetails details) {
    switch (details) {
        case TextDetails::Lines: return "lines";
        case TextDetails::Words: return "words";
        case TextDetails::Chars: return "chars";
    }
    return "words";
}

// ==================== BBox ====================

void BBox::Update(const BBox& other) {
    if (other.empty()) {
        return;
    }
    if (empty()) {
        *this = other;
        return;
    }
    x0 = std::min(x0, other.x0);
    y0 = std::min(y0, other.y0);
    x1 = std::max(x1, other.x1);
    y1 = std::max(y1, other.y1);
}

BBox BBox::Rotated(int rotation, const cv::Size& pageSize) const {
    const int w = pageSize.width;
    const int h = pageSize.height;
    switch (rotation) {
        case 0:
            return *this;
        case 90:
            return BBox(h - y1, x0, h - y0, x1);
        case 180:
            return BBox(w - x1, h - y1, w - x0, h - y0);
        case 270:
            return BBox(y0, w - x1, y1, w - x0);
        default:
            throw std::invalid_argument(fmt::format("invalid page rotation: {}", rotation));
    }
}

BBox BBox::FromTopLeft(int left, int top, int width, int height, int pageHeight) {
    return BBox(left, pageHeight - top - height, left + width, pageHeight - top);
}

// ==================== TextZone ====================

TextZone& TextZone::AddChild(TextZone child) {
    children_.push_back(std::move(child));
    return children_.back();
}

void TextZone::Rotate(int rotation, const cv::Size& pageSize) {
    bbox_ = bbox_.Rotated(rotation, pageSize);
    for (auto& child : children_) {
        child.Rotate(rotation, pageSize);
    }
}

void TextZone::ApplyDetails(TextDetails details) {
    if (details == TextDetails::Words) {
        return;
    }

    if (details == TextDetails::Lines && type_ == ZoneType::Line) {
        std::string joined;
        for (const auto* leaf : Leaves()) {
            if (leaf == this || leaf->text_.empty()) continue;
            if (!joined.empty()) joined += ' ';
            joined += leaf->text_;
        }
        if (!children_.empty()) {
            text_ = std::move(joined);
            children_.clear();
        }
        return;
    }

    if (details == TextDetails::Chars && type_ == ZoneType::Word) {
        if (!children_.empty() || text_.empty()) {
            return;
        }
        auto codepoints = text::DecodeUtf8(text_);
        const int n = static_cast<int>(codepoints.size());
        const int width = bbox_.width();
        for (int i = 0; i < n; ++i) {
            BBox box(bbox_.x0 + width * i / n, bbox_.y0,
                     bbox_.x0 + width * (i + 1) / n, bbox_.y1);
            children_.emplace_back(ZoneType::Character, box, text::EncodeUtf8(codepoints[i]));
        }
        text_.clear();
        return;
    }

    for (auto& child : children_) {
        child.ApplyDetails(details);
    }
}

void TextZone::Prune() {
    for (auto& child : children_) {
        child.Prune();
    }
    children_.erase(
        std::remove_if(children_.begin(), children_.end(), [](const TextZone& z) {
            return z.isLeaf() && text::Trim(z.text_).empty();
        }),
        children_.end());
}

std::vector<const TextZone*> TextZone::Leaves() const {
    std::vector<const TextZone*> leaves;
    if (isLeaf()) {
        leaves.push_back(this);
        return leaves;
    }
    for (const auto& child : children_) {
        auto sub = child.Leaves();
        leaves.insert(leaves.end(), sub.begin(), sub.end());
    }
    return leaves;
}

void TextZone::CollectText(std::string& out) const {
    if (isLeaf()) {
        out += text_;
        return;
    }
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) {
            switch (children_[i].type_) {
                case ZoneType::Character: break;
                case ZoneType::Word:      out += ' '; break;
                default:                  out += '\n'; break;
            }
        }
        children_[i].CollectText(out);
    }
}

std::string TextZone::PlainText() const {
    std::string out;
    CollectText(out);
    return out;
}

void TextZone::WriteSexpr(std::string& out, int depth) const {
    out += fmt::format("({} {} {} {} {}", ZoneTypeName(type_),
                       bbox_.x0, bbox_.y0, bbox_.x1, bbox_.y1);
    if (isLeaf()) {
        out += ' ';
        out += text::QuoteScriptString(text_);
    } else {
        for (const auto& child : children_) {
            out += '\n';
            out.append(depth + 1, ' ');
            child.WriteSexpr(out, depth + 1);
        }
    }
    out += ')';
}

std::string TextZone::ToSexpr() const {
    std::string out;
    WriteSexpr(out, 0);
    return out;
}

} // namespace ocrlayer
