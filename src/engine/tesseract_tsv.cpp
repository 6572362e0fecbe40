#include "engine/tesseract_tsv.h"
#include "common/errors.h"
#include "common/text_utils.h"

#include <fmt/format.h>
#include <sstream>

namespace ocrlayer {

namespace {

enum TsvLevel {
    LEVEL_PAGE = 1,
    LEVEL_BLOCK = 2,
    LEVEL_PARA = 3,
    LEVEL_LINE = 4,
    LEVEL_WORD = 5,
};

struct TsvRow {
    int level = 0;
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;
    std::string text;
};

int ToInt(const std::string& field, size_t lineNo) {
    try {
        size_t used = 0;
        int value = std::stoi(field, &used);
        if (used != field.size()) {
            throw std::invalid_argument(field);
        }
        return value;
    } catch (const std::logic_error&) {
        throw EngineOutputError(fmt::format(
            "malformed TSV output at line {}: '{}' is not a number", lineNo, field));
    }
}

TsvRow ParseRow(const std::string& line, size_t lineNo) {
    auto fields = text::Split(line, '\t');
    if (fields.size() < 11) {
        throw EngineOutputError(fmt::format(
            "malformed TSV output at line {}: expected 12 columns, got {}", lineNo, fields.size()));
    }

    TsvRow row;
    row.level = ToInt(fields[0], lineNo);
    row.left = ToInt(fields[6], lineNo);
    row.top = ToInt(fields[7], lineNo);
    row.width = ToInt(fields[8], lineNo);
    row.height = ToInt(fields[9], lineNo);
    if (fields.size() > 11) {
        row.text = text::SanitizeUtf8(fields[11]);
    }
    return row;
}

} // namespace

TextZone ParseTesseractTsv(const std::string& tsv, cv::Size pageSize) {
    TextZone page(ZoneType::Page, BBox(0, 0, pageSize.width, pageSize.height));
    TextZone* block = nullptr;
    TextZone* para = nullptr;
    TextZone* line = nullptr;

    std::istringstream in(tsv);
    std::string raw;
    size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        if (raw.empty() || raw.compare(0, 5, "level") == 0) {
            continue;
        }

        TsvRow row = ParseRow(raw, lineNo);
        const int pageHeight = pageSize.height;

        switch (row.level) {
            case LEVEL_PAGE:
                if (pageSize.empty()) {
                    pageSize = cv::Size(row.width, row.height);
                    page = TextZone(ZoneType::Page, BBox(0, 0, row.width, row.height));
                    block = para = line = nullptr;
                }
                break;
            case LEVEL_BLOCK:
                block = &page.AddChild(TextZone(ZoneType::Region,
                    BBox::FromTopLeft(row.left, row.top, row.width, row.height, pageHeight)));
                para = line = nullptr;
                break;
            case LEVEL_PARA:
                if (block == nullptr) {
                    throw EngineOutputError(fmt::format(
                        "malformed TSV output at line {}: paragraph outside a block", lineNo));
                }
                para = &block->AddChild(TextZone(ZoneType::Paragraph,
                    BBox::FromTopLeft(row.left, row.top, row.width, row.height, pageHeight)));
                line = nullptr;
                break;
            case LEVEL_LINE:
                if (para == nullptr) {
                    throw EngineOutputError(fmt::format(
                        "malformed TSV output at line {}: line outside a paragraph", lineNo));
                }
                line = &para->AddChild(TextZone(ZoneType::Line,
                    BBox::FromTopLeft(row.left, row.top, row.width, row.height, pageHeight)));
                break;
            case LEVEL_WORD:
                if (line == nullptr) {
                    throw EngineOutputError(fmt::format(
                        "malformed TSV output at line {}: word outside a line", lineNo));
                }
                line->AddChild(TextZone(ZoneType::Word,
                    BBox::FromTopLeft(row.left, row.top, row.width, row.height, pageHeight),
                    text::Trim(row.text)));
                break;
            default:
                throw EngineOutputError(fmt::format(
                    "malformed TSV output at line {}: unknown level {}", lineNo, row.level));
        }
    }

    return page;
}

} // namespace ocrlayer
