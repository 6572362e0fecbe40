#include "common/page_range.h"
#include "common/logger.hpp"
#include "common/text_utils.h"

#include <fmt/format.h>
#include <cctype>
#include <set>
#include <stdexcept>

namespace ocrlayer {

namespace {

int ParseNumber(const std::string& token, const std::string& whole) {
    std::string t = text::Trim(token);
    if (t.empty() || t.size() > 9) {
        throw std::invalid_argument(fmt::format("Unable to parse page numbers: '{}'", whole));
    }
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(fmt::format("Unable to parse page numbers: '{}'", whole));
        }
    }
    return std::stoi(t);
}

} // namespace

std::vector<int> ParsePageNumbers(const std::string& pages) {
    std::vector<int> result;

    for (const auto& pageRange : text::Split(pages, ',')) {
        auto dash = pageRange.find('-');
        if (dash == std::string::npos) {
            result.push_back(ParseNumber(pageRange, pages));
            continue;
        }

        int first = ParseNumber(pageRange.substr(0, dash), pages);
        int last = ParseNumber(pageRange.substr(dash + 1), pages);
        for (int n = first; n <= last; ++n) {
            result.push_back(n);
        }
    }

    return result;
}

std::vector<int> ValidatePageNumbers(const std::vector<int>& pageNumbers, int pageCount) {
    std::vector<int> result;
    std::set<int> seen;
    result.reserve(pageNumbers.size());

    for (int n : pageNumbers) {
        if (n < 1 || n > pageCount) {
            throw std::out_of_range(fmt::format(
                "page {} is out of range (document has {} pages)", n, pageCount));
        }
        if (!seen.insert(n).second) {
            LOG_WARN("Page {} requested more than once, processing it once", n);
            continue;
        }
        result.push_back(n);
    }

    return result;
}

} // namespace ocrlayer
