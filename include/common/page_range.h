#pragma once

#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Expand a page selection such as "17,37-42" into 1-based page numbers
 *
 * Ranges are inclusive and expand in ascending order; an inverted range
 * ("42-37") contributes nothing. Whitespace around numbers is ignored.
 *
 * @throws std::invalid_argument on malformed input
 */
std::vector<int> ParsePageNumbers(const std::string& pages);

/**
 * @brief Check 1-based page numbers against the document and drop duplicates
 *
 * Keeps the first occurrence of every page, in input order.
 *
 * @throws std::out_of_range if a number is outside [1, pageCount]
 */
std::vector<int> ValidatePageNumbers(const std::vector<int>& pageNumbers, int pageCount);

} // namespace ocrlayer
