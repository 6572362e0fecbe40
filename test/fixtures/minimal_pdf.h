#pragma once

/**
 * @file minimal_pdf.h
 * @brief Writes small blank PDF files for document and persistence tests
 */

#include <fmt/format.h>
#include <fstream>
#include <string>
#include <vector>

namespace ocrlayer {
namespace testing_support {

/**
 * @brief Blank US Letter pages (612x792 pt) with the given /Rotate values
 */
inline void WriteBlankPdf(const std::string& path, const std::vector<int>& rotations) {
    const int pageCount = static_cast<int>(rotations.size());
    std::vector<std::string> objects;

    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    std::string kids;
    for (int i = 0; i < pageCount; ++i) {
        kids += fmt::format("{} 0 R ", 3 + i);
    }
    objects.push_back(fmt::format("<< /Type /Pages /Kids [{}] /Count {} >>", kids, pageCount));
    for (int i = 0; i < pageCount; ++i) {
        objects.push_back(fmt::format(
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Rotate {} >>", rotations[i]));
    }

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += fmt::format("{} 0 obj\n{}\nendobj\n", i + 1, objects[i]);
    }

    const size_t xref = pdf.size();
    pdf += fmt::format("xref\n0 {}\n", objects.size() + 1);
    pdf += "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        pdf += fmt::format("{:010d} 00000 n \n", offset);
    }
    pdf += fmt::format("trailer\n<< /Size {} /Root 1 0 R >>\nstartxref\n{}\n%%EOF\n",
                       objects.size() + 1, xref);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << pdf;
}

} // namespace testing_support
} // namespace ocrlayer
