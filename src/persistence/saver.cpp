#include "persistence/saver.h"
#include "persistence/pdf_text_layer.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ocrlayer {

// ==================== BundledSaver ====================

void BundledSaver::Save(const std::string& documentPath, const Transcript& transcript,
                        const std::vector<int>& pagesToSave) const {
    PdfWriter writer(documentPath);
    int pages = writer.ApplyTranscript(transcript);
    writer.SaveAs(savePath_, pagesToSave);
    LOG_INFO("Saved {} ({} page(s) with text)", savePath_, pages);
}

// ==================== IndirectSaver ====================

std::string IndirectSaver::PagePath(int pageNumber) const {
    fs::path index(indexPath_);
    std::string name = fmt::format("{}_{:04d}.pdf", index.stem().string(), pageNumber);
    return (index.parent_path() / name).string();
}

void IndirectSaver::Save(const std::string& documentPath, const Transcript& transcript,
                         const std::vector<int>& pagesToSave) const {
    PdfWriter writer(documentPath);
    writer.ApplyTranscript(transcript);

    std::vector<int> indices = pagesToSave;
    if (indices.empty()) {
        for (int i = 0; i < writer.PageCount(); ++i) {
            indices.push_back(i);
        }
    }

    std::vector<bool> hasText(writer.PageCount(), false);
    std::vector<std::string> identifiers(writer.PageCount());
    for (const auto& entry : transcript.entries()) {
        hasText[entry.page.documentIndex] = entry.zone != nullptr;
        identifiers[entry.page.documentIndex] = entry.page.identifier;
    }

    json index;
    index["source"] = fs::absolute(documentPath).string();
    index["pages"] = json::array();
    for (int documentIndex : indices) {
        const std::string pagePath = PagePath(documentIndex + 1);
        writer.SaveAs(pagePath, {documentIndex});

        json page;
        page["page"] = documentIndex + 1;
        page["file"] = fs::path(pagePath).filename().string();
        if (!identifiers[documentIndex].empty()) {
            page["id"] = identifiers[documentIndex];
        }
        page["text"] = static_cast<bool>(hasText[documentIndex]);
        index["pages"].push_back(page);
    }

    std::ofstream out(indexPath_, std::ios::trunc);
    out << index.dump(2) << '\n';
    out.close();
    if (!out) {
        throw PersistenceError("cannot write index " + indexPath_);
    }
    LOG_INFO("Saved {} ({} page file(s))", indexPath_, indices.size());
}

// ==================== ScriptSaver ====================

void ScriptSaver::Save(const std::string&, const Transcript& transcript,
                       const std::vector<int>&) const {
    std::error_code ec;
    fs::copy_file(transcript.path(), savePath_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PersistenceError(fmt::format("cannot copy {} to {}: {}", transcript.path(),
                                           savePath_, ec.message()));
    }
    LOG_INFO("Saved {}", savePath_);
}

// ==================== InPlaceSaver ====================

void InPlaceSaver::Save(const std::string& documentPath, const Transcript& transcript,
                        const std::vector<int>&) const {
    // Only the text layer changes; pages are never dropped from the input
    PdfWriter writer(documentPath);
    int pages = writer.ApplyTranscript(transcript);
    writer.SaveAs(documentPath);
    LOG_INFO("Updated {} ({} page(s) with text)", documentPath, pages);
}

} // namespace ocrlayer
