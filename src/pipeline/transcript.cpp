#include "pipeline/transcript.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/text_utils.h"

#include <fmt/format.h>
#include <stdexcept>

namespace ocrlayer {

namespace {

bool IsQuotable(const std::string& identifier) {
    if (identifier.empty() || !text::IsValidUtf8(identifier)) {
        return false;
    }
    for (unsigned char c : identifier) {
        if (c < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

} // namespace

Transcript::Transcript(const std::string& scriptPath, bool clearText)
    : path_(scriptPath), clearText_(clearText), out_(scriptPath, std::ios::binary | std::ios::trunc) {
    if (!out_) {
        throw PersistenceError("cannot create transcript " + path_);
    }
    if (clearText_) {
        Write("remove-txt\n");
    }
}

Transcript::~Transcript() {
    if (out_.is_open()) {
        out_.close();
    }
}

std::string Transcript::SelectCommand(const PageDescriptor& page) {
    if (!IsQuotable(page.identifier)) {
        LOG_WARN("Cannot use the identifier of page {} in the script, selecting it by number",
                 page.pageNumber());
        return fmt::format("select {}\n", page.pageNumber());
    }
    std::string quoted;
    quoted.reserve(page.identifier.size() + 2);
    for (char c : page.identifier) {
        if (c == '\\' || c == '\'') {
            quoted += '\\';
        }
        quoted += c;
    }
    return fmt::format("select '{}'\n", quoted);
}

std::string Transcript::RenderFragment(const PageDescriptor& page, const TextZone* zone) {
    std::string fragment = SelectCommand(page);
    fragment += "set-txt\n";
    if (zone != nullptr) {
        fragment += zone->ToSexpr();
    }
    fragment += "\n.\n\n";
    return fragment;
}

void Transcript::Write(const std::string& data) {
    out_ << data;
    out_.flush();
    if (!out_) {
        throw PersistenceError("cannot write transcript " + path_);
    }
}

void Transcript::Append(const PageDescriptor& page, std::shared_ptr<const TextZone> zone) {
    if (closed_) {
        throw std::logic_error("transcript is closed");
    }
    if (page.index != static_cast<int>(entries_.size())) {
        throw std::logic_error(fmt::format("transcript expects page index {}, got {}",
                                           entries_.size(), page.index));
    }
    Write(RenderFragment(page, zone.get()));
    entries_.push_back(TranscriptEntry{page, std::move(zone)});
}

void Transcript::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    out_.flush();
    out_.close();
    if (out_.fail()) {
        throw PersistenceError("cannot close transcript " + path_);
    }
    LOG_DEBUG("Transcript closed: {} page(s) in {}", entries_.size(), path_);
}

std::vector<int> Transcript::DocumentIndices() const {
    std::vector<int> indices;
    indices.reserve(entries_.size());
    for (const auto& entry : entries_) {
        indices.push_back(entry.page.documentIndex);
    }
    return indices;
}

} // namespace ocrlayer
