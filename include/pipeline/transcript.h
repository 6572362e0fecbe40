#pragma once

#include "document/page_source.h"
#include "zones/text_zone.h"
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief One page of the transcript
 */
struct TranscriptEntry {
    PageDescriptor page;
    std::shared_ptr<const TextZone> zone;   // nullptr: no text for this page
};

/**
 * @brief Ordered per-page text-layer fragments of one document run
 *
 * Backed by a script file that grows as entries are appended:
 *
 *     remove-txt
 *     select 'p1'
 *     set-txt
 *     (page 0 0 2480 3508
 *      (line ...))
 *     .
 *
 * Entries must be appended in ascending index order, once per page. Only
 * the assembler thread touches a Transcript.
 */
class Transcript {
public:
    /**
     * @throws PersistenceError if the script file cannot be created
     */
    Transcript(const std::string& scriptPath, bool clearText);
    ~Transcript();

    Transcript(const Transcript&) = delete;
    Transcript& operator=(const Transcript&) = delete;

    /**
     * @brief Append the next page
     * @throws std::logic_error if page.index is not the next expected index
     *         or the transcript is closed
     * @throws PersistenceError on write failure
     */
    void Append(const PageDescriptor& page, std::shared_ptr<const TextZone> zone);

    /// Flush and close the script file; idempotent
    void Close();

    const std::vector<TranscriptEntry>& entries() const { return entries_; }
    const std::string& path() const { return path_; }
    bool clearText() const { return clearText_; }
    bool closed() const { return closed_; }

    /// 0-based document positions of the written pages, in order
    std::vector<int> DocumentIndices() const;

    /**
     * @brief Script fragment of one page
     * @param zone nullptr for a page without text
     */
    static std::string RenderFragment(const PageDescriptor& page, const TextZone* zone);

    /**
     * @brief "select 'id'" or, if the identifier cannot be quoted, "select N"
     */
    static std::string SelectCommand(const PageDescriptor& page);

private:
    void Write(const std::string& data);

    std::string path_;
    bool clearText_;
    std::ofstream out_;
    std::vector<TranscriptEntry> entries_;
    bool closed_ = false;
};

} // namespace ocrlayer
