#pragma once

#include "pipeline/transcript.h"
#include <memory>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Where the results of a run go
 *
 * Exactly one strategy is selected per run. In-place strategies rewrite the
 * input document, so the caller releases its handle on it first.
 */
class Saver {
public:
    virtual ~Saver() = default;

    virtual std::string Name() const = 0;
    virtual bool InPlace() const { return false; }

    /**
     * @param documentPath the input PDF
     * @param transcript closed transcript of the run
     * @param pagesToSave 0-based pages to keep; empty: every page
     * @throws PersistenceError, DocumentError
     */
    virtual void Save(const std::string& documentPath, const Transcript& transcript,
                      const std::vector<int>& pagesToSave) const = 0;
};

/// New PDF with the text layer
class BundledSaver : public Saver {
public:
    explicit BundledSaver(std::string savePath) : savePath_(std::move(savePath)) {}

    std::string Name() const override { return "bundled"; }
    void Save(const std::string& documentPath, const Transcript& transcript,
              const std::vector<int>& pagesToSave) const override;

private:
    std::string savePath_;
};

/**
 * @brief One PDF per page plus a JSON index
 *
 * Page files are written next to the index as <stem>_<page>.pdf.
 */
class IndirectSaver : public Saver {
public:
    explicit IndirectSaver(std::string indexPath) : indexPath_(std::move(indexPath)) {}

    std::string Name() const override { return "indirect"; }
    void Save(const std::string& documentPath, const Transcript& transcript,
              const std::vector<int>& pagesToSave) const override;

    /// Path of the file holding page pageNumber (1-based)
    std::string PagePath(int pageNumber) const;

private:
    std::string indexPath_;
};

/// Copy of the transcript script
class ScriptSaver : public Saver {
public:
    explicit ScriptSaver(std::string savePath) : savePath_(std::move(savePath)) {}

    std::string Name() const override { return "script"; }
    void Save(const std::string& documentPath, const Transcript& transcript,
              const std::vector<int>& pagesToSave) const override;

private:
    std::string savePath_;
};

/**
 * @brief Rewrites the input document
 *
 * pagesToSave is ignored: every page of the input is kept.
 */
class InPlaceSaver : public Saver {
public:
    std::string Name() const override { return "in-place"; }
    bool InPlace() const override { return true; }
    void Save(const std::string& documentPath, const Transcript& transcript,
              const std::vector<int>& pagesToSave) const override;
};

/// Changes nothing
class DryRunSaver : public Saver {
public:
    std::string Name() const override { return "dry-run"; }
    void Save(const std::string&, const Transcript&, const std::vector<int>&) const override {}
};

} // namespace ocrlayer
