#pragma once

#include <atomic>
#include <string>

namespace ocrlayer {

/**
 * @brief Temporary working directory with diagnostic retention
 *
 * Created with mkdtemp() under the system temporary directory. The
 * directory and its contents are removed on destruction unless Retain() was
 * called; a retained directory is reported through the log.
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "ocrlayer.");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    /// Join a file name onto the directory
    std::string File(const std::string& name) const;

    /// Keep the directory after destruction (debug mode, aborted runs)
    void Retain() { retain_ = true; }
    bool retained() const { return retain_; }

    /**
     * @brief Remove the directory now unless retained
     * @return the kept path, or an empty string if it was removed
     */
    std::string Close();

private:
    std::string path_;
    std::atomic<bool> retain_{false};
    bool closed_ = false;
};

} // namespace ocrlayer
