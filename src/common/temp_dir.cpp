#include "common/temp_dir.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace ocrlayer {

TempDir::TempDir(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        throw Error(fmt::format("cannot create temporary directory {}: {}",
                                tmpl, std::strerror(errno)));
    }
    path_ = buffer.data();
    LOG_DEBUG("Working directory: {}", path_);
}

TempDir::~TempDir() {
    if (closed_) {
        return;
    }
    std::string kept = Close();
    if (!kept.empty()) {
        LOG_INFO("Intermediate files were left in the '{}' directory.", kept);
    }
}

std::string TempDir::File(const std::string& name) const {
    return (fs::path(path_) / name).string();
}

std::string TempDir::Close() {
    if (closed_) {
        return retain_ ? path_ : std::string();
    }
    closed_ = true;

    if (retain_) {
        return path_;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove working directory {}: {}", path_, ec.message());
        return path_;
    }
    return std::string();
}

} // namespace ocrlayer
