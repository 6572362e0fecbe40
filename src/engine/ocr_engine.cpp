#include "engine/ocr_engine.h"
#include "common/logger.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

namespace ocrlayer {

void RawOutput::Save(const std::string& prefix) const {
    std::string path = prefix + "." + extension_;
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw std::system_error(errno, std::generic_category(), "cannot open " + path);
    }
    ofs << text_;
    ofs.close();
    if (!ofs) {
        throw std::system_error(errno, std::generic_category(), "cannot write " + path);
    }
    LOG_DEBUG("Raw OCR output saved to {}", path);
}

} // namespace ocrlayer
