#pragma once

#include "engine/ocr_engine.h"
#include <memory>
#include <string>
#include <vector>

namespace ocrlayer {

constexpr const char* DEFAULT_ENGINE = "tesseract";

/// Names of the built-in back-ends, sorted
std::vector<std::string> ListEngineNames();

/**
 * @brief Instantiate a back-end by name
 * @throws EngineConfigError for an unknown name or property
 * @throws EngineNotFoundError if the back-end's tool is unusable
 */
std::unique_ptr<OcrEngine> CreateEngine(const std::string& name,
                                        const EngineProperties& properties = EngineProperties());

} // namespace ocrlayer
