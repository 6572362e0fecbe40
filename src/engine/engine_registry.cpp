#include "engine/engine_registry.h"
#include "engine/tesseract_engine.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <functional>
#include <map>

namespace ocrlayer {

namespace {

using EngineFactory = std::function<std::unique_ptr<OcrEngine>(const EngineProperties&)>;

const std::map<std::string, EngineFactory>& Registry() {
    static const std::map<std::string, EngineFactory> registry = {
        {"tesseract", [](const EngineProperties& properties) -> std::unique_ptr<OcrEngine> {
             return std::make_unique<TesseractEngine>(TesseractConfig::FromProperties(properties));
         }},
    };
    return registry;
}

} // namespace

std::vector<std::string> ListEngineNames() {
    std::vector<std::string> names;
    for (const auto& entry : Registry()) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<OcrEngine> CreateEngine(const std::string& name, const EngineProperties& properties) {
    auto it = Registry().find(name);
    if (it == Registry().end()) {
        throw EngineConfigError("unknown OCR engine: " + name);
    }
    LOG_DEBUG("Creating OCR engine: {}", name);
    return it->second(properties);
}

} // namespace ocrlayer
