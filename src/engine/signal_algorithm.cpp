#include "engine/signal_algorithm.hpp"
#include "core/errors.hpp"
#include "engine/signal_engine.hpp"
#include "engine/volume_ratio_algorithm.hpp"
#include <spdlog/spdlog.h>

namespace flowscope {

std::unique_ptr<SignalAlgorithm> make_algorithm(const Config& config, BaselineStore& store) {
    if (auto problem = config.validate()) {
        throw ConfigError(*problem);
    }

    std::unique_ptr<SignalAlgorithm> algorithm;
    if (config.engine.algorithm == kInstitutionalAlgorithm) {
        algorithm = std::make_unique<SignalEngine>(config, store);
    } else if (config.engine.algorithm == kVolumeRatioAlgorithm) {
        algorithm = std::make_unique<VolumeRatioAlgorithm>(config);
    } else {
        throw ConfigError("unknown algorithm '" + config.engine.algorithm + "'");
    }

    spdlog::info("Signal algorithm: {}", algorithm->name());
    return algorithm;
}

}  // namespace flowscope
