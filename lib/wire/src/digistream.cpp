// Library-level entry points for DIGISTREAM
#include "digistream/digistream.hpp"

namespace DIGISTREAM {

const char* getVersion() {
    return "1.0.0";
}

Wire::Result<Wire::CodecConfig> initialize(const char* config_path) {
    Wire::CodecConfig config;
    if (config_path) {
        auto loaded = Wire::CodecConfig::fromFile(config_path);
        if (!Wire::isOk(loaded)) {
            return Wire::getError(loaded);
        }
        config = Wire::getValue(loaded);
    }

    auto status = Wire::configureLogging(config);
    if (!Wire::isOk(status)) {
        return Wire::getError(status);
    }

    Wire::Logger::getLogger("DIGISTREAM")->info("DIGISTREAM v%s initialized on %s (%s)",
                                                 getVersion(), Wire::Platform::getPlatformName(),
                                                 config_path ? config_path : "default configuration");
    return config;
}

} // namespace DIGISTREAM
