#include "digistream/wire/config/CodecConfig.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>

namespace DIGISTREAM::Wire {

Status CodecConfig::validate() const
{
    // The smallest message is an event list with no events
    if (max_message_size < calculateEventListSize(0)) {
        return Error{Error::INVALID_CONFIG,
                     "max_message_size " + std::to_string(max_message_size) +
                     " is smaller than an empty message (" +
                     std::to_string(calculateEventListSize(0)) + " bytes)"};
    }
    return std::monostate{};
}

Result<CodecConfig> CodecConfig::fromJSON(const nlohmann::json& config)
{
    if (!config.is_object()) {
        return Error{Error::INVALID_CONFIG, "Codec configuration must be a JSON object"};
    }

    CodecConfig codec_config;
    try {
        if (config.contains("strict_channels")) {
            codec_config.strict_channels = config["strict_channels"].get<bool>();
        }
        if (config.contains("max_message_size")) {
            codec_config.max_message_size = config["max_message_size"].get<size_t>();
        }
        if (config.contains("log_level")) {
            auto name = config["log_level"].get<std::string>();
            auto level = logLevelFromString(name);
            if (!level) {
                return Error{Error::INVALID_CONFIG, "Unknown log_level \"" + name + "\""};
            }
            codec_config.log_level = *level;
        }
        if (config.contains("log_directory")) {
            codec_config.log_directory = config["log_directory"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{Error::INVALID_CONFIG, std::string("Invalid codec configuration: ") + e.what()};
    }

    auto status = codec_config.validate();
    if (!isOk(status)) {
        return getError(status);
    }
    return codec_config;
}

Result<CodecConfig> CodecConfig::fromFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Error{Error::SYSTEM_ERROR, "Cannot open configuration file " + filename, errno};
    }

    std::string file_content((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
    if (file_content.empty()) {
        return Error{Error::INVALID_CONFIG, "Configuration file " + filename + " is empty"};
    }

    try {
        return fromJSON(nlohmann::json::parse(file_content));
    } catch (const nlohmann::json::parse_error& e) {
        return Error{Error::INVALID_CONFIG,
                     "Cannot parse configuration file " + filename + ": " + e.what()};
    }
}

nlohmann::json CodecConfig::toJSON() const
{
    nlohmann::json config;
    config["strict_channels"] = strict_channels;
    config["max_message_size"] = max_message_size;
    config["log_level"] = logLevelToString(log_level);
    config["log_directory"] = log_directory;
    return config;
}

Status configureLogging(const CodecConfig& config)
{
    if (!Logger::initialize(config.log_directory, config.log_level)) {
        return Error{Error::SYSTEM_ERROR, "Cannot create log directory " + config.log_directory};
    }
    return std::monostate{};
}

} // namespace DIGISTREAM::Wire
