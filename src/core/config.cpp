/// @file config.cpp
/// @brief JSON configuration loading for spatial_core

#include <spatial/core/config.hpp>

#include <fstream>
#include <iterator>

namespace spatial_core {

namespace {

Result<LogConfig> log_config_from_json(const nlohmann::json& j) {
    LogConfig config;

    if (!j.is_object()) {
        return Error(ErrorCode::ValidationError, "'logging' must be an object");
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Error(ErrorCode::ValidationError, "'logging.level' must be a string");
        }
        auto name = j["level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Error(ErrorCode::ValidationError, "Unknown log level: " + name);
        }
        config.level = *level;
    }

    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return Error(ErrorCode::ValidationError, "'logging.console' must be a boolean");
        }
        config.console_enabled = j["console"].get<bool>();
    }

    if (j.contains("file")) {
        if (!j["file"].is_boolean()) {
            return Error(ErrorCode::ValidationError, "'logging.file' must be a boolean");
        }
        config.file_enabled = j["file"].get<bool>();
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Error(ErrorCode::ValidationError, "'logging.directory' must be a string");
        }
        config.log_directory = j["directory"].get<std::string>();
    }

    if (j.contains("max_file_size")) {
        if (!j["max_file_size"].is_number_unsigned()) {
            return Error(ErrorCode::ValidationError, "'logging.max_file_size' must be a positive integer");
        }
        config.max_file_size = j["max_file_size"].get<std::size_t>();
    }

    if (j.contains("max_files")) {
        if (!j["max_files"].is_number_unsigned()) {
            return Error(ErrorCode::ValidationError, "'logging.max_files' must be a positive integer");
        }
        config.max_files = j["max_files"].get<std::size_t>();
    }

    if (j.contains("modules")) {
        const auto& modules = j["modules"];
        if (!modules.is_object()) {
            return Error(ErrorCode::ValidationError, "'logging.modules' must be an object");
        }
        for (auto it = modules.begin(); it != modules.end(); ++it) {
            auto module = parse_log_module(it.key());
            if (!module) {
                return Error(ErrorCode::ValidationError, "Unknown log module: " + it.key());
            }
            if (!it.value().is_string()) {
                return Error(ErrorCode::ValidationError, "'logging.modules." + it.key() + "' must be a string");
            }
            auto level = parse_log_level(it.value().get<std::string>());
            if (!level) {
                return Error(ErrorCode::ValidationError, "Unknown log level: " + it.value().get<std::string>());
            }
            config.module_levels[static_cast<std::size_t>(*module)] = *level;
        }
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return Error(ErrorCode::ValidationError, "File logging requires 'logging.directory'");
    }

    return config;
}

} // anonymous namespace

Result<SpatialConfig> config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::ValidationError, "Configuration must be an object");
    }

    SpatialConfig config;

    if (j.contains("logging")) {
        auto logging = log_config_from_json(j["logging"]);
        if (!logging) {
            return logging.error();
        }
        config.logging = std::move(*logging);
    }

    return config;
}

Result<SpatialConfig> config_from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::ParseError, "Failed to parse configuration JSON: " + std::string(e.what()));
    }

    return config_from_json(j);
}

Result<SpatialConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::IOError, "Failed to open configuration: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = config_from_json_string(content);
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

nlohmann::json config_to_json(const SpatialConfig& config) {
    nlohmann::json logging;
    logging["level"] = log_level_name(config.logging.level);
    logging["console"] = config.logging.console_enabled;
    logging["file"] = config.logging.file_enabled;
    logging["directory"] = config.logging.log_directory;
    logging["max_file_size"] = config.logging.max_file_size;
    logging["max_files"] = config.logging.max_files;

    nlohmann::json modules = nlohmann::json::object();
    for (LogModule module : {LogModule::Core, LogModule::Math, LogModule::Shapes}) {
        const auto& level = config.logging.module_levels[static_cast<std::size_t>(module)];
        if (level) {
            modules[log_module_key(module)] = log_level_name(*level);
        }
    }
    if (!modules.empty()) {
        logging["modules"] = modules;
    }

    nlohmann::json j;
    j["logging"] = logging;
    return j;
}

void apply_config(const SpatialConfig& config) {
    configure_logging(config.logging);
    core_logger()->debug("Logging configured: core={} math={} shapes={}",
        log_level_name(config.logging.level_for(LogModule::Core)),
        log_level_name(config.logging.level_for(LogModule::Math)),
        log_level_name(config.logging.level_for(LogModule::Shapes)));
}

} // namespace spatial_core
