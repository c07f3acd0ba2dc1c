/// @file log.cpp
/// @brief Module logger registry for spatial_core

#include <spatial/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace spatial_core {

namespace {

constexpr std::array<LogModule, k_log_module_count> k_modules = {
    LogModule::Core, LogModule::Math, LogModule::Shapes};

struct ModuleLoggers {
    std::mutex mutex;
    LogConfig config;
    std::array<std::shared_ptr<spdlog::logger>, k_log_module_count> loggers;
};

ModuleLoggers& registry() {
    static ModuleLoggers instance;
    return instance;
}

bool same_sinks(const LogConfig& a, const LogConfig& b) {
    return a.console_enabled == b.console_enabled
        && a.file_enabled == b.file_enabled
        && a.log_directory == b.log_directory
        && a.max_file_size == b.max_file_size
        && a.max_files == b.max_files;
}

/// Sinks for one module logger; a file that cannot be opened is skipped
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const char* name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console);
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        const auto path = std::filesystem::path(config.log_directory) / (std::string(name) + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file {}: {}", path.string(), ex.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Modules
// =============================================================================

const char* log_module_name(LogModule module) {
    switch (module) {
        case LogModule::Core: return "spatial_core";
        case LogModule::Math: return "spatial_math";
        case LogModule::Shapes: return "spatial_shapes";
    }
    return "spatial";
}

const char* log_module_key(LogModule module) {
    switch (module) {
        case LogModule::Core: return "core";
        case LogModule::Math: return "math";
        case LogModule::Shapes: return "shapes";
    }
    return "";
}

std::optional<LogModule> parse_log_module(const std::string& str) {
    for (LogModule module : k_modules) {
        if (str == log_module_key(module)) {
            return module;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    const bool rebuild = !same_sinks(reg.config, config);
    reg.config = config;

    for (LogModule module : k_modules) {
        auto& logger = reg.loggers[static_cast<std::size_t>(module)];
        if (!logger) {
            continue;
        }
        if (rebuild) {
            logger->sinks() = make_sinks(reg.config, log_module_name(module));
        }
        logger->set_level(reg.config.level_for(module));
    }
}

LogConfig current_log_config() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Module Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> module_logger(LogModule module) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& logger = reg.loggers[static_cast<std::size_t>(module)];
    if (!logger) {
        const char* name = log_module_name(module);
        auto sinks = make_sinks(reg.config, name);
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(reg.config.level_for(module));
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return module_logger(LogModule::Core);
}

std::shared_ptr<spdlog::logger> math_logger() {
    return module_logger(LogModule::Math);
}

std::shared_ptr<spdlog::logger> shapes_logger() {
    return module_logger(LogModule::Shapes);
}

// =============================================================================
// Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

} // namespace spatial_core
