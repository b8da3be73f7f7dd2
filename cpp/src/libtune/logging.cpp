#include "libtune/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

namespace libtune {

namespace {
constexpr const char* kLoggerName = "libtune";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    created->set_pattern(kPattern);
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);
    return created;
}
}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(init_flag, []() { instance = create_logger(); });
    return instance;
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
    static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};
    const auto it = level_map.find(level);
    if (it == level_map.end()) {
        throw std::invalid_argument("unknown log level: " + level);
    }
    return it->second;
}

void set_log_level(const std::string& level) {
    logger()->set_level(parse_log_level(level));
}

}  // namespace libtune
