// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace tubeq::core {

void init_logging(std::string_view level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("[config] cannot open log file {}: {}", file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("tubeq", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);

    spdlog::set_default_logger(std::move(logger));
}

} // namespace tubeq::core
