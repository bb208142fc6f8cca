// common/log/logging.cpp
#include "common/log/logging.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentgraph {

void init_logging(const std::string& level, const std::string& pattern) {
    auto lvl = spdlog::level::from_str(level);
    // from_str 对未知字符串返回 off
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigError("unknown log level '" + level + "'");
    }

    auto logger = spdlog::get("agentgraph");
    if (!logger) {
        logger = spdlog::stderr_color_mt("agentgraph");
    }
    logger->set_level(lvl);
    if (!pattern.empty()) {
        logger->set_pattern(pattern);
    }
    spdlog::set_default_logger(logger);
}

} // namespace agentgraph
