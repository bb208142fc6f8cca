#ifndef AGENTGRAPH_COMMON_LOG_LOGGING_H
#define AGENTGRAPH_COMMON_LOG_LOGGING_H

#include <string>

namespace agentgraph {

// Configures the spdlog default logger (stderr, colored). Unknown level -> ConfigError.
void init_logging(const std::string& level, const std::string& pattern);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LOG_LOGGING_H
