#ifndef AGENTGRAPH_CORE_STATE_H
#define AGENTGRAPH_CORE_STATE_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace agentgraph {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using State = nlohmann::json; // 完整状态记录，始终为 object

// 阶段标识
using StageId = std::string; // e.g., "coder", "section_compiler"

// 伪状态
inline const StageId kStart = "__start__";
inline const StageId kTerminal = "__terminal__";

// 字段合并策略
enum class MergePolicy : uint8_t {
    OVERWRITE,      // new value replaces old
    APPEND_ORDERED  // new values are concatenated in emission order
};

inline std::string_view to_string(MergePolicy policy) {
    return policy == MergePolicy::OVERWRITE ? "overwrite" : "append-ordered";
}

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_STATE_H
