#ifndef AGENTGRAPH_CORE_RESULT_H
#define AGENTGRAPH_CORE_RESULT_H

#include "agentgraph/core/state.h"
#include <cstdint>
#include <string>
#include <vector>

namespace agentgraph {

// ExecutionResult structure
struct ExecutionResult {
    bool success = false;
    std::string message;              // 错误信息或成功信息
    State final_state;                // 执行结束时的状态
    std::string session_id;
    StageId stage_pointer = kTerminal; // next stage to run; kTerminal when finished
    StageId last_stage;               // last completed stage
    uint64_t seq = 0;                 // checkpoint sequence number
    std::vector<std::string> exhausted_scopes; // loop scopes that hit their bound
    bool resumed = false;

    bool completed() const { return stage_pointer == kTerminal; }
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_RESULT_H
