#ifndef AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "agentgraph/core/state.h"
#include <inja/inja.hpp>
#include <filesystem> // Required by Inja for set_include_callback
#include <string>
#include <string_view>

namespace agentgraph {

// Renders prompt templates against the state record.
// `include` is disabled; extra callbacks: numbered(list), bullets(list), json(value).
class PromptRenderer {
public:
    PromptRenderer();

    // 静态方法：使用共享环境渲染模板
    static std::string render(std::string_view template_str, const State& data);

    std::string render_with_env(std::string_view template_str, const State& data);

private:
    inja::Environment env_;
    void configure_security();
    void register_callbacks();
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
