// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "agentgraph/core/errors.h"
#include <mutex>

namespace agentgraph {

PromptRenderer::PromptRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    // prompts are markdown: "##" headings must not become line statements
    env_.set_line_statement("%%");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);

    configure_security();
    register_callbacks();
}

void PromptRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

void PromptRenderer::register_callbacks() {
    // "1. a\n2. b"
    env_.add_callback("numbered", 1, [](inja::Arguments& args) {
        std::string out;
        int i = 1;
        for (const auto& item : *args.at(0)) {
            if (!out.empty()) out += '\n';
            out += std::to_string(i++) + ". " + (item.is_string() ? item.get<std::string>() : item.dump());
        }
        return out;
    });
    // "- a\n- b"
    env_.add_callback("bullets", 1, [](inja::Arguments& args) {
        std::string out;
        for (const auto& item : *args.at(0)) {
            if (!out.empty()) out += '\n';
            out += "- " + (item.is_string() ? item.get<std::string>() : item.dump());
        }
        return out;
    });
    env_.add_callback("json", 1, [](inja::Arguments& args) {
        return args.at(0)->dump(2);
    });
}

std::string PromptRenderer::render(std::string_view template_str, const State& data) {
    static PromptRenderer renderer;
    static std::mutex mutex; // 并行调用时共享环境
    std::lock_guard<std::mutex> lock(mutex);
    return renderer.render_with_env(template_str, data);
}

std::string PromptRenderer::render_with_env(std::string_view template_str, const State& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw WorkflowError("Template render error: " + std::string(e.message));
    }
}

} // namespace agentgraph
