// workflows/workflow.cpp
#include "workflows/workflow.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

std::shared_ptr<LlmService> make_llm(const WorkflowServices& services, const std::string& workflow) {
    return std::make_shared<LlmService>(services.completion,
                                        services.config->roster(workflow),
                                        services.config->default_model);
}

std::string get_string(const State& state, const std::string& field) {
    auto it = state.find(field);
    if (it == state.end() || it->is_null()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

std::vector<std::string> get_strings(const State& state, const std::string& field) {
    std::vector<std::string> out;
    auto it = state.find(field);
    if (it == state.end() || !it->is_array()) {
        return out;
    }
    for (const auto& item : *it) {
        out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return out;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::vector<std::string> parse_list_lines(const std::string& text) {
    std::vector<std::string> out;
    for (auto line : split_nonempty_lines(text)) {
        for (const char* marker : {"- ", "* "}) {
            size_t pos;
            while ((pos = line.find(marker)) != std::string::npos) {
                line.erase(pos, 2);
            }
        }
        line = trim(line);
        if (!line.empty()) {
            out.push_back(std::move(line));
        }
    }
    return out;
}

std::string format_search_results(const std::vector<SearchResult>& results) {
    if (results.empty()) {
        return "No results found.";
    }
    std::string out;
    for (const auto& r : results) {
        out += "Title: " + r.title + "\nURL: " + r.url + "\nSnippet: " + r.snippet + "\n\n";
    }
    return out;
}

std::string search_as_text(SearchProvider& search, const std::string& query, int max_results) {
    try {
        return format_search_results(search.search(query, max_results));
    } catch (const std::exception& e) {
        spdlog::warn("search for '{}' failed: {}", query, e.what());
        return std::string("Error: ") + e.what();
    }
}

} // namespace agentgraph
