#ifndef AGENTGRAPH_COMMON_UTILS_TEXT_UTILS_H
#define AGENTGRAPH_COMMON_UTILS_TEXT_UTILS_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

std::string trim(std::string_view text);

// 去除 <think>...</think> 推理块
std::string strip_reasoning(std::string_view text);

// First block fenced with ```<lang>; else the first generic fenced block; else the trimmed text.
std::string extract_fenced_block(std::string_view text, std::string_view lang = "python");

// Parses the first JSON value found in a fenced block or in the raw text.
std::optional<nlohmann::json> extract_json(std::string_view text);

std::vector<std::string> split_nonempty_lines(std::string_view text);

// Collapses runs of whitespace into single spaces / blank-line paragraph breaks.
std::string collapse_whitespace(std::string_view text);

std::string truncate(std::string_view text, size_t max_chars);

// Replaces every byte that is not part of a well-formed UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(std::string_view bytes);

std::string base64_encode(std::string_view bytes);

// Top-level modules imported by a Python script that are not in the standard library.
std::vector<std::string> third_party_python_imports(std::string_view code);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEXT_UTILS_H
