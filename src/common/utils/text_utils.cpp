// common/utils/text_utils.cpp
#include "common/utils/text_utils.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>

namespace agentgraph {

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string strip_reasoning(std::string_view text) {
    static const std::regex think_pattern(R"(<think>[\s\S]*?</think>)", std::regex::ECMAScript);
    std::string input(text);
    return trim(std::regex_replace(input, think_pattern, ""));
}

std::string extract_fenced_block(std::string_view text, std::string_view lang) {
    const std::string input(text);

    // 1. 带语言标记的代码块
    if (!lang.empty()) {
        const std::string fence = "```" + std::string(lang);
        size_t open = input.find(fence);
        if (open != std::string::npos) {
            size_t body = open + fence.size();
            size_t close = input.find("```", body);
            if (close != std::string::npos) {
                return trim(std::string_view(input).substr(body, close - body));
            }
        }
    }

    // 2. 第一个普通代码块（未闭合时取到结尾）
    size_t open = input.find("```");
    if (open != std::string::npos) {
        size_t body = open + 3;
        size_t close = input.find("```", body);
        std::string block = input.substr(body, close == std::string::npos ? std::string::npos : close - body);
        // drop an info string such as "json" on the fence line
        size_t newline = block.find('\n');
        if (newline != std::string::npos) {
            std::string first = trim(std::string_view(block).substr(0, newline));
            bool is_tag = !first.empty() && std::all_of(first.begin(), first.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '_' || c == '+' || c == '-';
            });
            if (is_tag) block.erase(0, newline + 1);
        }
        return trim(block);
    }

    // 3. 原始文本
    return trim(input);
}

std::optional<nlohmann::json> extract_json(std::string_view text) {
    std::vector<std::string> candidates;
    candidates.push_back(extract_fenced_block(text, "json"));
    candidates.push_back(trim(text));

    // widest bracketed span in the raw text
    const std::string raw(text);
    for (auto [open, close] : {std::pair{'[', ']'}, std::pair{'{', '}'}}) {
        size_t first = raw.find(open);
        size_t last = raw.rfind(close);
        if (first != std::string::npos && last != std::string::npos && last > first) {
            candidates.push_back(raw.substr(first, last - first + 1));
        }
    }

    for (const auto& candidate : candidates) {
        if (candidate.empty()) continue;
        auto parsed = nlohmann::json::parse(candidate, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::vector<std::string> split_nonempty_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::istringstream iss{std::string(text)};
    std::string line;
    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (!t.empty()) lines.push_back(std::move(t));
    }
    return lines;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    for (const auto& line : split_nonempty_lines(text)) {
        std::string collapsed;
        bool in_space = false;
        for (char c : line) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                in_space = true;
                continue;
            }
            if (in_space && !collapsed.empty()) collapsed += ' ';
            in_space = false;
            collapsed += c;
        }
        if (!out.empty()) out += '\n';
        out += collapsed;
    }
    return out;
}

std::string truncate(std::string_view text, size_t max_chars) {
    if (text.size() <= max_chars) return std::string(text);
    // 不在 UTF-8 多字节序列中间截断
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return std::string(text.substr(0, cut));
}

std::string sanitize_utf8(std::string_view bytes) {
    static constexpr const char* kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;      // 过长编码
            else if (c == 0xED) hi = 0x9F; // 代理区
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            else if (c == 0xF4) hi = 0x8F; // > U+10FFFF
        }

        bool valid = len > 0 && i + len <= bytes.size();
        for (size_t k = 1; valid && k < len; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char min = k == 1 ? lo : 0x80;
            const unsigned char max = k == 1 ? hi : 0xBF;
            valid = cc >= min && cc <= max;
        }

        if (valid) {
            out.append(bytes.substr(i, len));
            i += len;
        } else {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

std::string base64_encode(std::string_view bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }
    size_t rest = bytes.size() - i;
    if (rest > 0) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        if (rest == 2) n |= static_cast<uint8_t>(bytes[i + 1]) << 8;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += rest == 2 ? kAlphabet[(n >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

std::vector<std::string> third_party_python_imports(std::string_view code) {
    static const std::set<std::string> kStdlib = {
        "__future__", "abc", "argparse", "array", "ast", "asyncio", "base64", "bisect", "builtins",
        "calendar", "cmath", "collections", "concurrent", "contextlib", "copy", "csv", "ctypes",
        "dataclasses", "datetime", "decimal", "difflib", "enum", "errno", "fractions", "functools",
        "gc", "glob", "gzip", "hashlib", "heapq", "hmac", "html", "http", "importlib", "inspect",
        "io", "itertools", "json", "logging", "math", "multiprocessing", "numbers", "operator", "os",
        "pathlib", "pickle", "platform", "pprint", "queue", "random", "re", "secrets", "shutil",
        "signal", "socket", "sqlite3", "statistics", "string", "struct", "subprocess", "sys",
        "tempfile", "textwrap", "threading", "time", "timeit", "traceback", "types", "typing",
        "unittest", "urllib", "uuid", "warnings", "weakref", "xml", "zipfile", "zlib"};

    static const std::regex import_line(R"(^\s*import\s+([\w\.\s,]+?)\s*(?:#.*)?$)");
    static const std::regex from_line(R"(^\s*from\s+([\w\.]+)\s+import\b)");

    std::set<std::string> modules;
    std::istringstream iss{std::string(code)};
    std::string line;
    while (std::getline(iss, line)) {
        std::smatch m;
        if (std::regex_search(line, m, from_line)) {
            std::string mod = m[1].str();
            if (!mod.empty() && mod[0] != '.') {
                modules.insert(mod.substr(0, mod.find('.')));
            }
        } else if (std::regex_search(line, m, import_line)) {
            std::stringstream names(m[1].str());
            std::string item;
            while (std::getline(names, item, ',')) {
                std::string name = trim(item);
                name = name.substr(0, name.find(' ')); // "numpy as np"
                if (!name.empty()) modules.insert(name.substr(0, name.find('.')));
            }
        }
    }

    std::vector<std::string> third_party;
    for (const auto& mod : modules) {
        if (kStdlib.count(mod) == 0) third_party.push_back(mod);
    }
    return third_party;
}

} // namespace agentgraph
