// modules/classifier/failure_classifier.h
#ifndef AGENTGRAPH_MODULES_CLASSIFIER_FAILURE_CLASSIFIER_H
#define AGENTGRAPH_MODULES_CLASSIFIER_FAILURE_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <string_view>

namespace agentgraph {

enum class FailureKind : uint8_t {
    SYNTAX, // the formal artifact does not compile
    LOGIC   // the reasoning behind it is wrong
};

std::string_view to_string(FailureKind kind);

struct Classification {
    FailureKind kind = FailureKind::SYNTAX;
    std::string critique;   // verdict text with the TYPE markers removed, trimmed
    bool defaulted = false; // neither marker present
};

inline constexpr std::string_view kLogicMarker = "TYPE: LOGIC";
inline constexpr std::string_view kSyntaxMarker = "TYPE: SYNTAX";

// LOGIC marker wins over SYNTAX; with neither, `fallback` is returned.
Classification classify_failure(std::string_view verdict, FailureKind fallback = FailureKind::SYNTAX);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CLASSIFIER_FAILURE_CLASSIFIER_H
