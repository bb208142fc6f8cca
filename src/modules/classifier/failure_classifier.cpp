// modules/classifier/failure_classifier.cpp
#include "modules/classifier/failure_classifier.h"
#include "common/utils/text_utils.h"

namespace agentgraph {

std::string_view to_string(FailureKind kind) {
    return kind == FailureKind::LOGIC ? "LOGIC" : "SYNTAX";
}

namespace {

void erase_all(std::string& text, std::string_view marker) {
    size_t pos = 0;
    while ((pos = text.find(marker, pos)) != std::string::npos) {
        text.erase(pos, marker.size());
    }
}

} // namespace

Classification classify_failure(std::string_view verdict, FailureKind fallback) {
    Classification c;
    if (verdict.find(kLogicMarker) != std::string_view::npos) {
        c.kind = FailureKind::LOGIC;
    } else if (verdict.find(kSyntaxMarker) != std::string_view::npos) {
        c.kind = FailureKind::SYNTAX;
    } else {
        c.kind = fallback;
        c.defaulted = true;
    }

    std::string critique(verdict);
    erase_all(critique, kLogicMarker);
    erase_all(critique, kSyntaxMarker);
    c.critique = trim(critique);
    return c;
}

} // namespace agentgraph
