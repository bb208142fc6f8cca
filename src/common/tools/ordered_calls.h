#ifndef AGENTGRAPH_COMMON_TOOLS_ORDERED_CALLS_H
#define AGENTGRAPH_COMMON_TOOLS_ORDERED_CALLS_H

#include <functional>
#include <future>
#include <vector>

namespace agentgraph {

// Runs independent calls and returns their results in issuance order.
// With `parallel` the calls run concurrently (std::async); exceptions propagate
// from the first failing call in issuance order.
template <typename T>
std::vector<T> run_ordered(const std::vector<std::function<T()>>& calls, bool parallel) {
    std::vector<T> results;
    results.reserve(calls.size());

    if (!parallel || calls.size() < 2) {
        for (const auto& call : calls) {
            results.push_back(call());
        }
        return results;
    }

    std::vector<std::future<T>> futures;
    futures.reserve(calls.size());
    for (const auto& call : calls) {
        futures.push_back(std::async(std::launch::async, call));
    }
    // 按发出顺序收集，保证追加顺序一致
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_ORDERED_CALLS_H
