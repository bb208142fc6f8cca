// tests/support/fakes.h
#ifndef AGENTGRAPH_TESTS_SUPPORT_FAKES_H
#define AGENTGRAPH_TESTS_SUPPORT_FAKES_H

#include "agentgraph/core/errors.h"
#include "common/config/engine_config.h"
#include "common/llm/completion_client.h"
#include "common/tools/page_fetcher.h"
#include "common/tools/process_runner.h"
#include "common/tools/search_provider.h"
#include "workflows/workflow.h"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentgraph::testing {

// Answers completions from a handler; records every request.
class ScriptedCompletionClient : public CompletionClient {
public:
    using Handler = std::function<std::string(const CompletionRequest&)>;

    explicit ScriptedCompletionClient(Handler handler) : handler_(std::move(handler)) {}

    std::string complete(const CompletionRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        return handler_(request);
    }

    bool supports_images() const override { return true; }

    std::vector<CompletionRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t count_for_model(const std::string& model) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) n += r.model == model;
        return n;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<CompletionRequest> requests_;
};

class FakeSearchProvider : public SearchProvider {
public:
    FakeSearchProvider(std::string name, std::vector<SearchResult> results, bool fail = false)
        : name_(std::move(name)), results_(std::move(results)), fail_(fail) {}

    std::string name() const override { return name_; }

    struct Call {
        std::string query;
        int max_results;
        bool operator==(const Call& other) const {
            return query == other.query && max_results == other.max_results;
        }
    };

    std::vector<SearchResult> search(const std::string& query, int max_results) override {
        queries.push_back(query);
        calls.push_back({query, max_results});
        if (fail_) {
            throw ExternalServiceError(name_ + " unavailable");
        }
        std::vector<SearchResult> out = results_;
        if (static_cast<int>(out.size()) > max_results) out.resize(max_results);
        return out;
    }

    std::vector<std::string> queries;
    std::vector<Call> calls;

private:
    std::string name_;
    std::vector<SearchResult> results_;
    bool fail_;
};

class FakePageFetcher : public PageFetcher {
public:
    std::string fetch_text(const std::string& url, size_t max_chars) override {
        std::lock_guard<std::mutex> lock(mutex_);
        fetched.push_back(url);
        std::string text = "content of " + url;
        return text.substr(0, max_chars);
    }

    std::vector<std::string> fetched;

private:
    std::mutex mutex_;
};

// Replays queued results per executable; unknown executables succeed with empty output.
class FakeProcessRunner : public ProcessRunner {
public:
    struct Call {
        std::string executable;
        std::vector<std::string> args;
        std::string working_dir;
    };

    void queue(const std::string& executable, ProcessResult result) {
        results_[executable].push_back(std::move(result));
    }

    ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                      int, const std::string& working_dir) override {
        calls.push_back({executable, args, working_dir});
        auto& q = results_[executable];
        if (q.empty()) {
            ProcessResult ok;
            ok.exit_code = 0;
            return ok;
        }
        ProcessResult r = q.front();
        if (q.size() > 1) q.pop_front(); // 最后一个结果重复使用
        return r;
    }

    std::vector<Call> calls;

private:
    std::map<std::string, std::deque<ProcessResult>> results_;
};

inline ProcessResult process_result(int exit_code, std::string out = "", std::string err = "") {
    ProcessResult r;
    r.exit_code = exit_code;
    r.stdout_text = std::move(out);
    r.stderr_text = std::move(err);
    return r;
}

} // namespace agentgraph::testing

#endif // AGENTGRAPH_TESTS_SUPPORT_FAKES_H
