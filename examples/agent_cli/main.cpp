// main.cpp
#include "agentgraph/core/engine.h"
#include "agentgraph/core/errors.h"
#include "common/log/logging.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* kDefaultConfig = "agentgraph.yaml";

void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " run <workflow> [--session ID] [--config FILE] [--verbose] <objective...>\n"
              << "  " << prog << " resume <session> [--config FILE] [--verbose]\n"
              << "  " << prog << " sessions [--config FILE]\n"
              << "  " << prog << " prune <session> [--config FILE]\n"
              << "  " << prog << " workflows\n";
}

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::string session;
    std::string config = kDefaultConfig;
    bool verbose = false;
};

bool parse_args(int argc, char* argv[], Args& args) {
    if (argc < 2) return false;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--session" || a == "--config") {
            if (i + 1 >= argc) {
                std::cerr << a << " needs a value\n";
                return false;
            }
            (a == "--session" ? args.session : args.config) = argv[++i];
        } else if (a == "--verbose" || a == "-v") {
            args.verbose = true;
        } else {
            args.positional.push_back(a);
        }
    }
    return true;
}

void write_outputs(const agentgraph::RunReport& report) {
    const auto& r = report.result;
    if (r.success) {
        std::cout << "[SUCCESS] " << r.message << "\n";
    } else {
        std::cerr << "[ERROR] " << r.message << "\n";
    }
    if (!r.exhausted_scopes.empty()) {
        std::cout << "Loop bound reached:";
        for (const auto& s : r.exhausted_scopes) std::cout << " " << s;
        std::cout << "\n";
    }

    if (r.completed() && !report.artifact.empty()) {
        std::string artifact_file = report.artifact_name + "_" + r.session_id + ".md";
        std::ofstream out(artifact_file);
        out << report.artifact << "\n";
        std::cout << "Artifact written to " << artifact_file << "\n";
    } else if (!r.completed()) {
        std::cout << "Session " << r.session_id << " paused before '" << r.stage_pointer
                  << "'; continue with: resume " << r.session_id << "\n";
    }

    std::string trace_file = "execution_trace_" + r.session_id + ".json";
    std::ofstream trace(trace_file);
    trace << report.trace.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    std::cout << "Trace exported to " << trace_file << " (" << report.trace.size() << " records)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage(argv[0]);
        return 1;
    }

    try {
        if (args.command == "workflows") {
            agentgraph::WorkflowCatalog catalog;
            for (const auto& name : catalog.names()) {
                std::cout << name << "\t" << catalog.description(name) << "\n";
            }
            return 0;
        }

        agentgraph::EngineConfig config = agentgraph::EngineConfig::load(args.config);
        config.apply_env_overrides();
        agentgraph::init_logging(args.verbose ? "debug" : config.log.level, config.log.pattern);
        auto engine = agentgraph::WorkflowEngine::from_config(
            std::make_shared<const agentgraph::EngineConfig>(std::move(config)));

        if (args.command == "run") {
            if (args.positional.size() < 2) {
                usage(argv[0]);
                return 1;
            }
            const std::string workflow = args.positional[0];
            if (!engine->catalog().contains(workflow)) {
                std::cerr << "Unknown workflow: " << workflow << " (see '" << argv[0] << " workflows')\n";
                return 1;
            }
            std::string objective;
            for (size_t i = 1; i < args.positional.size(); ++i) {
                if (i > 1) objective += ' ';
                objective += args.positional[i];
            }
            auto report = engine->run_or_resume(workflow, objective, args.session);
            std::cout << "Session: " << report.result.session_id << "\n";
            write_outputs(report);
            return report.result.success ? 0 : 1;
        }

        if (args.command == "resume") {
            if (args.positional.size() != 1) {
                usage(argv[0]);
                return 1;
            }
            try {
                auto report = engine->resume(args.positional[0]);
                write_outputs(report);
                return report.result.success ? 0 : 1;
            } catch (const agentgraph::SessionNotFound& e) {
                std::cerr << e.what() << "\nStart it with: " << argv[0]
                          << " run <workflow> --session " << e.session_id() << " <objective...>\n";
                return 2;
            }
        }

        if (args.command == "sessions") {
            for (const auto& cp : engine->sessions()) {
                std::cout << cp.session_id << "\t" << cp.workflow << "\tseq=" << cp.seq << "\t"
                          << (cp.stage_pointer == agentgraph::kTerminal ? "finished" : "next: " + cp.stage_pointer)
                          << "\n";
            }
            return 0;
        }

        if (args.command == "prune") {
            if (args.positional.size() != 1) {
                usage(argv[0]);
                return 1;
            }
            if (!engine->prune(args.positional[0])) {
                std::cerr << "No such session: " << args.positional[0] << "\n";
                return 2;
            }
            std::cout << "Removed session " << args.positional[0] << "\n";
            return 0;
        }

        usage(argv[0]);
        return 1;
    } catch (const agentgraph::SessionLocked& e) {
        std::cerr << "[LOCKED] " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
