// sabhad: Command-line driver for the agent council
//
// Usage: sabhad <command> [options]
//
// Commands:
//   run        Boot from config and run ticks
//   recall     Query memory through the input router
//   stats      Show store and coordination statistics
//   sweep      Remove records past retention
//   snapshot   Print the coordination snapshot as JSON
//   version    Show version

#include <sabha/sabha.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <chrono>

using namespace sabha;

namespace {

const char* prog_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "sabhad " << SABHA_VERSION << " - Agent council\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Run ticks with the configured agents\n"
              << "  recall <text>      Semantic recall from memory\n"
              << "  stats              Show store and coordination statistics\n"
              << "  sweep              Remove records older than the retention window\n"
              << "  snapshot           Print the coordination snapshot\n"
              << "  version            Show version\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      Configuration file (required except for version)\n"
              << "  --ticks N          Ticks to run (default: 1)\n"
              << "  --interval MS      Pause between ticks (default: 0)\n"
              << "  --settle LABEL     Resolve each approved decision (success|failure|neutral)\n"
              << "  --pnl X            P&L reported with --settle (default: 0)\n"
              << "  --limit N          Recall results (default: 5)\n"
              << "  --agent ID         Agent asking in recall (default: cli)\n"
              << "  --symbol SYM       Restrict recall to a symbol\n"
              << "  --failures         Include failed precedent in recall\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Debug logging\n";
}

void print_stats(const CouncilStats& s, bool json_output) {
    if (json_output) {
        json j = {
            {"version", SABHA_VERSION},
            {"phase", phase_name(s.phase)},
            {"degraded", s.degraded},
            {"pending", s.pending},
            {"unlearned", s.unlearned},
            {"coordination", stats_to_json(s.coordination)},
            {"store", {
                {"mode", s.store.mode == StoreMode::ReadWrite ? "read_write" : "read_only"},
                {"degraded_reason", s.store.degraded_reason},
                {"records", s.store.records},
                {"signals", s.store.signals},
                {"decisions", s.store.decisions},
                {"outcomes", s.store.outcomes},
                {"failures", s.store.failures},
                {"swept", s.store.swept},
            }},
            {"embedder", {
                {"primary", s.embedder.primary},
                {"degraded", s.embedder.degraded},
                {"embeddings", s.embedder.embeddings},
                {"fallbacks", s.embedder.fallbacks},
                {"cache_hits", s.embedder.cache_hits},
            }},
            {"output_router", {
                {"events", s.output.events},
                {"admitted", s.output.admitted},
                {"persisted", s.output.persisted},
                {"persist_failures", s.output.persist_failures},
                {"deliveries", s.output.deliveries},
                {"delivery_failures", s.output.delivery_failures},
                {"deliveries_behind", s.output.deliveries_behind},
            }},
            {"input_router", {
                {"queries", s.input.queries},
                {"cache_hits", s.input.cache_hits},
                {"successes", s.input.successes},
                {"failures", s.input.failures},
            }},
        };
        std::cout << j.dump(2) << "\n";
        return;
    }

    const auto& c = s.coordination;
    std::cout << "Sabha " << SABHA_VERSION << "\n"
              << "═══════════════════════════════\n"
              << "Memory:      " << s.store.records << " records ("
              << s.store.signals << " signals, " << s.store.decisions << " decisions, "
              << s.store.outcomes << " outcomes)\n"
              << "Store mode:  " << (s.store.mode == StoreMode::ReadWrite ? "read-write" : "read-only");
    if (!s.store.degraded_reason.empty()) std::cout << " (" << s.store.degraded_reason << ")";
    std::cout << "\n"
              << "Embedder:    " << (s.embedder.degraded ? "hash fallback" : s.embedder.primary)
              << ", " << s.embedder.embeddings << " embeddings\n"
              << "Ticks:       " << c.ticks << " (" << c.abandoned << " abandoned)\n"
              << "Decisions:   " << c.decisions << " (" << c.approved << " approved, "
              << c.rejected << " rejected, " << c.deferred << " deferred)\n"
              << "Outcomes:    " << c.successes << " success, " << c.failures << " failure, "
              << c.neutrals << " neutral\n"
              << "Accuracy:    " << fixed2(c.accuracy() * 100.0) << "%\n"
              << "Total P&L:   " << fixed2(c.total_pnl) << "\n"
              << "Phase:       " << phase_name(s.phase) << (s.degraded ? " (degraded)" : "") << "\n";
}

int cmd_run(Council& council, int ticks, int interval_ms,
            std::optional<OutcomeLabel> settle, double pnl, bool json_output) {
    for (int i = 0; i < ticks; ++i) {
        TickResult r = council.tick();
        if (r.decision && settle && r.decision->verdict == Verdict::Approved) {
            council.report_outcome(r.decision->id, *settle, pnl);
        }
        if (!json_output) {
            std::cout << "tick " << r.tick_id << ": ";
            if (r.abandoned) {
                std::cout << "abandoned";
            } else if (r.decision) {
                const auto& d = *r.decision;
                std::cout << verdict_name(d.verdict) << " " << action_name(d.action);
                if (!d.symbol.empty()) std::cout << " " << d.symbol;
                std::cout << " consensus=" << fixed2(d.consensus)
                          << " size=" << fixed2(d.position_size * 100.0) << "%";
                for (const auto& v : d.violations) std::cout << "\n  ! " << v;
            } else {
                std::cout << "no signals";
            }
            std::cout << " (" << r.responded << "/" << r.polled << " answered)\n";
        }
        if (interval_ms > 0 && i + 1 < ticks) {
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        }
    }
    if (json_output) std::cout << council.snapshot().dump(2) << "\n";
    return 0;
}

int cmd_recall(Council& council, const std::string& agent, const RetrievalQuery& query,
               int limit, bool json_output) {
    std::vector<RankedRecord> results;
    try {
        results = council.recall(agent, query, static_cast<size_t>(limit));
    } catch (const Error& e) {
        std::cerr << "Error: recall failed: " << e.what() << "\n";
        return 1;
    }

    if (json_output) {
        json arr = json::array();
        for (const auto& r : results) {
            json j = record_to_json(r.record);
            j["similarity"] = r.similarity;
            j["score"] = r.score;
            arr.push_back(std::move(j));
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (results.empty()) {
        std::cout << "No matching memories.\n";
        return 0;
    }
    for (const auto& r : results) {
        std::cout << "[" << fixed2(r.score) << "] " << kind_name(r.record.kind)
                  << " " << r.record.agent_id;
        if (r.record.outcome) std::cout << " (" << outcome_name(*r.record.outcome) << ")";
        std::cout << "\n  " << r.record.summary << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string command;
    std::string query_text;
    std::string agent = "cli";
    std::string symbol;
    std::optional<OutcomeLabel> settle;
    double pnl = 0.0;
    int ticks = 1;
    int interval_ms = 0;
    int limit = 5;
    bool include_failures = false;
    bool json_output = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--ticks") == 0 && i + 1 < argc) {
            ticks = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            interval_ms = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--settle") == 0 && i + 1 < argc) {
            settle = parse_outcome(argv[++i]);
            if (!settle || *settle == OutcomeLabel::Pending) {
                std::cerr << "Error: --settle takes success, failure or neutral\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--pnl") == 0 && i + 1 < argc) {
            pnl = std::atof(argv[++i]);
        } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--agent") == 0 && i + 1 < argc) {
            agent = argv[++i];
        } else if (strcmp(argv[i], "--symbol") == 0 && i + 1 < argc) {
            symbol = argv[++i];
        } else if (strcmp(argv[i], "--failures") == 0) {
            include_failures = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "sabha " << SABHA_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (command == "recall" && query_text.empty()) {
                query_text = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "sabha " << SABHA_VERSION << "\n";
        return 0;
    }
    if (command != "run" && command != "recall" && command != "stats" &&
        command != "sweep" && command != "snapshot") {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (config_path.empty()) {
        std::cerr << "Error: --config is required for " << command << "\n";
        return 1;
    }
    if (ticks < 1 || limit < 1 || interval_ms < 0) {
        std::cerr << "Error: --ticks and --limit must be positive\n";
        return 1;
    }

    std::unique_ptr<Council> council;
    try {
        SabhaConfig config = load_config(config_path);
        if (config.logging.sink == "none") {
            set_log_sink(nullptr);
        } else {
            set_log_sink(stderr_sink(verbose ? LogLevel::Debug : config.logging.level));
        }
        council = boot_council(std::move(config));
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    int result = 0;
    if (command == "run") {
        result = cmd_run(*council, ticks, interval_ms, settle, pnl, json_output);
    } else if (command == "recall") {
        if (query_text.empty()) {
            std::cerr << "Usage: sabhad recall <text> --config PATH\n";
            result = 1;
        } else {
            RetrievalQuery q;
            q.text = query_text;
            q.symbol = symbol;
            q.include_failures = include_failures;
            result = cmd_recall(*council, agent, q, limit, json_output);
        }
    } else if (command == "stats") {
        print_stats(council->stats(), json_output);
    } else if (command == "sweep") {
        if (!council->store().writable()) {
            std::cerr << "Error: memory is read-only: " << council->store().degraded_reason() << "\n";
            result = 1;
        } else {
            try {
                size_t removed = council->sweep();
                std::cout << "Swept " << removed << " records past retention\n";
            } catch (const Error& e) {
                std::cerr << "Error: sweep failed: " << e.what() << "\n";
                result = 1;
            }
        }
    } else if (command == "snapshot") {
        std::cout << council->snapshot().dump(2) << "\n";
    }

    council->shutdown();
    return result;
}
