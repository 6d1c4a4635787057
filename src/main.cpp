#include "backtest/replay_simulator.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "market_data/historical_feed.hpp"
#include "market_data/synthetic_feed.hpp"
#include "monitoring/performance_report.hpp"
#include "strategy/strategy_engine.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

namespace {

struct CliOptions {
    std::string config_path;
    std::string trades_path;
    std::string log_path;
    std::string metrics_path;
    std::string data_path;
    size_t synthetic_ticks = 0;
    bool help = false;
};

void print_usage(const char* prog) {
    printf("usage: %s [--config FILE] [--trades FILE] [--log FILE] [--metrics FILE]\n"
           "       %*s [--synthetic N] [DATA_CSV]\n"
           "\n"
           "Replays recorded order book snapshots (or N synthetic ticks) through the\n"
           "configured strategy and prints a performance report.\n",
           prog, static_cast<int>(std::strlen(prog)), "");
}

// Returns false (after printing why) on a malformed command line.
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag, std::string& out) {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s needs a value\n", flag);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--config") {
            if (!value("--config", opts.config_path)) return false;
        } else if (arg == "--trades") {
            if (!value("--trades", opts.trades_path)) return false;
        } else if (arg == "--log") {
            if (!value("--log", opts.log_path)) return false;
        } else if (arg == "--metrics") {
            if (!value("--metrics", opts.metrics_path)) return false;
        } else if (arg == "--synthetic") {
            std::string n;
            if (!value("--synthetic", n)) return false;
            char* end = nullptr;
            unsigned long long ticks = std::strtoull(n.c_str(), &end, 10);
            if (n.empty() || *end != '\0' || ticks == 0) {
                fprintf(stderr, "--synthetic expects a positive tick count, got '%s'\n", n.c_str());
                return false;
            }
            opts.synthetic_ticks = static_cast<size_t>(ticks);
        } else if (!arg.empty() && arg[0] == '-') {
            fprintf(stderr, "unknown option %s\n", arg.c_str());
            return false;
        } else if (opts.data_path.empty()) {
            opts.data_path = arg;
        } else {
            fprintf(stderr, "unexpected argument %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace statarb;

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    // --- Load config ---
    SystemConfig config;
    try {
        config = opts.config_path.empty() ? default_config() : load_config(opts.config_path);
    } catch (const std::exception& e) {
        fprintf(stderr, "config error: %s\n", e.what());
        return 1;
    }

    // Command line overrides the replay section
    ReplayConfig& replay = config.replay;
    if (!opts.trades_path.empty()) replay.trade_log_path = opts.trades_path;
    if (!opts.log_path.empty()) replay.log_path = opts.log_path;
    if (!opts.data_path.empty()) replay.data_path = opts.data_path;

    LogLevel level = LogLevel::Info;
    if (!Logger::parse_level(replay.log_level, level)) {
        fprintf(stderr, "unknown log level '%s'\n", replay.log_level.c_str());
        return 1;
    }
    Logger::instance().set_level(level);
    if (!replay.log_path.empty() && !Logger::instance().open_file(replay.log_path)) {
        fprintf(stderr, "cannot open log file '%s'\n", replay.log_path.c_str());
        return 1;
    }

    printf("=== Statistical Arbitrage Replay ===\n");
    printf("  Config:       %s\n", config.config_path.empty() ? "(built-in)" : config.config_path.c_str());

    // --- Load market data ---
    HistoricalFeed feed;
    try {
        if (opts.synthetic_ticks > 0) {
            SyntheticFeed synthetic = SyntheticFeed::research_universe();
            synthetic.fill(feed, opts.synthetic_ticks);
            printf("  Data:         %zu synthetic ticks x %zu instruments\n",
                   opts.synthetic_ticks, synthetic.instrument_count());
        } else if (!replay.data_path.empty()) {
            feed.load_csv(replay.data_path, replay.delimiter);
            printf("  Data:         %s (%zu rows, %zu dropped)\n",
                   replay.data_path.c_str(), feed.row_count(), feed.dropped_rows());
        } else {
            fprintf(stderr, "no market data: pass DATA_CSV or --synthetic N\n");
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "data error: %s\n", e.what());
        return 1;
    }

    // --- Run ---
    StrategyEngine engine(config.strategy);

    ReplaySimulator::Params params;
    params.depth_levels = replay.depth_levels;
    params.enforce_position_limits = replay.enforce_position_limits;
    ReplaySimulator simulator(engine, config.strategy.limits, params);

    printf("  Strategy:     %.*s (%zu instruments, %zu pairs, %zu baskets, %zu correlations)\n",
           static_cast<int>(engine.name().size()), engine.name().data(),
           config.strategy.instruments.size(), config.strategy.pairs.size(),
           config.strategy.baskets.size(), config.strategy.correlations.size());
    printf("  Limits:       %s\n", params.enforce_position_limits ? "enforced" : "audited");

    uint64_t start = now_ns();
    simulator.run(feed);
    double elapsed = static_cast<double>(now_ns() - start) / 1e9;

    simulator.metrics().print_summary(elapsed);
    print_report(analyze_performance(simulator.trades(), simulator.ledger(),
                                     simulator.pnl_history()));

    int exit_code = 0;
    if (!replay.trade_log_path.empty()) {
        try {
            simulator.write_trade_log(replay.trade_log_path);
            printf("Trade log written to %s\n", replay.trade_log_path.c_str());
        } catch (const std::exception& e) {
            fprintf(stderr, "%s\n", e.what());
            exit_code = 1;
        }
    }
    if (!opts.metrics_path.empty() && !simulator.metrics().dump_csv(opts.metrics_path)) {
        fprintf(stderr, "cannot write metrics to '%s'\n", opts.metrics_path.c_str());
        exit_code = 1;
    }

    Logger::instance().flush();
    return exit_code;
}
