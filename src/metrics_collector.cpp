#include "monitoring/metrics_collector.hpp"
#include <fstream>

namespace statarb {

void MetricsCollector::print_summary(double elapsed_seconds) const {
    printf("\n");
    printf("=== Replay Summary ===\n");

    printf("--- Throughput (%.3fs elapsed) ---\n", elapsed_seconds);
    printf("  Ticks:            %lu (%lu skipped)\n",
           static_cast<unsigned long>(tick_count_),
           static_cast<unsigned long>(skipped_tick_count_));
    if (elapsed_seconds > 0) {
        printf("  Tick rate:        %.0f ticks/sec\n",
               static_cast<double>(tick_count_) / elapsed_seconds);
    }
    printf("  Orders received:  %lu\n", static_cast<unsigned long>(orders_received_));
    printf("  Orders rejected:  %lu\n", static_cast<unsigned long>(orders_rejected_));
    printf("  Fills:            %lu\n", static_cast<unsigned long>(fill_count_));
    printf("  Limit warnings:   %lu\n", static_cast<unsigned long>(limit_warnings_));
    printf("\n");

    printf("--- Strategy Latency (nanoseconds) ---\n");
    printf("%10s %10s %10s %10s %12s\n", "p50", "p90", "p99", "max", "mean");
    if (strategy_latency_.count() == 0) {
        printf("%10s %10s %10s %10s %12s\n", "N/A", "N/A", "N/A", "N/A", "N/A");
        return;
    }
    auto stats = strategy_latency_.compute_stats();
    printf("%10lu %10lu %10lu %10lu %12.1f\n",
           static_cast<unsigned long>(stats.p50),
           static_cast<unsigned long>(stats.p90),
           static_cast<unsigned long>(stats.p99),
           static_cast<unsigned long>(stats.max),
           stats.mean);
}

bool MetricsCollector::dump_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) return false;

    file << "metric,value\n";
    file << "ticks," << tick_count_ << "\n";
    file << "skipped_ticks," << skipped_tick_count_ << "\n";
    file << "orders_received," << orders_received_ << "\n";
    file << "orders_rejected," << orders_rejected_ << "\n";
    file << "fills," << fill_count_ << "\n";
    file << "limit_warnings," << limit_warnings_ << "\n";

    if (strategy_latency_.count() > 0) {
        auto stats = strategy_latency_.compute_stats();
        file << "strategy_p50_ns," << stats.p50 << "\n";
        file << "strategy_p90_ns," << stats.p90 << "\n";
        file << "strategy_p99_ns," << stats.p99 << "\n";
        file << "strategy_max_ns," << stats.max << "\n";
    }
    return static_cast<bool>(file);
}

void MetricsCollector::reset() noexcept {
    strategy_latency_.clear();
    tick_count_ = 0;
    skipped_tick_count_ = 0;
    orders_received_ = 0;
    orders_rejected_ = 0;
    fill_count_ = 0;
    limit_warnings_ = 0;
}

} // namespace statarb
