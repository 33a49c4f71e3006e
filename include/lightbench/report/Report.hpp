#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "lightbench/metrics/MetricsSink.hpp"

namespace lightbench {

class Report {
public:
    // Flat per-protocol table followed by the error breakdown.
    static void writeTable(std::ostream& os, const std::vector<StatsSnapshot>& stats);

    // One line per protocol, used for interval reports during a run.
    static void writeSummary(std::ostream& os, const std::vector<StatsSnapshot>& stats);

    // <prefix>_stats.csv and <prefix>_failures.csv. Returns false and logs
    // if a file cannot be written.
    static bool writeCsv(const std::string& prefix, const std::vector<StatsSnapshot>& stats);

    static void writeStatsCsv(std::ostream& os, const std::vector<StatsSnapshot>& stats);
    static void writeFailuresCsv(std::ostream& os, const std::vector<StatsSnapshot>& stats);
};

} // namespace lightbench
