#include "lightbench/report/Report.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>

namespace lightbench {

static std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void Report::writeTable(std::ostream& os, const std::vector<StatsSnapshot>& stats) {
    const auto flags = os.flags();
    const auto prec = os.precision();

    os << std::left
       << std::setw(9)  << "Protocol"
       << std::setw(16) << "Name"
       << std::right
       << std::setw(9)  << "Count"
       << std::setw(9)  << "Fails"
       << std::setw(9)  << "p50"
       << std::setw(9)  << "p90"
       << std::setw(9)  << "p95"
       << std::setw(9)  << "p99"
       << std::setw(8)  << "Err%"
       << std::setw(12) << "Bytes"
       << std::setw(9)  << "AvgB"
       << std::setw(9)  << "Req/s" << "\n";
    os << std::string(118, '-') << "\n";

    uint64_t count = 0, fails = 0, bytes = 0;
    double rps = 0.0;
    os << std::fixed;
    for (const auto& s : stats) {
        os << std::left
           << std::setw(9)  << s.label
           << std::setw(16) << s.name
           << std::right
           << std::setw(9)  << s.count
           << std::setw(9)  << s.failures
           << std::setprecision(1)
           << std::setw(9)  << s.p50_ms
           << std::setw(9)  << s.p90_ms
           << std::setw(9)  << s.p95_ms
           << std::setw(9)  << s.p99_ms
           << std::setprecision(2)
           << std::setw(8)  << s.errorRate() * 100.0
           << std::setw(12) << s.bytes_total
           << std::setprecision(0)
           << std::setw(9)  << s.avgBytes()
           << std::setprecision(1)
           << std::setw(9)  << s.rps << "\n";
        count += s.count;
        fails += s.failures;
        bytes += s.bytes_total;
        rps += s.rps;
    }
    os << std::string(118, '-') << "\n";
    os << std::left << std::setw(25) << "Aggregated"
       << std::right
       << std::setw(9) << count
       << std::setw(9) << fails
       << std::setw(36) << ""
       << std::setprecision(2)
       << std::setw(8) << (count ? 100.0 * static_cast<double>(fails) / static_cast<double>(count) : 0.0)
       << std::setw(12) << bytes
       << std::setw(9) << ""
       << std::setprecision(1)
       << std::setw(9) << rps << "\n";

    bool any = false;
    for (const auto& s : stats) {
        for (const auto& e : s.errors) {
            if (!any) {
                os << "\nError report\n";
                os << std::left << std::setw(9) << "Protocol"
                   << std::setw(22) << "Error" << std::right
                   << std::setw(9) << "Count" << "\n";
                os << std::string(40, '-') << "\n";
                any = true;
            }
            os << std::left << std::setw(9) << s.label
               << std::setw(22) << errorClassName(e.first) << std::right
               << std::setw(9) << e.second << "\n";
        }
    }

    os.flags(flags);
    os.precision(prec);
}

void Report::writeSummary(std::ostream& os, const std::vector<StatsSnapshot>& stats) {
    const auto flags = os.flags();
    const auto prec = os.precision();
    os << std::fixed << std::setprecision(1);
    for (const auto& s : stats) {
        os << "[REPORT] " << s.label
           << " n=" << s.count
           << " fail=" << s.failures
           << " p50=" << s.p50_ms << "ms"
           << " p99=" << s.p99_ms << "ms"
           << " rps=" << s.rps << "\n";
    }
    os.flags(flags);
    os.precision(prec);
}

void Report::writeStatsCsv(std::ostream& os, const std::vector<StatsSnapshot>& stats) {
    os << "Protocol,Name,Request Count,Failure Count,Min (ms),Max (ms),Mean (ms),"
          "50%,90%,95%,99%,Error Rate,Total Bytes,Average Bytes,Requests/s\n";
    for (const auto& s : stats) {
        os << csvField(s.label) << ',' << csvField(s.name) << ','
           << s.count << ',' << s.failures << ','
           << s.min_ms << ',' << s.max_ms << ',' << s.mean_ms << ','
           << s.p50_ms << ',' << s.p90_ms << ',' << s.p95_ms << ',' << s.p99_ms << ','
           << s.errorRate() << ',' << s.bytes_total << ',' << s.avgBytes() << ','
           << s.rps << "\n";
    }
}

void Report::writeFailuresCsv(std::ostream& os, const std::vector<StatsSnapshot>& stats) {
    os << "Protocol,Name,Error,Occurrences\n";
    for (const auto& s : stats) {
        for (const auto& e : s.errors) {
            os << csvField(s.label) << ',' << csvField(s.name) << ','
               << errorClassName(e.first) << ',' << e.second << "\n";
        }
    }
}

bool Report::writeCsv(const std::string& prefix, const std::vector<StatsSnapshot>& stats) {
    const std::string stats_path = prefix + "_stats.csv";
    const std::string fail_path = prefix + "_failures.csv";

    std::ofstream st(stats_path);
    if (!st) {
        std::cerr << "[REPORT] Cannot write " << stats_path << "\n";
        return false;
    }
    writeStatsCsv(st, stats);

    std::ofstream fl(fail_path);
    if (!fl) {
        std::cerr << "[REPORT] Cannot write " << fail_path << "\n";
        return false;
    }
    writeFailuresCsv(fl, stats);

    std::cout << "[REPORT] Wrote " << stats_path << " and " << fail_path << "\n";
    return true;
}

} // namespace lightbench
