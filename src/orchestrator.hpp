#pragma once
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "adapters/iadapter.hpp"
#include "comparison_reporter.hpp"
#include "config.hpp"
#include "workload_registry.hpp"

struct PairComparison {
    std::string left;
    std::string right;
    std::vector<ComparisonRow> rows;
    // Positions in the adapter list; names need not be unique.
    size_t left_index{0};
    size_t right_index{0};
};

struct WorkloadRun {
    std::string workload;
    std::string target_class;
    std::vector<AdapterResult> results;     // adapter registration order
    std::vector<PairComparison> comparisons;
};

// Drives workloads x adapters strictly one after another and hands completed
// results to the reporter. Fault handling lives in the adapters.
class Orchestrator {
public:
    using json = nlohmann::json;

    Orchestrator(WorkloadRegistry registry, std::ostream& out);

    void add_adapter(std::unique_ptr<IAdapter> adapter);
    // Builds and initializes adapters from config. Adapters that fail to
    // initialize stay registered and report every stage unavailable.
    void add_adapters(const BenchConfig& cfg);

    void set_output(OutputMode m) { output_ = m; }
    void set_pairing(Pairing p) { pairing_ = p; }
    void set_strict_exit(bool on) { strict_exit_ = on; }

    // 0, or 1 in strict mode when nothing at all could be measured.
    int run();

    const std::vector<WorkloadRun>& runs() const { return runs_; }
    const std::vector<std::unique_ptr<IAdapter>>& adapters() const { return adapters_; }
    json report() const;

private:
    std::vector<std::pair<size_t, size_t>> pairs() const;
    void print_summary();
    json summary() const;

    WorkloadRegistry registry_;
    std::ostream& out_;
    ComparisonReporter reporter_;
    std::vector<std::unique_ptr<IAdapter>> adapters_;
    std::vector<WorkloadRun> runs_;
    OutputMode output_{OutputMode::Table};
    Pairing pairing_{Pairing::FirstTwo};
    bool strict_exit_{false};
};

// "library" or "process"; nullptr for anything else.
std::unique_ptr<IAdapter> make_adapter(const std::string& type);
