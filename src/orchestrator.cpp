#include "orchestrator.hpp"
#include "adapters/library_adapter.hpp"
#include "adapters/process_adapter.hpp"
#include <array>
#include <iomanip>
#include <iostream>
#include <map>

using json = nlohmann::json;

std::unique_ptr<IAdapter> make_adapter(const std::string& type) {
    if (type == "library") return std::make_unique<LibraryAdapter>();
    if (type == "process") return std::make_unique<ProcessAdapter>();
    return nullptr;
}

Orchestrator::Orchestrator(WorkloadRegistry registry, std::ostream& out)
    : registry_(std::move(registry)), out_(out), reporter_(out) {}

void Orchestrator::add_adapter(std::unique_ptr<IAdapter> adapter) {
    adapters_.push_back(std::move(adapter));
}

void Orchestrator::add_adapters(const BenchConfig& cfg) {
    for (const auto& a : cfg.adapter_configs()) {
        const std::string type = a.value("type", "");
        auto adapter = make_adapter(type);
        if (!adapter) {
            std::cerr << "[Orchestrator] Unknown adapter type '" << type << "', skipping" << std::endl;
            continue;
        }
        if (!adapter->initialize(a)) {
            std::cerr << "[Orchestrator] Adapter '" << adapter->name()
                      << "' failed to initialize, its results will be unavailable" << std::endl;
        }
        add_adapter(std::move(adapter));
    }
}

std::vector<std::pair<size_t, size_t>> Orchestrator::pairs() const {
    std::vector<std::pair<size_t, size_t>> out;
    if (adapters_.size() < 2) return out;
    if (pairing_ == Pairing::FirstTwo) {
        out.emplace_back(0, 1);
        return out;
    }
    for (size_t i = 0; i < adapters_.size(); ++i) {
        for (size_t j = i + 1; j < adapters_.size(); ++j) out.emplace_back(i, j);
    }
    return out;
}

int Orchestrator::run() {
    runs_.clear();
    reporter_.set_printing(output_ == OutputMode::Table);

    if (output_ == OutputMode::Table) {
        out_ << "schemabench: " << registry_.size() << " workload(s), " << adapters_.size() << " adapter(s)\n";
    }

    for (const auto& w : registry_) {
        WorkloadRun run;
        run.workload = w.name;
        run.target_class = w.target_class;

        for (auto& adapter : adapters_) {
            run.results.push_back(adapter->run(w));
        }

        const std::string title = w.name + " (" + w.target_class + ")";
        for (const auto& [i, j] : pairs()) {
            const auto& left = run.results[i];
            const auto& right = run.results[j];
            auto rows = reporter_.compare(title + ": " + left.adapter + " vs " + right.adapter, left, right);
            run.comparisons.push_back({left.adapter, right.adapter, std::move(rows), i, j});
        }
        if (adapters_.size() == 1) {
            AdapterResult none;
            none.adapter = "(none)";
            reporter_.compare(title + ": " + run.results[0].adapter, run.results[0], none);
        }
        runs_.push_back(std::move(run));
    }

    if (output_ == OutputMode::Json) {
        out_ << report().dump(2) << std::endl;
    } else {
        print_summary();
    }

    if (strict_exit_) {
        size_t measured = 0, expected = 0;
        for (const auto& run : runs_) {
            for (const auto& r : run.results) {
                measured += r.available_count();
                expected += r.stages.size();
            }
        }
        if (expected > 0 && measured == 0) return 1;
    }
    return 0;
}

// --------------------- summary ---------------------

json Orchestrator::summary() const {
    json adapters = json::array();
    for (size_t k = 0; k < adapters_.size(); ++k) {
        size_t measured = 0, expected = 0;
        double total_ms = 0.0;
        for (const auto& run : runs_) {
            const auto& r = run.results[k];
            expected += r.stages.size();
            for (const auto& s : r.stages) {
                if (!s.available()) continue;
                ++measured;
                total_ms += s.ms;
            }
        }
        adapters.push_back({
            {"adapter", adapters_[k]->name()},
            {"kind", adapters_[k]->kind()},
            {"measured_stages", measured},
            {"expected_stages", expected},
            {"total_ms", total_ms}
        });
    }

    json pair_summaries = json::array();
    for (const auto& [i, j] : pairs()) {
        // stage -> (left faster, right faster, not comparable), first-seen order
        std::vector<std::string> order;
        std::map<std::string, std::array<int, 3>> counts;
        for (const auto& run : runs_) {
            for (const auto& cmp : run.comparisons) {
                if (cmp.left_index != i || cmp.right_index != j) continue;
                for (const auto& row : cmp.rows) {
                    if (!counts.count(row.label)) {
                        order.push_back(row.label);
                        counts[row.label] = {0, 0, 0};
                    }
                    auto& c = counts[row.label];
                    if (!row.speedup) ++c[2];
                    else if (*row.speedup < 1.0) ++c[0];
                    else ++c[1];
                }
            }
        }
        json stages = json::array();
        for (const auto& label : order) {
            const auto& c = counts[label];
            stages.push_back({{"stage", label}, {"left_faster", c[0]}, {"right_faster", c[1]}, {"not_comparable", c[2]}});
        }
        pair_summaries.push_back({{"left", adapters_[i]->name()}, {"right", adapters_[j]->name()}, {"stages", stages}});
    }

    json skipped = json::array();
    for (const auto& e : registry_.load_errors()) skipped.push_back(e);

    return {{"adapters", adapters}, {"pairs", pair_summaries}, {"skipped_workloads", skipped}};
}

void Orchestrator::print_summary() {
    const json s = summary();
    out_ << "\n== Summary ==\n";
    for (const auto& a : s["adapters"]) {
        out_ << a["adapter"].get<std::string>() << " (" << a["kind"].get<std::string>() << "): "
             << a["measured_stages"].get<size_t>() << "/" << a["expected_stages"].get<size_t>()
             << " stages measured, " << std::fixed << std::setprecision(2) << a["total_ms"].get<double>()
             << " ms total\n";
    }
    for (const auto& p : s["pairs"]) {
        const auto left = p["left"].get<std::string>();
        const auto right = p["right"].get<std::string>();
        out_ << left << " vs " << right << ":\n";
        for (const auto& st : p["stages"]) {
            out_ << "  " << st["stage"].get<std::string>() << ": " << left << " faster on "
                 << st["left_faster"].get<int>() << ", " << right << " faster on " << st["right_faster"].get<int>()
                 << ", not comparable on " << st["not_comparable"].get<int>() << "\n";
        }
    }
    if (!s["skipped_workloads"].empty()) {
        out_ << "skipped workloads: " << s["skipped_workloads"].size() << "\n";
        for (const auto& e : s["skipped_workloads"]) out_ << "  " << e.get<std::string>() << "\n";
    }
    out_.flush();
}

json Orchestrator::report() const {
    auto ms_or_null = [](double ms) -> json { return ms >= 0.0 ? json(ms) : json(nullptr); };

    json workloads = json::array();
    for (const auto& run : runs_) {
        json results = json::array();
        for (const auto& r : run.results) {
            json stages = json::array();
            for (const auto& s : r.stages) {
                json st = {{"stage", s.stage}, {"ms", ms_or_null(s.ms)}, {"elapsed_ms", s.elapsed_ms}, {"ok", s.ok}};
                if (!s.error.empty()) st["error"] = s.error;
                if (s.ok && s.payload.is_object() && s.payload.contains("valid")) st["valid"] = s.payload["valid"];
                stages.push_back(st);
            }
            results.push_back({{"adapter", r.adapter}, {"stages", stages}});
        }
        json comparisons = json::array();
        for (const auto& c : run.comparisons) {
            json rows = json::array();
            for (const auto& row : c.rows) rows.push_back(row.to_json());
            comparisons.push_back({{"left", c.left}, {"right", c.right}, {"rows", rows}});
        }
        workloads.push_back({
            {"name", run.workload},
            {"target_class", run.target_class},
            {"results", results},
            {"comparisons", comparisons}
        });
    }
    return {{"workloads", workloads}, {"summary", summary()}};
}
