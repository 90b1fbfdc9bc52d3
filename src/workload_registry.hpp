#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// A named (schema, data, target class) fixture. Immutable once registered.
struct Workload {
    std::string name;
    std::string schema_text;    // schema in its JSON serialization
    nlohmann::json data;
    std::string target_class;
};

class WorkloadRegistry {
public:
    using json = nlohmann::json;
    using const_iterator = std::vector<Workload>::const_iterator;

    WorkloadRegistry() = default;
    explicit WorkloadRegistry(std::vector<Workload> workloads);

    // Builds a registry from the "workloads" array of a config document.
    // Entries that fail to load are skipped and kept in load_errors().
    static WorkloadRegistry from_config(const json& cfg, const std::string& base_dir);

    // Parses one entry. Throws WorkloadLoadError.
    static Workload load_workload(const json& entry, const std::string& base_dir);

    void add(Workload w);
    // Keeps only the named workloads (no-op for an empty filter).
    void retain(const std::vector<std::string>& names);

    const std::vector<Workload>& get_workloads() const { return workloads_; }
    const_iterator begin() const { return workloads_.begin(); }
    const_iterator end() const { return workloads_.end(); }
    size_t size() const { return workloads_.size(); }
    bool empty() const { return workloads_.empty(); }

    const std::vector<std::string>& load_errors() const { return load_errors_; }

private:
    std::vector<Workload> workloads_;
    std::vector<std::string> load_errors_;
};

// simple, complex, batch_{10,100,1000}, pattern_{valid,invalid},
// enum_large_{valid,invalid}, deep_inheritance, invalid
std::vector<Workload> builtin_workloads();
