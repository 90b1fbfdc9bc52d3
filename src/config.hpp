#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class OutputMode { Table, Json };
enum class Pairing { FirstTwo, AllPairs };

struct BenchConfig {
    using json = nlohmann::json;

    bool verbose{false};
    OutputMode output{OutputMode::Table};
    Pairing pairing{Pairing::FirstTwo};
    bool strict_exit{false};
    std::vector<std::string> workload_filter;
    std::string base_dir;       // relative workload files resolve against this
    std::string exe_dir;        // directory of the running harness binary
    json doc = json::object();  // "workloads", "builtin_workloads", "adapters"

    // Throws ConfigError on a malformed document.
    static BenchConfig from_json(const json& doc, const std::string& base_dir, const std::string& exe_dir = "");
    // Reads and parses path. Throws ConfigError.
    static BenchConfig load(const std::string& path, const std::string& exe_dir = "");
    // Built-in workloads, the native in-process engine and the schema-validate binary.
    static json default_document();

    // Adapter configs with verbose and exe_dir filled in.
    json adapter_configs() const;

    void set_timeout_ms(int ms);
    // Makes path the first candidate of every process adapter.
    void prepend_binary(const std::string& path);
};
