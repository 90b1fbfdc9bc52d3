#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include "config.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "workload_registry.hpp"

// Very small CLI parser
struct Args {
    std::string config_path;
    bool json = false;
    bool all_pairs = false;
    bool strict = false;
    bool verbose = false;
    bool list = false;
    int timeout_ms = 0;
    std::vector<std::string> binaries;
    std::vector<std::string> workloads;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config FILE] [--json] [--all-pairs] [--strict] [--verbose]\n"
              << "       [--timeout-ms N] [--binary PATH] [--workload NAME]... [--list]\n";
    std::cout << "\nTimes schema parsing and validation across the configured adapters and prints\n"
              << "side-by-side comparisons. Without --config the built-in workloads are compared\n"
              << "between the in-process engine and the schema-validate binary.\n";
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--config" && i + 1 < argc) { a.config_path = argv[++i]; }
        else if (s == "--json") { a.json = true; }
        else if (s == "--all-pairs") { a.all_pairs = true; }
        else if (s == "--strict") { a.strict = true; }
        else if (s == "--verbose") { a.verbose = true; }
        else if (s == "--list") { a.list = true; }
        else if (s == "--timeout-ms" && i + 1 < argc) { a.timeout_ms = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--binary" && i + 1 < argc) { a.binaries.push_back(argv[++i]); }
        else if (s == "--workload" && i + 1 < argc) { a.workloads.push_back(argv[++i]); }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    return a;
}

static std::string executable_dir(const char* argv0) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) self = std::filesystem::absolute(argv0, ec);
    return ec ? std::string() : self.parent_path().string();
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    const std::string exe_dir = executable_dir(argv[0]);

    BenchConfig cfg;
    try {
        cfg = args.config_path.empty()
                  ? BenchConfig::from_json(BenchConfig::default_document(), "", exe_dir)
                  : BenchConfig::load(args.config_path, exe_dir);
    } catch (const ConfigError& e) {
        std::cerr << "[schemabench] " << e.what() << "\n";
        return 2;
    }

    if (args.json) cfg.output = OutputMode::Json;
    if (args.all_pairs) cfg.pairing = Pairing::AllPairs;
    if (args.strict) cfg.strict_exit = true;
    if (args.verbose) cfg.verbose = true;
    if (args.timeout_ms > 0) cfg.set_timeout_ms(args.timeout_ms);
    // Last --binary ends up first.
    for (const auto& b : args.binaries) cfg.prepend_binary(b);
    cfg.workload_filter = args.workloads;

    auto registry = WorkloadRegistry::from_config(cfg.doc, cfg.base_dir);
    registry.retain(cfg.workload_filter);

    if (args.list) {
        for (const auto& w : registry) std::cout << w.name << " (" << w.target_class << ")\n";
        return 0;
    }
    if (registry.empty()) {
        std::cerr << "[schemabench] no workloads to run\n";
    }

    Orchestrator orchestrator(std::move(registry), std::cout);
    orchestrator.set_output(cfg.output);
    orchestrator.set_pairing(cfg.pairing);
    orchestrator.set_strict_exit(cfg.strict_exit);
    orchestrator.add_adapters(cfg);

    return orchestrator.run();
}
