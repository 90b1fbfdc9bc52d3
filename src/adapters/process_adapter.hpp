#pragma once
#include "iadapter.hpp"
#include "binary_locator.hpp"

// Out-of-process variant. Writes the workload to a scoped temp directory and runs
//   <binary> validate --schema <path> --data <path> --target-class <name>
// The whole subprocess wall time is the "validate" stage; parse and prepare
// happen inside the child and cannot be timed separately from here.
class ProcessAdapter : public IAdapter {
public:
    static constexpr int kDefaultTimeoutMs = 10000;

    ProcessAdapter() = default;

    // cfg: { "name", "program", "candidates": [...], "timeout_ms", "temp_dir",
    //        "extra_args": [...], "verbose" }
    bool initialize(const json& cfg) override;
    std::string name() const override { return name_; }
    std::string kind() const override { return "process"; }
    std::vector<std::string> stage_names() const override { return {kStageValidate}; }
    AdapterResult run(const Workload& w) override;

    BinaryLocator& locator() { return locator_; }
    int timeout_ms() const { return timeout_ms_; }
    const std::string& temp_root() const { return temp_root_; }

private:
    TimedResult invoke(const std::string& exe, const Workload& w);

    std::string name_{"process"};
    std::string program_{"schema-validate"};
    BinaryLocator locator_;
    int timeout_ms_{kDefaultTimeoutMs};
    std::string temp_root_;
    std::vector<std::string> extra_args_;
    std::string init_error_;
    bool verbose_{false};
};
