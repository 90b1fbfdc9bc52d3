#pragma once
#include "../timed_invoker.hpp"
#include "../workload_registry.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

inline const std::string kStageParse = "parse";
inline const std::string kStagePrepare = "prepare";
inline const std::string kStageValidate = "validate";

// One measured implementation. run() never throws: every fault ends up as an
// unavailable stage in the returned AdapterResult.
class IAdapter {
public:
    using json = nlohmann::json;
    virtual ~IAdapter() = default;
    virtual bool initialize(const json& cfg) = 0;
    virtual std::string name() const = 0;
    virtual std::string kind() const = 0;
    // Stages run() reports, in order.
    virtual std::vector<std::string> stage_names() const = 0;
    virtual AdapterResult run(const Workload& w) = 0;
};
