#pragma once
#include "iadapter.hpp"
#include "../engines/ischema_engine.hpp"
#include <memory>

// In-process variant: parse, prepare (build_view) and validate are called
// directly and timed one by one.
class LibraryAdapter : public IAdapter {
public:
    LibraryAdapter() = default;
    // Uses a caller-supplied engine instead of the "engine" config key.
    LibraryAdapter(std::string name, std::unique_ptr<ISchemaEngine> engine);

    // cfg: { "name": "...", "engine": "native" | "lua", "script": "...", "verbose": bool }
    bool initialize(const json& cfg) override;
    std::string name() const override { return name_; }
    std::string kind() const override { return "library"; }
    std::vector<std::string> stage_names() const override;
    AdapterResult run(const Workload& w) override;

private:
    std::string name_{"library"};
    std::unique_ptr<ISchemaEngine> engine_;
    std::string init_error_;
    bool verbose_{false};
};
