#include "library_adapter.hpp"
#include <iostream>

LibraryAdapter::LibraryAdapter(std::string name, std::unique_ptr<ISchemaEngine> engine)
    : name_(std::move(name)), engine_(std::move(engine)) {}

bool LibraryAdapter::initialize(const json& cfg) {
    std::string engine_name;
    try {
        name_ = cfg.value("name", name_);
        verbose_ = cfg.value("verbose", false);
        engine_name = cfg.value("engine", "native");
    } catch (const json::type_error& e) {
        init_error_ = std::string("bad adapter config: ") + e.what();
        std::cerr << "[LibraryAdapter] " << name_ << ": " << init_error_ << std::endl;
        engine_.reset();
        return false;
    }

    if (!engine_) {
        engine_ = make_schema_engine(engine_name);
        if (!engine_) {
            init_error_ = "schema engine '" + engine_name + "' is not available in this build";
            std::cerr << "[LibraryAdapter] " << name_ << ": " << init_error_ << std::endl;
            return false;
        }
    }
    bool engine_ok = false;
    try {
        engine_ok = engine_->initialize(cfg);
    } catch (const json::type_error& e) {
        std::cerr << "[LibraryAdapter] " << name_ << ": bad engine config: " << e.what() << std::endl;
    }
    if (!engine_ok) {
        init_error_ = "schema engine '" + engine_->name() + "' failed to initialize";
        std::cerr << "[LibraryAdapter] " << name_ << ": " << init_error_ << std::endl;
        engine_.reset();
        return false;
    }
    if (verbose_) {
        std::cerr << "[LibraryAdapter] " << name_ << " using engine " << engine_->name() << std::endl;
    }
    return true;
}

std::vector<std::string> LibraryAdapter::stage_names() const {
    return {kStageParse, kStagePrepare, kStageValidate};
}

AdapterResult LibraryAdapter::run(const Workload& w) {
    AdapterResult r;
    r.adapter = name_;
    r.workload = w.name;

    if (!engine_) {
        const std::string reason = init_error_.empty() ? "adapter not initialized" : init_error_;
        for (const auto& s : stage_names()) r.stages.push_back(skipped_stage(s, reason));
        return r;
    }

    std::shared_ptr<SchemaObject> schema;
    r.stages.push_back(to_timed_result(kStageParse, measure([&] {
        schema = engine_->parse(w.schema_text);
    })));
    if (!r.stages.back().ok) {
        std::cerr << "[LibraryAdapter] " << name_ << "/" << w.name << " parse failed: "
                  << r.stages.back().error << std::endl;
        r.stages.push_back(skipped_stage(kStagePrepare, "skipped: parse failed"));
        r.stages.push_back(skipped_stage(kStageValidate, "skipped: parse failed"));
        return r;
    }

    r.stages.push_back(to_timed_result(kStagePrepare, measure([&] {
        auto view = engine_->build_view(*schema);
        return json{{"classes", view->class_count()}, {"induced_slots", view->induced_slot_count()}};
    })));
    if (!r.stages.back().ok) {
        std::cerr << "[LibraryAdapter] " << name_ << "/" << w.name << " prepare failed: "
                  << r.stages.back().error << std::endl;
        r.stages.push_back(skipped_stage(kStageValidate, "skipped: prepare failed"));
        return r;
    }

    r.stages.push_back(to_timed_result(kStageValidate, measure([&] {
        return engine_->validate(w.data, *schema, w.target_class).to_json();
    })));
    if (!r.stages.back().ok) {
        std::cerr << "[LibraryAdapter] " << name_ << "/" << w.name << " validate failed: "
                  << r.stages.back().error << std::endl;
    } else if (verbose_) {
        const auto& p = r.stages.back().payload;
        std::cerr << "[LibraryAdapter] " << name_ << "/" << w.name << " valid=" << p.value("valid", false)
                  << " issues=" << p.value("issues", json::array()).size() << std::endl;
    }
    return r;
}
