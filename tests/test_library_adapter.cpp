#include <gtest/gtest.h>
#include <stdexcept>

#include "adapters/library_adapter.hpp"
#include "errors.hpp"
#include "workload_registry.hpp"

using json = nlohmann::json;

namespace {

struct FakeSchema : SchemaObject {};
struct FakeView : SchemaView {
    size_t class_count() const override { return 1; }
    size_t induced_slot_count() const override { return 2; }
};

// Engine whose stages can be made to fail one at a time.
class FakeEngine : public ISchemaEngine {
public:
    enum class FailAt { None, Parse, Prepare, Validate };
    explicit FakeEngine(FailAt fail, int* calls = nullptr) : fail_(fail), calls_(calls) {}

    bool initialize(const json&) override { return true; }
    std::string name() const override { return "fake"; }

    std::shared_ptr<SchemaObject> parse(const std::string&) override {
        bump();
        if (fail_ == FailAt::Parse) throw SchemaError("bad schema");
        return std::make_shared<FakeSchema>();
    }
    std::shared_ptr<SchemaView> build_view(const SchemaObject&) override {
        bump();
        if (fail_ == FailAt::Prepare) throw SchemaError("cannot induce");
        return std::make_shared<FakeView>();
    }
    ValidationReport validate(const json&, const SchemaObject&, const std::string& target_class) override {
        bump();
        if (fail_ == FailAt::Validate) throw std::runtime_error("validator crashed");
        ValidationReport r;
        r.target_class = target_class;
        r.instance_count = 1;
        return r;
    }

private:
    void bump() { if (calls_) ++*calls_; }
    FailAt fail_;
    int* calls_;
};

Workload simple_workload() {
    for (auto& w : builtin_workloads()) if (w.name == "simple") return w;
    throw std::runtime_error("missing builtin");
}

} // namespace

TEST(LibraryAdapter, NativeEngineMeasuresThreeStages) {
    LibraryAdapter adapter;
    ASSERT_TRUE(adapter.initialize({{"name", "native-inproc"}, {"engine", "native"}}));
    EXPECT_EQ(adapter.name(), "native-inproc");
    EXPECT_EQ(adapter.kind(), "library");

    auto r = adapter.run(simple_workload());
    EXPECT_EQ(r.adapter, "native-inproc");
    EXPECT_EQ(r.workload, "simple");
    ASSERT_EQ(r.stages.size(), 3u);
    EXPECT_EQ(r.stages[0].stage, kStageParse);
    EXPECT_EQ(r.stages[1].stage, kStagePrepare);
    EXPECT_EQ(r.stages[2].stage, kStageValidate);
    for (const auto& s : r.stages) {
        EXPECT_TRUE(s.available()) << s.stage << ": " << s.error;
        EXPECT_GE(s.ms, 0.0);
    }
    EXPECT_EQ(r.stages[1].payload["classes"], 1);
    EXPECT_EQ(r.stages[2].payload["valid"], true);
}

TEST(LibraryAdapter, InvalidDataIsStillASuccessfulRun) {
    LibraryAdapter adapter;
    ASSERT_TRUE(adapter.initialize({{"engine", "native"}}));
    Workload w = simple_workload();
    w.data = {{"age", 200}};
    auto r = adapter.run(w);
    ASSERT_EQ(r.stages.size(), 3u);
    EXPECT_TRUE(r.stages[2].available());
    EXPECT_EQ(r.stages[2].payload["valid"], false);
}

TEST(LibraryAdapter, ParseFailureSkipsDownstream) {
    int calls = 0;
    LibraryAdapter adapter("fake", std::make_unique<FakeEngine>(FakeEngine::FailAt::Parse, &calls));
    ASSERT_TRUE(adapter.initialize(json::object()));
    auto r = adapter.run(simple_workload());
    ASSERT_EQ(r.stages.size(), 3u);
    EXPECT_EQ(r.stages[0].ms, kUnavailableMs);
    EXPECT_EQ(r.stages[0].error, "bad schema");
    EXPECT_EQ(r.stages[1].ms, kUnavailableMs);
    EXPECT_EQ(r.stages[2].ms, kUnavailableMs);
    EXPECT_NE(r.stages[2].error.find("parse failed"), std::string::npos);
    EXPECT_EQ(calls, 1);
}

TEST(LibraryAdapter, PrepareFailureSkipsValidate) {
    LibraryAdapter adapter("fake", std::make_unique<FakeEngine>(FakeEngine::FailAt::Prepare));
    ASSERT_TRUE(adapter.initialize(json::object()));
    auto r = adapter.run(simple_workload());
    ASSERT_EQ(r.stages.size(), 3u);
    EXPECT_TRUE(r.stages[0].available());
    EXPECT_FALSE(r.stages[1].available());
    EXPECT_FALSE(r.stages[2].available());
    EXPECT_NE(r.stages[2].error.find("prepare failed"), std::string::npos);
}

TEST(LibraryAdapter, ValidateFailureKeepsEarlierStages) {
    LibraryAdapter adapter("fake", std::make_unique<FakeEngine>(FakeEngine::FailAt::Validate));
    ASSERT_TRUE(adapter.initialize(json::object()));
    auto r = adapter.run(simple_workload());
    ASSERT_EQ(r.stages.size(), 3u);
    EXPECT_TRUE(r.stages[0].available());
    EXPECT_TRUE(r.stages[1].available());
    EXPECT_EQ(r.stages[2].ms, kUnavailableMs);
    EXPECT_EQ(r.stages[2].error, "validator crashed");
    EXPECT_GE(r.stages[2].elapsed_ms, 0.0);
}

TEST(LibraryAdapter, RunsAreIndependent) {
    LibraryAdapter adapter;
    ASSERT_TRUE(adapter.initialize({{"engine", "native"}}));
    auto a = adapter.run(simple_workload());
    auto b = adapter.run(simple_workload());
    EXPECT_EQ(a.available_count(), 3u);
    EXPECT_EQ(b.available_count(), 3u);
}

TEST(LibraryAdapter, UnknownEngineReportsEverythingUnavailable) {
    LibraryAdapter adapter;
    EXPECT_FALSE(adapter.initialize({{"name", "ghost"}, {"engine", "no-such-engine"}}));
    auto r = adapter.run(simple_workload());
    ASSERT_EQ(r.stages.size(), 3u);
    for (const auto& s : r.stages) {
        EXPECT_EQ(s.ms, kUnavailableMs);
        EXPECT_NE(s.error.find("no-such-engine"), std::string::npos);
    }
}

TEST(LibraryAdapter, MistypedConfigFailsInitializeInsteadOfThrowing) {
    LibraryAdapter bad_name;
    EXPECT_FALSE(bad_name.initialize({{"name", 7}, {"engine", "native"}}));
    for (const auto& s : bad_name.run(simple_workload()).stages) EXPECT_EQ(s.ms, kUnavailableMs);

    LibraryAdapter bad_depth;
    EXPECT_FALSE(bad_depth.initialize({{"engine", "native"}, {"max_depth", "deep"}}));
    auto r = bad_depth.run(simple_workload());
    ASSERT_EQ(r.stages.size(), 3u);
    for (const auto& s : r.stages) EXPECT_EQ(s.ms, kUnavailableMs);
}
