#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "engines/native_engine.hpp"
#include "test_helpers.hpp"
#include "workload_registry.hpp"

using json = nlohmann::json;

TEST(BenchConfig, DefaultDocument) {
    auto cfg = BenchConfig::from_json(BenchConfig::default_document(), "", "/opt/bin");
    EXPECT_EQ(cfg.output, OutputMode::Table);
    EXPECT_EQ(cfg.pairing, Pairing::FirstTwo);
    EXPECT_FALSE(cfg.strict_exit);
    auto adapters = cfg.adapter_configs();
    ASSERT_EQ(adapters.size(), 2u);
    EXPECT_EQ(adapters[0]["type"], "library");
    EXPECT_EQ(adapters[1]["type"], "process");
    EXPECT_EQ(adapters[1]["timeout_ms"], 10000);
    EXPECT_EQ(adapters[1]["exe_dir"], "/opt/bin");
    EXPECT_EQ(adapters[1]["verbose"], false);
}

TEST(BenchConfig, MissingAdaptersUseDefaults) {
    auto cfg = BenchConfig::from_json({{"output", "json"}, {"pairing", "all-pairs"}, {"verbose", true}}, "");
    EXPECT_EQ(cfg.output, OutputMode::Json);
    EXPECT_EQ(cfg.pairing, Pairing::AllPairs);
    auto adapters = cfg.adapter_configs();
    ASSERT_EQ(adapters.size(), 2u);
    EXPECT_EQ(adapters[0]["verbose"], true);
}

TEST(BenchConfig, RejectsBadValues) {
    EXPECT_THROW(BenchConfig::from_json(json::array(), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"output", "xml"}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"pairing", "random"}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"verbose", "yes"}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"adapters", json::array({json::object({{"type", "grpc"}})})}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"adapters", "native"}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"builtin_workloads", "no"}}, ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json({{"workloads", json::object()}}, ""), ConfigError);
}

TEST(BenchConfig, RejectsMistypedAdapterFields) {
    auto with = [](size_t index, const std::string& key, const json& value) {
        auto doc = BenchConfig::default_document();
        doc["adapters"][index][key] = value;
        return doc;
    };
    EXPECT_THROW(BenchConfig::from_json(with(1, "timeout_ms", "10s"), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(1, "timeout_ms", -5), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(1, "candidates", json::array({1, 2})), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(1, "extra_args", "--quiet"), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(0, "name", 1), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(0, "type", 5), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(0, "engine", true), ""), ConfigError);
    EXPECT_THROW(BenchConfig::from_json(with(0, "verbose", "yes"), ""), ConfigError);

    try {
        BenchConfig::from_json(with(1, "timeout_ms", "10s"), "");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("schema-validate"), std::string::npos);
        EXPECT_NE(what.find("timeout_ms"), std::string::npos);
    }
}

TEST(BenchConfig, AcceptedAdaptersInitializeWithoutThrowing) {
    auto doc = BenchConfig::default_document();
    doc["adapters"][1]["timeout_ms"] = 250;
    doc["adapters"][1]["extra_args"] = json::array({"--quiet"});
    auto cfg = BenchConfig::from_json(doc, "");
    for (const auto& a : cfg.adapter_configs()) {
        auto adapter = make_adapter(a["type"].get<std::string>());
        ASSERT_NE(adapter, nullptr);
        EXPECT_NO_THROW(adapter->initialize(a));
    }
}

TEST(BenchConfig, LoadResolvesRelativeToConfigFile) {
    ScratchDir dir("config");
    auto path = dir.write("bench.json", R"({
        "adapters": [{"type": "library", "name": "lua", "engine": "lua", "script": "engine.lua"}]
    })");
    auto cfg = BenchConfig::load(path);
    EXPECT_EQ(cfg.base_dir, dir.str());
    auto adapters = cfg.adapter_configs();
    EXPECT_EQ(adapters[0]["script"], (dir.path() / "engine.lua").string());
}

TEST(BenchConfig, LoadErrors) {
    ScratchDir dir("config");
    EXPECT_THROW(BenchConfig::load((dir.path() / "missing.json").string()), ConfigError);
    auto bad = dir.write("bad.json", "{ nope");
    EXPECT_THROW(BenchConfig::load(bad), ConfigError);
}

TEST(BenchConfig, TimeoutOverrideOnlyTouchesProcessAdapters) {
    auto cfg = BenchConfig::from_json(BenchConfig::default_document(), "");
    cfg.set_timeout_ms(250);
    auto adapters = cfg.adapter_configs();
    EXPECT_FALSE(adapters[0].contains("timeout_ms"));
    EXPECT_EQ(adapters[1]["timeout_ms"], 250);
}

TEST(BenchConfig, PrependBinaryKeepsDefaults) {
    auto cfg = BenchConfig::from_json(BenchConfig::default_document(), "", "/opt/bin");
    cfg.prepend_binary("/first/schema-validate");
    cfg.prepend_binary("/second/schema-validate");
    auto c = cfg.adapter_configs()[1]["candidates"];
    ASSERT_GT(c.size(), 2u);
    EXPECT_EQ(c[0], "/second/schema-validate");
    EXPECT_EQ(c[1], "/first/schema-validate");
    EXPECT_EQ(c.back(), "/opt/bin/schema-validate");
    EXPECT_FALSE(cfg.adapter_configs()[0].contains("candidates"));
}

TEST(BenchConfig, ExampleConfigAndFixturesLoad) {
    auto cfg = BenchConfig::load(std::string(SCHEMABENCH_SOURCE_DIR) + "/config/bench.example.json");
    EXPECT_EQ(cfg.pairing, Pairing::AllPairs);
    EXPECT_EQ(cfg.adapter_configs().size(), 3u);

    auto reg = WorkloadRegistry::from_config(cfg.doc, cfg.base_dir);
    EXPECT_TRUE(reg.load_errors().empty());
    reg.retain({"library_books"});
    ASSERT_EQ(reg.size(), 1u);

    const auto& w = reg.get_workloads()[0];
    NativeSchemaEngine engine;
    ASSERT_TRUE(engine.initialize(json::object()));
    auto schema = engine.parse(w.schema_text);
    auto view = engine.build_view(*schema);
    EXPECT_EQ(view->class_count(), 3u);
    auto report = engine.validate(w.data, *schema, w.target_class);
    EXPECT_TRUE(report.valid) << report.to_json().dump();
    EXPECT_EQ(report.instance_count, 2u);
}
