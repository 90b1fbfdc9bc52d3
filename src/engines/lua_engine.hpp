#pragma once
#ifdef HAVE_LUA
#include "ischema_engine.hpp"
#include <sol/sol.hpp>

struct LuaSchema : SchemaObject {
    sol::object value;
};

struct LuaSchemaView : SchemaView {
    size_t classes{0};
    size_t slots{0};
    size_t class_count() const override { return classes; }
    size_t induced_slot_count() const override { return slots; }
};

// JSON <-> Lua value bridging. Lists become 1-based sequences; tables whose
// keys are not exactly 1..n become objects (non-string keys are dropped).
nlohmann::json lua_to_json(const sol::object& v);
sol::object json_to_lua(sol::state& L, const nlohmann::json& j);

// Script-hosted engine. The script defines three globals:
//   parse(schema_table)                    -> schema
//   build_view(schema)                     -> { ClassName = { slot, ... }, ... }
//   validate(data_table, schema, class)    -> { valid = bool, instance_count = n,
//                                               issues = { { path =, message = }, ... } }
// Lua errors surface as std::runtime_error.
class LuaSchemaEngine : public ISchemaEngine {
public:
    LuaSchemaEngine();
    ~LuaSchemaEngine() override;

    // cfg: { "script": "path/to/engine.lua" } or { "source": "<lua code>" }
    bool initialize(const json& cfg) override;
    std::string name() const override { return "lua"; }

    bool load(const std::string& lua_source);

    std::shared_ptr<SchemaObject> parse(const std::string& schema_text) override;
    std::shared_ptr<SchemaView> build_view(const SchemaObject& schema) override;
    ValidationReport validate(const json& data, const SchemaObject& schema,
                              const std::string& target_class) override;

private:
    sol::protected_function entry(const char* fn);
    static const LuaSchema& as_lua(const SchemaObject& schema);

    sol::state L_;
    bool loaded_ = false;
};

#endif // HAVE_LUA
