#include "lua_engine.hpp"

#ifdef HAVE_LUA
#include "../errors.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

LuaSchemaEngine::LuaSchemaEngine() {
    L_.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table);
}

LuaSchemaEngine::~LuaSchemaEngine() = default;

bool LuaSchemaEngine::initialize(const json& cfg) {
    if (cfg.contains("source") && cfg["source"].is_string()) {
        return load(cfg["source"].get<std::string>());
    }
    const std::string path = cfg.value("script", "");
    if (path.empty()) {
        std::cerr << "[lua] engine config needs \"script\" or \"source\"\n";
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[lua] cannot open " << path << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return load(ss.str());
}

bool LuaSchemaEngine::load(const std::string& lua_source) {
    sol::protected_function_result r = L_.safe_script(lua_source, &sol::script_pass_on_error);
    if (!r.valid()) {
        sol::error err = r;
        std::cerr << "[lua] load error: " << err.what() << "\n";
        return false;
    }
    for (const char* fn : {"parse", "build_view", "validate"}) {
        sol::optional<sol::function> f = L_[fn];
        if (!f) {
            std::cerr << "[lua] script is missing " << fn << "()\n";
            return false;
        }
    }
    loaded_ = true;
    return true;
}

sol::protected_function LuaSchemaEngine::entry(const char* fn) {
    if (!loaded_) throw SchemaError("lua engine has no script loaded");
    sol::protected_function f = L_[fn];
    return f;
}

const LuaSchema& LuaSchemaEngine::as_lua(const SchemaObject& schema) {
    auto* s = dynamic_cast<const LuaSchema*>(&schema);
    if (!s) throw SchemaError("schema object was not produced by the lua engine");
    return *s;
}

std::shared_ptr<SchemaObject> LuaSchemaEngine::parse(const std::string& schema_text) {
    json doc;
    try {
        doc = json::parse(schema_text);
    } catch (const json::parse_error& e) {
        throw SchemaError(std::string("schema is not valid JSON: ") + e.what());
    }
    sol::protected_function_result r = entry("parse")(json_to_lua(L_, doc));
    if (!r.valid()) {
        sol::error err = r;
        throw SchemaError(std::string("lua parse error: ") + err.what());
    }
    auto out = std::make_shared<LuaSchema>();
    out->value = r.get<sol::object>();
    return out;
}

std::shared_ptr<SchemaView> LuaSchemaEngine::build_view(const SchemaObject& schema) {
    sol::protected_function_result r = entry("build_view")(as_lua(schema).value);
    if (!r.valid()) {
        sol::error err = r;
        throw SchemaError(std::string("lua build_view error: ") + err.what());
    }
    sol::object view_obj = r;
    json view = lua_to_json(view_obj);
    auto out = std::make_shared<LuaSchemaView>();
    if (view.is_object()) {
        out->classes = view.size();
        for (const auto& [cls, slots] : view.items()) {
            if (slots.is_array() || slots.is_object()) out->slots += slots.size();
        }
    }
    return out;
}

ValidationReport LuaSchemaEngine::validate(const json& data, const SchemaObject& schema,
                                           const std::string& target_class) {
    sol::protected_function_result r =
        entry("validate")(json_to_lua(L_, data), as_lua(schema).value, target_class);
    if (!r.valid()) {
        sol::error err = r;
        throw SchemaError(std::string("lua validate error: ") + err.what());
    }
    sol::object result = r;
    json out = lua_to_json(result);
    if (!out.is_object()) throw SchemaError("lua validate() must return a table");

    ValidationReport report;
    report.target_class = target_class;
    report.valid = out.value("valid", false);
    report.instance_count = out.value("instance_count", size_t{1});
    if (out.contains("issues") && out["issues"].is_array()) {
        for (const auto& i : out["issues"]) {
            report.issues.push_back({i.value("path", "/"), i.value("message", "")});
        }
    }
    return report;
}

// ------------------ conversions ------------------

namespace {

// A table is a list when its keys are exactly 1..#t.
bool is_sequence(const sol::table& t) {
    const std::size_t len = t.size();
    if (len == 0) return false;
    std::size_t entries = 0;
    for (const auto& kv : t) {
        (void)kv;
        ++entries;
    }
    return entries == len;
}

json number_to_json(const sol::object& v) {
    const double d = v.as<double>();
    const bool integral = std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.0e15;
    if (integral) return static_cast<long long>(d);
    return d;
}

json table_to_json(const sol::table& t) {
    if (is_sequence(t)) {
        json list = json::array();
        for (std::size_t i = 1, n = t.size(); i <= n; ++i) {
            sol::object item = t[i];
            list.push_back(lua_to_json(item));
        }
        return list;
    }
    json obj = json::object();
    for (const auto& kv : t) {
        // Non-string keys have no JSON counterpart.
        if (kv.first.get_type() != sol::type::string) continue;
        obj[kv.first.as<std::string>()] = lua_to_json(kv.second);
    }
    return obj;
}

} // namespace

json lua_to_json(const sol::object& v) {
    if (!v.valid()) return nullptr;
    const sol::type t = v.get_type();
    if (t == sol::type::boolean) return v.as<bool>();
    if (t == sol::type::number) return number_to_json(v);
    if (t == sol::type::string) return v.as<std::string>();
    if (t == sol::type::table) return table_to_json(v.as<sol::table>());
    return nullptr;
}

sol::object json_to_lua(sol::state& L, const json& j) {
    if (j.is_boolean()) return sol::make_object(L, j.get<bool>());
    if (j.is_number_integer()) return sol::make_object(L, j.get<long long>());
    if (j.is_number()) return sol::make_object(L, j.get<double>());
    if (j.is_string()) return sol::make_object(L, j.get_ref<const std::string&>());
    if (j.is_array()) {
        sol::table list = L.create_table(static_cast<int>(j.size()), 0);
        for (std::size_t i = 0; i < j.size(); ++i) list[i + 1] = json_to_lua(L, j[i]);
        return list;
    }
    if (j.is_object()) {
        sol::table obj = L.create_table(0, static_cast<int>(j.size()));
        for (const auto& [key, value] : j.items()) obj[key] = json_to_lua(L, value);
        return obj;
    }
    return sol::make_object(L, sol::lua_nil);
}

#endif // HAVE_LUA
