#include "ischema_engine.hpp"
#include "native_engine.hpp"
#ifdef HAVE_LUA
#include "lua_engine.hpp"
#endif

nlohmann::json ValidationReport::to_json() const {
    nlohmann::json issues_json = nlohmann::json::array();
    for (const auto& i : issues) {
        issues_json.push_back({{"path", i.path}, {"message", i.message}});
    }
    return {
        {"valid", valid},
        {"target_class", target_class},
        {"instance_count", instance_count},
        {"issues", issues_json}
    };
}

std::unique_ptr<ISchemaEngine> make_schema_engine(const std::string& name) {
    if (name == "native") return std::make_unique<NativeSchemaEngine>();
#ifdef HAVE_LUA
    if (name == "lua") return std::make_unique<LuaSchemaEngine>();
#endif
    return nullptr;
}
