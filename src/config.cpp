#include "config.hpp"
#include "errors.hpp"
#include "adapters/binary_locator.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

json BenchConfig::default_document() {
    return {
        {"builtin_workloads", true},
        {"workloads", json::array()},
        {"adapters", json::array({
            {{"type", "library"}, {"name", "native-inproc"}, {"engine", "native"}},
            {{"type", "process"}, {"name", "schema-validate"}, {"program", "schema-validate"},
             {"timeout_ms", 10000}}
        })}
    };
}

// --------------------- adapter field checks ---------------------

enum class FieldKind { String, Boolean, PositiveInt, StringList };

static const char* kind_name(FieldKind k) {
    switch (k) {
        case FieldKind::String: return "a string";
        case FieldKind::Boolean: return "a boolean";
        case FieldKind::PositiveInt: return "a positive integer";
        case FieldKind::StringList: return "a list of strings";
    }
    return "?";
}

static bool field_matches(const json& v, FieldKind k) {
    switch (k) {
        case FieldKind::String: return v.is_string();
        case FieldKind::Boolean: return v.is_boolean();
        case FieldKind::PositiveInt:
            return v.is_number_integer() && v.get<long long>() > 0 && v.get<long long>() <= INT32_MAX;
        case FieldKind::StringList:
            if (!v.is_array()) return false;
            for (const auto& x : v) if (!x.is_string()) return false;
            return true;
    }
    return false;
}

static void check_adapter(const json& a, size_t index) {
    if (!a.is_object()) throw ConfigError("adapter entry " + std::to_string(index) + " must be an object");

    auto type_it = a.find("type");
    if (type_it == a.end() || !type_it->is_string()) {
        throw ConfigError("adapter entry " + std::to_string(index) + ": \"type\" must be a string");
    }
    const std::string type = type_it->get<std::string>();

    std::string label = "adapter entry " + std::to_string(index);
    auto name_it = a.find("name");
    if (name_it != a.end() && name_it->is_string()) label = "adapter '" + name_it->get<std::string>() + "'";

    std::vector<std::pair<const char*, FieldKind>> fields = {
        {"name", FieldKind::String}, {"verbose", FieldKind::Boolean}, {"exe_dir", FieldKind::String}
    };
    if (type == "library") {
        fields.insert(fields.end(), {{"engine", FieldKind::String}, {"script", FieldKind::String},
                                     {"source", FieldKind::String}, {"max_depth", FieldKind::PositiveInt}});
    } else if (type == "process") {
        fields.insert(fields.end(), {{"program", FieldKind::String}, {"candidates", FieldKind::StringList},
                                     {"timeout_ms", FieldKind::PositiveInt}, {"temp_dir", FieldKind::String},
                                     {"extra_args", FieldKind::StringList}});
    } else {
        throw ConfigError(label + ": unknown type '" + type + "'");
    }

    for (const auto& [key, kind] : fields) {
        auto it = a.find(key);
        if (it == a.end() || field_matches(*it, kind)) continue;
        throw ConfigError(label + ": \"" + key + "\" must be " + kind_name(kind) + ", got " + it->dump());
    }
}

BenchConfig BenchConfig::from_json(const json& doc, const std::string& base_dir, const std::string& exe_dir) {
    if (!doc.is_object()) throw ConfigError("config document must be an object");

    BenchConfig c;
    c.base_dir = base_dir;
    c.exe_dir = exe_dir;
    c.doc = doc;
    try {
        c.verbose = doc.value("verbose", false);
        c.strict_exit = doc.value("strict_exit", false);

        const std::string output = doc.value("output", "table");
        if (output == "table") c.output = OutputMode::Table;
        else if (output == "json") c.output = OutputMode::Json;
        else throw ConfigError("unknown output mode '" + output + "'");

        const std::string pairing = doc.value("pairing", "first-two");
        if (pairing == "first-two") c.pairing = Pairing::FirstTwo;
        else if (pairing == "all-pairs") c.pairing = Pairing::AllPairs;
        else throw ConfigError("unknown pairing '" + pairing + "'");

        if (doc.contains("builtin_workloads") && !doc["builtin_workloads"].is_boolean()) {
            throw ConfigError("\"builtin_workloads\" must be a boolean");
        }
        if (doc.contains("workloads") && !doc["workloads"].is_array()) {
            throw ConfigError("\"workloads\" must be an array");
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }

    if (!c.doc.contains("adapters")) c.doc["adapters"] = default_document()["adapters"];
    if (!c.doc["adapters"].is_array()) throw ConfigError("\"adapters\" must be an array");
    for (size_t i = 0; i < c.doc["adapters"].size(); ++i) check_adapter(c.doc["adapters"][i], i);
    return c;
}

BenchConfig BenchConfig::load(const std::string& path, const std::string& exe_dir) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("config file " + path + " is not valid JSON: " + e.what());
    }
    auto base = std::filesystem::path(path).parent_path().string();
    return from_json(doc, base, exe_dir);
}

json BenchConfig::adapter_configs() const {
    json out = doc["adapters"];
    for (auto& a : out) {
        if (!a.contains("verbose")) a["verbose"] = verbose;
        if (!a.contains("exe_dir")) a["exe_dir"] = exe_dir;
        // Lua scripts resolve like workload files.
        if (a.contains("script") && a["script"].is_string() && !base_dir.empty()) {
            std::filesystem::path p(a["script"].get<std::string>());
            if (p.is_relative()) a["script"] = (std::filesystem::path(base_dir) / p).string();
        }
    }
    return out;
}

void BenchConfig::set_timeout_ms(int ms) {
    for (auto& a : doc["adapters"]) {
        if (a.value("type", "") == "process") a["timeout_ms"] = ms;
    }
}

void BenchConfig::prepend_binary(const std::string& path) {
    for (auto& a : doc["adapters"]) {
        if (a.value("type", "") != "process") continue;
        json candidates = json::array();
        if (a.contains("candidates") && a["candidates"].is_array()) {
            candidates = a["candidates"];
        } else {
            for (auto& c : BinaryLocator::default_candidates(a.value("program", "schema-validate"), exe_dir)) {
                candidates.push_back(c);
            }
        }
        candidates.insert(candidates.begin(), path);
        a["candidates"] = candidates;
    }
}
