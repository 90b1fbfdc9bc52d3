#include "workload_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

// --------------------- file helpers ---------------------

static std::string resolve_path(const std::string& path, const std::string& base_dir) {
    std::filesystem::path p(path);
    if (p.is_relative() && !base_dir.empty()) p = std::filesystem::path(base_dir) / p;
    return p.string();
}

static std::string read_text(const std::string& path, const std::string& workload) {
    std::ifstream in(path);
    if (!in) throw WorkloadLoadError("workload '" + workload + "': cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static json parse_json(const std::string& text, const std::string& what, const std::string& workload) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw WorkloadLoadError("workload '" + workload + "': malformed " + what + ": " + e.what());
    }
}

// Optional string member; anything other than a string or absence is an error.
static std::string string_field(const json& entry, const char* key, const std::string& workload) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw WorkloadLoadError("workload '" + workload + "': " + key + " must be a string, got " +
                                it->type_name());
    }
    return it->get<std::string>();
}

// --------------------- registry ---------------------

WorkloadRegistry::WorkloadRegistry(std::vector<Workload> workloads) {
    for (auto& w : workloads) add(std::move(w));
}

void WorkloadRegistry::add(Workload w) {
    auto it = std::find_if(workloads_.begin(), workloads_.end(),
                           [&](const Workload& x) { return x.name == w.name; });
    if (it != workloads_.end()) {
        std::cerr << "[WorkloadRegistry] Replacing workload '" << w.name << "'" << std::endl;
        *it = std::move(w);
        return;
    }
    workloads_.push_back(std::move(w));
}

void WorkloadRegistry::retain(const std::vector<std::string>& names) {
    if (names.empty()) return;
    workloads_.erase(std::remove_if(workloads_.begin(), workloads_.end(), [&](const Workload& w) {
                         return std::find(names.begin(), names.end(), w.name) == names.end();
                     }),
                     workloads_.end());
}

Workload WorkloadRegistry::load_workload(const json& entry, const std::string& base_dir) {
    if (!entry.is_object()) throw WorkloadLoadError("workload entry is not an object");

    Workload w;
    w.name = string_field(entry, "name", "?");
    if (w.name.empty()) throw WorkloadLoadError("workload entry without a name");

    if (entry.contains("schema")) {
        const auto& s = entry["schema"];
        if (s.is_string()) {
            w.schema_text = s.get<std::string>();
        } else if (s.is_object()) {
            w.schema_text = s.dump(2);
        } else {
            throw WorkloadLoadError("workload '" + w.name + "': schema must be an object or a string");
        }
    } else if (entry.contains("schema_file")) {
        auto path = resolve_path(string_field(entry, "schema_file", w.name), base_dir);
        w.schema_text = read_text(path, w.name);
        // Reject garbage here rather than letting every adapter fail on it.
        parse_json(w.schema_text, "schema file " + path, w.name);
    } else {
        throw WorkloadLoadError("workload '" + w.name + "': needs schema or schema_file");
    }

    if (entry.contains("data")) {
        w.data = entry["data"];
    } else if (entry.contains("data_file")) {
        auto path = resolve_path(string_field(entry, "data_file", w.name), base_dir);
        w.data = parse_json(read_text(path, w.name), "data file " + path, w.name);
    } else {
        throw WorkloadLoadError("workload '" + w.name + "': needs data or data_file");
    }

    w.target_class = string_field(entry, "target_class", w.name);
    if (w.target_class.empty()) throw WorkloadLoadError("workload '" + w.name + "': missing target_class");
    return w;
}

WorkloadRegistry WorkloadRegistry::from_config(const json& cfg, const std::string& base_dir) {
    WorkloadRegistry reg;
    if (!cfg.is_object()) {
        reg.load_errors_.push_back("workload config must be an object");
        std::cerr << "[WorkloadRegistry] workload config must be an object, ignoring it" << std::endl;
        return reg;
    }
    bool builtins = true;
    auto b = cfg.find("builtin_workloads");
    if (b != cfg.end() && !b->is_null()) {
        if (b->is_boolean()) {
            builtins = b->get<bool>();
        } else {
            reg.load_errors_.push_back("\"builtin_workloads\" must be a boolean");
            std::cerr << "[WorkloadRegistry] \"builtin_workloads\" must be a boolean, using true" << std::endl;
        }
    }
    if (builtins) {
        for (auto& w : builtin_workloads()) reg.add(std::move(w));
    }
    if (!cfg.contains("workloads")) return reg;
    if (!cfg["workloads"].is_array()) {
        reg.load_errors_.push_back("\"workloads\" must be an array");
        std::cerr << "[WorkloadRegistry] \"workloads\" must be an array, ignoring it" << std::endl;
        return reg;
    }
    for (const auto& entry : cfg["workloads"]) {
        try {
            reg.add(load_workload(entry, base_dir));
        } catch (const WorkloadLoadError& e) {
            std::cerr << "[WorkloadRegistry] Skipping workload: " << e.what() << std::endl;
            reg.load_errors_.push_back(e.what());
        }
    }
    return reg;
}

// --------------------- built-in fixtures ---------------------

static json person_schema() {
    return {
        {"id", "https://example.org/benchmark"},
        {"name", "benchmark_schema"},
        {"slots", {
            {"name", {{"range", "string"}, {"required", true}}},
            {"age", {{"range", "integer"}, {"minimum_value", 0}, {"maximum_value", 150}}}
        }},
        {"classes", {
            {"Person", {{"slots", {"name", "age"}}}}
        }}
    };
}

static json complex_schema() {
    json schema = {
        {"id", "https://example.org/complex"},
        {"name", "complex_schema"},
        {"enums", {
            {"Status", {{"permissible_values", {"active", "inactive", "pending"}}}}
        }}
    };

    json slots = json::object();
    for (int i = 0; i < 20; ++i) {
        json slot = {{"range", i % 3 == 0 ? "string" : (i % 3 == 1 ? "integer" : "boolean")}};
        if (i % 4 == 0) slot["required"] = true;
        if (i % 5 == 0) slot["pattern"] = "^\\w+$";
        slots["field_" + std::to_string(i)] = slot;
    }
    slots["status"] = {{"range", "Status"}};
    schema["slots"] = slots;

    json classes = json::object();
    classes["BaseEntity"] = {{"slots", {"field_0", "field_1", "status"}}};
    for (int i = 0; i < 5; ++i) {
        json cls_slots = json::array();
        for (int j = 2; j < 6; ++j) cls_slots.push_back("field_" + std::to_string((i * 4 + j) % 20));
        classes["Entity" + std::to_string(i)] = {{"is_a", "BaseEntity"}, {"slots", cls_slots}};
    }
    schema["classes"] = classes;
    return schema;
}

static json complex_instance() {
    json data = json::object();
    for (int i = 0; i < 20; ++i) {
        std::string key = "field_" + std::to_string(i);
        if (i % 3 == 0) data[key] = "valid_string";
        else if (i % 3 == 1) data[key] = 42;
        else data[key] = true;
    }
    data["status"] = "active";
    return data;
}

static json contact_schema() {
    return {
        {"id", "https://example.org/pattern"},
        {"name", "pattern_schema"},
        {"slots", {
            {"email", {{"range", "string"}, {"pattern", "^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}$"}}}
        }},
        {"classes", {
            {"Contact", {{"slots", json::array({"email"})}}}
        }}
    };
}

static json location_schema() {
    json countries = json::array();
    for (int i = 0; i < 200; ++i) {
        std::ostringstream code;
        code << "COUNTRY_" << std::setw(3) << std::setfill('0') << i;
        countries.push_back(code.str());
    }
    return {
        {"id", "https://example.org/enum"},
        {"name", "enum_schema"},
        {"enums", {{"Country", {{"permissible_values", countries}}}}},
        {"slots", {{"country", {{"range", "Country"}}}}},
        {"classes", {{"Location", {{"slots", json::array({"country"})}}}}}
    };
}

// Level0 <- Level1 <- ... <- Level9, one string slot per level.
static json inheritance_schema() {
    json slots = json::object();
    json classes = json::object();
    for (int i = 0; i < 10; ++i) {
        const std::string slot = "field_level_" + std::to_string(i);
        slots[slot] = {{"range", "string"}};
        json cls = {{"slots", json::array({slot})}};
        if (i > 0) cls["is_a"] = "Level" + std::to_string(i - 1);
        classes["Level" + std::to_string(i)] = cls;
    }
    return {
        {"id", "https://example.org/inheritance"},
        {"name", "inheritance_schema"},
        {"slots", slots},
        {"classes", classes}
    };
}

static Workload batch_workload(int size) {
    json persons = json::array();
    for (int i = 0; i < size; ++i) {
        persons.push_back({{"name", "Person " + std::to_string(i)}, {"age", i % 100}});
    }
    return {"batch_" + std::to_string(size), person_schema().dump(2), {{"persons", persons}}, "Person"};
}

std::vector<Workload> builtin_workloads() {
    std::vector<Workload> out;

    out.push_back({"simple", person_schema().dump(2), {{"name", "John Doe"}, {"age", 30}}, "Person"});

    out.push_back({"complex", complex_schema().dump(2), complex_instance(), "Entity0"});

    for (int size : {10, 100, 1000}) out.push_back(batch_workload(size));

    const std::string contact = contact_schema().dump(2);
    out.push_back({"pattern_valid", contact, {{"email", "user@example.com"}}, "Contact"});
    out.push_back({"pattern_invalid", contact, {{"email", "not-an-email"}}, "Contact"});

    const std::string location = location_schema().dump(2);
    out.push_back({"enum_large_valid", location, {{"country", "COUNTRY_050"}}, "Location"});
    out.push_back({"enum_large_invalid", location, {{"country", "INVALID_COUNTRY"}}, "Location"});

    json levels = json::object();
    for (int i = 0; i < 10; ++i) levels["field_level_" + std::to_string(i)] = "value_" + std::to_string(i);
    out.push_back({"deep_inheritance", inheritance_schema().dump(2), levels, "Level9"});

    // Invalid data still validates successfully as an execution.
    out.push_back({"invalid", person_schema().dump(2), {{"age", 200}}, "Person"});

    return out;
}
