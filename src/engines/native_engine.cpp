#include "native_engine.hpp"
#include "../errors.hpp"
#include <algorithm>

using json = nlohmann::json;

// --------------------- schema helpers ---------------------

static const std::set<std::string>& builtin_types() {
    static const std::set<std::string> types = {
        "string", "str", "integer", "int", "float", "double", "decimal",
        "boolean", "bool", "uri", "uriorcurie", "curie", "ncname",
        "date", "datetime", "time"
    };
    return types;
}

std::string NativeSchema::base_type(const std::string& range) const {
    if (builtin_types().count(range)) return range;
    auto it = types.find(range);
    return it != types.end() ? it->second : std::string();
}

static std::shared_ptr<const std::regex> compile_pattern(const std::string& slot, const std::string& pattern) {
    try {
        return std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw SchemaError("slot '" + slot + "': invalid pattern '" + pattern + "': " + e.what());
    }
}

static std::optional<double> number_field(const json& def, const char* key, const std::string& slot) {
    if (!def.contains(key)) return std::nullopt;
    if (!def[key].is_number()) throw SchemaError("slot '" + slot + "': " + key + " must be a number");
    return def[key].get<double>();
}

// Applies the fields present in def on top of s.
static void apply_slot_fields(SlotDef& s, const json& def) {
    if (!def.is_object()) throw SchemaError("slot '" + s.name + "': definition must be an object");
    if (def.contains("range")) {
        if (!def["range"].is_string()) throw SchemaError("slot '" + s.name + "': range must be a string");
        s.range = def["range"].get<std::string>();
    }
    s.required = def.value("required", s.required);
    s.multivalued = def.value("multivalued", s.multivalued);
    s.identifier = def.value("identifier", s.identifier);
    if (def.contains("pattern")) {
        if (!def["pattern"].is_string()) throw SchemaError("slot '" + s.name + "': pattern must be a string");
        s.pattern = def["pattern"].get<std::string>();
        s.pattern_re = compile_pattern(s.name, *s.pattern);
    }
    if (auto v = number_field(def, "minimum_value", s.name)) s.minimum = v;
    if (auto v = number_field(def, "maximum_value", s.name)) s.maximum = v;
    if (s.identifier) s.required = true;
}

static SlotDef parse_slot(const std::string& name, const json& def) {
    SlotDef s;
    s.name = name;
    if (def.is_null()) return s;    // bare "slot_name:" entry
    apply_slot_fields(s, def);
    return s;
}

static std::vector<std::string> string_list(const json& j, const std::string& what) {
    std::vector<std::string> out;
    if (j.is_null()) return out;
    if (!j.is_array()) throw SchemaError(what + " must be a list");
    for (const auto& x : j) {
        if (!x.is_string()) throw SchemaError(what + " must contain strings");
        out.push_back(x.get<std::string>());
    }
    return out;
}

static void check_range(const NativeSchema& schema, const SlotDef& s, const std::string& owner) {
    if (!schema.base_type(s.range).empty() || schema.enums.count(s.range) || schema.classes.count(s.range)) return;
    throw SchemaError(owner + "slot '" + s.name + "': unknown range '" + s.range + "'");
}

// --------------------- view ---------------------

size_t NativeSchemaView::induced_slot_count() const {
    size_t n = 0;
    for (const auto& [cls, slots] : induced_) n += slots.size();
    return n;
}

const std::vector<SlotDef>* NativeSchemaView::induced_slots(const std::string& cls) const {
    auto it = induced_.find(cls);
    return it != induced_.end() ? &it->second : nullptr;
}

static void put_slot(std::vector<SlotDef>& out, SlotDef s) {
    auto it = std::find_if(out.begin(), out.end(), [&](const SlotDef& x) { return x.name == s.name; });
    if (it != out.end()) *it = std::move(s);
    else out.push_back(std::move(s));
}

static void induce_into(const NativeSchema& schema, const std::string& cls,
                        std::vector<SlotDef>& out, std::vector<std::string>& visiting) {
    if (std::find(visiting.begin(), visiting.end(), cls) != visiting.end()) {
        throw SchemaError("inheritance cycle through class '" + cls + "'");
    }
    auto it = schema.classes.find(cls);
    if (it == schema.classes.end()) throw SchemaError("unknown class '" + cls + "'");
    const ClassDef& c = it->second;

    visiting.push_back(cls);
    if (c.is_a) induce_into(schema, *c.is_a, out, visiting);
    for (const auto& m : c.mixins) induce_into(schema, m, out, visiting);
    visiting.pop_back();

    for (const auto& name : c.slots) put_slot(out, schema.slots.at(name));
    for (const auto& a : c.attributes) put_slot(out, a);

    for (auto u = c.slot_usage.begin(); u != c.slot_usage.end(); ++u) {
        auto target = std::find_if(out.begin(), out.end(), [&](const SlotDef& x) { return x.name == u.key(); });
        if (target == out.end()) {
            throw SchemaError("class '" + cls + "': slot_usage for unknown slot '" + u.key() + "'");
        }
        apply_slot_fields(*target, u.value());
    }
}

std::vector<SlotDef> NativeSchemaEngine::induce_slots(const NativeSchema& schema, const std::string& cls) {
    std::vector<SlotDef> out;
    std::vector<std::string> visiting;
    induce_into(schema, cls, out, visiting);
    return out;
}

// --------------------- engine ---------------------

bool NativeSchemaEngine::initialize(const json& cfg) {
    max_depth_ = cfg.value("max_depth", max_depth_);
    return max_depth_ > 0;
}

const NativeSchema& NativeSchemaEngine::as_native(const SchemaObject& schema) {
    auto* s = dynamic_cast<const NativeSchema*>(&schema);
    if (!s) throw SchemaError("schema object was not produced by the native engine");
    return *s;
}

std::shared_ptr<SchemaObject> NativeSchemaEngine::parse(const std::string& schema_text) {
    json doc;
    try {
        doc = json::parse(schema_text);
    } catch (const json::parse_error& e) {
        throw SchemaError(std::string("schema is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) throw SchemaError("schema document must be an object");

    auto schema = std::make_shared<NativeSchema>();
    schema->id = doc.value("id", "");
    schema->name = doc.value("name", "");

    const auto types = doc.value("types", json::object());
    for (auto it = types.begin(); it != types.end(); ++it) {
        std::string base = it.value().is_object() ? it.value().value("typeof", "string") : "string";
        if (!builtin_types().count(base)) {
            throw SchemaError("type '" + it.key() + "': typeof '" + base + "' is not a builtin type");
        }
        schema->types[it.key()] = base;
    }

    const auto enums = doc.value("enums", json::object());
    for (auto it = enums.begin(); it != enums.end(); ++it) {
        EnumDef e;
        e.name = it.key();
        const auto pv = it.value().is_object() ? it.value().value("permissible_values", json()) : json();
        if (pv.is_array()) {
            for (const auto& v : pv) {
                if (v.is_string()) e.values.insert(v.get<std::string>());
                else if (v.is_object() && v.contains("text")) e.values.insert(v["text"].get<std::string>());
            }
        } else if (pv.is_object()) {
            for (auto v = pv.begin(); v != pv.end(); ++v) e.values.insert(v.key());
        }
        schema->enums[e.name] = std::move(e);
    }

    const auto slots = doc.value("slots", json::object());
    for (auto it = slots.begin(); it != slots.end(); ++it) {
        schema->slots[it.key()] = parse_slot(it.key(), it.value());
    }

    const auto classes = doc.value("classes", json::object());
    if (!classes.is_object()) throw SchemaError("classes must be a mapping");
    for (auto it = classes.begin(); it != classes.end(); ++it) {
        const json& def = it.value().is_null() ? json::object() : it.value();
        if (!def.is_object()) throw SchemaError("class '" + it.key() + "': definition must be an object");
        ClassDef c;
        c.name = it.key();
        if (def.contains("is_a")) c.is_a = def["is_a"].get<std::string>();
        c.mixins = string_list(def.value("mixins", json()), "class '" + c.name + "' mixins");
        c.slots = string_list(def.value("slots", json()), "class '" + c.name + "' slots");
        const auto attrs = def.value("attributes", json::object());
        for (auto a = attrs.begin(); a != attrs.end(); ++a) c.attributes.push_back(parse_slot(a.key(), a.value()));
        c.slot_usage = def.value("slot_usage", json::object());
        c.abstract = def.value("abstract", false);
        schema->classes[c.name] = std::move(c);
    }

    // Cross references.
    for (const auto& [name, slot] : schema->slots) check_range(*schema, slot, "");
    for (const auto& [name, c] : schema->classes) {
        if (c.is_a && !schema->has_class(*c.is_a)) {
            throw SchemaError("class '" + name + "': is_a refers to unknown class '" + *c.is_a + "'");
        }
        for (const auto& m : c.mixins) {
            if (!schema->has_class(m)) throw SchemaError("class '" + name + "': unknown mixin '" + m + "'");
        }
        for (const auto& s : c.slots) {
            if (!schema->slots.count(s)) throw SchemaError("class '" + name + "': unknown slot '" + s + "'");
        }
        for (const auto& a : c.attributes) check_range(*schema, a, "class '" + name + "' ");
    }
    return schema;
}

std::shared_ptr<SchemaView> NativeSchemaEngine::build_view(const SchemaObject& schema_obj) {
    const auto& schema = as_native(schema_obj);
    std::map<std::string, std::vector<SlotDef>> induced;
    for (const auto& [name, c] : schema.classes) {
        auto slots = induce_slots(schema, name);
        for (const auto& s : slots) check_range(schema, s, "class '" + name + "' ");
        induced.emplace(name, std::move(slots));
    }
    return std::make_shared<NativeSchemaView>(std::move(induced));
}

// --------------------- validation ---------------------

namespace {

std::string pointer_token(const std::string& key) {
    std::string out;
    for (char c : key) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
    return out;
}

class InstanceChecker {
public:
    InstanceChecker(const NativeSchema& schema, ValidationReport& report, size_t max_depth)
        : schema_(schema), report_(report), max_depth_(max_depth) {}

    void check_object(const json& obj, const std::string& cls, const std::string& path, size_t depth) {
        if (depth > max_depth_) {
            issue(path, "nesting deeper than " + std::to_string(max_depth_) + " levels");
            return;
        }
        if (!obj.is_object()) {
            issue(path, "expected an object of class " + cls + ", got " + obj.type_name());
            return;
        }
        for (const auto& slot : slots_for(cls)) {
            const std::string slot_path = path + "/" + pointer_token(slot.name);
            auto it = obj.find(slot.name);
            if (it == obj.end() || it->is_null()) {
                if (slot.required) issue(slot_path, "required slot '" + slot.name + "' is missing");
                continue;
            }
            if (slot.multivalued) {
                if (!it->is_array()) {
                    issue(slot_path, "multivalued slot '" + slot.name + "' expects a list");
                    continue;
                }
                if (slot.required && it->empty()) issue(slot_path, "required slot '" + slot.name + "' is empty");
                for (size_t i = 0; i < it->size(); ++i) {
                    check_value((*it)[i], slot, slot_path + "/" + std::to_string(i), depth);
                }
            } else {
                if (it->is_array()) {
                    issue(slot_path, "slot '" + slot.name + "' is single-valued but got a list");
                    continue;
                }
                check_value(*it, slot, slot_path, depth);
            }
        }
    }

private:
    const std::vector<SlotDef>& slots_for(const std::string& cls) {
        auto it = cache_.find(cls);
        if (it != cache_.end()) return it->second;
        return cache_.emplace(cls, NativeSchemaEngine::induce_slots(schema_, cls)).first->second;
    }

    void check_value(const json& v, const SlotDef& slot, const std::string& path, size_t depth) {
        if (schema_.has_class(slot.range)) {
            // A string is a reference to an identified object.
            if (v.is_string()) return;
            check_object(v, slot.range, path, depth + 1);
            return;
        }
        auto e = schema_.enums.find(slot.range);
        if (e != schema_.enums.end()) {
            if (!v.is_string() || !e->second.values.count(v.get<std::string>())) {
                issue(path, v.dump() + " is not a permissible value of " + slot.range);
            }
            return;
        }

        const std::string base = schema_.base_type(slot.range);
        if (base == "integer" || base == "int") {
            if (!v.is_number_integer()) { type_issue(v, slot, path); return; }
            check_bounds(v.get<double>(), slot, path);
        } else if (base == "float" || base == "double" || base == "decimal") {
            if (!v.is_number()) { type_issue(v, slot, path); return; }
            check_bounds(v.get<double>(), slot, path);
        } else if (base == "boolean" || base == "bool") {
            if (!v.is_boolean()) type_issue(v, slot, path);
        } else {
            if (!v.is_string()) { type_issue(v, slot, path); return; }
            const auto& s = v.get_ref<const std::string&>();
            if (base == "date" && !std::regex_match(s, date_re())) {
                issue(path, "'" + s + "' is not an ISO date");
            }
            if (slot.pattern_re && !std::regex_search(s, *slot.pattern_re)) {
                issue(path, "'" + s + "' does not match pattern " + *slot.pattern);
            }
        }
    }

    void check_bounds(double d, const SlotDef& slot, const std::string& path) {
        if (slot.minimum && d < *slot.minimum) {
            issue(path, std::to_string(d) + " is below minimum_value " + std::to_string(*slot.minimum));
        }
        if (slot.maximum && d > *slot.maximum) {
            issue(path, std::to_string(d) + " is above maximum_value " + std::to_string(*slot.maximum));
        }
    }

    void type_issue(const json& v, const SlotDef& slot, const std::string& path) {
        issue(path, "expected " + slot.range + ", got " + v.type_name());
    }

    void issue(const std::string& path, std::string msg) {
        report_.valid = false;
        report_.issues.push_back({path.empty() ? "/" : path, std::move(msg)});
    }

    static const std::regex& date_re() {
        static const std::regex re("^\\d{4}-\\d{2}-\\d{2}$");
        return re;
    }

    const NativeSchema& schema_;
    ValidationReport& report_;
    size_t max_depth_;
    std::map<std::string, std::vector<SlotDef>> cache_;
};

// A single-member object whose member is a list and not a slot of the target
// class is a container of instances.
const json* container_items(const json& data, const std::vector<SlotDef>& target_slots, std::string& key) {
    if (!data.is_object() || data.size() != 1) return nullptr;
    auto it = data.begin();
    if (!it.value().is_array()) return nullptr;
    for (const auto& s : target_slots) {
        if (s.name == it.key()) return nullptr;
    }
    key = it.key();
    return &it.value();
}

} // namespace

ValidationReport NativeSchemaEngine::validate(const json& data, const SchemaObject& schema_obj,
                                              const std::string& target_class) {
    const auto& schema = as_native(schema_obj);
    if (!schema.has_class(target_class)) throw SchemaError("unknown target class '" + target_class + "'");

    ValidationReport report;
    report.target_class = target_class;
    InstanceChecker checker(schema, report, max_depth_);

    std::string key;
    const auto target_slots = induce_slots(schema, target_class);
    if (data.is_array()) {
        report.instance_count = data.size();
        for (size_t i = 0; i < data.size(); ++i) {
            checker.check_object(data[i], target_class, "/" + std::to_string(i), 0);
        }
    } else if (const json* items = container_items(data, target_slots, key)) {
        report.instance_count = items->size();
        for (size_t i = 0; i < items->size(); ++i) {
            checker.check_object((*items)[i], target_class, "/" + pointer_token(key) + "/" + std::to_string(i), 0);
        }
    } else {
        report.instance_count = 1;
        checker.check_object(data, target_class, "", 0);
    }
    return report;
}
