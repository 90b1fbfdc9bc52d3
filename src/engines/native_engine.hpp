#pragma once
#include "ischema_engine.hpp"
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <unordered_map>

// Slot definition after type resolution. Shared by schema-level slots,
// class attributes and slot_usage overrides.
struct SlotDef {
    std::string name;
    std::string range{"string"};
    bool required{false};
    bool multivalued{false};
    bool identifier{false};
    std::optional<std::string> pattern;
    std::shared_ptr<const std::regex> pattern_re;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

struct ClassDef {
    std::string name;
    std::optional<std::string> is_a;
    std::vector<std::string> mixins;
    std::vector<std::string> slots;
    std::vector<SlotDef> attributes;
    nlohmann::json slot_usage = nlohmann::json::object();
    bool abstract{false};
};

struct EnumDef {
    std::string name;
    std::set<std::string> values;
};

class NativeSchema : public SchemaObject {
public:
    std::string id;
    std::string name;
    std::unordered_map<std::string, SlotDef> slots;
    std::map<std::string, ClassDef> classes;
    std::map<std::string, EnumDef> enums;
    std::map<std::string, std::string> types;   // custom type -> builtin base

    bool has_class(const std::string& n) const { return classes.count(n) > 0; }
    // Builtin base of a range that names a type, or empty for enums and classes.
    std::string base_type(const std::string& range) const;
};

class NativeSchemaView : public SchemaView {
public:
    explicit NativeSchemaView(std::map<std::string, std::vector<SlotDef>> induced)
        : induced_(std::move(induced)) {}

    size_t class_count() const override { return induced_.size(); }
    size_t induced_slot_count() const override;
    const std::vector<SlotDef>* induced_slots(const std::string& cls) const;

private:
    std::map<std::string, std::vector<SlotDef>> induced_;
};

// Reference LinkML-subset engine working on the JSON serialization of a schema.
class NativeSchemaEngine : public ISchemaEngine {
public:
    bool initialize(const json& cfg) override;
    std::string name() const override { return "native"; }

    std::shared_ptr<SchemaObject> parse(const std::string& schema_text) override;
    std::shared_ptr<SchemaView> build_view(const SchemaObject& schema) override;
    ValidationReport validate(const json& data, const SchemaObject& schema,
                              const std::string& target_class) override;

    // Induced slots of one class: ancestors and mixins first, local definitions override.
    static std::vector<SlotDef> induce_slots(const NativeSchema& schema, const std::string& cls);

private:
    static const NativeSchema& as_native(const SchemaObject& schema);
    size_t max_depth_{64};
};
