#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

// Engine-specific parsed schema.
struct SchemaObject {
    virtual ~SchemaObject() = default;
};

// Engine-specific introspection view built from a SchemaObject.
struct SchemaView {
    virtual ~SchemaView() = default;
    virtual size_t class_count() const = 0;
    virtual size_t induced_slot_count() const = 0;
};

struct ValidationIssue {
    std::string path;
    std::string message;
};

struct ValidationReport {
    bool valid{true};
    std::string target_class;
    size_t instance_count{0};
    std::vector<ValidationIssue> issues;

    nlohmann::json to_json() const;
};

// An in-process schema validation implementation. Errors are thrown.
class ISchemaEngine {
public:
    using json = nlohmann::json;
    virtual ~ISchemaEngine() = default;
    virtual bool initialize(const json& cfg) = 0;
    virtual std::string name() const = 0;

    virtual std::shared_ptr<SchemaObject> parse(const std::string& schema_text) = 0;
    virtual std::shared_ptr<SchemaView> build_view(const SchemaObject& schema) = 0;
    virtual ValidationReport validate(const json& data, const SchemaObject& schema,
                                      const std::string& target_class) = 0;
};

// "native", or "lua" when built with HAVE_LUA. Returns nullptr for unknown names.
std::unique_ptr<ISchemaEngine> make_schema_engine(const std::string& name);
