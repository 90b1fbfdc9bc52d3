#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "engines/native_engine.hpp"

using json = nlohmann::json;

struct Args {
    std::string command;
    std::string schema_path;
    std::string data_path;
    std::string target_class;
    bool quiet = false;
};

static void print_help(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " validate --schema FILE --data FILE --target-class NAME [--quiet]\n";
}

// Returns false on bad arguments.
static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2) return false;
    a.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--schema" && i + 1 < argc) { a.schema_path = argv[++i]; }
        else if (s == "--data" && i + 1 < argc) { a.data_path = argv[++i]; }
        else if (s == "--target-class" && i + 1 < argc) { a.target_class = argv[++i]; }
        else if (s == "--quiet") { a.quiet = true; }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            return false;
        }
    }
    return a.command == "validate" && !a.schema_path.empty() && !a.data_path.empty() && !a.target_class.empty();
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Exit 0 when validation ran, whatever the verdict; 1 on any execution fault.
int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_help(argv[0]);
        return 1;
    }

    std::string schema_text, data_text;
    if (!read_file(args.schema_path, schema_text)) {
        std::cerr << "cannot read schema " << args.schema_path << "\n";
        return 1;
    }
    if (!read_file(args.data_path, data_text)) {
        std::cerr << "cannot read data " << args.data_path << "\n";
        return 1;
    }

    try {
        json data = json::parse(data_text);

        NativeSchemaEngine engine;
        if (!engine.initialize(json::object())) {
            std::cerr << "engine failed to initialize\n";
            return 1;
        }
        auto schema = engine.parse(schema_text);
        auto view = engine.build_view(*schema);
        auto report = engine.validate(data, *schema, args.target_class);

        json out = report.to_json();
        out["classes"] = view->class_count();
        if (!args.quiet) out["instances"] = data;
        std::cout << out.dump() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "validation failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
