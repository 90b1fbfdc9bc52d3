#include "process_adapter.hpp"
#include "scoped_temp_dir.hpp"
#include "../errors.hpp"
#include "../fingerprint.hpp"
#include "../subprocess.hpp"
#include <iostream>

// First line of captured output, for one-line error messages.
static std::string first_line(const std::string& text, size_t max_len = 200) {
    auto end = text.find('\n');
    std::string line = text.substr(0, end);
    if (line.size() > max_len) line = line.substr(0, max_len) + "...";
    return line;
}

bool ProcessAdapter::initialize(const json& cfg) {
    init_error_.clear();
    try {
        name_ = cfg.value("name", name_);
        program_ = cfg.value("program", program_);
        timeout_ms_ = cfg.value("timeout_ms", timeout_ms_);
        temp_root_ = cfg.value("temp_dir", ScopedTempDir::default_root());
        verbose_ = cfg.value("verbose", false);

        extra_args_.clear();
        if (cfg.contains("extra_args") && cfg["extra_args"].is_array()) {
            for (auto& x : cfg["extra_args"]) if (x.is_string()) extra_args_.push_back(x.get<std::string>());
        }

        std::vector<std::string> candidates;
        if (cfg.contains("candidates") && cfg["candidates"].is_array()) {
            for (auto& x : cfg["candidates"]) if (x.is_string()) candidates.push_back(x.get<std::string>());
        } else {
            candidates = BinaryLocator::default_candidates(program_, cfg.value("exe_dir", ""));
        }
        locator_ = BinaryLocator(std::move(candidates));
    } catch (const json::type_error& e) {
        init_error_ = std::string("bad adapter config: ") + e.what();
        std::cerr << "[ProcessAdapter] " << name_ << ": " << init_error_ << std::endl;
        return false;
    }

    if (timeout_ms_ <= 0) {
        std::cerr << "[ProcessAdapter] " << name_ << ": timeout_ms must be positive, using "
                  << kDefaultTimeoutMs << std::endl;
        timeout_ms_ = kDefaultTimeoutMs;
    }
    if (verbose_) {
        std::cerr << "[ProcessAdapter] " << name_ << " program=" << program_ << " timeout=" << timeout_ms_
                  << "ms temp=" << temp_root_ << " candidates=" << locator_.candidates().size() << std::endl;
    }
    return true;
}

AdapterResult ProcessAdapter::run(const Workload& w) {
    AdapterResult r;
    r.adapter = name_;
    r.workload = w.name;

    if (!init_error_.empty()) {
        r.stages.push_back(skipped_stage(kStageValidate, init_error_));
        return r;
    }

    std::string exe;
    try {
        exe = locator_.resolve();
    } catch (const BinaryNotFoundError& e) {
        std::cerr << "[ProcessAdapter] " << name_ << ": " << program_ << " " << e.what() << std::endl;
        r.stages.push_back(skipped_stage(kStageValidate, std::string("binary not found: ") + e.what()));
        return r;
    }
    if (verbose_) std::cerr << "[ProcessAdapter] Using binary: " << exe << std::endl;

    r.stages.push_back(invoke(exe, w));
    return r;
}

TimedResult ProcessAdapter::invoke(const std::string& exe, const Workload& w) {
    const std::string data_text = w.data.dump();
    const std::string tag = w.name + "-" + short_fingerprint(w.schema_text, data_text);

    // Files are written before the clock starts; the guard outlives the child.
    std::unique_ptr<ScopedTempDir> dir;
    std::string schema_path, data_path;
    try {
        dir = std::make_unique<ScopedTempDir>(temp_root_, tag);
        schema_path = dir->write_file("schema.json", w.schema_text);
        data_path = dir->write_file("data.json", data_text);
    } catch (const std::exception& e) {
        std::cerr << "[ProcessAdapter] " << name_ << "/" << w.name << " cannot stage temp files: "
                  << e.what() << std::endl;
        return skipped_stage(kStageValidate, std::string("temp files: ") + e.what());
    }

    std::vector<std::string> argv = {
        exe, "validate", "--schema", schema_path, "--data", data_path, "--target-class", w.target_class
    };
    argv.insert(argv.end(), extra_args_.begin(), extra_args_.end());

    if (verbose_) {
        std::cerr << "[ProcessAdapter] Executing:";
        for (auto& a : argv) std::cerr << " " << a;
        std::cerr << std::endl;
    }

    ProcessResult proc;
    Measurement m = measure([&] {
        proc = run_process(argv, timeout_ms_);
        if (proc.timed_out) {
            throw SubprocessTimeoutError("timed out after " + std::to_string(timeout_ms_) + " ms", timeout_ms_);
        }
        if (proc.signal != 0) {
            throw SubprocessExitError("process killed by signal " + std::to_string(proc.signal), -1, proc.err);
        }
        if (proc.exit_code != 0) {
            std::string what = "process exited with code " + std::to_string(proc.exit_code);
            if (!proc.err.empty()) what += ": " + first_line(proc.err);
            throw SubprocessExitError(what, proc.exit_code, proc.err);
        }
        try {
            return json::parse(proc.out);
        } catch (const json::parse_error&) {
            return json{{"stdout", proc.out}};
        }
    });

    TimedResult t = to_timed_result(kStageValidate, std::move(m));
    if (!t.ok) {
        t.payload = {{"stdout", proc.out}, {"stderr", proc.err}, {"exit_code", proc.exit_code}};
        std::cerr << "[ProcessAdapter] " << name_ << "/" << w.name << " validate failed: " << t.error << std::endl;
        if (verbose_ && !proc.err.empty()) std::cerr << "[ProcessAdapter] stderr:\n" << proc.err << std::endl;
    }
    return t;
}
