#include "timed_invoker.hpp"

double clamp_elapsed(double ms) {
    if (!std::isfinite(ms) || ms < 0.0) return 0.0;
    return ms;
}

TimedResult to_timed_result(const std::string& stage, Measurement m) {
    TimedResult r;
    r.stage = stage;
    r.ok = m.ok;
    r.elapsed_ms = m.elapsed_ms;
    r.ms = m.ok ? m.elapsed_ms : kUnavailableMs;
    r.payload = std::move(m.payload);
    r.error = std::move(m.error);
    return r;
}

TimedResult skipped_stage(const std::string& stage, const std::string& reason) {
    TimedResult r;
    r.stage = stage;
    r.error = reason;
    return r;
}

const TimedResult* AdapterResult::find(const std::string& stage) const {
    for (const auto& s : stages) {
        if (s.stage == stage) return &s;
    }
    return nullptr;
}

double AdapterResult::ms(const std::string& stage) const {
    const auto* s = find(stage);
    return s ? s->ms : kUnavailableMs;
}

size_t AdapterResult::available_count() const {
    size_t n = 0;
    for (const auto& s : stages) {
        if (s.available()) ++n;
    }
    return n;
}
