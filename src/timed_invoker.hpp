#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Duration reported for a stage that could not be measured.
constexpr double kUnavailableMs = -1.0;

// Outcome of one measured call. Either ok with a payload or failed with an error.
struct Measurement {
    bool ok{false};
    double elapsed_ms{0.0};     // wall time up to completion or up to the fault
    nlohmann::json payload;
    std::string error;
};

// One stage of one adapter on one workload.
struct TimedResult {
    std::string stage;
    double ms{kUnavailableMs};  // >= 0, or kUnavailableMs when the stage failed or was skipped
    double elapsed_ms{0.0};
    bool ok{false};
    nlohmann::json payload;
    std::string error;

    bool available() const { return ms >= 0.0; }
};

// Stage results in the order the adapter produced them.
struct AdapterResult {
    std::string adapter;
    std::string workload;
    std::vector<TimedResult> stages;

    const TimedResult* find(const std::string& stage) const;
    double ms(const std::string& stage) const;
    size_t available_count() const;
};

double clamp_elapsed(double ms);

// Runs op between two steady_clock samples. op returns a json payload (or void).
// Any thrown object becomes a failed Measurement; nothing escapes.
template <typename F>
Measurement measure(F&& op) {
    Measurement m;
    const auto t0 = std::chrono::steady_clock::now();
    try {
        if constexpr (std::is_void_v<decltype(op())>) {
            op();
        } else {
            m.payload = op();
        }
        m.ok = true;
    } catch (const std::exception& e) {
        m.error = e.what();
    } catch (...) {
        m.error = "unknown fault";
    }
    const auto t1 = std::chrono::steady_clock::now();
    m.elapsed_ms = clamp_elapsed(std::chrono::duration<double, std::milli>(t1 - t0).count());
    return m;
}

// Successful measurements keep their elapsed time, failed ones get kUnavailableMs.
TimedResult to_timed_result(const std::string& stage, Measurement m);

// A stage that was never run because an earlier one failed.
TimedResult skipped_stage(const std::string& stage, const std::string& reason);
