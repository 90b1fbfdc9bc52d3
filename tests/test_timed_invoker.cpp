#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>

#include "errors.hpp"
#include "timed_invoker.hpp"

TEST(TimedInvoker, SuccessCarriesPayloadAndDuration) {
    auto m = measure([] { return nlohmann::json{{"answer", 42}}; });
    EXPECT_TRUE(m.ok);
    EXPECT_TRUE(m.error.empty());
    EXPECT_EQ(m.payload["answer"], 42);
    EXPECT_GE(m.elapsed_ms, 0.0);
    EXPECT_FALSE(std::isnan(m.elapsed_ms));
}

TEST(TimedInvoker, VoidOperationLeavesNullPayload) {
    int calls = 0;
    auto m = measure([&] { ++calls; });
    EXPECT_TRUE(m.ok);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(m.payload.is_null());
}

TEST(TimedInvoker, ExceptionBecomesFailureWithMessage) {
    Measurement m;
    EXPECT_NO_THROW(m = measure([]() -> nlohmann::json { throw MeasurementFault("stage exploded"); }));
    EXPECT_FALSE(m.ok);
    EXPECT_EQ(m.error, "stage exploded");
    EXPECT_GE(m.elapsed_ms, 0.0);
}

TEST(TimedInvoker, NonStandardThrowIsContained) {
    Measurement m;
    EXPECT_NO_THROW(m = measure([] { throw 7; }));
    EXPECT_FALSE(m.ok);
    EXPECT_EQ(m.error, "unknown fault");
}

TEST(TimedInvoker, ElapsedTimeCoversTheFaultPoint) {
    auto m = measure([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw std::runtime_error("late failure");
    });
    EXPECT_FALSE(m.ok);
    EXPECT_GE(m.elapsed_ms, 15.0);
}

TEST(TimedInvoker, FailedMeasurementMapsToSentinel) {
    Measurement m;
    m.ok = false;
    m.elapsed_ms = 12.5;
    m.error = "boom";
    auto t = to_timed_result("validate", m);
    EXPECT_EQ(t.stage, "validate");
    EXPECT_EQ(t.ms, kUnavailableMs);
    EXPECT_EQ(t.elapsed_ms, 12.5);
    EXPECT_FALSE(t.available());
    EXPECT_EQ(t.error, "boom");
}

TEST(TimedInvoker, SuccessfulMeasurementKeepsDuration) {
    Measurement m;
    m.ok = true;
    m.elapsed_ms = 3.25;
    auto t = to_timed_result("parse", m);
    EXPECT_EQ(t.ms, 3.25);
    EXPECT_TRUE(t.available());
}

TEST(TimedInvoker, ZeroDurationIsAvailable) {
    Measurement m;
    m.ok = true;
    m.elapsed_ms = 0.0;
    EXPECT_TRUE(to_timed_result("parse", m).available());
}

TEST(TimedInvoker, ClampRejectsNanAndNegative) {
    EXPECT_EQ(clamp_elapsed(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_EQ(clamp_elapsed(-3.0), 0.0);
    EXPECT_EQ(clamp_elapsed(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_EQ(clamp_elapsed(1.5), 1.5);
}

TEST(TimedInvoker, SkippedStageIsUnavailable) {
    auto t = skipped_stage("prepare", "skipped: parse failed");
    EXPECT_EQ(t.ms, kUnavailableMs);
    EXPECT_FALSE(t.ok);
    EXPECT_EQ(t.error, "skipped: parse failed");
}

TEST(AdapterResult, LookupByStage) {
    AdapterResult r;
    r.stages.push_back(to_timed_result("parse", measure([] {})));
    r.stages.push_back(skipped_stage("validate", "nope"));
    EXPECT_NE(r.find("parse"), nullptr);
    EXPECT_EQ(r.find("prepare"), nullptr);
    EXPECT_GE(r.ms("parse"), 0.0);
    EXPECT_EQ(r.ms("validate"), kUnavailableMs);
    EXPECT_EQ(r.ms("prepare"), kUnavailableMs);
    EXPECT_EQ(r.available_count(), 1u);
}
