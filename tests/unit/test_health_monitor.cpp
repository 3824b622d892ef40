// ============================================================================
// LIFELINE - Health Monitor Unit Tests
// ============================================================================

#include "lifeline/resilience/health_monitor.hpp"

#include "fake_gateway_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <vector>

using namespace lifeline;
using namespace lifeline::test;
using resilience::HealthSignalKind;
using resilience::SampleStatus;

namespace {

class SignalRecorder : public resilience::IHealthListener {
public:
    void on_health_sample(const resilience::HealthSample& sample) override {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.push_back(sample);
    }

    void on_health_signal(const resilience::HealthSignal& signal) override {
        std::lock_guard<std::mutex> lock(mutex_);
        signals_.push_back(signal);
    }

    size_t count(HealthSignalKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(signals_.begin(), signals_.end(),
            [kind](const auto& s) { return s.kind == kind; }));
    }

    size_t sample_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<resilience::HealthSample> samples_;
    std::vector<resilience::HealthSignal> signals_;
};

}  // namespace

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = fast_config().health;
    }

    std::unique_ptr<resilience::HealthMonitor> build() {
        auto monitor = std::make_unique<resilience::HealthMonitor>(config_, target_, clock_.fn());
        monitor->add_listener(&recorder_);
        return monitor;
    }

    config::HealthConfig config_;
    FakeProbeTarget target_;
    ManualClock clock_;
    SignalRecorder recorder_;
};

// ============================================================================
// Sampling
// ============================================================================

TEST_F(HealthMonitorTest, NoSamplesWhileSessionNotReady) {
    target_.ready = false;
    auto monitor = build();

    monitor->run_cycle();
    EXPECT_EQ(target_.probe_calls.load(), 0);
    EXPECT_TRUE(monitor->recent_samples().empty());
    EXPECT_FALSE(monitor->data_age().has_value());
}

TEST_F(HealthMonitorTest, OkSampleRecorded) {
    auto monitor = build();
    monitor->run_cycle();

    const auto samples = monitor->recent_samples();
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].status, SampleStatus::Ok);
    EXPECT_EQ(samples[0].generation, 1u);
    EXPECT_EQ(recorder_.sample_count(), 1u);
}

TEST_F(HealthMonitorTest, TimeoutAndErrorClassified) {
    auto monitor = build();

    target_.fault = Fault::Timeout;
    monitor->run_cycle();
    target_.fault = Fault::Transient;
    monitor->run_cycle();

    const auto samples = monitor->recent_samples();
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].status, SampleStatus::Timeout);
    EXPECT_EQ(samples[1].status, SampleStatus::Error);
}

TEST_F(HealthMonitorTest, SampleWindowIsBounded) {
    auto monitor = build();
    for (size_t i = 0; i < resilience::HealthMonitor::SAMPLE_WINDOW + 10; ++i) {
        monitor->run_cycle();
    }
    EXPECT_EQ(monitor->recent_samples().size(), resilience::HealthMonitor::SAMPLE_WINDOW);
}

// ============================================================================
// Degrading Verdict
// ============================================================================

TEST_F(HealthMonitorTest, DegradingFiresOnceAtThreshold) {
    auto monitor = build();
    target_.fault = Fault::Transient;

    monitor->run_cycle();
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 0u);

    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 1u);

    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 1u);
    EXPECT_EQ(monitor->consecutive_failures(), 4u);
}

TEST_F(HealthMonitorTest, OkSampleResetsFailureCount) {
    auto monitor = build();

    target_.fault = Fault::Transient;
    monitor->run_cycle();
    monitor->run_cycle();
    target_.fault = Fault::None;
    monitor->run_cycle();
    target_.fault = Fault::Transient;
    monitor->run_cycle();

    EXPECT_EQ(monitor->consecutive_failures(), 1u);
    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 0u);
}

TEST_F(HealthMonitorTest, NewSessionStartsFreshCount) {
    auto monitor = build();

    target_.fault = Fault::Transient;
    monitor->run_cycle();
    monitor->run_cycle();
    target_.generation = 2;
    monitor->run_cycle();

    EXPECT_EQ(monitor->consecutive_failures(), 1u);
    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 0u);
}

TEST_F(HealthMonitorTest, RequestTimeoutsCountTowardThreshold) {
    auto monitor = build();

    monitor->record_request_timeout();
    monitor->record_request_timeout();
    monitor->record_request_timeout();

    EXPECT_EQ(recorder_.count(HealthSignalKind::Degrading), 1u);
    EXPECT_EQ(monitor->recent_samples().back().status, SampleStatus::Timeout);
}

// ============================================================================
// Staleness
// ============================================================================

TEST_F(HealthMonitorTest, StalenessArmedOnFirstReadyCycle) {
    auto monitor = build();
    EXPECT_FALSE(monitor->data_age().has_value());

    monitor->run_cycle();
    ASSERT_TRUE(monitor->data_age().has_value());
    EXPECT_EQ(*monitor->data_age(), std::chrono::seconds(0));
}

TEST_F(HealthMonitorTest, SixMinutesWithoutDataIsStaleAndPersistent) {
    auto monitor = build();
    monitor->run_cycle();

    clock_.advance(std::chrono::minutes(4));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Stale), 0u);

    clock_.advance(std::chrono::minutes(2));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Stale), 1u);
    EXPECT_EQ(recorder_.count(HealthSignalKind::StalePersistent), 1u);
    EXPECT_EQ(*monitor->data_age(), std::chrono::seconds(360));

    // One signal per episode
    clock_.advance(std::chrono::minutes(1));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Stale), 1u);
    EXPECT_EQ(recorder_.count(HealthSignalKind::StalePersistent), 1u);
}

TEST_F(HealthMonitorTest, GracePeriodDelaysEscalation) {
    config_.stale_grace_period = std::chrono::seconds(120);
    auto monitor = build();
    monitor->run_cycle();

    clock_.advance(std::chrono::minutes(6));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Stale), 1u);
    EXPECT_EQ(recorder_.count(HealthSignalKind::StalePersistent), 0u);

    clock_.advance(std::chrono::minutes(2));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::StalePersistent), 1u);
}

TEST_F(HealthMonitorTest, MarketUpdateClosesStaleEpisode) {
    auto monitor = build();
    monitor->run_cycle();
    clock_.advance(std::chrono::minutes(6));
    monitor->run_cycle();
    ASSERT_EQ(recorder_.count(HealthSignalKind::Stale), 1u);

    monitor->note_market_update();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Fresh), 1u);
    EXPECT_EQ(*monitor->data_age(), std::chrono::seconds(0));

    // A new episode can open again
    clock_.advance(std::chrono::minutes(6));
    monitor->run_cycle();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Stale), 2u);
}

TEST_F(HealthMonitorTest, MarketUpdateWithoutEpisodeIsQuiet) {
    auto monitor = build();
    monitor->run_cycle();
    monitor->note_market_update();
    EXPECT_EQ(recorder_.count(HealthSignalKind::Fresh), 0u);
}

// ============================================================================
// Timer Loop
// ============================================================================

TEST_F(HealthMonitorTest, TimerDrivesCycles) {
    auto monitor = build();
    monitor->start();
    EXPECT_TRUE(monitor->running());

    EXPECT_TRUE(wait_for([&] { return target_.probe_calls.load() >= 3; }));

    monitor->stop();
    EXPECT_FALSE(monitor->running());
    const int after_stop = target_.probe_calls.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(target_.probe_calls.load(), after_stop);
}

TEST_F(HealthMonitorTest, StopIsIdempotent) {
    auto monitor = build();
    monitor->stop();
    monitor->start();
    monitor->stop();
    monitor->stop();
    EXPECT_FALSE(monitor->running());
}
