// ============================================================================
// LIFELINE - Degradation Coordinator Unit Tests
// ============================================================================

#include "lifeline/resilience/degradation_coordinator.hpp"
#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/session/session_manager.hpp"

#include "fake_gateway_transport.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

using namespace lifeline;
using namespace lifeline::test;
using resilience::DegradationCoordinator;
using resilience::HealthSignalKind;
using resilience::SampleStatus;
using session::SessionState;

namespace {

class TransitionRecorder : public resilience::IDegradationListener {
public:
    void on_degradation_entered(const resilience::DegradationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entered.push_back(event);
    }

    void on_degradation_recovered(const resilience::DegradationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        recovered.push_back(event);
    }

    std::vector<resilience::DegradationEvent> entered;
    std::vector<resilience::DegradationEvent> recovered;

private:
    std::mutex mutex_;
};

session::SessionEvent session_event(SessionState from, SessionState to, uint64_t generation,
                                    std::optional<DegradationReason> escalation = std::nullopt) {
    session::SessionEvent event;
    event.from = from;
    event.to = to;
    event.generation = generation;
    event.at = now();
    event.reason = "test";
    event.escalation = escalation;
    return event;
}

resilience::HealthSample sample(SampleStatus status, uint64_t generation) {
    resilience::HealthSample s;
    s.timestamp = now();
    s.status = status;
    s.generation = generation;
    return s;
}

resilience::HealthSignal signal(HealthSignalKind kind) {
    resilience::HealthSignal s;
    s.kind = kind;
    s.at = now();
    s.data_age = std::chrono::seconds(360);
    return s;
}

}  // namespace

class DegradationCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override { coordinator_.subscribe(&recorder_); }

    void become_ready(uint64_t generation) {
        coordinator_.on_session_event(
            session_event(SessionState::Authenticating, SessionState::Ready, generation));
    }

    void healthy(int count, uint64_t generation) {
        for (int i = 0; i < count; ++i) {
            coordinator_.on_health_sample(sample(SampleStatus::Ok, generation));
        }
    }

    config::DegradationConfig config_;  // 3 healthy samples to recover
    DegradationCoordinator coordinator_{config_};
    TransitionRecorder recorder_;
};

// ============================================================================
// Entry
// ============================================================================

TEST_F(DegradationCoordinatorTest, StartsSafeToAct) {
    EXPECT_FALSE(coordinator_.safe_mode_active());
    EXPECT_TRUE(coordinator_.is_safe_to_act());
    EXPECT_FALSE(coordinator_.open_event().has_value());
}

TEST_F(DegradationCoordinatorTest, TriggerEntersImmediately) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "30 attempts failed");

    EXPECT_TRUE(coordinator_.safe_mode_active());
    ASSERT_TRUE(coordinator_.open_event().has_value());
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::ConnectionExhausted);
    EXPECT_TRUE(coordinator_.open_event()->is_open());
    ASSERT_EQ(recorder_.entered.size(), 1u);
}

TEST_F(DegradationCoordinatorTest, FurtherTriggersJoinOpenEvent) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "first");
    const auto id = coordinator_.open_event()->id;

    coordinator_.trigger(DegradationReason::DataStale, "second");
    EXPECT_EQ(coordinator_.open_event()->id, id);
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::ConnectionExhausted);
    EXPECT_EQ(recorder_.entered.size(), 1u);
}

TEST_F(DegradationCoordinatorTest, SessionEscalationTriggers) {
    coordinator_.on_session_event(session_event(SessionState::Reconnecting,
                                                SessionState::Disconnected, 4,
                                                DegradationReason::ConnectionExhausted));
    EXPECT_TRUE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::ConnectionExhausted);
}

TEST_F(DegradationCoordinatorTest, ConnectResultClassification) {
    coordinator_.note_connect_result(SessionState::Ready);
    coordinator_.note_connect_result(SessionState::Disconnected);
    EXPECT_FALSE(coordinator_.safe_mode_active());

    coordinator_.note_connect_result(SessionState::Reconnecting);
    EXPECT_TRUE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::StartupTimeout);
}

TEST_F(DegradationCoordinatorTest, StartupTimeoutRecoversLikeAnyHealthyReconnect) {
    coordinator_.note_connect_result(SessionState::Connecting);
    become_ready(1);
    healthy(3, 1);
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(DegradationCoordinatorTest, RecoversAfterHealthySamplesOnReadySession) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "exhausted");
    become_ready(2);

    healthy(2, 2);
    EXPECT_TRUE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.healthy_streak(), 2u);

    healthy(1, 2);
    EXPECT_FALSE(coordinator_.safe_mode_active());
    EXPECT_FALSE(coordinator_.open_event().has_value());

    const auto history = coordinator_.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_TRUE(history[0].recovered_at.has_value());
    EXPECT_GE(*history[0].recovered_at, history[0].entered_at);
    ASSERT_EQ(recorder_.recovered.size(), 1u);
    EXPECT_EQ(recorder_.recovered[0].id, recorder_.entered[0].id);
}

TEST_F(DegradationCoordinatorTest, SamplesWithoutReadySessionIgnored) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "exhausted");
    healthy(5, 1);
    EXPECT_TRUE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.healthy_streak(), 0u);
}

TEST_F(DegradationCoordinatorTest, SamplesFromOldSessionIgnored) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "exhausted");
    become_ready(3);
    healthy(5, 2);
    EXPECT_TRUE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, FailedSampleResetsStreak) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "exhausted");
    become_ready(2);

    healthy(2, 2);
    coordinator_.on_health_sample(sample(SampleStatus::Timeout, 2));
    healthy(2, 2);
    EXPECT_TRUE(coordinator_.safe_mode_active());

    healthy(1, 2);
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, LeavingReadyResetsStreak) {
    coordinator_.trigger(DegradationReason::ConnectionExhausted, "exhausted");
    become_ready(2);
    healthy(2, 2);

    coordinator_.on_session_event(
        session_event(SessionState::Ready, SessionState::Reconnecting, 2));
    become_ready(3);
    healthy(2, 3);
    EXPECT_TRUE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, AuthenticationFailureNeedsAcknowledgement) {
    coordinator_.trigger(DegradationReason::AuthenticationFailed, "rejected");
    become_ready(2);
    healthy(5, 2);
    EXPECT_TRUE(coordinator_.safe_mode_active());

    coordinator_.acknowledge_authentication();
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, ManualOverrideNeedsClear) {
    coordinator_.trigger_manual_override("operator halt");
    become_ready(1);
    healthy(5, 1);
    EXPECT_TRUE(coordinator_.safe_mode_active());

    coordinator_.clear_manual_override();
    EXPECT_FALSE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.history().back().trigger_reason, DegradationReason::ManualOverride);
}

TEST_F(DegradationCoordinatorTest, ClearAloneDoesNotRecoverUnhealthySession) {
    coordinator_.trigger_manual_override("operator halt");
    coordinator_.clear_manual_override();
    EXPECT_TRUE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, DataStaleNeedsFreshData) {
    become_ready(1);
    coordinator_.on_health_signal(signal(HealthSignalKind::StalePersistent));
    EXPECT_TRUE(coordinator_.safe_mode_active());
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::DataStale);

    healthy(5, 1);
    EXPECT_TRUE(coordinator_.safe_mode_active());

    coordinator_.on_health_signal(signal(HealthSignalKind::Fresh));
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, StaleWithoutPersistenceDoesNotTrigger) {
    coordinator_.on_health_signal(signal(HealthSignalKind::Stale));
    coordinator_.on_health_signal(signal(HealthSignalKind::Degrading));
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

TEST_F(DegradationCoordinatorTest, HistoryIsBounded) {
    config::DegradationConfig small;
    small.recovery_healthy_samples = 1;
    small.history_size = 2;
    DegradationCoordinator coordinator(small);

    coordinator.on_session_event(session_event(SessionState::Authenticating, SessionState::Ready, 1));
    for (int i = 0; i < 3; ++i) {
        coordinator.trigger(DegradationReason::ConnectionExhausted, "cycle");
        coordinator.on_session_event(
            session_event(SessionState::Authenticating, SessionState::Ready, 1));
        coordinator.on_health_sample(sample(SampleStatus::Ok, 1));
        ASSERT_FALSE(coordinator.safe_mode_active());
    }

    const auto history = coordinator.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, 2u);
    EXPECT_EQ(history[1].id, 3u);
}

// ============================================================================
// With Health Monitor
// ============================================================================

TEST_F(DegradationCoordinatorTest, SixMinutesWithoutMarketDataEntersDataStale) {
    FakeProbeTarget target;
    ManualClock clock;
    resilience::HealthMonitor monitor(fast_config().health, target, clock.fn());
    monitor.add_listener(&coordinator_);

    become_ready(1);
    monitor.run_cycle();
    clock.advance(std::chrono::minutes(6));
    monitor.run_cycle();

    EXPECT_TRUE(coordinator_.safe_mode_active());
    ASSERT_TRUE(coordinator_.open_event().has_value());
    EXPECT_EQ(coordinator_.open_event()->trigger_reason, DegradationReason::DataStale);

    // Fresh data plus healthy probes release it
    monitor.note_market_update();
    monitor.run_cycle();
    monitor.run_cycle();
    monitor.run_cycle();
    EXPECT_FALSE(coordinator_.safe_mode_active());
}

// ============================================================================
// With Session Manager
// ============================================================================

class CoordinatorWithSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = fast_config();
        transport_ = std::make_shared<FakeGatewayTransport>();
    }

    void TearDown() override {
        if (session_) session_->shutdown();
    }

    session::SessionManager& build() {
        coordinator_ = std::make_unique<DegradationCoordinator>(config_.degradation);
        session_ = std::make_unique<session::SessionManager>(
            config_, transport_,
            std::make_shared<session::ClientIdAllocator>(config_.session.reserved_client_ids),
            resilience::BackoffPolicy(config_.backoff, resilience::BackoffPolicy::no_jitter()));
        session_->add_listener(coordinator_.get());
        return *session_;
    }

    config::CoreConfig config_;
    std::shared_ptr<FakeGatewayTransport> transport_;
    std::unique_ptr<DegradationCoordinator> coordinator_;
    std::unique_ptr<session::SessionManager> session_;
};

TEST_F(CoordinatorWithSessionTest, ExhaustedBudgetActivatesSafeMode) {
    config_.backoff.max_attempts = 3;
    transport_->fail_opens(3);
    auto& manager = build();

    const auto state = manager.connect();
    EXPECT_EQ(state, SessionState::Disconnected);
    coordinator_->note_connect_result(state);

    EXPECT_TRUE(coordinator_->safe_mode_active());
    ASSERT_TRUE(coordinator_->open_event().has_value());
    EXPECT_EQ(coordinator_->open_event()->trigger_reason, DegradationReason::ConnectionExhausted);
    EXPECT_EQ(transport_->open_calls.load(), 3);
}

TEST_F(CoordinatorWithSessionTest, StartupTimeoutWithRetriesLeftIsNotExhaustion) {
    config_.session.startup_timeout = std::chrono::seconds(1);
    config_.backoff.initial_delay = 5000ms;
    config_.backoff.max_delay = 5000ms;
    transport_->fail_opens(1);
    auto& manager = build();

    const auto state = manager.connect();
    EXPECT_EQ(state, SessionState::Reconnecting);
    coordinator_->note_connect_result(state);

    EXPECT_TRUE(coordinator_->safe_mode_active());
    EXPECT_EQ(coordinator_->open_event()->trigger_reason, DegradationReason::StartupTimeout);
}

TEST_F(CoordinatorWithSessionTest, TransientFailuresBelowBudgetNeverDegrade) {
    transport_->fail_opens(5);
    auto& manager = build();

    const auto state = manager.connect();
    EXPECT_EQ(state, SessionState::Ready);
    coordinator_->note_connect_result(state);

    EXPECT_FALSE(coordinator_->safe_mode_active());
    EXPECT_TRUE(coordinator_->history().empty());
}
