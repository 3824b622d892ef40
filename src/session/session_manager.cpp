// ============================================================================
// LIFELINE - Session Manager Implementation
// ============================================================================
// Attempt loop on a single io_context worker with steady_timer backoff.
// epoch_ invalidates attempts and timers started before a disconnect or a
// forced reconnect; generation identifies one Session instance.
// ============================================================================

#include "lifeline/session/session_manager.hpp"
#include "lifeline/utils/logger.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace lifeline::session {

namespace net = boost::asio;

// ============================================================================
// Session Manager Implementation
// ============================================================================

struct SessionManager::Impl {
    Impl(const config::CoreConfig& config,
         std::shared_ptr<gateway::IGatewayTransport> transport,
         std::shared_ptr<ClientIdAllocator> allocator,
         resilience::BackoffPolicy backoff)
        : config_(config)
        , transport_(std::move(transport))
        , allocator_(std::move(allocator))
        , backoff_(std::move(backoff))
        , io_context_(1)
        , work_(net::make_work_guard(io_context_))
        , retry_timer_(io_context_) {
        worker_ = std::thread([this] { io_context_.run(); });
    }

    ~Impl() {
        stop();
    }

    // ------------------------------------------------------------------------
    // Transitions (mutex_ held)
    // ------------------------------------------------------------------------

    void transition_locked(SessionState to, std::string reason,
                           std::optional<DegradationReason> escalation = std::nullopt) {
        SessionEvent event;
        event.from = session_.state;
        event.to = to;
        event.client_id = session_.id;
        event.generation = session_.generation;
        event.attempt_number = attempt_.attempt_number;
        event.at = now();
        event.reason = std::move(reason);
        event.escalation = escalation;

        session_.state = to;
        state_.store(to, std::memory_order_release);

        if (escalation) {
            LOG_ERROR("Session {} -> {} (client {}): {} [{}]",
                      to_string(event.from), to_string(to), event.client_id,
                      event.reason, to_string(*escalation));
        } else if (to == SessionState::Reconnecting) {
            LOG_WARN("Session {} -> {} (client {}): {}",
                     to_string(event.from), to_string(to), event.client_id, event.reason);
        } else {
            LOG_INFO("Session {} -> {} (client {}): {}",
                     to_string(event.from), to_string(to), event.client_id, event.reason);
        }

        pending_events_.push_back(std::move(event));
        state_cv_.notify_all();
    }

    /// Fresh Session with a new identity; qualification starts empty
    void new_session_locked() {
        session_.id = allocator_->next();
        session_.generation = ++next_generation_;
        session_.created_at = now();
        session_.last_heartbeat_at = Timestamp{};
        session_.qualified_contracts.clear();
        generation_.store(session_.generation, std::memory_order_release);

        attempt_ = ConnectionAttempt{};
        attempt_.attempt_number = failed_attempts_ + 1;
        attempt_.started_at = mono_now();

        qual_cv_.notify_all();
    }

    /// Deliver queued events in order, outside mutex_. Re-entrant calls
    /// return immediately; the active dispatcher drains what they queued.
    void flush_events() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (dispatching_) return;
        dispatching_ = true;

        while (!pending_events_.empty()) {
            SessionEvent event = std::move(pending_events_.front());
            pending_events_.pop_front();
            const auto listeners = listeners_;

            lock.unlock();
            for (auto* listener : listeners) {
                try {
                    listener->on_session_event(event);
                } catch (const std::exception& e) {
                    LOG_ERROR("Session listener failed on {} event: {}", to_string(event.to), e.what());
                }
            }
            lock.lock();
        }

        dispatching_ = false;
        state_cv_.notify_all();
    }

    // ------------------------------------------------------------------------
    // Attempt Loop (worker thread)
    // ------------------------------------------------------------------------

    void run_attempt(uint64_t epoch) {
        ClientId client_id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch != epoch_ || stopped_) return;
            client_id = session_.id;
        }

        const auto deadline = mono_now() + config_.session.handshake_timeout;
        try {
            transport_->close();
            transport_->open(config_.gateway, client_id, deadline);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (epoch != epoch_) return;
                transition_locked(SessionState::Authenticating, "transport open");
            }
            flush_events();

            transport_->authenticate(deadline);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (epoch != epoch_) return;
                attempt_.outcome = AttemptOutcome::Success;
                failed_attempts_ = 0;
                auth_escalated_ = false;
                session_.last_heartbeat_at = now();
                ready_since_ = now();
                transition_locked(SessionState::Ready, "authenticated");
            }
            flush_events();
        } catch (const AuthenticationError& e) {
            handle_failure(epoch,
                           e.pending_second_factor() ? FailureClass::AuthPendingSecondFactor
                                                     : FailureClass::AuthRejected,
                           e.what());
        } catch (const std::exception& e) {
            handle_failure(epoch, FailureClass::Transient, e.what());
        }
    }

    void handle_failure(uint64_t epoch, FailureClass failure, const std::string& detail) {
        transport_->close();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch != epoch_ || stopped_) return;

            attempt_.outcome = AttemptOutcome::Failure;
            attempt_.failure_class = failure;
            ++failed_attempts_;

            LOG_WARN("Connection attempt {} failed ({}): {}",
                     attempt_.attempt_number, to_string(failure), detail);

            if (failure == FailureClass::AuthRejected) {
                transition_locked(SessionState::Reconnecting, detail);
                ++epoch_;
                transition_locked(SessionState::Disconnected, "authentication rejected",
                                  DegradationReason::AuthenticationFailed);
                session_.qualified_contracts.clear();
            } else {
                const auto decision = backoff_.decide(failed_attempts_, failure);

                std::optional<DegradationReason> escalation;
                if (failure == FailureClass::AuthPendingSecondFactor && !auth_escalated_) {
                    escalation = DegradationReason::AuthenticationFailed;
                    auth_escalated_ = true;
                }

                if (decision.give_up) {
                    transition_locked(SessionState::Reconnecting, detail, escalation);
                    ++epoch_;
                    transition_locked(SessionState::Disconnected,
                                      "retry budget exhausted after " +
                                          std::to_string(failed_attempts_) + " attempts",
                                      DegradationReason::ConnectionExhausted);
                    session_.qualified_contracts.clear();
                } else {
                    transition_locked(SessionState::Reconnecting, detail, escalation);
                    LOG_INFO("Retrying in {} ms (attempt {} of {})",
                             decision.wait.count(), failed_attempts_ + 1, backoff_.budget());
                    retry_timer_.expires_after(decision.wait);
                    retry_timer_.async_wait([this, epoch](const boost::system::error_code& ec) {
                        if (!ec) begin_next_attempt(epoch);
                    });
                }
            }
        }
        flush_events();
    }

    void begin_next_attempt(uint64_t epoch) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch != epoch_ || stopped_) return;
            new_session_locked();
            transition_locked(SessionState::Connecting,
                              "attempt " + std::to_string(attempt_.attempt_number));
        }
        flush_events();
        run_attempt(epoch);
    }

    // ------------------------------------------------------------------------
    // External Triggers
    // ------------------------------------------------------------------------

    void force_reconnect(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_ || session_.state != SessionState::Ready) return;

            const auto epoch = ++epoch_;
            failed_attempts_ = 0;
            ++reconnect_count_;
            transition_locked(SessionState::Reconnecting, reason);
            session_.qualified_contracts.clear();
            qual_cv_.notify_all();

            net::post(io_context_, [this, epoch] {
                retry_timer_.cancel();
                transport_->close();
                begin_next_attempt(epoch);
            });
        }
        flush_events();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) return;
            stopped_ = true;
            ++epoch_;
        }
        work_.reset();
        io_context_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }
        transport_->close();
    }

    // Members
    config::CoreConfig config_;
    std::shared_ptr<gateway::IGatewayTransport> transport_;
    std::shared_ptr<ClientIdAllocator> allocator_;
    resilience::BackoffPolicy backoff_;

    net::io_context io_context_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    net::steady_timer retry_timer_;  // worker thread only
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::condition_variable qual_cv_;

    Session session_;
    ConnectionAttempt attempt_;
    std::atomic<SessionState> state_{SessionState::Disconnected};
    std::atomic<uint64_t> generation_{0};
    uint64_t epoch_ = 0;
    uint64_t next_generation_ = 0;
    uint32_t failed_attempts_ = 0;
    uint64_t reconnect_count_ = 0;
    Timestamp ready_since_{};
    bool auth_escalated_ = false;
    bool stopped_ = false;

    std::deque<SessionEvent> pending_events_;
    bool dispatching_ = false;
    std::vector<ISessionListener*> listeners_;
    std::unordered_set<ContractKey> qualifying_;
};

// ============================================================================
// SessionManager Public Interface
// ============================================================================

SessionManager::SessionManager(const config::CoreConfig& config,
                               std::shared_ptr<gateway::IGatewayTransport> transport,
                               std::shared_ptr<ClientIdAllocator> allocator,
                               resilience::BackoffPolicy backoff)
    : impl_(std::make_unique<Impl>(config, std::move(transport), std::move(allocator),
                                   std::move(backoff))) {}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::add_listener(ISessionListener* listener) {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->listeners_.push_back(listener);
}

SessionState SessionManager::connect() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->stopped_) return SessionState::Disconnected;

        if (impl_->session_.state == SessionState::Disconnected) {
            const auto epoch = ++impl_->epoch_;
            impl_->failed_attempts_ = 0;
            impl_->auth_escalated_ = false;
            impl_->new_session_locked();
            impl_->transition_locked(SessionState::Connecting, "connect requested");
            net::post(impl_->io_context_, [this, epoch] { impl_->run_attempt(epoch); });
        }
    }
    impl_->flush_events();

    std::unique_lock<std::mutex> lock(impl_->mutex_);
    const auto deadline = mono_now() + impl_->config_.session.startup_timeout;
    const bool settled = impl_->state_cv_.wait_until(lock, deadline, [this] {
        const auto state = impl_->session_.state;
        return (state == SessionState::Ready || state == SessionState::Disconnected) &&
               impl_->pending_events_.empty() && !impl_->dispatching_;
    });
    if (!settled) {
        LOG_WARN("Startup timeout ({} s) elapsed in state {}",
                 impl_->config_.session.startup_timeout.count(), to_string(impl_->session_.state));
    }
    return impl_->session_.state;
}

void SessionManager::disconnect() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->session_.state == SessionState::Disconnected) return;

        ++impl_->epoch_;
        impl_->transition_locked(SessionState::Disconnected, "disconnect requested");
        impl_->session_.qualified_contracts.clear();
        impl_->qual_cv_.notify_all();

        if (!impl_->stopped_) {
            net::post(impl_->io_context_, [this] {
                impl_->retry_timer_.cancel();
                impl_->transport_->close();
            });
        }
    }
    impl_->flush_events();
}

void SessionManager::shutdown() {
    disconnect();
    impl_->stop();
}

SessionState SessionManager::current_state() const noexcept {
    return impl_->state_.load(std::memory_order_acquire);
}

SessionSnapshot SessionManager::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    SessionSnapshot snap;
    snap.state = impl_->session_.state;
    snap.client_id = impl_->session_.id;
    snap.generation = impl_->session_.generation;
    snap.created_at = impl_->session_.created_at;
    snap.last_heartbeat_at = impl_->session_.last_heartbeat_at;
    snap.ready_since = impl_->ready_since_;
    snap.qualified_count = static_cast<size_t>(std::count_if(
        impl_->session_.qualified_contracts.begin(), impl_->session_.qualified_contracts.end(),
        [](const auto& entry) { return entry.second.ok(); }));
    snap.reconnect_count = impl_->reconnect_count_;
    snap.attempt_number = impl_->attempt_.attempt_number;
    return snap;
}

QualificationResult SessionManager::qualify(const ContractKey& key, MonoTime deadline) {
    std::unique_lock<std::mutex> lock(impl_->mutex_);
    if (impl_->session_.state != SessionState::Ready) {
        return {RequestError::SessionNotReady, std::nullopt, "session not ready", false};
    }

    // One qualification per contract in flight; later callers reuse its result
    while (impl_->qualifying_.count(key) != 0) {
        if (impl_->qual_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            return {RequestError::RequestTimeout, std::nullopt, "qualification wait timed out", false};
        }
        if (impl_->session_.state != SessionState::Ready) {
            return {RequestError::SessionNotReady, std::nullopt, "session not ready", false};
        }
    }

    const auto cached = impl_->session_.qualified_contracts.find(key);
    if (cached != impl_->session_.qualified_contracts.end()) {
        QualificationResult result = cached->second;
        result.from_cache = true;
        return result;
    }

    const auto generation = impl_->session_.generation;
    impl_->qualifying_.insert(key);
    lock.unlock();

    QualificationResult result;
    bool cacheable = false;
    const auto call_deadline =
        std::min(deadline, mono_now() + impl_->config_.session.qualification_timeout);

    try {
        const auto spec = parse_contract_key(key.view());
        auto contract = impl_->transport_->qualify(key, spec, call_deadline);
        if (contract.con_id <= 0) {
            throw QualificationError("gateway returned non-positive conId");
        }
        LOG_INFO("Qualified {} (conId {})", key.view(), contract.con_id);
        result.contract = std::move(contract);
        cacheable = true;
    } catch (const QualificationError& e) {
        LOG_WARN("Qualification failed for {}: {}", key.view(), e.what());
        result.error = RequestError::NotQualified;
        result.detail = e.what();
        cacheable = true;
    } catch (const RequestTimeoutError& e) {
        LOG_WARN("Qualification timed out for {}: {}", key.view(), e.what());
        result.error = RequestError::RequestTimeout;
        result.detail = e.what();
    } catch (const std::exception& e) {
        LOG_WARN("Qualification transport failure for {}: {}", key.view(), e.what());
        result.error = RequestError::TransportFailure;
        result.detail = e.what();
    }

    lock.lock();
    impl_->qualifying_.erase(key);
    if (cacheable && impl_->session_.generation == generation &&
        impl_->session_.state == SessionState::Ready) {
        impl_->session_.qualified_contracts[key] = result;
    }
    impl_->qual_cv_.notify_all();
    return result;
}

std::optional<QualifiedContract> SessionManager::lookup_qualified(const ContractKey& key) const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (impl_->session_.state != SessionState::Ready) return std::nullopt;
    const auto it = impl_->session_.qualified_contracts.find(key);
    if (it == impl_->session_.qualified_contracts.end() || !it->second.ok()) return std::nullopt;
    return it->second.contract;
}

void SessionManager::report_transport_failure(const std::string& detail) {
    impl_->force_reconnect("transport failure: " + detail);
}

bool SessionManager::probe_ready() const {
    return current_state() == SessionState::Ready;
}

uint64_t SessionManager::probe_generation() const {
    return impl_->generation_.load(std::memory_order_acquire);
}

void SessionManager::probe(MonoTime deadline) {
    impl_->transport_->heartbeat(deadline);
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->session_.last_heartbeat_at = now();
}

void SessionManager::on_health_signal(const resilience::HealthSignal& signal) {
    switch (signal.kind) {
        case resilience::HealthSignalKind::Degrading:
            impl_->force_reconnect(std::to_string(signal.consecutive_failures) +
                                   " consecutive failed health probes");
            break;
        case resilience::HealthSignalKind::Stale:
            impl_->force_reconnect("no market data for " +
                                   std::to_string(signal.data_age.count()) + " s");
            break;
        case resilience::HealthSignalKind::StalePersistent:
        case resilience::HealthSignalKind::Fresh:
            break;
    }
}

}  // namespace lifeline::session
