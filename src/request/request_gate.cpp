// ============================================================================
// LIFELINE - Request Gate Implementation
// ============================================================================
// Calls execute on a boost::asio::thread_pool; the submitting thread waits on
// a PendingCall until completion, deadline or cancellation. The first
// completion wins, so a late transport answer after a timeout is discarded.
// ============================================================================

#include "lifeline/request/request_gate.hpp"
#include "lifeline/utils/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <unordered_map>

namespace lifeline::request {

namespace net = boost::asio;

namespace {

// ============================================================================
// Pending Call
// ============================================================================

struct PendingCall {
    uint64_t id = 0;
    ContractKey key;
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    RequestError error = RequestError::None;
    std::string detail;
    std::optional<Quote> quote;
    std::vector<Bar> bars;

    /// First completion wins; returns false if already completed
    bool complete(RequestError err, std::string why,
                  std::optional<Quote> q = std::nullopt, std::vector<Bar> b = {}) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (done) return false;
            done = true;
            error = err;
            detail = std::move(why);
            quote = std::move(q);
            bars = std::move(b);
        }
        cv.notify_all();
        return true;
    }

    bool wait_until(MonoTime deadline) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_until(lock, deadline, [this] { return done; });
    }
};

}  // namespace

// ============================================================================
// Request Gate Implementation
// ============================================================================

struct RequestGate::Impl {
    Impl(const config::CoreConfig& config, session::SessionManager& session,
         std::shared_ptr<gateway::IGatewayTransport> transport, resilience::HealthMonitor* monitor)
        : gate_(config.gate)
        , staleness_threshold_(config.health.staleness_threshold)
        , session_(session)
        , transport_(std::move(transport))
        , monitor_(monitor)
        , pool_(config.gate.worker_threads) {}

    // ------------------------------------------------------------------------
    // Validation
    // ------------------------------------------------------------------------

    std::optional<std::pair<RequestError, std::string>> validate_window(const DataRequest& request) const {
        if (!request.window) {
            return std::make_pair(RequestError::InvalidWindow, std::string("historical request without window"));
        }
        const auto& window = *request.window;
        if (window.end <= window.start || window.bar_size.count() <= 0) {
            return std::make_pair(RequestError::InvalidWindow, std::string("empty window or bar size"));
        }
        // Gateway bar sizes are whole minutes; anything else would come back coarser
        if (window.bar_size.count() % 60 != 0) {
            return std::make_pair(RequestError::InvalidWindow,
                                  "unsupported bar size of " +
                                      std::to_string(window.bar_size.count()) + " s");
        }
        if (window.length() > gate_.max_window) {
            return std::make_pair(RequestError::WindowTooLarge,
                                  "window of " +
                                      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                                         window.length()).count()) +
                                      " s exceeds " + std::to_string(gate_.max_window.count()) + " s");
        }
        if (window.bar_count() > static_cast<int64_t>(gate_.max_bars)) {
            return std::make_pair(RequestError::WindowTooLarge,
                                  std::to_string(window.bar_count()) + " bars exceeds " +
                                      std::to_string(gate_.max_bars));
        }
        if (!gate_.trading_hours.contains(window)) {
            return std::make_pair(RequestError::InvalidWindow,
                                  std::string("window outside regular trading hours"));
        }
        return std::nullopt;
    }

    // ------------------------------------------------------------------------
    // Concurrency Limits
    // ------------------------------------------------------------------------

    std::shared_ptr<std::timed_mutex> contract_mutex(const ContractKey& key) {
        std::lock_guard<std::mutex> lock(contracts_mutex_);
        auto& slot = contract_mutexes_[key];
        if (!slot) {
            slot = std::make_shared<std::timed_mutex>();
        }
        return slot;
    }

    bool acquire_slot(MonoTime deadline) {
        std::unique_lock<std::mutex> lock(slot_mutex_);
        if (!slot_cv_.wait_until(lock, deadline, [this] { return in_flight_ < gate_.max_in_flight; })) {
            return false;
        }
        ++in_flight_;
        return true;
    }

    void release_slot() {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            --in_flight_;
        }
        slot_cv_.notify_one();
    }

    struct SlotGuard {
        Impl& impl;
        bool held = false;
        ~SlotGuard() {
            if (held) impl.release_slot();
        }
    };

    // ------------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------------

    void register_call(const std::shared_ptr<PendingCall>& call) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[call->id] = call;
    }

    void unregister_call(uint64_t id) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
    }

    void dispatch(const std::shared_ptr<PendingCall>& call, const QualifiedContract& contract,
                  const DataRequest& request, MonoTime deadline) {
        gateway::RequestContext ctx;
        ctx.request_id = call->id;
        ctx.deadline = deadline;
        ctx.cancelled = call->cancelled;

        net::post(pool_, [call, contract, request, ctx, transport = transport_] {
            if (ctx.is_cancelled()) return;
            try {
                if (request.kind == RequestKind::MarketSnapshot) {
                    call->complete(RequestError::None, {}, transport->request_snapshot(contract, ctx));
                } else {
                    call->complete(RequestError::None, {}, std::nullopt,
                                   transport->request_historical(contract, *request.window, ctx));
                }
            } catch (const RequestCancelledError& e) {
                call->complete(RequestError::SessionClosed, e.what());
            } catch (const RequestTimeoutError& e) {
                call->complete(RequestError::RequestTimeout, e.what());
            } catch (const InvalidResponseError& e) {
                call->complete(RequestError::InvalidResponse, e.what());
            } catch (const std::exception& e) {
                call->complete(RequestError::TransportFailure, e.what());
            }
        });
    }

    void finish_success(SubmitResult& result, const DataRequest& request, PendingCall& call) {
        if (request.kind == RequestKind::MarketSnapshot) {
            if (!call.quote || !call.quote->is_valid()) {
                result.error = RequestError::InvalidResponse;
                result.detail = "snapshot failed validation";
                return;
            }
            const auto& quote = *call.quote;
            if (quote.timestamp != Timestamp{} && now() - quote.timestamp > staleness_threshold_) {
                result.error = RequestError::StaleData;
                result.detail = "snapshot older than " + std::to_string(staleness_threshold_.count()) + " s";
                return;
            }
            result.quote = quote;
        } else {
            for (const auto& bar : call.bars) {
                if (bar.is_valid()) {
                    result.bars.push_back(bar);
                } else {
                    ++result.dropped_bars;
                }
            }
            if (result.dropped_bars > 0) {
                LOG_WARN("Request {} for {}: dropped {} bars failing OHLC validation",
                         result.request_id, request.contract_key.view(), result.dropped_bars);
            }
        }

        if (monitor_ != nullptr) {
            monitor_->note_market_update();
        }
    }

    SubmitResult reject(SubmitResult result, RequestError error, std::string detail,
                        const DataRequest& request) const {
        result.error = error;
        result.detail = std::move(detail);
        if (error == RequestError::UnsafeModeRejected || error == RequestError::WindowTooLarge) {
            LOG_WARN("Request {} for {} rejected: {} ({})", result.request_id,
                     request.contract_key.view(), to_string(error), result.detail);
        } else {
            LOG_DEBUG("Request {} for {} rejected: {} ({})", result.request_id,
                      request.contract_key.view(), to_string(error), result.detail);
        }
        return result;
    }

    // Members
    config::GateConfig gate_;
    std::chrono::seconds staleness_threshold_;
    session::SessionManager& session_;
    std::shared_ptr<gateway::IGatewayTransport> transport_;
    resilience::HealthMonitor* monitor_;
    net::thread_pool pool_;

    std::atomic<uint64_t> next_request_id_{1};

    std::mutex contracts_mutex_;
    std::unordered_map<ContractKey, std::shared_ptr<std::timed_mutex>> contract_mutexes_;

    mutable std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    uint32_t in_flight_ = 0;

    std::mutex pending_mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<PendingCall>> pending_;
};

// ============================================================================
// RequestGate Public Interface
// ============================================================================

RequestGate::RequestGate(const config::CoreConfig& config,
                         session::SessionManager& session,
                         std::shared_ptr<gateway::IGatewayTransport> transport,
                         resilience::HealthMonitor* monitor)
    : impl_(std::make_unique<Impl>(config, session, std::move(transport), monitor)) {}

RequestGate::~RequestGate() {
    cancel_all(RequestError::SessionClosed);
    impl_->pool_.join();
}

SubmitResult RequestGate::submit(const DataRequest& request) {
    SubmitResult result;
    result.request_id = impl_->next_request_id_.fetch_add(1, std::memory_order_relaxed);

    // 1. Snapshot only, regardless of session state
    if (request.mode != DataMode::Snapshot) {
        return impl_->reject(std::move(result), RequestError::UnsafeModeRejected,
                             "streaming subscriptions are not allowed", request);
    }

    // 2. Session
    if (impl_->session_.current_state() != session::SessionState::Ready) {
        return impl_->reject(std::move(result), RequestError::SessionNotReady,
                             std::string(to_string(impl_->session_.current_state())), request);
    }

    // 3. Window
    if (request.kind == RequestKind::HistoricalBars) {
        if (auto violation = impl_->validate_window(request)) {
            return impl_->reject(std::move(result), violation->first, violation->second, request);
        }
    }

    const auto timeout = request.timeout.value_or(impl_->gate_.default_timeout);
    const auto deadline = mono_now() + timeout;

    // Same-contract requests run one at a time
    const auto mutex = impl_->contract_mutex(request.contract_key);
    std::unique_lock<std::timed_mutex> contract_lock(*mutex, deadline);
    if (!contract_lock.owns_lock()) {
        return impl_->reject(std::move(result), RequestError::RequestTimeout,
                             "timed out waiting for a request on the same contract", request);
    }

    Impl::SlotGuard slot{*impl_};
    slot.held = impl_->acquire_slot(deadline);
    if (!slot.held) {
        return impl_->reject(std::move(result), RequestError::RequestTimeout,
                             "timed out waiting for an in-flight slot", request);
    }

    // 4. Qualification
    if (request.contract_key.oversized()) {
        return impl_->reject(std::move(result), RequestError::NotQualified,
                             "contract key longer than " +
                                 std::to_string(ContractKey::MAX_LENGTH) + " characters",
                             request);
    }
    auto contract = impl_->session_.lookup_qualified(request.contract_key);
    if (!contract) {
        LOG_DEBUG("Request {} for {}: not qualified, qualifying", result.request_id,
                  request.contract_key.view());
        auto qualification = impl_->session_.qualify(request.contract_key, deadline);
        if (!qualification.ok()) {
            const auto error = qualification.error == RequestError::None ? RequestError::NotQualified
                                                                         : qualification.error;
            // Qualification is a gateway call on this request's deadline
            if (error == RequestError::RequestTimeout && impl_->monitor_ != nullptr) {
                impl_->monitor_->record_request_timeout();
            } else if (error == RequestError::TransportFailure) {
                impl_->session_.report_transport_failure(qualification.detail);
            }
            return impl_->reject(std::move(result), error, qualification.detail, request);
        }
        contract = qualification.contract;
        result.qualified_on_demand = true;
    }

    auto call = std::make_shared<PendingCall>();
    call->id = result.request_id;
    call->key = request.contract_key;
    impl_->register_call(call);

    // Session may have dropped while qualifying
    if (impl_->session_.current_state() != session::SessionState::Ready) {
        impl_->unregister_call(call->id);
        return impl_->reject(std::move(result), RequestError::SessionClosed,
                             "session left READY before dispatch", request);
    }

    impl_->dispatch(call, *contract, request, deadline);

    if (!call->wait_until(deadline)) {
        call->cancelled->store(true, std::memory_order_release);
        call->complete(RequestError::RequestTimeout, "no response within " +
                                                         std::to_string(timeout.count()) + " ms");
    }
    impl_->unregister_call(call->id);

    RequestError error;
    std::string detail;
    {
        std::lock_guard<std::mutex> lock(call->mutex);
        error = call->error;
        detail = call->detail;
    }

    switch (error) {
        case RequestError::None:
            impl_->finish_success(result, request, *call);
            if (!result.ok()) {
                LOG_WARN("Request {} for {} failed: {} ({})", result.request_id,
                         request.contract_key.view(), to_string(result.error), result.detail);
            }
            return result;
        case RequestError::RequestTimeout:
            if (impl_->monitor_ != nullptr) {
                impl_->monitor_->record_request_timeout();
            }
            break;
        case RequestError::TransportFailure:
            impl_->session_.report_transport_failure(detail);
            break;
        default:
            break;
    }

    result.error = error;
    result.detail = std::move(detail);
    LOG_WARN("Request {} for {} failed: {} ({})", result.request_id,
             request.contract_key.view(), to_string(result.error), result.detail);
    return result;
}

void RequestGate::cancel_all(RequestError reason) {
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->pending_mutex_);
        for (auto& [id, call] : impl_->pending_) {
            call->cancelled->store(true, std::memory_order_release);
            if (call->complete(reason, "cancelled: " + std::string(to_string(reason)))) {
                ++cancelled;
            }
        }
    }
    if (cancelled > 0) {
        LOG_WARN("Cancelled {} in-flight requests ({})", cancelled, to_string(reason));
    }
}

size_t RequestGate::in_flight() const {
    std::lock_guard<std::mutex> lock(impl_->slot_mutex_);
    return impl_->in_flight_;
}

void RequestGate::on_session_event(const session::SessionEvent& event) {
    if (event.from == session::SessionState::Ready && event.to != session::SessionState::Ready) {
        cancel_all(RequestError::SessionClosed);
    }
}

void RequestGate::on_degradation_entered(const resilience::DegradationEvent& /*event*/) {
    cancel_all(RequestError::Degraded);
}

}  // namespace lifeline::request
