// ============================================================================
// LIFELINE - REST Gateway Transport Implementation
// ============================================================================
// Boost.Beast HTTPS client. Each call runs its own io_context so a deadline
// watchdog can abort resolve, connect, handshake, write and read uniformly.
// ============================================================================

#include "lifeline/gateway/rest_transport.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/gateway/json_codec.hpp"
#include "lifeline/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include <cctype>
#include <cmath>
#include <ctime>
#include <functional>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace lifeline::gateway {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto WATCHDOG_TICK = std::chrono::milliseconds(20);
constexpr int SNAPSHOT_POLLS = 3;
constexpr auto SNAPSHOT_POLL_PAUSE = std::chrono::milliseconds(250);

// ============================================================================
// Query Helpers
// ============================================================================

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) ss << '&';
        ss << url_encode(key) << '=' << url_encode(value);
        first = false;
    }
    return ss.str();
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/// "20260206" -> "FEB26"
std::string month_code(const std::string& expiry) {
    static constexpr const char* MONTHS[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                             "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
    const int month = std::stoi(expiry.substr(4, 2));
    return std::string(MONTHS[month - 1]) + expiry.substr(2, 2);
}

/// Gateway history time format, UTC: YYYYMMDD-HH:MM:SS
std::string format_gateway_time(Timestamp ts) {
    const std::time_t secs = static_cast<std::time_t>(
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count());
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d-%H:%M:%S");
    return ss.str();
}

/// Whole minutes only; the gate rejects anything finer
std::string format_bar_size(std::chrono::seconds bar) {
    const auto secs = bar.count();
    if (secs % 3600 == 0) return std::to_string(secs / 3600) + "h";
    return std::to_string(secs / 60) + "min";
}

std::string format_period(const HistoricalWindow& window) {
    const auto minutes = std::chrono::ceil<std::chrono::minutes>(window.length()).count();
    return std::to_string(std::max<int64_t>(minutes, 1)) + "min";
}

// ============================================================================
// HTTP Result
// ============================================================================

struct HttpResult {
    unsigned status = 0;
    std::string body;

    [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
};

std::string describe(const char* what, const HttpResult& res) {
    return std::string(what) + " failed with HTTP " + std::to_string(res.status);
}

/// Server-side and session-level failures are retried by reconnecting
void throw_for_status(const char* what, const HttpResult& res) {
    if (res.is_success()) return;
    throw TransientConnectionError(describe(what, res));
}

}  // namespace

// ============================================================================
// Transport Implementation
// ============================================================================

struct RestGatewayTransport::Impl {
    using https_stream = beast::ssl_stream<beast::tcp_stream>;

    struct Target {
        config::GatewayEndpoint endpoint;
        ClientId client_id = 0;
        std::shared_ptr<ssl::context> ssl_context;
    };

    Target current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_) {
            throw TransientConnectionError("transport is not open");
        }
        return target_;
    }

    HttpResult perform(const Target& target, http::verb verb, const std::string& path,
                       const std::map<std::string, std::string>& params,
                       MonoTime deadline, const std::atomic<bool>* cancelled) {
        net::io_context ioc(1);
        tcp::resolver resolver(ioc);
        https_stream stream(ioc, *target.ssl_context);
        net::steady_timer watchdog(ioc);

        const auto& host = target.endpoint.host;

        // Set SNI hostname for SSL
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            throw TransientConnectionError("SSL hostname failed: " + ec.message());
        }
        if (target.endpoint.verify_tls) {
            stream.set_verify_callback(ssl::host_name_verification(host));
        }

        std::string request_target = target.endpoint.base_path + path;
        if (!params.empty()) {
            request_target += "?" + build_query_string(params);
        }

        http::request<http::string_body> req{verb, request_target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, "Lifeline/1.0");
        req.set("X-Client-Id", std::to_string(target.client_id));
        if (verb == http::verb::post) {
            req.set(http::field::content_type, "application/json");
            req.body() = "{}";
            req.prepare_payload();
        }

        http::response<http::string_body> res;
        beast::flat_buffer buffer;
        beast::error_code result_ec;
        bool done = false;
        bool timed_out = false;
        bool aborted = false;

        auto finish = [&](beast::error_code ec) {
            result_ec = ec;
            done = true;
            watchdog.cancel();
        };

        std::function<void(beast::error_code)> on_tick = [&](beast::error_code ec) {
            if (ec == net::error::operation_aborted || done) return;
            const bool expired = mono_now() >= deadline;
            const bool was_cancelled = cancelled != nullptr && cancelled->load(std::memory_order_acquire);
            if (expired || was_cancelled) {
                timed_out = expired;
                aborted = was_cancelled && !expired;
                resolver.cancel();
                beast::get_lowest_layer(stream).cancel();
                return;
            }
            watchdog.expires_after(WATCHDOG_TICK);
            watchdog.async_wait(on_tick);
        };

        watchdog.expires_after(WATCHDOG_TICK);
        watchdog.async_wait(on_tick);

        resolver.async_resolve(
            host, std::to_string(target.endpoint.port),
            [&](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return finish(ec);
                beast::get_lowest_layer(stream).async_connect(
                    results,
                    [&](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        if (ec) return finish(ec);
                        stream.async_handshake(
                            ssl::stream_base::client,
                            [&](beast::error_code ec) {
                                if (ec) return finish(ec);
                                http::async_write(
                                    stream, req,
                                    [&](beast::error_code ec, std::size_t) {
                                        if (ec) return finish(ec);
                                        http::async_read(
                                            stream, buffer, res,
                                            [&](beast::error_code ec, std::size_t) {
                                                finish(ec);
                                            });
                                    });
                            });
                    });
            });

        ioc.run();

        // Connection is single-use; skip the TLS close_notify round trip
        beast::error_code ignored;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (timed_out) {
            throw RequestTimeoutError(path + " timed out");
        }
        if (aborted) {
            throw RequestCancelledError(path + " cancelled");
        }
        if (result_ec) {
            throw TransientConnectionError(path + ": " + result_ec.message());
        }

        HttpResult result;
        result.status = res.result_int();
        result.body = std::move(res.body());
        return result;
    }

    HttpResult get(const Target& target, const std::string& path,
                   const std::map<std::string, std::string>& params,
                   MonoTime deadline, const std::atomic<bool>* cancelled = nullptr) {
        return perform(target, http::verb::get, path, params, deadline, cancelled);
    }

    /// Interruptible pause between snapshot polls
    static void pause(const RequestContext& ctx, std::chrono::milliseconds duration) {
        const auto until = std::min(mono_now() + duration, ctx.deadline);
        while (mono_now() < until) {
            if (ctx.is_cancelled()) {
                throw RequestCancelledError("snapshot cancelled");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (ctx.expired()) {
            throw RequestTimeoutError("snapshot timed out");
        }
    }

    // Members
    mutable std::mutex mutex_;
    Target target_;
    bool opened_ = false;
};

// ============================================================================
// RestGatewayTransport Public Interface
// ============================================================================

RestGatewayTransport::RestGatewayTransport()
    : impl_(std::make_unique<Impl>()) {}

RestGatewayTransport::~RestGatewayTransport() = default;

void RestGatewayTransport::open(const config::GatewayEndpoint& endpoint, ClientId client_id,
                                MonoTime deadline) {
    Impl::Target target;
    target.endpoint = endpoint;
    target.client_id = client_id;
    target.ssl_context = std::make_shared<ssl::context>(ssl::context::tlsv12_client);
    target.ssl_context->set_default_verify_paths();
    target.ssl_context->set_verify_mode(endpoint.verify_tls ? ssl::verify_peer : ssl::verify_none);

    const auto res = impl_->get(target, "/iserver/auth/status", {}, deadline);
    if (res.status == 401) {
        // Reachable, not logged in yet; authenticate() classifies it
        LOG_DEBUG("Gateway {}:{} reachable, no brokerage login yet", endpoint.host, endpoint.port);
    } else {
        throw_for_status("auth status", res);
    }

    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->target_ = std::move(target);
    impl_->opened_ = true;
}

void RestGatewayTransport::authenticate(MonoTime deadline) {
    const auto target = impl_->current();
    const auto res = impl_->get(target, "/iserver/auth/status", {}, deadline);

    if (res.status == 401) {
        throw AuthenticationError("gateway awaiting login approval", true);
    }
    throw_for_status("auth status", res);

    const auto status = json::parse_auth_status(res.body);
    if (status.authenticated && status.connected) {
        return;
    }
    if (!status.fail.empty()) {
        throw AuthenticationError("login rejected: " + status.fail, false);
    }
    if (status.competing) {
        throw TransientConnectionError("competing brokerage session");
    }
    throw AuthenticationError(
        status.message.empty() ? std::string("second factor pending") : status.message, true);
}

void RestGatewayTransport::heartbeat(MonoTime deadline) {
    const auto target = impl_->current();
    const auto res = impl_->perform(target, http::verb::post, "/tickle", {}, deadline, nullptr);
    throw_for_status("tickle", res);
}

QualifiedContract RestGatewayTransport::qualify(const ContractKey& key, const ContractSpec& spec,
                                                MonoTime deadline) {
    const auto target = impl_->current();

    std::map<std::string, std::string> search{{"symbol", spec.symbol}};
    if (spec.sec_type == SecurityType::Stock) {
        search["secType"] = "STK";
    }
    const auto res = impl_->get(target, "/iserver/secdef/search", search, deadline);
    if (res.status >= 400 && res.status < 500 && res.status != 401) {
        throw QualificationError(describe("secdef search", res));
    }
    throw_for_status("secdef search", res);

    const auto hits = json::parse_secdef_search(res.body);
    const json::SearchHit* match = nullptr;
    for (const auto& hit : hits) {
        if (hit.symbol == spec.symbol) {
            match = &hit;
            break;
        }
    }
    if (match == nullptr) {
        throw QualificationError("no contract found for " + std::string(key.view()));
    }

    QualifiedContract contract;
    contract.key = key;
    contract.spec = spec;

    if (spec.sec_type == SecurityType::Stock) {
        if (!match->has_stock) {
            throw QualificationError(spec.symbol + " is not listed as a stock");
        }
        contract.con_id = match->con_id;
        return contract;
    }

    const auto month = month_code(spec.expiry);
    if (!match->has_option || match->option_months.find(month) == std::string::npos) {
        throw QualificationError("no option series " + month + " for " + spec.symbol);
    }

    const std::map<std::string, std::string> info_params{
        {"conid", std::to_string(match->con_id)},
        {"sectype", "OPT"},
        {"month", month},
        {"strike", format_number(spec.strike)},
        {"right", std::string(1, right_code(spec.right))}};
    const auto info_res = impl_->get(target, "/iserver/secdef/info", info_params, deadline);
    if (info_res.status >= 400 && info_res.status < 500 && info_res.status != 401) {
        throw QualificationError(describe("secdef info", info_res));
    }
    throw_for_status("secdef info", info_res);

    for (const auto& info : json::parse_secdef_info(info_res.body)) {
        if (info.maturity == spec.expiry && info.right == right_code(spec.right) &&
            std::fabs(info.strike - spec.strike) < 1e-6) {
            contract.con_id = info.con_id;
            return contract;
        }
    }
    throw QualificationError("no option contract matches " + std::string(key.view()));
}

Quote RestGatewayTransport::request_snapshot(const QualifiedContract& contract,
                                             const RequestContext& ctx) {
    const auto target = impl_->current();
    const std::map<std::string, std::string> params{
        {"conids", std::to_string(contract.con_id)},
        {"fields", "31,84,86,87"}};

    // First request for a contract primes the gateway and returns no fields
    for (int poll = 0; poll < SNAPSHOT_POLLS; ++poll) {
        const auto res = impl_->get(target, "/iserver/marketdata/snapshot", params,
                                    ctx.deadline, ctx.cancelled.get());
        throw_for_status("market snapshot", res);
        if (auto quote = json::parse_snapshot(res.body, contract.con_id)) {
            return *quote;
        }
        Impl::pause(ctx, SNAPSHOT_POLL_PAUSE);
    }
    throw InvalidResponseError("snapshot for " + std::string(contract.key.view()) +
                               " returned no price fields");
}

std::vector<Bar> RestGatewayTransport::request_historical(const QualifiedContract& contract,
                                                          const HistoricalWindow& window,
                                                          const RequestContext& ctx) {
    const auto target = impl_->current();
    const std::map<std::string, std::string> params{
        {"conid", std::to_string(contract.con_id)},
        {"period", format_period(window)},
        {"bar", format_bar_size(window.bar_size)},
        {"startTime", format_gateway_time(window.end)},
        {"outsideRth", "false"}};

    const auto res = impl_->get(target, "/iserver/marketdata/history", params,
                                ctx.deadline, ctx.cancelled.get());
    throw_for_status("historical data", res);

    std::vector<Bar> bars;
    for (const auto& bar : json::parse_history(res.body)) {
        if (bar.time >= window.start && bar.time < window.end) {
            bars.push_back(bar);
        }
    }
    return bars;
}

void RestGatewayTransport::close() noexcept {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->opened_ = false;
}

}  // namespace lifeline::gateway
