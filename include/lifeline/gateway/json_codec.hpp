#pragma once
// ============================================================================
// LIFELINE - Gateway JSON Codec
// ============================================================================
// Decoding of gateway REST responses (simdjson on-demand).
// Every function throws InvalidResponseError on malformed input.
// ============================================================================

#include "lifeline/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lifeline::gateway::json {

/// GET /iserver/auth/status
struct AuthStatus {
    bool authenticated = false;
    bool connected = false;
    bool competing = false;
    std::string message;
    std::string fail;
};

/// One row of GET /iserver/secdef/search
struct SearchHit {
    ConId con_id = 0;
    std::string symbol;
    bool has_stock = false;
    bool has_option = false;
    std::string option_months;  // "FEB26;MAR26;..."
};

/// One row of GET /iserver/secdef/info
struct ContractInfo {
    ConId con_id = 0;
    std::string symbol;
    std::string maturity;  // YYYYMMDD
    char right = '\0';
    double strike = 0.0;
};

[[nodiscard]] AuthStatus parse_auth_status(std::string_view body);

[[nodiscard]] std::vector<SearchHit> parse_secdef_search(std::string_view body);

[[nodiscard]] std::vector<ContractInfo> parse_secdef_info(std::string_view body);

/// Snapshot row for con_id. nullopt while the gateway has not populated any
/// price field yet (first call for a contract returns only the conid).
[[nodiscard]] std::optional<Quote> parse_snapshot(std::string_view body, ConId con_id);

[[nodiscard]] std::vector<Bar> parse_history(std::string_view body);

/// Gateway display numbers: "450.25", "C450.25" (closing), "1,234", "1.2M"
[[nodiscard]] std::optional<double> parse_display_number(std::string_view text);

}  // namespace lifeline::gateway::json
