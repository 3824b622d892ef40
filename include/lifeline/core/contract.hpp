#pragma once
// ============================================================================
// LIFELINE - Contract Keys
// ============================================================================
// Parsing of caller-facing contract keys into gateway contract specs.
//   Stock:  "SPY"
//   Option: "SPY-20260206-C-450" (symbol, expiry YYYYMMDD, right, strike)
// ============================================================================

#include "lifeline/core/types.hpp"

#include <string>
#include <string_view>

namespace lifeline {

enum class SecurityType : uint8_t {
    Stock = 0,
    Option = 1
};

enum class OptionRight : uint8_t {
    Call = 0,
    Put = 1
};

struct ContractSpec {
    std::string symbol;
    SecurityType sec_type = SecurityType::Stock;
    std::string expiry;                 // YYYYMMDD, options only
    OptionRight right = OptionRight::Call;
    double strike = 0.0;
    std::string exchange = "SMART";
    std::string currency = "USD";

    /// Cache key in the gateway's own terms: symbol_secType_exchange_currency
    [[nodiscard]] std::string cache_key() const;
};

/// A contract confirmed by the gateway
struct QualifiedContract {
    ContractKey key;
    ConId con_id = 0;
    ContractSpec spec;
};

/// Parse a contract key. Throws QualificationError on malformed input.
[[nodiscard]] ContractSpec parse_contract_key(std::string_view key);

/// Inverse of parse_contract_key (strike printed without trailing zeros)
[[nodiscard]] std::string format_contract_key(const ContractSpec& spec);

[[nodiscard]] constexpr char right_code(OptionRight right) noexcept {
    return right == OptionRight::Call ? 'C' : 'P';
}

}  // namespace lifeline
