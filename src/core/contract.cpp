// ============================================================================
// LIFELINE - Contract Key Parsing
// ============================================================================

#include "lifeline/core/contract.hpp"
#include "lifeline/core/errors.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>

namespace lifeline {

namespace {

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (true) {
        const auto next = text.find(sep, pos);
        if (next == std::string_view::npos) {
            parts.push_back(text.substr(pos));
            break;
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

bool valid_symbol(std::string_view symbol) {
    if (symbol.empty() || symbol.size() > 12) return false;
    for (char c : symbol) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::isupper(uc) || std::isdigit(uc) || c == '.')) return false;
    }
    return true;
}

bool valid_expiry(std::string_view expiry) {
    if (expiry.size() != 8) return false;
    for (char c : expiry) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    const int month = (expiry[4] - '0') * 10 + (expiry[5] - '0');
    const int day = (expiry[6] - '0') * 10 + (expiry[7] - '0');
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

double parse_strike(std::string_view text, std::string_view key) {
    double strike = 0.0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, strike);
    if (ec != std::errc{} || ptr != last || !(strike > 0.0)) {
        throw QualificationError("invalid strike in contract key '" + std::string(key) + "'");
    }
    return strike;
}

}  // namespace

std::string ContractSpec::cache_key() const {
    std::ostringstream ss;
    ss << symbol << '_' << (sec_type == SecurityType::Stock ? "STK" : "OPT") << '_'
       << exchange << '_' << currency;
    if (sec_type == SecurityType::Option) {
        ss << '_' << expiry << '_' << right_code(right) << '_' << strike;
    }
    return ss.str();
}

ContractSpec parse_contract_key(std::string_view key) {
    if (key.size() > ContractKey::MAX_LENGTH) {
        throw QualificationError("contract key longer than " +
                                 std::to_string(ContractKey::MAX_LENGTH) + " characters");
    }
    const auto parts = split(key, '-');
    ContractSpec spec;

    if (parts.size() == 1) {
        if (!valid_symbol(parts[0])) {
            throw QualificationError("invalid symbol in contract key '" + std::string(key) + "'");
        }
        spec.symbol = std::string(parts[0]);
        spec.sec_type = SecurityType::Stock;
        return spec;
    }

    if (parts.size() != 4) {
        throw QualificationError("malformed contract key '" + std::string(key) + "'");
    }
    if (!valid_symbol(parts[0])) {
        throw QualificationError("invalid symbol in contract key '" + std::string(key) + "'");
    }
    if (!valid_expiry(parts[1])) {
        throw QualificationError("invalid expiry in contract key '" + std::string(key) + "'");
    }
    if (parts[2] != "C" && parts[2] != "P") {
        throw QualificationError("invalid right in contract key '" + std::string(key) + "'");
    }

    spec.symbol = std::string(parts[0]);
    spec.sec_type = SecurityType::Option;
    spec.expiry = std::string(parts[1]);
    spec.right = parts[2] == "C" ? OptionRight::Call : OptionRight::Put;
    spec.strike = parse_strike(parts[3], key);
    return spec;
}

std::string format_contract_key(const ContractSpec& spec) {
    if (spec.sec_type == SecurityType::Stock) {
        return spec.symbol;
    }
    std::ostringstream ss;
    ss << spec.symbol << '-' << spec.expiry << '-' << right_code(spec.right) << '-' << spec.strike;
    return ss.str();
}

}  // namespace lifeline
