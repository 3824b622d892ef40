// ============================================================================
// LIFELINE - Gateway JSON Codec Implementation
// ============================================================================
// IMPORTANT: simdjson on-demand is FORWARD-ONLY. Objects are walked field by
// field so decoding does not depend on the order the gateway emits keys in.
// ============================================================================

#include "lifeline/gateway/json_codec.hpp"
#include "lifeline/core/errors.hpp"

#include <simdjson.h>

#include <charconv>
#include <cmath>

namespace lifeline::gateway::json {

namespace od = simdjson::ondemand;

namespace {

od::parser& thread_parser() {
    thread_local od::parser parser;
    return parser;
}

/// Numbers arrive as JSON numbers or as strings depending on the endpoint
std::optional<double> read_number(od::value value) {
    switch (value.type().value()) {
        case od::json_type::number:
            return value.get_double().value();
        case od::json_type::string:
            return parse_display_number(value.get_string().value());
        default:
            return std::nullopt;
    }
}

ConId read_con_id(od::value value) {
    const auto number = read_number(value);
    if (!number || *number <= 0) {
        throw InvalidResponseError("conid missing or not positive");
    }
    return static_cast<ConId>(std::llround(*number));
}

/// Listing endpoints may carry rows without a usable conid; those read as 0
ConId read_optional_con_id(od::value value) {
    const auto number = read_number(value);
    return number && *number > 0 ? static_cast<ConId>(std::llround(*number)) : 0;
}

std::string read_string(od::value value) {
    if (value.type().value() != od::json_type::string) {
        return {};
    }
    return std::string(value.get_string().value());
}

bool read_bool(od::value value) {
    return value.type().value() == od::json_type::boolean && value.get_bool().value();
}

template <typename Fn>
auto decode(std::string_view body, const char* what, Fn&& fn) {
    try {
        simdjson::padded_string padded(body);
        od::document doc = thread_parser().iterate(padded);
        return fn(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw InvalidResponseError(std::string(what) + ": " + e.what());
    }
}

}  // namespace

// ============================================================================
// Display Numbers
// ============================================================================

std::optional<double> parse_display_number(std::string_view text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != ',' && c != ' ') cleaned.push_back(c);
    }

    // Leading status markers: C = previous close, H = trading halted
    while (!cleaned.empty() && (cleaned.front() == 'C' || cleaned.front() == 'H')) {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return std::nullopt;

    double multiplier = 1.0;
    switch (cleaned.back()) {
        case 'K': multiplier = 1e3; cleaned.pop_back(); break;
        case 'M': multiplier = 1e6; cleaned.pop_back(); break;
        case 'B': multiplier = 1e9; cleaned.pop_back(); break;
        default: break;
    }

    double value = 0.0;
    const auto* first = cleaned.data();
    const auto* last = cleaned.data() + cleaned.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value * multiplier;
}

// ============================================================================
// Authentication
// ============================================================================

AuthStatus parse_auth_status(std::string_view body) {
    return decode(body, "auth status", [](od::document& doc) {
        AuthStatus status;
        od::object obj = doc.get_object();
        for (od::field field : obj) {
            const std::string_view key = field.unescaped_key().value();
            if (key == "authenticated") {
                status.authenticated = read_bool(field.value());
            } else if (key == "connected") {
                status.connected = read_bool(field.value());
            } else if (key == "competing") {
                status.competing = read_bool(field.value());
            } else if (key == "message") {
                status.message = read_string(field.value());
            } else if (key == "fail") {
                status.fail = read_string(field.value());
            }
        }
        return status;
    });
}

// ============================================================================
// Contract Definitions
// ============================================================================

std::vector<SearchHit> parse_secdef_search(std::string_view body) {
    return decode(body, "secdef search", [](od::document& doc) {
        std::vector<SearchHit> hits;
        od::array rows = doc.get_array();
        for (od::value row : rows) {
            SearchHit hit;
            bool has_sections = false;
            od::object obj = row.get_object();
            for (od::field field : obj) {
                const std::string_view key = field.unescaped_key().value();
                if (key == "conid") {
                    hit.con_id = read_optional_con_id(field.value());
                } else if (key == "symbol") {
                    hit.symbol = read_string(field.value());
                } else if (key == "sections") {
                    has_sections = true;
                    od::array sections = field.value().get_array();
                    for (od::value section : sections) {
                        std::string sec_type;
                        std::string months;
                        od::object sec = section.get_object();
                        for (od::field sf : sec) {
                            const std::string_view skey = sf.unescaped_key().value();
                            if (skey == "secType") {
                                sec_type = read_string(sf.value());
                            } else if (skey == "months") {
                                months = read_string(sf.value());
                            }
                        }
                        if (sec_type == "STK") {
                            hit.has_stock = true;
                        } else if (sec_type == "OPT") {
                            hit.has_option = true;
                            hit.option_months = months;
                        }
                    }
                }
            }
            // Rows without sections describe the stock itself
            if (!has_sections) hit.has_stock = true;
            if (hit.con_id > 0) hits.push_back(std::move(hit));
        }
        return hits;
    });
}

std::vector<ContractInfo> parse_secdef_info(std::string_view body) {
    return decode(body, "secdef info", [](od::document& doc) {
        std::vector<ContractInfo> infos;
        od::array rows = doc.get_array();
        for (od::value row : rows) {
            ContractInfo info;
            od::object obj = row.get_object();
            for (od::field field : obj) {
                const std::string_view key = field.unescaped_key().value();
                if (key == "conid") {
                    info.con_id = read_optional_con_id(field.value());
                } else if (key == "symbol") {
                    info.symbol = read_string(field.value());
                } else if (key == "maturityDate") {
                    info.maturity = read_string(field.value());
                } else if (key == "right") {
                    const auto right = read_string(field.value());
                    info.right = right.empty() ? '\0' : right.front();
                } else if (key == "strike") {
                    info.strike = read_number(field.value()).value_or(0.0);
                }
            }
            if (info.con_id > 0) infos.push_back(std::move(info));
        }
        return infos;
    });
}

// ============================================================================
// Market Data
// ============================================================================

std::optional<Quote> parse_snapshot(std::string_view body, ConId con_id) {
    return decode(body, "market snapshot", [con_id](od::document& doc) -> std::optional<Quote> {
        od::array rows = doc.get_array();
        for (od::value row : rows) {
            Quote quote;
            std::optional<double> volume;
            std::optional<double> volume_raw;
            od::object obj = row.get_object();
            for (od::field field : obj) {
                const std::string_view key = field.unescaped_key().value();
                if (key == "conid") {
                    quote.con_id = read_con_id(field.value());
                } else if (key == "31") {
                    quote.last = read_number(field.value());
                } else if (key == "84") {
                    quote.bid = read_number(field.value());
                } else if (key == "86") {
                    quote.ask = read_number(field.value());
                } else if (key == "87") {
                    volume = read_number(field.value());
                } else if (key == "87_raw") {
                    volume_raw = read_number(field.value());
                } else if (key == "_updated") {
                    if (const auto ms = read_number(field.value())) {
                        quote.timestamp = from_epoch_ms(static_cast<int64_t>(*ms));
                    }
                }
            }
            if (quote.con_id != con_id) continue;
            if (!quote.bid && !quote.ask && !quote.last) return std::nullopt;
            quote.volume = volume_raw.value_or(volume.value_or(0.0));
            return quote;
        }
        return std::nullopt;
    });
}

std::vector<Bar> parse_history(std::string_view body) {
    return decode(body, "historical data", [](od::document& doc) {
        std::vector<Bar> bars;
        od::object obj = doc.get_object();
        for (od::field field : obj) {
            if (field.unescaped_key().value() != "data") continue;

            od::array rows = field.value().get_array();
            for (od::value row : rows) {
                Bar bar;
                od::object bar_obj = row.get_object();
                for (od::field bf : bar_obj) {
                    const std::string_view key = bf.unescaped_key().value();
                    const double value = read_number(bf.value()).value_or(0.0);
                    if (key == "t") {
                        bar.time = from_epoch_ms(static_cast<int64_t>(value));
                    } else if (key == "o") {
                        bar.open = value;
                    } else if (key == "h") {
                        bar.high = value;
                    } else if (key == "l") {
                        bar.low = value;
                    } else if (key == "c") {
                        bar.close = value;
                    } else if (key == "v") {
                        bar.volume = value;
                    }
                }
                bars.push_back(bar);
            }
        }
        return bars;
    });
}

}  // namespace lifeline::gateway::json
