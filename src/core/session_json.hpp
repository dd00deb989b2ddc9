#pragma once

#include <nlohmann/json.hpp>
#include "session_types.hpp"

namespace tradeflow {

// nlohmann ADL hooks. Decimals are written as strings, timestamps as ISO-8601 with milliseconds.
void to_json(nlohmann::json& j, const RiskConfig& r);
void from_json(const nlohmann::json& j, RiskConfig& r);
void to_json(nlohmann::json& j, const SessionConfig& c);
void from_json(const nlohmann::json& j, SessionConfig& c);
void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);
void to_json(nlohmann::json& j, const ClosedTrade& t);
void from_json(const nlohmann::json& j, ClosedTrade& t);
void to_json(nlohmann::json& j, const EquityPoint& e);
void from_json(const nlohmann::json& j, EquityPoint& e);
void to_json(nlohmann::json& j, const BacktestReport& r);
void from_json(const nlohmann::json& j, BacktestReport& r);
void to_json(nlohmann::json& j, const SessionEvent& e);

/**
 * Durable session record: {id, config, status, current_capital, open_positions,
 * closed_trades, equity_curve, ...}. Round-trips through snapshot_from_record.
 */
nlohmann::json snapshot_to_record(const SessionSnapshot& s);
SessionSnapshot snapshot_from_record(const nlohmann::json& j);

// Lightweight view for listings: no trade log or equity curve.
nlohmann::json snapshot_summary(const SessionSnapshot& s);

// Parse a create request body on top of the given defaults. Throws ValidationError on malformed fields.
SessionConfig session_config_from_request(const nlohmann::json& body, SessionConfig defaults);

} // namespace tradeflow
