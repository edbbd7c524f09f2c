#pragma once

#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace stocktrade {

void to_json(nlohmann::json& j, const Position& pos);
void from_json(const nlohmann::json& j, Position& pos);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const EquityPoint& point);
void from_json(const nlohmann::json& j, EquityPoint& point);

void to_json(nlohmann::json& j, const PortfolioState& state);
void from_json(const nlohmann::json& j, PortfolioState& state);

} // namespace stocktrade
