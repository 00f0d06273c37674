#pragma once

#include <string>

#include "core/json_utils.h"
#include "core/types.h"

namespace feedback_engine {

/**
 * @brief 决策持久化记录（外部契约）
 *
 * 字段：asset_pair, timestamp, action, confidence, position_type,
 * recommended_position_size, entry_price, stop_loss_percentage,
 * risk_percentage, signal_only, aggregation_tier, risk_verdict_reason。
 * signal-only 或 HOLD 决策的仓位字段写为 null，不写 0。
 */
JsonValue DecisionToRecord(const Decision& decision);

/// 缓存单元编解码。
JsonValue DraftToJson(const DecisionDraft& draft);
bool DraftFromJson(const JsonValue& value, DecisionDraft* out_draft,
                   std::string* out_error);

/// 交易结果编解码（PortfolioMemory 持久化）。
JsonValue OutcomeToJson(const TradeOutcome& outcome);
bool OutcomeFromJson(const JsonValue& value, TradeOutcome* out_outcome,
                     std::string* out_error);

bool ParseAction(const std::string& text, Action* out_action);
bool ParseMarketRegime(const std::string& text, MarketRegime* out_regime);
bool ParsePositionType(const std::string& text, PositionType* out_type);

}  // namespace feedback_engine
