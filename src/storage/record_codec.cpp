#include "storage/record_codec.h"

#include <cmath>

namespace feedback_engine {

namespace {

JsonValue OptionalNumber(const std::optional<double>& value) {
  return value.has_value() ? MakeJsonNumber(*value) : MakeJsonNull();
}

JsonValue VoteToJson(const ProviderVote& vote) {
  JsonValue out = MakeJsonObject();
  out.object_value["provider_id"] = MakeJsonString(vote.provider_id);
  out.object_value["action"] = MakeJsonString(ToString(vote.action));
  out.object_value["confidence"] = MakeJsonNumber(vote.confidence);
  out.object_value["rationale"] = MakeJsonString(vote.rationale);
  out.object_value["latency_ms"] = MakeJsonNumber(vote.latency_ms);
  out.object_value["suggested_size"] = OptionalNumber(vote.suggested_size);
  return out;
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

bool RequireNumber(const JsonValue& object, const char* key, double* out,
                   std::string* out_error) {
  const auto value = JsonAsNumber(JsonObjectField(&object, key));
  if (!value.has_value()) {
    return Fail(std::string("缺少数值字段: ") + key, out_error);
  }
  *out = *value;
  return true;
}

bool RequireString(const JsonValue& object, const char* key, std::string* out,
                   std::string* out_error) {
  const auto value = JsonAsString(JsonObjectField(&object, key));
  if (!value.has_value()) {
    return Fail(std::string("缺少字符串字段: ") + key, out_error);
  }
  *out = *value;
  return true;
}

bool VoteFromJson(const JsonValue& value, ProviderVote* out_vote,
                  std::string* out_error) {
  std::string action;
  if (!RequireString(value, "provider_id", &out_vote->provider_id, out_error) ||
      !RequireString(value, "action", &action, out_error) ||
      !RequireNumber(value, "confidence", &out_vote->confidence, out_error)) {
    return false;
  }
  if (!ParseAction(action, &out_vote->action)) {
    return Fail("未知动作: " + action, out_error);
  }
  out_vote->rationale =
      JsonAsString(JsonObjectField(&value, "rationale")).value_or("");
  out_vote->latency_ms =
      JsonAsNumber(JsonObjectField(&value, "latency_ms")).value_or(0.0);
  out_vote->suggested_size =
      JsonAsNumber(JsonObjectField(&value, "suggested_size"));
  return true;
}

}  // namespace

bool ParseAction(const std::string& text, Action* out_action) {
  if (text == "BUY") {
    *out_action = Action::kBuy;
  } else if (text == "SELL") {
    *out_action = Action::kSell;
  } else if (text == "HOLD") {
    *out_action = Action::kHold;
  } else {
    return false;
  }
  return true;
}

bool ParseMarketRegime(const std::string& text, MarketRegime* out_regime) {
  if (text == "trending") {
    *out_regime = MarketRegime::kTrending;
  } else if (text == "ranging") {
    *out_regime = MarketRegime::kRanging;
  } else if (text == "volatile") {
    *out_regime = MarketRegime::kVolatile;
  } else {
    return false;
  }
  return true;
}

bool ParsePositionType(const std::string& text, PositionType* out_type) {
  if (text == "LONG") {
    *out_type = PositionType::kLong;
  } else if (text == "SHORT") {
    *out_type = PositionType::kShort;
  } else if (text == "NONE") {
    *out_type = PositionType::kNone;
  } else {
    return false;
  }
  return true;
}

JsonValue DecisionToRecord(const Decision& decision) {
  JsonValue out = MakeJsonObject();
  auto& fields = out.object_value;
  fields["decision_id"] = MakeJsonString(decision.id);
  fields["asset_pair"] = MakeJsonString(decision.asset_pair);
  fields["timestamp"] = MakeJsonNumber(static_cast<double>(decision.timestamp));
  fields["action"] = MakeJsonString(ToString(decision.action));
  fields["confidence"] = MakeJsonNumber(decision.confidence);
  fields["position_type"] = decision.position_type == PositionType::kNone
                                ? MakeJsonNull()
                                : MakeJsonString(ToString(decision.position_type));
  if (decision.sizing.has_value()) {
    const PositionSizing& sizing = *decision.sizing;
    fields["recommended_position_size"] =
        MakeJsonNumber(sizing.recommended_position_size);
    fields["entry_price"] = MakeJsonNumber(sizing.entry_price);
    fields["stop_loss_percentage"] = MakeJsonNumber(sizing.stop_loss_pct);
    fields["risk_percentage"] = MakeJsonNumber(sizing.risk_pct);
  } else {
    fields["recommended_position_size"] = MakeJsonNull();
    fields["entry_price"] = MakeJsonNull();
    fields["stop_loss_percentage"] = MakeJsonNull();
    fields["risk_percentage"] = MakeJsonNull();
  }
  fields["signal_only"] = MakeJsonBool(decision.signal_only);
  fields["aggregation_tier"] = decision.tier == AggregationTier::kNone
                                   ? MakeJsonNull()
                                   : MakeJsonNumber(TierNumber(decision.tier));
  fields["risk_verdict_reason"] = decision.verdict.has_value()
                                      ? MakeJsonString(decision.verdict->reason)
                                      : MakeJsonNull();
  fields["risk_allowed"] = decision.verdict.has_value()
                               ? MakeJsonBool(decision.verdict->allow)
                               : MakeJsonNull();
  return out;
}

JsonValue DraftToJson(const DecisionDraft& draft) {
  JsonValue out = MakeJsonObject();
  auto& fields = out.object_value;
  fields["asset_pair"] = MakeJsonString(draft.asset_pair);
  fields["timestamp"] = MakeJsonNumber(static_cast<double>(draft.timestamp));
  fields["action"] = MakeJsonString(ToString(draft.action));
  fields["confidence"] = MakeJsonNumber(draft.confidence);
  fields["tier"] = MakeJsonNumber(TierNumber(draft.tier));
  fields["strategy_used"] = MakeJsonString(draft.strategy_used);
  fields["agreement_score"] = MakeJsonNumber(draft.agreement_score);
  fields["suggested_size"] = OptionalNumber(draft.suggested_size);
  fields["regime"] = MakeJsonString(ToString(draft.regime));
  JsonValue votes = MakeJsonArray();
  for (const auto& vote : draft.contributing_votes) {
    votes.array_value.push_back(VoteToJson(vote));
  }
  fields["votes"] = std::move(votes);
  JsonValue failed = MakeJsonArray();
  for (const auto& provider : draft.failed_providers) {
    failed.array_value.push_back(MakeJsonString(provider));
  }
  fields["failed_providers"] = std::move(failed);
  JsonValue weights = MakeJsonObject();
  for (const auto& [provider, weight] : draft.applied_weights) {
    weights.object_value[provider] = MakeJsonNumber(weight);
  }
  fields["applied_weights"] = std::move(weights);
  return out;
}

bool DraftFromJson(const JsonValue& value, DecisionDraft* out_draft,
                   std::string* out_error) {
  if (out_draft == nullptr || value.type != JsonType::kObject) {
    return Fail("决策草稿记录格式非法", out_error);
  }
  DecisionDraft draft;
  double timestamp = 0.0;
  double tier = 0.0;
  std::string action;
  std::string regime;
  if (!RequireString(value, "asset_pair", &draft.asset_pair, out_error) ||
      !RequireNumber(value, "timestamp", &timestamp, out_error) ||
      !RequireString(value, "action", &action, out_error) ||
      !RequireNumber(value, "confidence", &draft.confidence, out_error) ||
      !RequireNumber(value, "tier", &tier, out_error) ||
      !RequireString(value, "regime", &regime, out_error)) {
    return false;
  }
  if (!ParseAction(action, &draft.action) ||
      !ParseMarketRegime(regime, &draft.regime)) {
    return Fail("决策草稿动作或 regime 非法", out_error);
  }
  if (tier < 1.0 || tier > 4.0) {
    return Fail("决策草稿 tier 越界", out_error);
  }
  draft.timestamp = static_cast<std::int64_t>(timestamp);
  draft.tier = static_cast<AggregationTier>(static_cast<int>(tier));
  draft.strategy_used =
      JsonAsString(JsonObjectField(&value, "strategy_used")).value_or("");
  draft.agreement_score =
      JsonAsNumber(JsonObjectField(&value, "agreement_score")).value_or(0.0);
  draft.suggested_size = JsonAsNumber(JsonObjectField(&value, "suggested_size"));

  const JsonValue* votes = JsonObjectField(&value, "votes");
  if (votes != nullptr && votes->type == JsonType::kArray) {
    for (const auto& item : votes->array_value) {
      ProviderVote vote;
      if (!VoteFromJson(item, &vote, out_error)) {
        return false;
      }
      draft.contributing_votes.push_back(std::move(vote));
    }
  }
  const JsonValue* failed = JsonObjectField(&value, "failed_providers");
  if (failed != nullptr && failed->type == JsonType::kArray) {
    for (const auto& item : failed->array_value) {
      if (const auto id = JsonAsString(&item)) {
        draft.failed_providers.push_back(*id);
      }
    }
  }
  const JsonValue* weights = JsonObjectField(&value, "applied_weights");
  if (weights != nullptr && weights->type == JsonType::kObject) {
    for (const auto& [provider, weight] : weights->object_value) {
      if (const auto number = JsonAsNumber(&weight)) {
        draft.applied_weights[provider] = *number;
      }
    }
  }
  *out_draft = std::move(draft);
  return true;
}

JsonValue OutcomeToJson(const TradeOutcome& outcome) {
  JsonValue out = MakeJsonObject();
  auto& fields = out.object_value;
  fields["trade_id"] = MakeJsonString(outcome.trade_id);
  fields["decision_id"] = MakeJsonString(outcome.decision_id);
  fields["asset_pair"] = MakeJsonString(outcome.asset_pair);
  fields["position_type"] = MakeJsonString(ToString(outcome.position_type));
  fields["entry_timestamp"] =
      MakeJsonNumber(static_cast<double>(outcome.entry_timestamp));
  fields["exit_timestamp"] =
      MakeJsonNumber(static_cast<double>(outcome.exit_timestamp));
  fields["entry_price"] = MakeJsonNumber(outcome.entry_price);
  fields["exit_price"] = MakeJsonNumber(outcome.exit_price);
  fields["size"] = MakeJsonNumber(outcome.size);
  fields["fees"] = MakeJsonNumber(outcome.fees);
  fields["realized_pnl"] = MakeJsonNumber(outcome.realized_pnl);
  fields["pnl_pct"] = MakeJsonNumber(outcome.pnl_pct);
  fields["holding_hours"] = MakeJsonNumber(outcome.holding_hours);
  fields["confidence"] = MakeJsonNumber(outcome.confidence);
  fields["regime"] = MakeJsonString(ToString(outcome.regime));
  fields["was_profitable"] = MakeJsonBool(outcome.was_profitable);
  JsonValue providers = MakeJsonArray();
  for (const auto& provider : outcome.contributing_providers) {
    providers.array_value.push_back(MakeJsonString(provider));
  }
  fields["contributing_providers"] = std::move(providers);
  return out;
}

bool OutcomeFromJson(const JsonValue& value, TradeOutcome* out_outcome,
                     std::string* out_error) {
  if (out_outcome == nullptr || value.type != JsonType::kObject) {
    return Fail("交易结果记录格式非法", out_error);
  }
  TradeOutcome outcome;
  std::string position_type;
  std::string regime;
  double entry_ts = 0.0;
  double exit_ts = 0.0;
  if (!RequireString(value, "trade_id", &outcome.trade_id, out_error) ||
      !RequireString(value, "asset_pair", &outcome.asset_pair, out_error) ||
      !RequireString(value, "position_type", &position_type, out_error) ||
      !RequireNumber(value, "entry_timestamp", &entry_ts, out_error) ||
      !RequireNumber(value, "exit_timestamp", &exit_ts, out_error) ||
      !RequireNumber(value, "entry_price", &outcome.entry_price, out_error) ||
      !RequireNumber(value, "exit_price", &outcome.exit_price, out_error) ||
      !RequireNumber(value, "size", &outcome.size, out_error) ||
      !RequireNumber(value, "realized_pnl", &outcome.realized_pnl, out_error) ||
      !RequireString(value, "regime", &regime, out_error)) {
    return false;
  }
  if (!ParsePositionType(position_type, &outcome.position_type) ||
      !ParseMarketRegime(regime, &outcome.regime)) {
    return Fail("交易结果方向或 regime 非法", out_error);
  }
  if (!std::isfinite(outcome.realized_pnl) || outcome.size < 0.0) {
    return Fail("交易结果数值非法: " + outcome.trade_id, out_error);
  }
  outcome.entry_timestamp = static_cast<std::int64_t>(entry_ts);
  outcome.exit_timestamp = static_cast<std::int64_t>(exit_ts);
  outcome.decision_id =
      JsonAsString(JsonObjectField(&value, "decision_id")).value_or("");
  outcome.fees = JsonAsNumber(JsonObjectField(&value, "fees")).value_or(0.0);
  outcome.pnl_pct = JsonAsNumber(JsonObjectField(&value, "pnl_pct")).value_or(0.0);
  outcome.holding_hours =
      JsonAsNumber(JsonObjectField(&value, "holding_hours")).value_or(0.0);
  outcome.confidence =
      JsonAsNumber(JsonObjectField(&value, "confidence")).value_or(0.0);
  outcome.was_profitable = JsonAsBool(JsonObjectField(&value, "was_profitable"))
                               .value_or(outcome.realized_pnl > 0.0);
  const JsonValue* providers = JsonObjectField(&value, "contributing_providers");
  if (providers != nullptr && providers->type == JsonType::kArray) {
    for (const auto& item : providers->array_value) {
      if (const auto id = JsonAsString(&item)) {
        outcome.contributing_providers.push_back(*id);
      }
    }
  }
  *out_outcome = std::move(outcome);
  return true;
}

}  // namespace feedback_engine
