#include "ensemble/weight_optimizer.h"

#include <algorithm>
#include <cmath>

#include <boost/random/beta_distribution.hpp>

#include "core/json_utils.h"
#include "core/log.h"
#include "storage/journal_store.h"

namespace feedback_engine {

namespace {

constexpr std::array<MarketRegime, 3> kRegimes = {
    MarketRegime::kTrending, MarketRegime::kRanging, MarketRegime::kVolatile};

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

WeightOptimizer::WeightOptimizer(std::vector<std::string> provider_ids,
                                 WeightOptimizerConfig config)
    : config_(std::move(config)),
      provider_ids_(std::move(provider_ids)),
      rng_(config_.seed) {
  for (const auto& id : provider_ids_) {
    slots_.emplace(id, std::make_unique<Slot>());
  }
}

std::size_t WeightOptimizer::RegimeIndex(MarketRegime regime) {
  switch (regime) {
    case MarketRegime::kTrending:
      return 0;
    case MarketRegime::kRanging:
      return 1;
    case MarketRegime::kVolatile:
      return 2;
  }
  return 1;
}

bool WeightOptimizer::Initialize(std::string* out_error) {
  if (config_.state_path.empty()) {
    return true;
  }
  std::string load_error;
  if (LoadFromFile(&load_error)) {
    return true;
  }
  if (!config_.allow_fresh_start) {
    return Fail("权重状态加载失败: " + load_error, out_error);
  }
  LogWarn("权重状态损坏，按配置从先验重新开始: " + load_error);
  ResetAll();
  return true;
}

bool WeightOptimizer::UpdateWeightsFromOutcome(const std::string& provider_id,
                                               bool won,
                                               MarketRegime regime,
                                               std::string* out_error) {
  const auto it = slots_.find(provider_id);
  if (it == slots_.end()) {
    return Fail("未知 provider: " + provider_id, out_error);
  }
  {
    Slot& slot = *it->second;
    std::lock_guard<std::mutex> lock(slot.mutex);
    ProviderWeightState& state = slot.state;
    double& multiplier = state.regime_multipliers[RegimeIndex(regime)];
    if (won) {
      state.alpha += 1.0;
      ++state.wins;
      multiplier *= config_.win_multiplier;
    } else {
      state.beta += 1.0;
      ++state.losses;
      multiplier *= config_.loss_multiplier;
    }
    multiplier =
        std::clamp(multiplier, config_.multiplier_min, config_.multiplier_max);
  }
  if (config_.state_path.empty() || !persistence_enabled_) {
    return true;
  }
  return Save(out_error);
}

std::map<std::string, double> WeightOptimizer::SampleWeights(MarketRegime regime) {
  std::map<std::string, double> weights;
  if (provider_ids_.empty()) {
    return weights;
  }
  if (provider_ids_.size() == 1) {
    weights[provider_ids_.front()] = 1.0;
    return weights;
  }

  const std::size_t regime_index = RegimeIndex(regime);
  double total = 0.0;
  {
    // 按优先级顺序采样，保证同种子下抽样序列一致。
    std::lock_guard<std::mutex> rng_lock(rng_mutex_);
    for (const auto& id : provider_ids_) {
      ProviderWeightState state;
      {
        std::lock_guard<std::mutex> lock(slots_.at(id)->mutex);
        state = slots_.at(id)->state;
      }
      boost::random::beta_distribution<double> distribution(state.alpha,
                                                            state.beta);
      const double sample =
          distribution(rng_) * state.regime_multipliers[regime_index];
      weights[id] = std::isfinite(sample) ? std::max(0.0, sample) : 0.0;
      total += weights[id];
    }
  }

  if (total <= 0.0) {
    const double equal = 1.0 / static_cast<double>(provider_ids_.size());
    for (auto& [id, weight] : weights) {
      weight = equal;
    }
    return weights;
  }
  for (auto& [id, weight] : weights) {
    weight /= total;
  }
  return weights;
}

std::map<std::string, double> WeightOptimizer::ExpectedWeights() const {
  std::map<std::string, double> out;
  for (const auto& [id, slot] : slots_) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    out[id] = slot->state.alpha / (slot->state.alpha + slot->state.beta);
  }
  return out;
}

std::map<std::string, double> WeightOptimizer::WinRates() const {
  std::map<std::string, double> out;
  for (const auto& [id, slot] : slots_) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    const int total = slot->state.wins + slot->state.losses;
    out[id] = total > 0 ? (slot->state.alpha - 1.0) / static_cast<double>(total)
                        : 0.5;
  }
  return out;
}

WeightOptimizerState WeightOptimizer::ExportState() const {
  WeightOptimizerState out;
  for (const auto& [id, slot] : slots_) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    out.providers[id] = slot->state;
  }
  return out;
}

bool WeightOptimizer::ValidateState(const ProviderWeightState& state,
                                    std::string* out_error) const {
  if (!std::isfinite(state.alpha) || !std::isfinite(state.beta) ||
      state.alpha < 1.0 || state.beta < 1.0) {
    return Fail("Beta 参数非法（须 >= 1）", out_error);
  }
  if (state.wins < 0 || state.losses < 0) {
    return Fail("胜负计数不能为负数", out_error);
  }
  for (const double multiplier : state.regime_multipliers) {
    if (!std::isfinite(multiplier) || multiplier < config_.multiplier_min ||
        multiplier > config_.multiplier_max) {
      return Fail("regime 乘子越界", out_error);
    }
  }
  return true;
}

bool WeightOptimizer::RestoreState(const WeightOptimizerState& state,
                                   std::string* out_error) {
  for (const auto& [id, provider_state] : state.providers) {
    if (slots_.find(id) == slots_.end()) {
      continue;
    }
    if (!ValidateState(provider_state, out_error)) {
      return false;
    }
  }
  for (auto& [id, slot] : slots_) {
    const auto it = state.providers.find(id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->state = it != state.providers.end() ? it->second : ProviderWeightState{};
  }
  return true;
}

void WeightOptimizer::ResetProvider(const std::string& provider_id) {
  const auto it = slots_.find(provider_id);
  if (it == slots_.end()) {
    return;
  }
  std::lock_guard<std::mutex> lock(it->second->mutex);
  it->second->state = ProviderWeightState{};
}

void WeightOptimizer::ResetAll() {
  for (auto& [id, slot] : slots_) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->state = ProviderWeightState{};
  }
}

void WeightOptimizer::Reseed(std::uint64_t seed) {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  rng_.seed(seed);
}

bool WeightOptimizer::Save(std::string* out_error) const {
  if (config_.state_path.empty()) {
    return Fail("未配置 weights.state_path", out_error);
  }
  // 导出与写盘在同一把锁内：后拿到锁的写者导出的一定是更新的状态。
  std::lock_guard<std::mutex> lock(save_mutex_);
  const WeightOptimizerState state = ExportState();
  JsonValue root = MakeJsonObject();
  JsonValue providers = MakeJsonArray();
  JsonValue stats = MakeJsonObject();
  JsonValue multipliers = MakeJsonObject();
  for (const auto& id : provider_ids_) {
    providers.array_value.push_back(MakeJsonString(id));
    const ProviderWeightState& provider_state = state.providers.at(id);
    JsonValue entry = MakeJsonObject();
    entry.object_value["alpha"] = MakeJsonNumber(provider_state.alpha);
    entry.object_value["beta"] = MakeJsonNumber(provider_state.beta);
    entry.object_value["wins"] = MakeJsonNumber(provider_state.wins);
    entry.object_value["losses"] = MakeJsonNumber(provider_state.losses);
    stats.object_value[id] = std::move(entry);
    JsonValue by_regime = MakeJsonObject();
    for (const auto regime : kRegimes) {
      by_regime.object_value[ToString(regime)] = MakeJsonNumber(
          provider_state.regime_multipliers[RegimeIndex(regime)]);
    }
    multipliers.object_value[id] = std::move(by_regime);
  }
  root.object_value["providers"] = std::move(providers);
  root.object_value["provider_stats"] = std::move(stats);
  root.object_value["regime_multipliers"] = std::move(multipliers);

  std::string write_error;
  if (!WriteFileAtomically(config_.state_path, SerializeJson(root),
                           &write_error)) {
    LogError("权重状态写盘失败: " + write_error);
    return Fail(write_error, out_error);
  }
  return true;
}

bool WeightOptimizer::LoadFromFile(std::string* out_error) {
  std::string content;
  bool exists = false;
  if (!ReadWholeFile(config_.state_path, &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    return true;
  }
  JsonValue root;
  if (!ParseJson(content, &root, out_error)) {
    return false;
  }
  const JsonValue* stats = JsonObjectField(&root, "provider_stats");
  if (stats == nullptr || stats->type != JsonType::kObject) {
    return Fail("缺少 provider_stats", out_error);
  }
  const JsonValue* multipliers = JsonObjectField(&root, "regime_multipliers");

  WeightOptimizerState state;
  for (const auto& [id, entry] : stats->object_value) {
    if (slots_.find(id) == slots_.end()) {
      LogWarn("权重状态中存在未配置的 provider，已忽略: " + id);
      continue;
    }
    const auto alpha = JsonAsNumber(JsonObjectField(&entry, "alpha"));
    const auto beta = JsonAsNumber(JsonObjectField(&entry, "beta"));
    if (!alpha.has_value() || !beta.has_value()) {
      return Fail("provider_stats." + id + " 缺少 alpha/beta", out_error);
    }
    ProviderWeightState provider_state;
    provider_state.alpha = *alpha;
    provider_state.beta = *beta;
    provider_state.wins = static_cast<int>(
        JsonAsNumber(JsonObjectField(&entry, "wins")).value_or(*alpha - 1.0));
    provider_state.losses = static_cast<int>(
        JsonAsNumber(JsonObjectField(&entry, "losses")).value_or(*beta - 1.0));
    const JsonValue* by_regime = JsonObjectField(multipliers, id);
    for (const auto regime : kRegimes) {
      if (const auto value =
              JsonAsNumber(JsonObjectField(by_regime, ToString(regime)))) {
        provider_state.regime_multipliers[RegimeIndex(regime)] = *value;
      }
    }
    std::string invalid;
    if (!ValidateState(provider_state, &invalid)) {
      return Fail("provider_stats." + id + ": " + invalid, out_error);
    }
    state.providers[id] = provider_state;
  }
  return RestoreState(state, out_error);
}

}  // namespace feedback_engine
