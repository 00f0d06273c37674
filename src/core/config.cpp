#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>
#include <unordered_map>

namespace feedback_engine {

namespace {

std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 引号内的 `#` 不视为注释。
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if ((ch == '\'' || ch == '"') && (quote == '\0' || quote == ch)) {
      quote = quote == '\0' ? ch : '\0';
      continue;
    }
    if (ch == '#' && quote == '\0') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() >= 2 &&
      ((text.front() == '\'' && text.back() == '\'') ||
       (text.front() == '"' && text.back() == '"'))) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::string ToLowerCopy(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool ParseDouble(const std::string& text, double* out_value) {
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (iss.fail() || !iss.eof() || !std::isfinite(value)) {
    return false;
  }
  *out_value = value;
  return true;
}

bool ParseInt(const std::string& text, int* out_value) {
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (iss.fail() || !iss.eof()) {
    return false;
  }
  *out_value = value;
  return true;
}

bool ParseUint64(const std::string& text, std::uint64_t* out_value) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  std::istringstream iss(text);
  std::uint64_t value = 0;
  iss >> value;
  if (iss.fail() || !iss.eof()) {
    return false;
  }
  *out_value = value;
  return true;
}

bool ParseBool(const std::string& text, bool* out_value) {
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseStringList(const std::string& text,
                     std::vector<std::string>* out_items) {
  const std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  out_items->clear();
  std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
  std::string token;
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      out_items->push_back(item);
    }
  }
  return true;
}

using Setter = std::function<bool(const std::string&)>;

Setter DoubleSetter(double* target) {
  return [target](const std::string& value) { return ParseDouble(value, target); };
}

Setter IntSetter(int* target) {
  return [target](const std::string& value) { return ParseInt(value, target); };
}

Setter BoolSetter(bool* target) {
  return [target](const std::string& value) { return ParseBool(value, target); };
}

Setter StringSetter(std::string* target) {
  return [target](const std::string& value) {
    *target = value;
    return true;
  };
}

/// 键路径（section.key 或 section.subsection.key）到字段写入器的映射。
std::unordered_map<std::string, Setter> BuildSetters(EngineConfig* config) {
  std::unordered_map<std::string, Setter> setters;
  EnsembleConfig& ensemble = config->ensemble;
  setters["ensemble.providers"] = [&ensemble](const std::string& value) {
    return ParseStringList(value, &ensemble.providers);
  };
  setters["ensemble.voting_strategy"] = [&ensemble](const std::string& value) {
    return ParseVotingStrategy(value, &ensemble.voting_strategy);
  };
  setters["ensemble.min_providers_required"] =
      IntSetter(&ensemble.min_providers_required);
  setters["ensemble.adaptive_weights"] = BoolSetter(&ensemble.adaptive_weights);
  setters["ensemble.tier3_confidence_factor"] =
      DoubleSetter(&ensemble.tier3_confidence_factor);
  setters["ensemble.tier4_confidence_factor"] =
      DoubleSetter(&ensemble.tier4_confidence_factor);

  WeightOptimizerConfig& weights = config->weights;
  setters["weights.seed"] = [&weights](const std::string& value) {
    return ParseUint64(value, &weights.seed);
  };
  setters["weights.state_path"] = StringSetter(&weights.state_path);
  setters["weights.allow_fresh_start"] = BoolSetter(&weights.allow_fresh_start);
  setters["weights.multiplier_min"] = DoubleSetter(&weights.multiplier_min);
  setters["weights.multiplier_max"] = DoubleSetter(&weights.multiplier_max);
  setters["weights.win_multiplier"] = DoubleSetter(&weights.win_multiplier);
  setters["weights.loss_multiplier"] = DoubleSetter(&weights.loss_multiplier);

  setters["provider_pool.timeout_ms"] = IntSetter(&config->provider_pool.timeout_ms);
  setters["provider_pool.max_threads"] =
      IntSetter(&config->provider_pool.max_threads);

  RiskConfig& risk = config->risk;
  setters["risk.max_drawdown"] = DoubleSetter(&risk.max_drawdown);
  setters["risk.correlation_threshold"] = DoubleSetter(&risk.correlation_threshold);
  setters["risk.max_correlation_reduction"] =
      DoubleSetter(&risk.max_correlation_reduction);
  setters["risk.max_var_pct"] = DoubleSetter(&risk.max_var_pct);
  setters["risk.var_confidence"] = DoubleSetter(&risk.var_confidence);
  setters["risk.min_var_samples"] = IntSetter(&risk.min_var_samples);
  setters["risk.volatility_threshold"] = DoubleSetter(&risk.volatility_threshold);
  setters["risk.min_confidence_in_volatile"] =
      DoubleSetter(&risk.min_confidence_in_volatile);
  setters["risk.max_total_exposure_pct"] =
      DoubleSetter(&risk.max_total_exposure_pct);
  setters["risk.reservation_ttl_s"] = IntSetter(&risk.reservation_ttl_s);
  setters["risk.freshness.intraday_max_age_s"] =
      IntSetter(&config->freshness.intraday_max_age_s);
  setters["risk.freshness.daily_max_age_s"] =
      IntSetter(&config->freshness.daily_max_age_s);

  SizingConfig& sizing = config->sizing;
  setters["sizing.risk_pct"] = DoubleSetter(&sizing.risk_pct);
  setters["sizing.stop_loss_pct"] = DoubleSetter(&sizing.stop_loss_pct);
  setters["sizing.use_dynamic_stop_loss"] =
      BoolSetter(&sizing.use_dynamic_stop_loss);
  setters["sizing.atr_multiplier"] = DoubleSetter(&sizing.atr_multiplier);
  setters["sizing.min_stop_loss_pct"] = DoubleSetter(&sizing.min_stop_loss_pct);
  setters["sizing.max_stop_loss_pct"] = DoubleSetter(&sizing.max_stop_loss_pct);
  setters["sizing.min_confidence_factor"] =
      DoubleSetter(&sizing.min_confidence_factor);

  PersistenceConfig& persistence = config->persistence;
  setters["persistence.decisions_path"] =
      StringSetter(&persistence.decisions_path);
  setters["persistence.cache_path"] = StringSetter(&persistence.cache_path);
  setters["persistence.memory_path"] = StringSetter(&persistence.memory_path);
  setters["persistence.memory_allow_fresh_start"] =
      BoolSetter(&persistence.memory_allow_fresh_start);

  RegimeConfig& regime = config->regime;
  setters["regime.enabled"] = BoolSetter(&regime.enabled);
  setters["regime.warmup_ticks"] = IntSetter(&regime.warmup_ticks);
  setters["regime.ewma_alpha"] = DoubleSetter(&regime.ewma_alpha);
  setters["regime.trend_threshold"] = DoubleSetter(&regime.trend_threshold);
  setters["regime.volatility_threshold"] =
      DoubleSetter(&regime.volatility_threshold);
  setters["regime.extreme_threshold"] = DoubleSetter(&regime.extreme_threshold);
  setters["regime.switch_confirm_ticks"] =
      IntSetter(&regime.switch_confirm_ticks);

  BacktestConfig& backtest = config->backtest;
  setters["backtest.initial_balance"] = DoubleSetter(&backtest.initial_balance);
  setters["backtest.fee_pct"] = DoubleSetter(&backtest.fee_pct);
  setters["backtest.slippage_pct"] = DoubleSetter(&backtest.slippage_pct);
  setters["backtest.commission_per_trade"] =
      DoubleSetter(&backtest.commission_per_trade);
  setters["backtest.allow_short"] = BoolSetter(&backtest.allow_short);
  setters["backtest.periods_per_year"] = DoubleSetter(&backtest.periods_per_year);

  setters["walk_forward.train_ratio"] =
      DoubleSetter(&config->walk_forward.train_ratio);
  setters["walk_forward.window_bars"] =
      IntSetter(&config->walk_forward.window_bars);
  setters["walk_forward.step_bars"] = IntSetter(&config->walk_forward.step_bars);

  MonteCarloConfig& monte_carlo = config->monte_carlo;
  setters["monte_carlo.num_simulations"] =
      IntSetter(&monte_carlo.num_simulations);
  setters["monte_carlo.price_noise_std"] =
      DoubleSetter(&monte_carlo.price_noise_std);
  setters["monte_carlo.seed"] = [&monte_carlo](const std::string& value) {
    return ParseUint64(value, &monte_carlo.seed);
  };
  setters["monte_carlo.max_threads"] = IntSetter(&monte_carlo.max_threads);
  return setters;
}

bool Reject(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

bool ParseVotingStrategy(const std::string& text, VotingStrategy* out_strategy) {
  if (out_strategy == nullptr) {
    return false;
  }
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "weighted") {
    *out_strategy = VotingStrategy::kWeighted;
    return true;
  }
  if (lowered == "majority") {
    *out_strategy = VotingStrategy::kMajority;
    return true;
  }
  if (lowered == "stacking") {
    *out_strategy = VotingStrategy::kStacking;
    return true;
  }
  return false;
}

bool ValidateEngineConfig(const EngineConfig& config, std::string* out_error) {
  const EnsembleConfig& ensemble = config.ensemble;
  if (ensemble.providers.empty()) {
    return Reject("ensemble.providers 不能为空", out_error);
  }
  std::set<std::string> unique_ids(ensemble.providers.begin(),
                                   ensemble.providers.end());
  if (unique_ids.size() != ensemble.providers.size()) {
    return Reject("ensemble.providers 存在重复 id", out_error);
  }
  for (const auto& [provider, weight] : ensemble.provider_weights) {
    if (!std::isfinite(weight) || weight < 0.0) {
      return Reject("ensemble.provider_weights." + provider + " 不能为负数",
                    out_error);
    }
  }
  if (ensemble.min_providers_required < 1) {
    return Reject("ensemble.min_providers_required 必须 >= 1", out_error);
  }
  if (ensemble.tier3_confidence_factor <= 0.0 ||
      ensemble.tier3_confidence_factor > 1.0 ||
      ensemble.tier4_confidence_factor <= 0.0 ||
      ensemble.tier4_confidence_factor > 1.0) {
    return Reject("ensemble 降级置信度系数必须在 (0,1] 范围内", out_error);
  }
  const WeightOptimizerConfig& weights = config.weights;
  if (weights.multiplier_min <= 0.0 ||
      weights.multiplier_max < weights.multiplier_min) {
    return Reject("weights.multiplier_min/max 配置非法", out_error);
  }
  if (weights.win_multiplier <= 0.0 || weights.loss_multiplier <= 0.0) {
    return Reject("weights 胜负乘子必须大于 0", out_error);
  }
  if (config.provider_pool.timeout_ms <= 0 ||
      config.provider_pool.max_threads <= 0) {
    return Reject("provider_pool.timeout_ms/max_threads 必须大于 0", out_error);
  }
  const RiskConfig& risk = config.risk;
  if (risk.max_drawdown <= 0.0 || risk.max_drawdown > 0.2) {
    return Reject("risk.max_drawdown 必须在 (0,0.2] 范围内", out_error);
  }
  if (risk.correlation_threshold <= 0.0 || risk.correlation_threshold >= 1.0) {
    return Reject("risk.correlation_threshold 必须在 (0,1) 范围内", out_error);
  }
  if (risk.max_correlation_reduction < 0.0 ||
      risk.max_correlation_reduction >= 1.0) {
    return Reject("risk.max_correlation_reduction 必须在 [0,1) 范围内",
                  out_error);
  }
  if (risk.var_confidence < 0.9 || risk.var_confidence > 0.99) {
    return Reject("risk.var_confidence 必须在 [0.9,0.99] 范围内", out_error);
  }
  if (risk.max_var_pct <= 0.0 || risk.max_var_pct > 1.0) {
    return Reject("risk.max_var_pct 必须在 (0,1] 范围内", out_error);
  }
  if (risk.min_var_samples < 1) {
    return Reject("risk.min_var_samples 必须 >= 1", out_error);
  }
  if (risk.max_total_exposure_pct <= 0.0) {
    return Reject("risk.max_total_exposure_pct 必须大于 0", out_error);
  }
  if (risk.reservation_ttl_s <= 0) {
    return Reject("risk.reservation_ttl_s 必须大于 0", out_error);
  }
  if (config.freshness.intraday_max_age_s <= 0 ||
      config.freshness.daily_max_age_s <= 0) {
    return Reject("risk.freshness 阈值必须大于 0", out_error);
  }
  const SizingConfig& sizing = config.sizing;
  if (sizing.risk_pct <= 0.0 || sizing.stop_loss_pct <= 0.0) {
    return Reject("sizing.risk_pct/stop_loss_pct 必须大于 0", out_error);
  }
  if (sizing.min_stop_loss_pct <= 0.0 ||
      sizing.max_stop_loss_pct < sizing.min_stop_loss_pct) {
    return Reject("sizing 止损上下限配置非法", out_error);
  }
  if (sizing.min_confidence_factor < 0.0 || sizing.min_confidence_factor > 1.0) {
    return Reject("sizing.min_confidence_factor 必须在 [0,1] 范围内", out_error);
  }
  if (config.regime.ewma_alpha <= 0.0 || config.regime.ewma_alpha > 1.0) {
    return Reject("regime.ewma_alpha 必须在 (0,1] 范围内", out_error);
  }
  if (config.regime.warmup_ticks < 0) {
    return Reject("regime.warmup_ticks 不能为负数", out_error);
  }
  const BacktestConfig& backtest = config.backtest;
  if (backtest.initial_balance <= 0.0) {
    return Reject("backtest.initial_balance 必须大于 0", out_error);
  }
  if (backtest.fee_pct < 0.0 || backtest.slippage_pct < 0.0 ||
      backtest.commission_per_trade < 0.0) {
    return Reject("backtest 费用参数不能为负数", out_error);
  }
  if (backtest.periods_per_year <= 0.0) {
    return Reject("backtest.periods_per_year 必须大于 0", out_error);
  }
  if (config.walk_forward.train_ratio <= 0.0 ||
      config.walk_forward.train_ratio >= 1.0) {
    return Reject("walk_forward.train_ratio 必须在 (0,1) 范围内", out_error);
  }
  if (config.walk_forward.window_bars < 2 || config.walk_forward.step_bars < 0) {
    return Reject("walk_forward.window_bars/step_bars 配置非法", out_error);
  }
  if (config.monte_carlo.num_simulations < 1) {
    return Reject("monte_carlo.num_simulations 必须 >= 1", out_error);
  }
  if (!std::isfinite(config.monte_carlo.price_noise_std) ||
      config.monte_carlo.price_noise_std < 0.0) {
    return Reject("monte_carlo.price_noise_std 不能为负数", out_error);
  }
  if (config.monte_carlo.max_threads < 1) {
    return Reject("monte_carlo.max_threads 必须 >= 1", out_error);
  }
  return true;
}

bool LoadEngineConfigFromYaml(const std::string& file_path,
                              EngineConfig* out_config,
                              std::string* out_error) {
  if (out_config == nullptr) {
    return Reject("out_config 为空", out_error);
  }
  std::ifstream input(file_path);
  if (!input.is_open()) {
    return Reject("无法打开配置文件: " + file_path, out_error);
  }

  EngineConfig config = *out_config;
  const auto setters = BuildSetters(&config);
  std::string current_section;
  std::string current_subsection;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string content = Trim(StripInlineComment(line));
    if (content.empty()) {
      continue;
    }
    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == 0 && content.back() == ':') {
      current_section = Trim(content.substr(0, content.size() - 1));
      current_subsection.clear();
      continue;
    }
    if (indent < 2) {
      continue;
    }
    if (indent == 2 && content.back() == ':') {
      current_subsection = Trim(content.substr(0, content.size() - 1));
      continue;
    }
    const std::size_t colon_pos = content.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(content.substr(0, colon_pos));
    const std::string raw_value = Trim(content.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    if (indent <= 2) {
      current_subsection.clear();
    }

    // provider_weights 的键是 provider id，无法静态注册。
    if (current_section == "ensemble" &&
        current_subsection == "provider_weights") {
      double weight = 0.0;
      if (!ParseDouble(value, &weight)) {
        return Reject("ensemble.provider_weights." + key +
                          " 解析失败，行号: " + std::to_string(line_no),
                      out_error);
      }
      config.ensemble.provider_weights[key] = weight;
      continue;
    }

    const std::string path =
        current_subsection.empty()
            ? current_section + "." + key
            : current_section + "." + current_subsection + "." + key;
    const auto it = setters.find(path);
    if (it == setters.end()) {
      continue;
    }
    if (!it->second(value)) {
      return Reject(path + " 解析失败，行号: " + std::to_string(line_no),
                    out_error);
    }
  }

  if (!ValidateEngineConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

}  // namespace feedback_engine
