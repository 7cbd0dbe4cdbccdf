#include "barsim/config/run_config.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/time/time_utils.hpp"

#include <fstream>

namespace barsim {

namespace {

std::optional<Timestamp> parseDate(const nlohmann::json& json,
                                   const char* key) {
  if (!json.contains(key) || json.at(key).is_null()) {
    return std::nullopt;
  }
  const auto text = json.at(key).get<std::string>();
  auto ts = parse_timestamp(text);
  if (!ts) {
    throw ConfigError(std::string("invalid date for '") + key + "': " + text);
  }
  return ts;
}

domain::SignalDirection parseDirection(const std::string& text) {
  if (text == "LONG") {
    return domain::SignalDirection::Long;
  }
  if (text == "SHORT") {
    return domain::SignalDirection::Short;
  }
  if (text == "EXIT") {
    return domain::SignalDirection::Exit;
  }
  throw ConfigError("unknown signal direction: " + text);
}

SizingConfig parseSizing(const nlohmann::json& json) {
  SizingConfig sizing;
  const auto mode = json.value("mode", std::string("smoothed"));
  if (mode == "smoothed") {
    sizing.mode = SizingMode::Smoothed;
  } else if (mode == "naive") {
    sizing.mode = SizingMode::Naive;
  } else {
    throw ConfigError("unknown sizing mode: " + mode);
  }
  sizing.slices = json.value("slices", sizing.slices);
  if (sizing.slices < 1) {
    throw ConfigError("sizing.slices must be at least 1");
  }
  return sizing;
}

CommissionSchedule parseCommission(const nlohmann::json& json) {
  CommissionSchedule c;
  c.minimum = json.value("minimum", c.minimum);
  c.tier_threshold = json.value("tier_threshold", c.tier_threshold);
  c.small_rate = json.value("small_rate", c.small_rate);
  c.large_rate = json.value("large_rate", c.large_rate);
  if (c.minimum < 0.0 || c.small_rate < 0.0 || c.large_rate < 0.0) {
    throw ConfigError("commission values must not be negative");
  }
  return c;
}

StrategyConfig parseStrategy(const nlohmann::json& json) {
  StrategyConfig s;
  const auto type = json.value("type", std::string("mac"));
  if (type == "mac") {
    s.type = StrategyType::MovingAverageCross;
    const auto short_window = json.value("short_window", 30);
    const auto long_window = json.value("long_window", 120);
    if (short_window <= 0 || long_window <= 0 || short_window >= long_window) {
      throw ConfigError(
          "strategy windows must satisfy 0 < short_window < long_window");
    }
    s.mac.short_window = static_cast<std::size_t>(short_window);
    s.mac.long_window = static_cast<std::size_t>(long_window);
    s.mac.quantity = json.value("quantity", s.mac.quantity);
  } else if (type == "scripted") {
    s.type = StrategyType::Scripted;
    const nlohmann::json signals =
        json.contains("signals") ? json.at("signals") : nlohmann::json::array();
    for (const auto& entry : signals) {
      ScriptedSignalConfig sig;
      const auto tick = entry.at("tick").get<std::int64_t>();
      if (tick < 1) {
        throw ConfigError("scripted signal tick must be >= 1");
      }
      sig.tick = static_cast<std::uint64_t>(tick);
      sig.direction = parseDirection(entry.at("direction").get<std::string>());
      sig.instrument = entry.at("instrument").get<std::string>();
      sig.quantity = entry.value("quantity", sig.quantity);
      sig.strength = entry.value("strength", sig.strength);
      s.signals.push_back(std::move(sig));
    }
  } else {
    throw ConfigError("unknown strategy type: " + type);
  }
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseRunConfig
// -----------------------------------------------------------------------------
RunConfig parseRunConfig(const nlohmann::json& json) {
  try {
    if (!json.is_object()) {
      throw ConfigError("run configuration must be a JSON object");
    }

    RunConfig cfg;
    if (!json.contains("instruments")) {
      throw ConfigError("missing required key 'instruments'");
    }
    cfg.instruments = json.at("instruments").get<std::vector<std::string>>();
    if (cfg.instruments.empty()) {
      throw ConfigError("'instruments' must not be empty");
    }

    cfg.data_dir = json.value("data_dir", cfg.data_dir);
    cfg.start = parseDate(json, "start");
    cfg.end = parseDate(json, "end");
    if (cfg.start && cfg.end && *cfg.end < *cfg.start) {
      throw ConfigError("'end' is before 'start'");
    }

    cfg.initial_capital = json.value("initial_capital", cfg.initial_capital);
    if (!(cfg.initial_capital > 0.0)) {
      throw ConfigError("initial_capital must be positive");
    }
    cfg.frequency = json.value("frequency", cfg.frequency);
    if (!(cfg.frequency > 0.0)) {
      throw ConfigError("frequency must be positive");
    }

    if (json.contains("sizing")) {
      cfg.sizing = parseSizing(json.at("sizing"));
    }
    if (json.contains("commission")) {
      cfg.commission = parseCommission(json.at("commission"));
    }
    cfg.exchange = json.value("exchange", cfg.exchange);
    if (json.contains("strategy")) {
      cfg.strategy = parseStrategy(json.at("strategy"));
    }
    if (json.contains("output")) {
      const auto& out = json.at("output");
      cfg.output.equity_curve_csv =
          out.value("equity_curve_csv", cfg.output.equity_curve_csv);
      cfg.output.summary_json =
          out.value("summary_json", cfg.output.summary_json);
    }
    cfg.verbose = json.value("verbose", cfg.verbose);
    return cfg;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid run configuration: ") + e.what());
  }
}

RunConfig loadRunConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + path);
  }
  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Config file " + path + " is not valid JSON: " +
                      e.what());
  }
  return parseRunConfig(json);
}

}  // namespace barsim
