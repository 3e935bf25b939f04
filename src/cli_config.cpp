// Implementation of tonelang_cli option handling.

#include "cli_config.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>

#include "core/json_parser.h"
#include "core/pitch_utils.h"

namespace tonelang {

namespace {

/// @brief Parse a whole string as a base-10 int.
bool parseInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long val = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (val < INT_MIN || val > INT_MAX) return false;
  out = static_cast<int>(val);
  return true;
}

/// @brief Parse "0,2,4" into a list of ints.
bool parseIntervalList(const std::string& text, std::vector<int>& out) {
  std::vector<int> result;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    int val = 0;
    if (!parseInt(text.substr(start, comma - start), val)) return false;
    result.push_back(val);
    start = comma + 1;
  }
  out = result;
  return true;
}

ConfigResult failure(const std::string& message) {
  ConfigResult result;
  result.error_message = message;
  return result;
}

ConfigResult applyRootName(const std::string& name, CliConfig& config) {
  PitchResult semitone = nameToSemitone(name);
  if (!semitone.ok()) return failure(semitone.error_message);
  config.root = semitone.value;
  config.root_specified = true;
  return {true, ""};
}

void applyScaleName(const std::string& name, CliConfig& config) {
  if (!scaleTypeFromString(name, config.scale)) {
    std::fprintf(stderr, "[Config] WARNING: unknown scale '%s', using major\n", name.c_str());
    config.scale = ScaleType::Major;
  }
  config.scale_specified = true;
}

}  // namespace

// ---------------------------------------------------------------------------
// JSON config
// ---------------------------------------------------------------------------

ConfigResult applyJsonConfig(const std::string& json_text, CliConfig& config) {
  JsonParseResult parsed = parseJsonObject(json_text);
  if (!parsed.success) {
    return failure("invalid config JSON at offset " + std::to_string(parsed.error_offset) +
                   ": " + parsed.error_message);
  }

  for (const auto& entry : parsed.values) {
    const std::string& key = entry.first;
    const JsonValue& val = entry.second;

    if (key == "notation") {
      if (val.type != JsonValue::String) return failure("'notation' must be a string");
      config.notation = val.string_val;
    } else if (key == "json") {
      if (val.type != JsonValue::Bool) return failure("'json' must be a boolean");
      config.json_output = val.bool_val;
    } else if (key == "root") {
      if (val.type == JsonValue::String) {
        ConfigResult root = applyRootName(val.string_val, config);
        if (!root.success) return root;
      } else if (val.type == JsonValue::Number) {
        int root = val.asInt(-1);
        if (!val.isInt() || root < 0 || root > 11) {
          return failure("'root' must be a pitch class name or an integer 0-11");
        }
        config.root = root;
        config.root_specified = true;
      } else {
        return failure("'root' must be a pitch class name or an integer 0-11");
      }
    } else if (key == "scale") {
      if (val.type != JsonValue::String) return failure("'scale' must be a string");
      applyScaleName(val.string_val, config);
    } else if (key == "intervals") {
      if (!val.asIntList(config.intervals)) {
        return failure("'intervals' must be an array of integers");
      }
    } else if (key == "transpose_steps") {
      if (!val.isInt()) return failure("'transpose_steps' must be an integer");
      config.transpose_steps = val.asInt();
    } else if (key == "legacy_grouping_timing") {
      if (val.type != JsonValue::Bool) {
        return failure("'legacy_grouping_timing' must be a boolean");
      }
      config.compile.honor_grouping_time_until_next = val.bool_val;
    } else {
      std::fprintf(stderr, "[Config] WARNING: unknown key '%s' ignored\n", key.c_str());
    }
  }
  return {true, ""};
}

// ---------------------------------------------------------------------------
// argv
// ---------------------------------------------------------------------------

std::string configPathFromArgs(const std::vector<std::string>& args) {
  for (size_t idx = 0; idx + 1 < args.size(); ++idx) {
    if (args[idx] == "--config") return args[idx + 1];
  }
  return "";
}

ConfigResult applyCliArgs(const std::vector<std::string>& args, CliConfig& config) {
  std::string words;
  bool has_words = false;

  for (size_t idx = 0; idx < args.size(); ++idx) {
    const std::string& arg = args[idx];
    bool has_value = idx + 1 < args.size();

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      return {true, ""};
    }

    if (arg == "--json") {
      config.json_output = true;
    } else if (arg == "--legacy-grouping-timing") {
      config.compile.honor_grouping_time_until_next = true;
    } else if (arg == "-f" || arg == "--config" || arg == "--root" || arg == "--scale" ||
               arg == "--intervals" || arg == "--transpose-steps") {
      if (!has_value) return failure("missing value for " + arg);
      const std::string& val = args[++idx];

      if (arg == "-f") {
        config.notation_file = val;
      } else if (arg == "--config") {
        // Loaded before argv is applied; see configPathFromArgs.
      } else if (arg == "--root") {
        ConfigResult root = applyRootName(val, config);
        if (!root.success) return root;
      } else if (arg == "--scale") {
        applyScaleName(val, config);
      } else if (arg == "--intervals") {
        if (!parseIntervalList(val, config.intervals)) {
          return failure("invalid interval list '" + val + "' (expected e.g. 0,2,4,5,7,9,11)");
        }
      } else {
        if (!parseInt(val, config.transpose_steps)) {
          return failure("invalid step count '" + val + "'");
        }
      }
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      return failure("unknown option " + arg);
    } else {
      if (has_words) words += ' ';
      words += arg;
      has_words = true;
    }
  }

  if (has_words) config.notation = words;
  return {true, ""};
}

// ---------------------------------------------------------------------------
// Validation and pitch post-processing
// ---------------------------------------------------------------------------

ConfigResult validateConfig(const CliConfig& config) {
  if (config.transpose_steps != 0 && !scaleQuantizationEnabled(config)) {
    return failure("--transpose-steps requires --root, --scale or --intervals");
  }
  if (!config.notation_file.empty() && !config.notation.empty()) {
    std::fprintf(stderr, "[Config] WARNING: -f given, inline notation ignored\n");
  }
  return {true, ""};
}

bool scaleQuantizationEnabled(const CliConfig& config) {
  return config.root_specified || config.scale_specified || !config.intervals.empty();
}

ScaleMask configScaleMask(const CliConfig& config) {
  if (!config.intervals.empty()) {
    return scale_util::buildScaleMask(config.root, config.intervals);
  }
  return scale_util::scaleMaskFor(config.scale, config.root);
}

void applyPitchTransforms(const CliConfig& config, std::vector<Event>& events) {
  if (!scaleQuantizationEnabled(config)) return;
  ScaleMask mask = configScaleMask(config);
  for (auto& event : events) {
    event.pitch = scale_util::stepInScale(event.pitch, config.transpose_steps, mask);
  }
}

}  // namespace tonelang
