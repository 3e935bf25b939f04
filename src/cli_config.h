// Command-line and config-file options for tonelang_cli.

#ifndef TONELANG_CLI_CONFIG_H
#define TONELANG_CLI_CONFIG_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/scale.h"
#include "notation/timeline.h"

namespace tonelang {

/// @brief Options gathered from a JSON config file and argv.
struct CliConfig {
  std::string notation;           ///< Inline notation (positional words joined).
  std::string notation_file;      ///< -f FILE; read by the caller.
  bool json_output = false;
  bool show_help = false;

  // Scale quantization, active when any of root/scale/intervals is set.
  bool root_specified = false;
  int root = 0;                   ///< Pitch class 0-11.
  bool scale_specified = false;
  ScaleType scale = ScaleType::Major;
  std::vector<int> intervals;     ///< Custom intervals; override scale.
  int transpose_steps = 0;

  CompileOptions compile;
};

/// @brief Outcome of a config step.
struct ConfigResult {
  bool success = false;
  std::string error_message;
};

/// @brief Apply a flat JSON config object.
///
/// Recognized keys: notation, json, root (name or 0-11), scale, intervals,
/// transpose_steps, legacy_grouping_timing. Unknown keys produce a warning on
/// stderr and are otherwise ignored.
/// @param json_text Config file contents.
/// @param config Updated in place.
ConfigResult applyJsonConfig(const std::string& json_text, CliConfig& config);

/// @brief Apply command-line arguments (argv without the program name).
///
/// Positional words are joined with spaces into the notation. Values given
/// here override those loaded by applyJsonConfig.
ConfigResult applyCliArgs(const std::vector<std::string>& args, CliConfig& config);

/// @brief Value following --config, or empty if absent.
std::string configPathFromArgs(const std::vector<std::string>& args);

/// @brief Check cross-option constraints once all sources are applied.
ConfigResult validateConfig(const CliConfig& config);

/// @brief True if root, scale or intervals were given.
bool scaleQuantizationEnabled(const CliConfig& config);

/// @brief Mask for the configured root and scale (custom intervals win).
ScaleMask configScaleMask(const CliConfig& config);

/// @brief Quantize and transpose event pitches in place.
///
/// No-op unless scaleQuantizationEnabled(config). Each pitch becomes
/// stepInScale(pitch, transpose_steps, mask), which is quantizeToScale for
/// zero steps.
void applyPitchTransforms(const CliConfig& config, std::vector<Event>& events);

}  // namespace tonelang

#endif  // TONELANG_CLI_CONFIG_H
