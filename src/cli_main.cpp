/// @file
/// @brief CLI entry point for the ToneLang notation compiler.

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "cli_config.h"
#include "core/basic_types.h"
#include "core/pitch_utils.h"
#include "notation/compiler.h"
#include "notation/event_json.h"
#include "notation/notation_parser.h"

namespace {

/// Indentation used for --json output.
constexpr int kJsonIndent = 2;

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("tonelang_cli - ToneLang notation compiler\n\n");
  std::printf("Usage: tonelang_cli [options] [NOTATION...]\n\n");
  std::printf("Options:\n");
  std::printf("  -f FILE                   Read notation from FILE\n");
  std::printf("  --config FILE             Flat JSON config (flags override it)\n");
  std::printf("  --json                    JSON output\n");
  std::printf("  --root NAME               Scale root pitch class (e.g. C, F#, Bb)\n");
  std::printf("  --scale TYPE              Quantize to a preset scale\n");
  std::printf("  --intervals a,b,c         Quantize to custom intervals from the root\n");
  std::printf("  --transpose-steps N       Move every note N scale steps\n");
  std::printf("  --legacy-grouping-timing  Grouping t overrides its natural length\n");
  std::printf("  --help                    Show this help\n");
  std::printf("\nScales:\n");
  std::printf("  major, natural_minor, harmonic_minor, melodic_minor, dorian,\n");
  std::printf("  mixolydian, chromatic\n");
  std::printf("\nExample:\n");
  std::printf("  tonelang_cli \"C3 D3 [E3 G3]v90n2 R (F3 A3)*2; C2n4 G1n4\"\n");
}

/// @brief Read a whole file into out.
bool readTextFile(const std::string& path, std::string& out) {
  std::ifstream file(path);
  if (!file.is_open()) return false;
  std::ostringstream contents;
  contents << file.rdbuf();
  out = contents.str();
  return true;
}

/// @brief Print events as a table.
void printEventTable(const tonelang::CompiledScore& compiled) {
  std::printf("Events:    %zu\n", compiled.events.size());
  std::printf("Duration:  %s beats (%u ticks)\n", compiled.duration.toString().c_str(),
              static_cast<unsigned>(tonelang::beatsToTicks(compiled.duration)));
  if (compiled.events.empty()) return;

  std::printf("\n%-6s %-6s %-10s %-10s %s\n", "pitch", "name", "start", "duration", "velocity");
  for (const auto& event : compiled.events) {
    tonelang::NameResult name = tonelang::midiToName(event.pitch);
    std::printf("%-6d %-6s %-10s %-10s %d\n", event.pitch,
                name.ok() ? name.name.c_str() : "?", event.start_time.toString().c_str(),
                event.duration.toString().c_str(), event.velocity);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  tonelang::CliConfig config;

  std::string config_path = tonelang::configPathFromArgs(args);
  if (!config_path.empty()) {
    std::string json_text;
    if (!readTextFile(config_path, json_text)) {
      std::fprintf(stderr, "Error: failed to read %s\n", config_path.c_str());
      return 1;
    }
    tonelang::ConfigResult loaded = tonelang::applyJsonConfig(json_text, config);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s: %s\n", config_path.c_str(), loaded.error_message.c_str());
      return 1;
    }
  }

  tonelang::ConfigResult applied = tonelang::applyCliArgs(args, config);
  if (!applied.success) {
    std::fprintf(stderr, "Error: %s\n", applied.error_message.c_str());
    return 1;
  }
  if (config.show_help) {
    printUsage();
    return 0;
  }

  tonelang::ConfigResult valid = tonelang::validateConfig(config);
  if (!valid.success) {
    std::fprintf(stderr, "Error: %s\n", valid.error_message.c_str());
    return 1;
  }

  std::string notation = config.notation;
  if (!config.notation_file.empty() &&
      !readTextFile(config.notation_file, notation)) {
    std::fprintf(stderr, "Error: failed to read %s\n", config.notation_file.c_str());
    return 1;
  }
  if (notation.empty()) {
    std::fprintf(stderr, "Error: no notation given (see --help)\n");
    return 1;
  }

  tonelang::ParseResult parsed = tonelang::parseNotation(notation);
  if (!parsed.success) {
    std::fprintf(stderr, "Error: %s\n", parsed.error.message.c_str());
    return 1;
  }

  tonelang::CompiledScore compiled = tonelang::compileScore(parsed.score, config.compile);
  tonelang::applyPitchTransforms(config, compiled.events);

  if (config.json_output) {
    std::printf("%s\n", tonelang::buildScoreJson(compiled, kJsonIndent).c_str());
    return 0;
  }

  std::printf("Voices:    %zu\n", parsed.score.size());
  if (tonelang::scaleQuantizationEnabled(config)) {
    std::string scale_name = config.intervals.empty()
                                 ? tonelang::scaleTypeToString(config.scale)
                                 : "custom";
    tonelang::NameResult root = tonelang::semitoneToName(config.root);
    std::printf("Scale:     %s %s", root.name.c_str(), scale_name.c_str());
    if (config.transpose_steps != 0) {
      std::printf(" (%+d steps)", config.transpose_steps);
    }
    std::printf("\n");
  }
  printEventTable(compiled);
  return 0;
}
