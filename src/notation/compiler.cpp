// Implementation of the notation compiler entry points.

#include "notation/compiler.h"

#include "notation/modifier_resolver.h"

namespace tonelang {

std::vector<Event> compileVoice(const Voice& voice, const CompileOptions& options) {
  return flattenVoice(resolveModifiers(voice), options);
}

CompiledScore compileScore(const Score& score, const CompileOptions& options) {
  CompiledScore compiled;
  for (const auto& voice : score) {
    Rational end = flattenSequence(resolveModifiers(voice), Rational(0), options,
                                   compiled.events);
    if (end > compiled.duration) {
      compiled.duration = end;
    }
  }
  return compiled;
}

std::vector<Event> compile(const Score& score, const CompileOptions& options) {
  return compileScore(score, options).events;
}

Rational scoreDuration(const Score& score, const CompileOptions& options) {
  return compileScore(score, options).duration;
}

}  // namespace tonelang
