#ifndef INCLUDE_BENCHBOX_RUNNER_H_
#define INCLUDE_BENCHBOX_RUNNER_H_

#include <filesystem>

#include <benchbox/result.h>

// The part that runs inside the container. It knows nothing about the
// orchestrator; its behavior is driven only by which source files exist.
struct RunnerOptions {
  std::filesystem::path code_dir;
  long run_time_limit; // us
  long compile_time_limit; // us; 0 for the per-language default
  long max_output; // bytes per stage

  RunnerOptions() : run_time_limit(kRunTimeLimit), compile_time_limit(0), max_output(kMaxOutput) {}
};

// compile (if needed) and run one language
LanguageResult RunLanguage(Language, const RunnerOptions&);
// all languages in the order of kLanguages, one after another
BenchmarkResult RunAllLanguages(const RunnerOptions&);

#endif  // INCLUDE_BENCHBOX_RUNNER_H_
