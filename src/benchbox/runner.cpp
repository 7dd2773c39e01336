#include <benchbox/runner.h>

#include <signal.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include <benchbox/paths.h>
#include "utils.h"
#include "process.h"

namespace {

std::string FailureDetail(const ProcessResult& res) {
  if (!res.error.empty()) return res.error;
  if (res.signal) return std::string("killed by signal ") + strsignal(res.signal);
  return "exited with status " + std::to_string(res.exit_code);
}

// the stage either fails with a result or returns nullopt to continue
std::optional<LanguageResult> Compile(Language lang, const RunnerOptions& opt) {
  ProcessOptions popt;
  popt.command = CompileCommand(lang);
  popt.workdir = opt.code_dir;
  popt.time_limit = opt.compile_time_limit ? opt.compile_time_limit : CompileTimeLimit(lang);
  popt.max_output = opt.max_output;
  ProcessResult res = RunProcess(popt);
  if (!res.started) return LanguageResult::Failed(res.spawn_error);
  if (res.timed_out) {
    spdlog::warn("{} compilation timed out", LanguageDisplayName(lang));
    return LanguageResult::Failed(kExecutionTimeout);
  }
  if (res.output_exceeded) {
    spdlog::warn("{} compiler output exceeded {} bytes", LanguageDisplayName(lang), opt.max_output);
    return LanguageResult::Failed(kOutputLimitExceeded);
  }
  if (!res.Succeeded()) {
    spdlog::info("{} compilation failed", LanguageDisplayName(lang));
    return LanguageResult::Failed(kCompilationErrorPrefix + FailureDetail(res));
  }
  spdlog::debug("{} compiled in {}us", LanguageDisplayName(lang), res.elapsed);
  return std::nullopt;
}

LanguageResult Execute(Language lang, const RunnerOptions& opt) {
  ProcessOptions popt;
  popt.command = ExecuteCommand(lang);
  popt.workdir = opt.code_dir;
  popt.time_limit = opt.run_time_limit;
  popt.max_output = opt.max_output;
  ProcessResult res = RunProcess(popt);
  if (!res.started) return LanguageResult::Failed(res.spawn_error);
  if (res.timed_out) {
    spdlog::warn("{} execution timed out", LanguageDisplayName(lang));
    return LanguageResult::Failed(kExecutionTimeout);
  }
  if (res.output_exceeded) {
    spdlog::warn("{} output exceeded {} bytes", LanguageDisplayName(lang), opt.max_output);
    return LanguageResult::Failed(kOutputLimitExceeded);
  }
  if (!res.Succeeded()) {
    spdlog::info("{} execution failed", LanguageDisplayName(lang));
    return LanguageResult::Failed(kRuntimeErrorPrefix + FailureDetail(res));
  }
  double seconds = res.elapsed / 1e6;
  spdlog::info("{} finished in {:.3f}s", LanguageDisplayName(lang), seconds);
  return LanguageResult::Succeeded(seconds, Trim(res.output));
}

} // namespace

LanguageResult RunLanguage(Language lang, const RunnerOptions& opt) {
  fs::path source = WorkspaceSourceFile(opt.code_dir, lang);
  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) return LanguageResult::FileNotFound();
  if (IsCompiled(lang)) {
    spdlog::info("Compiling and running {} code...", LanguageDisplayName(lang));
    if (auto res = Compile(lang, opt)) return std::move(*res);
  } else {
    spdlog::info("Running {} code...", LanguageDisplayName(lang));
  }
  return Execute(lang, opt);
}

BenchmarkResult RunAllLanguages(const RunnerOptions& opt) {
  BenchmarkResult ret;
  // strictly sequential: the languages share one CPU and would disturb each other's timing
  for (Language lang : kLanguages) {
    ret.languages.emplace(lang, RunLanguage(lang, opt));
  }
  return ret;
}
