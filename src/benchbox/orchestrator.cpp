#include <benchbox/benchmark.h>

#include <unistd.h>
#include <exception>

#include <spdlog/spdlog.h>
#include <benchbox/paths.h>
#include <benchbox/parser.h>
#include "utils.h"

namespace {

const char kEnvironmentFailure[] = "Failed to build execution environment";
const char kEnvironmentSlotFailure[] = "Environment setup failed";
const char kParseFailure[] = "Failed to parse benchmark results";

inline BenchmarkResult ErrorResult(std::string error) {
  BenchmarkResult ret;
  ret.error = std::move(error);
  return ret;
}

BenchmarkResult EnvironmentFailure() {
  BenchmarkResult ret = ErrorResult(kEnvironmentFailure);
  for (Language lang : kLanguages) {
    ret.languages.emplace(lang, LanguageResult::Failed(kEnvironmentSlotFailure));
  }
  return ret;
}

bool WriteSources(const fs::path& workspace, const BenchmarkRequest& req) {
  for (Language lang : kLanguages) {
    if (!req.IsPresent(lang)) continue;
    if (!WriteFile(WorkspaceSourceFile(workspace, lang), req.Source(lang), kPerm644)) return false;
  }
  return true;
}

// Removes the container when leaving scope, whatever happened before.
class ContainerGuard {
  ContainerEngine& engine_;
  std::string id_;
 public:
  ContainerGuard(ContainerEngine& engine, std::string id) : engine_(engine), id_(std::move(id)) {}
  ~ContainerGuard() {
    try {
      Dispose();
    } catch (const std::exception& err) {
      spdlog::warn("Failed to remove container {}: {}", id_, err.what());
    }
  }
  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;

  void Dispose() {
    if (id_.empty()) return;
    std::string id = std::move(id_);
    id_.clear();
    // leaked containers are worse than a noisy log
    if (!engine_.RemoveContainer(id)) spdlog::warn("Container {} was not removed", id);
  }
};

std::optional<std::string> LogsNoThrow(ContainerEngine& engine, const std::string& id) {
  try {
    return engine.ContainerLogs(id);
  } catch (const std::exception& err) {
    spdlog::warn("Failed to read logs of container {}: {}", id, err.what());
    return std::nullopt;
  }
}

} // namespace

Orchestrator::Orchestrator(Environment& env) : Orchestrator(env, kWorkspaceRoot) {}

Orchestrator::Orchestrator(Environment& env, fs::path workspace_root) :
    env_(env), workspace_root_(std::move(workspace_root)) {}

BenchmarkResult Orchestrator::Run(const BenchmarkRequest& req) const {
  try {
    if (!env_.EnsureEnvironment()) {
      spdlog::error("Execution environment is not available");
      return EnvironmentFailure();
    }
    ScopedTempDir workspace(workspace_root_, "benchbox_");
    if (!workspace) return ErrorResult("Failed to create workspace");
    if (!WriteSources(workspace.path(), req)) return ErrorResult("Failed to write source files");
    {
      std::string present;
      for (Language lang : kLanguages) {
        if (!req.IsPresent(lang)) continue;
        if (!present.empty()) present += ", ";
        present += LanguageName(lang);
      }
      spdlog::info("Running benchmark for: {}", present.empty() ? "(none)" : present);
    }
    return RunContainer(workspace.path());
  } catch (const std::exception& err) {
    spdlog::error("Benchmark failed: {}", err.what());
    return ErrorResult(err.what());
  }
}

BenchmarkResult Orchestrator::RunContainer(const fs::path& workspace) const {
  ContainerEngine& engine = env_.Engine();
  ContainerSpec spec;
  spec.image = env_.Image();
  spec.command = {kContainerRunner, kContainerCodeDir};
  spec.host_dir = workspace.string();
  spec.container_dir = kContainerCodeDir;
  // files created inside stay removable by us
  spec.user = std::to_string(geteuid()) + ':' + std::to_string(getegid());
  spec.memory = kContainerMemory;
  spec.cpu_period = kContainerCpuPeriod;
  spec.cpu_quota = kContainerCpuQuota;
  spec.pids_limit = kContainerPidsLimit;
  spec.network = false;

  auto id = engine.StartContainer(spec);
  if (!id) return ErrorResult("Failed to start benchmark container");
  ContainerGuard container(engine, *id);

  WaitResult wait;
  std::optional<std::string> logs;
  try {
    wait = engine.WaitContainer(*id, kContainerTimeLimit);
    spdlog::info("Container {} wait finished: {}, exit code {}", *id, WaitStatusName(wait.status), wait.exit_code);
    if (wait.status == WaitStatus::TIMEOUT) {
      spdlog::warn("Container {} timed out, killing", *id);
      engine.KillContainer(*id);
    }
    // must happen before the container is removed
    logs = engine.ContainerLogs(*id);
  } catch (const std::exception& err) {
    spdlog::error("Container execution failed: {}", err.what());
    BenchmarkResult ret = ErrorResult(std::string("Container execution error: ") + err.what());
    if (!logs) logs = LogsNoThrow(engine, *id);
    if (logs) {
      spdlog::info("Container output:\n{}", *logs);
      ret.raw_output = std::move(logs);
    }
    container.Dispose();
    return ret;
  }
  container.Dispose();

  BenchmarkResult ret;
  switch (wait.status) {
    case WaitStatus::TIMEOUT: {
      ret = ErrorResult("Benchmark timed out after " +
                        std::to_string(kContainerTimeLimit / 1'000'000) + " seconds");
      ret.raw_output = std::move(logs);
      return ret;
    }
    case WaitStatus::FAILED: {
      ret = ErrorResult("Container execution error: " + wait.message);
      ret.raw_output = std::move(logs);
      return ret;
    }
    case WaitStatus::EXITED: break;
  }
  if (!logs) {
    ret = ErrorResult("Failed to read benchmark output");
    ret.exit_code = wait.exit_code;
    return ret;
  }
  if (auto parsed = ExtractBenchmarkResult(*logs)) {
    spdlog::info("Benchmark completed, container exit code {}", wait.exit_code);
    return std::move(*parsed);
  }
  spdlog::error("Failed to parse benchmark results; container output:\n{}", *logs);
  ret = ErrorResult(kParseFailure);
  ret.raw_output = std::move(logs);
  ret.exit_code = wait.exit_code;
  return ret;
}
