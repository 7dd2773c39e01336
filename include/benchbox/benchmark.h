#ifndef INCLUDE_BENCHBOX_BENCHMARK_H_
#define INCLUDE_BENCHBOX_BENCHMARK_H_

#include <mutex>
#include <atomic>
#include <string>
#include <filesystem>

#include <benchbox/engine.h>
#include <benchbox/result.h>

// limits of the benchmark container; not configurable
constexpr long kContainerMemory = 1L * 1024 * 1024 * 1024; // 1 GiB
constexpr long kContainerCpuPeriod = 100'000; // us
constexpr long kContainerCpuQuota = 100'000; // one core
constexpr int kContainerPidsLimit = 256;
constexpr long kContainerTimeLimit = 180L * 1'000'000; // us, all languages combined

extern const char kDefaultImage[];
extern const char kDefaultSystemInfo[];

struct EnvironmentConfig {
  std::string image;
  std::filesystem::path dockerfile, build_context;
  std::string system_info;

  EnvironmentConfig();
};

// The execution image holding every compiler and interpreter.
// Built at most once; concurrent callers of EnsureEnvironment wait for the same build.
class Environment {
  ContainerEngine& engine_;
  const EnvironmentConfig config_;
  std::mutex build_mtx_;
  std::atomic_bool built_;

  bool BuildImage();
 public:
  Environment(ContainerEngine& engine, EnvironmentConfig config = EnvironmentConfig());
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  // idempotent; false if the image neither exists nor could be built
  bool EnsureEnvironment();
  bool IsBuilt() const { return built_; }
  // remove the image; the next EnsureEnvironment rebuilds it
  bool Cleanup();

  const std::string& GetSystemInfo() const { return config_.system_info; }
  // empty for interpreted or unknown languages
  std::string GetCompileCommand(const std::string& language) const;
  const std::string& Image() const { return config_.image; }
  ContainerEngine& Engine() const { return engine_; }
};

class Orchestrator {
  Environment& env_;
  std::filesystem::path workspace_root_;

  BenchmarkResult RunContainer(const std::filesystem::path& workspace) const;
 public:
  explicit Orchestrator(Environment& env);
  Orchestrator(Environment& env, std::filesystem::path workspace_root);

  // never throws; every failure is reported inside the result
  BenchmarkResult Run(const BenchmarkRequest&) const;
};

#endif  // INCLUDE_BENCHBOX_BENCHMARK_H_
