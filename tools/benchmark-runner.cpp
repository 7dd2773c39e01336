// Entry point of the benchmark container.
// Usage: benchmark-runner [code_dir]
// Progress goes to stderr; the result record is the last line on stdout.
#include <iostream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <benchbox/paths.h>
#include <benchbox/logger.h>
#include <benchbox/runner.h>

int main(int argc, char** argv) {
  InitLogger(1);
  RunnerOptions opt;
  opt.code_dir = argc > 1 ? argv[1] : kContainerCodeDir;
  BenchmarkResult result = RunAllLanguages(opt);
  spdlog::default_logger()->flush();
  std::cout << DumpJson(ToJson(result)) << std::endl;
}
