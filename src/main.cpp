#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <benchbox/paths.h>
#include <benchbox/logger.h>
#include <benchbox/benchmark.h>
#include "benchbox/docker.h"

namespace {

constexpr char kDefaultConfig[] = "/etc/benchbox.conf";

bool ParseConfig(const fs::path& conf_path, EnvironmentConfig& env_config, std::string& docker_bin) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  env_config.image = ini[""]["image"] | env_config.image;
  env_config.system_info = ini[""]["system_info"] | env_config.system_info;
  docker_bin = ini[""]["docker"] | docker_bin;
  std::string build_context = ini[""]["build_context"] | "";
  std::string dockerfile = ini[""]["dockerfile"] | "";
  std::string workspace_root = ini[""]["workspace_root"] | "";
  if (build_context.size()) {
    env_config.build_context = build_context;
    env_config.dockerfile = env_config.build_context / "docker" / "Dockerfile";
  }
  if (dockerfile.size()) env_config.dockerfile = dockerfile;
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  return true;
}

std::optional<std::string> ReadSource(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::stringstream buf;
  buf << fin.rdbuf();
  return buf.str();
}

int CommandRun(const argparse::ArgumentParser& args, Environment& env) {
  BenchmarkRequest req;
  for (Language lang : kLanguages) {
    auto path = args.present<std::string>(std::string("--") + LanguageName(lang));
    if (!path) continue;
    auto source = ReadSource(*path);
    if (!source) {
      spdlog::error("Cannot read {} source {}", LanguageDisplayName(lang), *path);
      return 1;
    }
    req.Set(lang, std::move(*source));
  }
  Orchestrator orchestrator(env);
  BenchmarkResult result = orchestrator.Run(req);
  std::cout << DumpJson(ToJson(result), args.get<bool>("--pretty") ? 2 : -1) << std::endl;
  return result.has_error() ? 2 : 0;
}

int CommandInfo(const argparse::ArgumentParser& args, Environment& env) {
  if (auto language = args.present<std::string>("--language")) {
    if (!GetLanguage(*language)) {
      spdlog::error("Unknown language {}", *language);
      return 1;
    }
    std::cout << env.GetCompileCommand(*language) << std::endl;
    return 0;
  }
  std::cout << "System: " << env.GetSystemInfo() << '\n';
  for (Language lang : kLanguages) {
    std::string command = env.GetCompileCommand(LanguageName(lang));
    std::cout << LanguageDisplayName(lang) << ": "
              << (command.empty() ? "(no compilation)" : command) << '\n';
  }
  std::cout << std::flush;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "benchbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Benchmark the given sources and print the result as JSON");
  for (Language lang : kLanguages) {
    run_cmd.add_argument(std::string("--") + LanguageName(lang))
      .help(std::string("Path of the ") + LanguageDisplayName(lang) + " source");
  }
  run_cmd.add_argument("--pretty")
    .default_value(false)
    .implicit_value(true)
    .help("Indent the result");

  argparse::ArgumentParser info_cmd("info");
  info_cmd.add_description("Print the execution environment and compile commands");
  info_cmd.add_argument("-l", "--language")
    .help("Only print the compile command of this language");

  argparse::ArgumentParser prepare_cmd("prepare");
  prepare_cmd.add_description("Build the execution image if it does not exist");
  argparse::ArgumentParser cleanup_cmd("cleanup");
  cleanup_cmd.add_description("Remove the execution image");

  parser.add_subparser(run_cmd);
  parser.add_subparser(info_cmd);
  parser.add_subparser(prepare_cmd);
  parser.add_subparser(cleanup_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  EnvironmentConfig env_config;
  std::string docker_bin = "docker";
  if (!ParseConfig(config_file, env_config, docker_bin) && parser.is_used("--config")) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    return 1;
  }

  DockerCli docker(docker_bin);
  Environment env(docker, env_config);
  if (parser.is_subcommand_used(run_cmd)) return CommandRun(run_cmd, env);
  if (parser.is_subcommand_used(info_cmd)) return CommandInfo(info_cmd, env);
  if (parser.is_subcommand_used(prepare_cmd)) {
    if (!env.EnsureEnvironment()) {
      spdlog::error("Failed to prepare the execution environment");
      return 1;
    }
    spdlog::info("Execution environment is ready");
    return 0;
  }
  if (parser.is_subcommand_used(cleanup_cmd)) return env.Cleanup() ? 0 : 1;
  std::cerr << parser;
  return 1;
}
