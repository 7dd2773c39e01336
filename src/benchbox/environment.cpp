#include <benchbox/benchmark.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <benchbox/paths.h>
#include "utils.h"

const char kDefaultImage[] = "benchbox-runtime:latest";
const char kDefaultSystemInfo[] = "Ubuntu 22.04 x86_64 (Docker)";

EnvironmentConfig::EnvironmentConfig() :
    image(kDefaultImage),
    dockerfile(DefaultDockerfile()),
    build_context(DefaultBuildContext()),
    system_info(kDefaultSystemInfo) {}

Environment::Environment(ContainerEngine& engine, EnvironmentConfig config) :
    engine_(engine), config_(std::move(config)), built_(false) {}

bool Environment::BuildImage() {
  spdlog::warn("Building image {} from {}; this may take several minutes",
               config_.image, config_.dockerfile.c_str());
  auto on_line = [](const std::string& raw) {
    std::string line = Trim(raw);
    if (line.empty()) return;
    std::string lower = ToLower(line);
    if (lower.find("error") != std::string::npos) {
      spdlog::error("[build] {}", line);
    } else if (line.rfind("Step ", 0) == 0 || (line[0] == '#' && line.find(" [") != std::string::npos)) {
      spdlog::info("[build] {}", line);
    } else {
      spdlog::debug("[build] {}", line);
    }
  };
  if (!engine_.BuildImage(config_.image, config_.dockerfile, config_.build_context, on_line)) {
    return false;
  }
  spdlog::info("Image {} built successfully", config_.image);
  return true;
}

bool Environment::EnsureEnvironment() {
  if (built_) return true;
  std::lock_guard lck(build_mtx_);
  if (built_) return true; // built by another thread while waiting
  auto exists = engine_.ImageExists(config_.image);
  if (!exists) return false;
  if (*exists) {
    spdlog::info("Image {} already exists, using cached", config_.image);
  } else if (!BuildImage()) {
    return false;
  }
  built_ = true;
  return true;
}

bool Environment::Cleanup() {
  std::lock_guard lck(build_mtx_);
  spdlog::info("Removing image {}", config_.image);
  if (!engine_.RemoveImage(config_.image)) return false;
  built_ = false;
  return true;
}

std::string Environment::GetCompileCommand(const std::string& language) const {
  auto lang = GetLanguage(language);
  if (!lang) return "";
  return fmt::format("{}", fmt::join(CompileCommand(*lang), " "));
}
