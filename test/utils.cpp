#include "utils.h"

#include <unistd.h>
#include <thread>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>

fs::path TestRoot() {
  return fs::temp_directory_path() / ("benchbox-test-" + std::to_string(getpid()));
}

fs::path MakeTestDir(const std::string& name) {
  fs::path path = TestRoot() / name;
  fs::remove_all(path);
  fs::create_directories(path);
  return path;
}

bool HasProgram(const std::string& name) {
  const char* env = getenv("PATH");
  std::istringstream sin(env ? env : "/usr/bin:/bin");
  for (std::string dir; std::getline(sin, dir, ':');) {
    if (dir.empty()) continue;
    if (access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}

int FakeEngine::CallIndex(const std::string& call) const {
  auto calls = Calls();
  for (size_t i = 0; i < calls.size(); i++) {
    if (calls[i] == call) return i;
  }
  return -1;
}

std::optional<bool> FakeEngine::ImageExists(const std::string&) {
  Record("ImageExists");
  std::lock_guard lck(mtx_);
  return image_exists;
}

bool FakeEngine::BuildImage(const std::string& image, const std::filesystem::path&,
                            const std::filesystem::path&,
                            const std::function<void(const std::string&)>& on_line) {
  Record("BuildImage");
  build_count++;
  if (build_delay) std::this_thread::sleep_for(std::chrono::microseconds(build_delay));
  if (on_line) {
    on_line("Step 1/2 : FROM ubuntu:22.04");
    on_line(build_ok ? "Successfully tagged " + image : "ERROR: failed to solve");
  }
  if (build_ok) {
    std::lock_guard lck(mtx_);
    image_exists = true;
  }
  return build_ok;
}

bool FakeEngine::RemoveImage(const std::string&) {
  Record("RemoveImage");
  std::lock_guard lck(mtx_);
  image_exists = false;
  return true;
}

std::optional<std::string> FakeEngine::StartContainer(const ContainerSpec& spec) {
  Record("StartContainer");
  last_spec = spec;
  workspace_files.clear();
  for (auto& entry : fs::directory_iterator(spec.host_dir)) {
    std::ifstream fin(entry.path());
    std::stringstream buf;
    buf << fin.rdbuf();
    workspace_files[entry.path().filename().string()] = buf.str();
  }
  if (!start_ok) return std::nullopt;
  return kContainerId;
}

WaitResult FakeEngine::WaitContainer(const std::string&, long) {
  Record("WaitContainer");
  if (throw_on_wait) throw std::runtime_error("connection reset");
  return wait_result;
}

bool FakeEngine::KillContainer(const std::string&) {
  Record("KillContainer");
  return true;
}

std::optional<std::string> FakeEngine::ContainerLogs(const std::string&) {
  Record("ContainerLogs");
  return logs;
}

bool FakeEngine::RemoveContainer(const std::string&) {
  Record("RemoveContainer");
  return true;
}
