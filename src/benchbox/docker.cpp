#include "docker.h"

#include <cerrno>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

inline bool IsNoSuchObject(const ProcessResult& res) {
  return ToLower(res.error).find("no such") != std::string::npos;
}

inline std::string ErrorText(const ProcessResult& res) {
  if (!res.started) return res.spawn_error;
  if (res.timed_out) return "timed out";
  std::string err = Trim(res.error);
  if (err.empty()) err = "exited with status " + std::to_string(res.exit_code);
  return err;
}

} // namespace

const char* WaitStatusName(WaitStatus status) {
  switch (status) {
#define X(name) case WaitStatus::name: return #name;
    ENUM_WAIT_STATUS_
#undef X
  }
  __builtin_unreachable();
}

ProcessResult DockerCli::Docker(std::vector<std::string> args, long time_limit, bool merge_error) const {
  ProcessOptions opt;
  opt.command = std::move(args);
  opt.command.insert(opt.command.begin(), docker_);
  opt.time_limit = time_limit;
  opt.merge_error = merge_error;
  return RunProcess(opt);
}

std::optional<bool> DockerCli::ImageExists(const std::string& image) {
  auto res = Docker({"image", "inspect", "--format", "{{.Id}}", image});
  if (res.Succeeded()) {
    spdlog::debug("Image {} exists: {}", image, Trim(res.output));
    return true;
  }
  if (res.started && !res.timed_out && IsNoSuchObject(res)) return false;
  spdlog::error("Failed to inspect image {}: {}", image, ErrorText(res));
  return std::nullopt;
}

bool DockerCli::BuildImage(const std::string& image, const std::filesystem::path& dockerfile,
                           const std::filesystem::path& context,
                           const std::function<void(const std::string&)>& on_line) {
  ProcessOptions opt;
  opt.command = {docker_, "build", "--rm", "--force-rm", "--pull",
                 "-t", image, "-f", dockerfile.string(), context.string()};
  opt.time_limit = kBuildTimeLimit;
  opt.merge_error = true; // BuildKit reports progress on stderr
  opt.on_output_line = on_line;
  auto res = RunProcess(opt);
  if (!res.Succeeded()) {
    spdlog::error("Failed to build image {}: {}", image,
                  res.started && !res.timed_out ? "exited with status " + std::to_string(res.exit_code)
                                                : ErrorText(res));
    return false;
  }
  return true;
}

bool DockerCli::RemoveImage(const std::string& image) {
  auto res = Docker({"image", "rm", "-f", image});
  if (res.Succeeded()) return true;
  if (res.started && !res.timed_out && IsNoSuchObject(res)) {
    spdlog::info("Image {} not found, nothing to remove", image);
    return true;
  }
  spdlog::warn("Failed to remove image {}: {}", image, ErrorText(res));
  return false;
}

std::vector<std::string> DockerCli::RunArguments(const ContainerSpec& spec) {
  std::vector<std::string> args = {"run", "--detach", "--label", "benchbox=1"};
  if (!spec.network) args.insert(args.end(), {"--network", "none"});
  if (spec.memory > 0) {
    // equal swap limit: no swap at all
    args.insert(args.end(), {"--memory", std::to_string(spec.memory),
                             "--memory-swap", std::to_string(spec.memory)});
  }
  if (spec.cpu_period > 0 && spec.cpu_quota > 0) {
    args.insert(args.end(), {"--cpu-period", std::to_string(spec.cpu_period),
                             "--cpu-quota", std::to_string(spec.cpu_quota)});
  }
  if (spec.pids_limit > 0) args.insert(args.end(), {"--pids-limit", std::to_string(spec.pids_limit)});
  if (!spec.user.empty()) args.insert(args.end(), {"--user", spec.user});
  if (!spec.host_dir.empty()) {
    args.insert(args.end(), {"--volume", spec.host_dir + ':' + spec.container_dir + ":rw"});
  }
  args.push_back(spec.image);
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

std::optional<std::string> DockerCli::StartContainer(const ContainerSpec& spec) {
  auto res = Docker(RunArguments(spec));
  std::string id = Trim(res.output);
  if (!res.Succeeded() || id.empty()) {
    spdlog::error("Failed to start container from {}: {}", spec.image, ErrorText(res));
    // `docker run -d` may have created the container before failing to start it
    if (!id.empty()) RemoveContainer(id);
    return std::nullopt;
  }
  spdlog::info("Container {} started", id.substr(0, 12));
  return id;
}

WaitResult DockerCli::WaitContainer(const std::string& id, long timeout) {
  WaitResult ret;
  auto res = Docker({"wait", id}, timeout);
  if (res.timed_out) {
    ret.status = WaitStatus::TIMEOUT;
    return ret;
  }
  if (!res.Succeeded()) {
    ret.message = ErrorText(res);
    return ret;
  }
  std::string str = Trim(res.output);
  char* end = nullptr;
  errno = 0;
  long code = strtol(str.c_str(), &end, 10);
  if (str.empty() || *end || errno) {
    ret.message = "unexpected output of docker wait: " + str;
    return ret;
  }
  ret.status = WaitStatus::EXITED;
  ret.exit_code = code;
  return ret;
}

bool DockerCli::KillContainer(const std::string& id) {
  auto res = Docker({"kill", id});
  if (!res.Succeeded()) {
    spdlog::warn("Failed to kill container {}: {}", id.substr(0, 12), ErrorText(res));
    return false;
  }
  return true;
}

std::optional<std::string> DockerCli::ContainerLogs(const std::string& id) {
  auto res = Docker({"logs", id}, kCommandTimeLimit, true);
  if (!res.Succeeded()) {
    spdlog::warn("Failed to read logs of container {}: {}", id.substr(0, 12), ErrorText(res));
    return std::nullopt;
  }
  return std::move(res.output);
}

bool DockerCli::RemoveContainer(const std::string& id) {
  auto res = Docker({"rm", "--force", id});
  if (!res.Succeeded()) {
    if (res.started && !res.timed_out && IsNoSuchObject(res)) return true;
    spdlog::warn("Failed to remove container {}: {}", id.substr(0, 12), ErrorText(res));
    return false;
  }
  spdlog::debug("Container {} removed", id.substr(0, 12));
  return true;
}
