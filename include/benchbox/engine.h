#ifndef INCLUDE_BENCHBOX_ENGINE_H_
#define INCLUDE_BENCHBOX_ENGINE_H_

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

struct ContainerSpec {
  std::string image;
  std::vector<std::string> command;
  // read-write bind mount
  std::string host_dir, container_dir;
  std::string user; // "uid:gid"; empty for the image default
  long memory; // bytes; swap is disabled
  long cpu_period, cpu_quota; // us
  int pids_limit;
  bool network;

  ContainerSpec() :
      memory(0),
      cpu_period(0), cpu_quota(0),
      pids_limit(0),
      network(false) {}
};

#define ENUM_WAIT_STATUS_ \
  X(EXITED) \
  X(TIMEOUT) \
  X(FAILED)
enum class WaitStatus {
#define X(name) name,
  ENUM_WAIT_STATUS_
#undef X
};

struct WaitResult {
  WaitStatus status;
  int exit_code; // valid if EXITED
  std::string message; // valid if FAILED
  WaitResult() : status(WaitStatus::FAILED), exit_code(-1) {}
};

// Container runtime used by Environment and Orchestrator.
// None of these should throw; failures are reported by return values.
class ContainerEngine {
 public:
  virtual ~ContainerEngine() = default;

  // nullopt if the engine itself cannot be queried
  virtual std::optional<bool> ImageExists(const std::string& image) = 0;
  // on_line receives the build output line by line
  virtual bool BuildImage(const std::string& image, const std::filesystem::path& dockerfile,
                          const std::filesystem::path& context,
                          const std::function<void(const std::string&)>& on_line) = 0;
  // removing an absent image succeeds
  virtual bool RemoveImage(const std::string& image) = 0;

  // returns container id
  virtual std::optional<std::string> StartContainer(const ContainerSpec&) = 0;
  // timeout: us; the container is left running on TIMEOUT
  virtual WaitResult WaitContainer(const std::string& id, long timeout) = 0;
  virtual bool KillContainer(const std::string& id) = 0;
  // stdout and stderr combined, in order
  virtual std::optional<std::string> ContainerLogs(const std::string& id) = 0;
  // forced; stops the container if still running
  virtual bool RemoveContainer(const std::string& id) = 0;
};

const char* WaitStatusName(WaitStatus);

#endif  // INCLUDE_BENCHBOX_ENGINE_H_
