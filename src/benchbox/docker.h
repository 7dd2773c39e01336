#ifndef BENCHBOX_DOCKER_H_
#define BENCHBOX_DOCKER_H_

#include <benchbox/engine.h>

#include "process.h"

// ContainerEngine backed by the docker command line client.
class DockerCli : public ContainerEngine {
  std::string docker_;

  ProcessResult Docker(std::vector<std::string> args, long time_limit = kCommandTimeLimit,
                       bool merge_error = false) const;
 public:
  // us; for every command except build and wait
  static constexpr long kCommandTimeLimit = 60L * 1'000'000;
  static constexpr long kBuildTimeLimit = 30L * 60 * 1'000'000;

  explicit DockerCli(std::string docker = "docker") : docker_(std::move(docker)) {}

  std::optional<bool> ImageExists(const std::string& image) override;
  bool BuildImage(const std::string& image, const std::filesystem::path& dockerfile,
                  const std::filesystem::path& context,
                  const std::function<void(const std::string&)>& on_line) override;
  bool RemoveImage(const std::string& image) override;

  std::optional<std::string> StartContainer(const ContainerSpec&) override;
  WaitResult WaitContainer(const std::string& id, long timeout) override;
  bool KillContainer(const std::string& id) override;
  std::optional<std::string> ContainerLogs(const std::string& id) override;
  bool RemoveContainer(const std::string& id) override;

  // the argument list of `docker run`, without the client itself
  static std::vector<std::string> RunArguments(const ContainerSpec&);
};

#endif  // BENCHBOX_DOCKER_H_
