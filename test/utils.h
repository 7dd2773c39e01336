#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <atomic>
#include <vector>
#include <stdexcept>

#include <gtest/gtest.h>
#include <benchbox/paths.h>
#include <benchbox/engine.h>

// scratch space of this test process; removed on teardown
fs::path TestRoot();
// a fresh empty directory below TestRoot()
fs::path MakeTestDir(const std::string& name);
// whether an executable is found in PATH
bool HasProgram(const std::string& name);

// ContainerEngine that records every call instead of talking to docker.
class FakeEngine : public ContainerEngine {
  mutable std::mutex mtx_;
  std::vector<std::string> calls_;

  void Record(const std::string& call) {
    std::lock_guard lck(mtx_);
    calls_.push_back(call);
  }
 public:
  static constexpr char kContainerId[] = "0123456789abcdef";

  // behavior
  std::optional<bool> image_exists;
  bool build_ok;
  long build_delay; // us, to widen race windows
  bool start_ok;
  WaitResult wait_result;
  bool throw_on_wait;
  std::optional<std::string> logs;

  // observations
  std::atomic_int build_count;
  ContainerSpec last_spec;
  std::map<std::string, std::string> workspace_files; // contents at start

  FakeEngine() :
      image_exists(false), build_ok(true), build_delay(0), start_ok(true),
      throw_on_wait(false), logs(""), build_count(0) {
    wait_result.status = WaitStatus::EXITED;
    wait_result.exit_code = 0;
  }

  std::vector<std::string> Calls() const {
    std::lock_guard lck(mtx_);
    return calls_;
  }
  // index of the first call named so, or -1
  int CallIndex(const std::string& call) const;

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
};

#endif // TEST_UTILS_H_
