#ifndef BENCHBOX_PROCESS_H_
#define BENCHBOX_PROCESS_H_

#include <string>
#include <vector>
#include <functional>
#include <filesystem>

struct ProcessOptions {
  std::vector<std::string> command; // argv; command[0] is looked up in PATH
  std::filesystem::path workdir; // empty to inherit
  long time_limit; // wall time, us; 0 for no limit
  long max_output; // bytes of stdout and stderr together; 0 for no limit
  bool merge_error; // deliver stderr through the stdout pipe
  // called for every complete stdout line (without '\n') as it arrives
  std::function<void(const std::string&)> on_output_line;

  ProcessOptions() : time_limit(0), max_output(0), merge_error(false) {}
};

struct ProcessResult {
  bool started; // false if fork/exec failed; see spawn_error
  bool timed_out; // killed because of time_limit
  bool output_exceeded; // killed because of max_output; output is truncated
  int exit_code; // -1 if killed by a signal
  int signal; // 0 if exited normally
  long elapsed; // us, from just before spawning to just after reaping
  std::string output, error;
  std::string spawn_error;

  ProcessResult() :
      started(false), timed_out(false), output_exceeded(false),
      exit_code(-1), signal(0),
      elapsed(0) {}
  bool Succeeded() const { return started && !timed_out && !output_exceeded && signal == 0 && exit_code == 0; }
};

// Run a command to completion, capturing its output.
// The child runs in its own process group, which is killed entirely on timeout.
ProcessResult RunProcess(const ProcessOptions&);

std::string CommandToString(const std::vector<std::string>&);

#endif  // BENCHBOX_PROCESS_H_
