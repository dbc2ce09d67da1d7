#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace gambit {

// A child process with its stdin and stdout connected to pipes. Construction
// launches it; destruction closes the pipes and reaps it, killing it if it
// does not exit within a short grace period.
class Process {
public:
  enum class ReadStatus { Line, Timeout, Eof };

  using Clock = std::chrono::steady_clock;

  // argv[0] is resolved through PATH. Throws std::system_error when the pipes
  // cannot be created, the fork fails, or the program cannot be executed.
  explicit Process(const std::vector<std::string>& argv);
  ~Process();

  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  Process(Process&&) = delete;
  Process& operator=(Process&&) = delete;

  // Writes `line` followed by '\n'. Throws std::system_error if the child has
  // closed its end of the pipe.
  void write_line(std::string_view line);

  // Reads one line (without the trailing newline) into `line`, waiting no
  // later than `deadline`. A line longer than `max_line` comes back in
  // `max_line` sized pieces.
  ReadStatus read_line(std::string& line, Clock::time_point deadline,
                       std::size_t max_line = DEFAULT_MAX_LINE);

  [[nodiscard]] bool running();
  [[nodiscard]] pid_t pid() const { return pid_; }

  // Sends SIGKILL and reaps the child.
  void kill();

  // Closes the child's stdin and waits up to `grace` for it to exit before
  // killing it.
  void shutdown(std::chrono::milliseconds grace);

  inline static constexpr std::size_t DEFAULT_MAX_LINE = 64 * 1024;

private:
  void close_stdin();
  bool reap(bool block);

  pid_t pid_{-1};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  bool exited_{false};
  bool eof_{false};
  std::string buffer_;
};

} // namespace gambit
