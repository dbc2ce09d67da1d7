#include "gambit/process.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gambit {

namespace {

std::once_flag g_sigpipe_once;

// A dead child must surface as EPIPE from write(), not as a signal that
// terminates the service.
void ignore_sigpipe() {
  std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void throw_errno(int err, const std::string& what) {
  throw std::system_error(err, std::generic_category(), what);
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end{-1};
  int write_end{-1};

  Pipe() = default;
  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  void open() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw_errno(errno, "pipe2");
    }
    read_end = fds[0];
    write_end = fds[1];
  }

  int release_read() noexcept {
    const int fd = read_end;
    read_end = -1;
    return fd;
  }

  int release_write() noexcept {
    const int fd = write_end;
    write_end = -1;
    return fd;
  }
};

} // namespace

Process::Process(const std::vector<std::string>& argv) {
  if (argv.empty() || argv[0].empty()) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            "empty process command line");
  }

  ignore_sigpipe();

  Pipe to_child;
  Pipe from_child;
  Pipe exec_status;
  to_child.open();
  from_child.open();
  exec_status.open();

  // Built before fork: the child may only call async-signal-safe functions.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw_errno(errno, "fork");
  }

  if (pid == 0) {
    // Blocked signals and ignored dispositions survive exec.
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    ::dup2(to_child.read_end, STDIN_FILENO);
    ::dup2(from_child.write_end, STDOUT_FILENO);
    ::execvp(args[0], args.data());

    const int err = errno;
    [[maybe_unused]] const auto written = ::write(exec_status.write_end, &err, sizeof(err));
    ::_exit(127);
  }

  pid_ = pid;
  close_fd(exec_status.write_end);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    reap(true);
    throw_errno(exec_errno, "exec " + argv[0]);
  }

  stdin_fd_ = to_child.release_write();
  stdout_fd_ = from_child.release_read();
}

Process::~Process() {
  shutdown(std::chrono::milliseconds{200});
  close_fd(stdout_fd_);
}

void Process::write_line(std::string_view line) {
  if (stdin_fd_ < 0) {
    throw_errno(EPIPE, "write to closed stdin");
  }

  std::string data(line);
  data.push_back('\n');

  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno(errno, "write to child stdin");
    }
    offset += static_cast<std::size_t>(n);
  }
}

Process::ReadStatus Process::read_line(std::string& line, Clock::time_point deadline,
                                       std::size_t max_line) {
  for (;;) {
    if (const auto pos = buffer_.find('\n'); pos != std::string::npos) {
      line.assign(buffer_, 0, pos);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      buffer_.erase(0, pos + 1);
      return ReadStatus::Line;
    }

    if (buffer_.size() >= max_line) {
      line.assign(buffer_, 0, max_line);
      buffer_.erase(0, max_line);
      return ReadStatus::Line;
    }

    if (eof_) {
      if (!buffer_.empty()) {
        line = std::move(buffer_);
        buffer_.clear();
        return ReadStatus::Line;
      }
      return ReadStatus::Eof;
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      return ReadStatus::Timeout;
    }

    const auto remaining =
        std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();

    pollfd pfd{.fd = stdout_fd_, .events = POLLIN, .revents = 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno(errno, "poll child stdout");
    }
    if (rc == 0) {
      continue;
    }

    char chunk[4096];
    const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw_errno(errno, "read child stdout");
    }

    if (n == 0) {
      eof_ = true;
    } else {
      buffer_.append(chunk, static_cast<std::size_t>(n));
    }
  }
}

bool Process::running() {
  return !reap(false);
}

void Process::kill() {
  if (!exited_ && pid_ > 0) {
    ::kill(pid_, SIGKILL);
    reap(true);
  }
}

void Process::shutdown(std::chrono::milliseconds grace) {
  close_stdin();

  const auto deadline = Clock::now() + grace;
  while (!reap(false) && Clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }

  kill();
}

void Process::close_stdin() {
  close_fd(stdin_fd_);
}

bool Process::reap(bool block) {
  if (exited_ || pid_ <= 0) {
    return true;
  }

  int status = 0;
  pid_t rc = 0;
  do {
    rc = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
    exited_ = true;
  }

  return exited_;
}

} // namespace gambit
