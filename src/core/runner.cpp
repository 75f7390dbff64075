// core/runner.cpp - fork/exec process runner
#include "runner.hpp"
#include "../utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace converge {

namespace {

constexpr int EXEC_FAILED_CODE = 127;

std::vector<char *> build_argv(const std::string &cmd,
                               const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(cmd.c_str()));
  for (const auto &a : args) {
    argv.push_back(const_cast<char *>(a.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

int wait_for(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

void set_cloexec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  if (flags >= 0)
    fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

} // namespace

std::string format_command(const std::string &cmd,
                           const std::vector<std::string> &args) {
  std::string out = cmd;
  for (const auto &a : args) {
    out += " ";
    out += a.find(' ') != std::string::npos ? "'" + a + "'" : a;
  }
  return out;
}

CommandOutput ProcessRunner::run(const std::string &cmd,
                                 const std::vector<std::string> &args) {
  CommandOutput result;
  LOG_DEBUG("exec: " + format_command(cmd, args));

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  // Closed on successful exec; receives errno when exec fails
  int exec_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
    result.stderr_text = std::string("pipe failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return result;
  }
  set_cloexec(exec_pipe[1]);

  std::vector<char *> argv = build_argv(cmd, args);

  pid_t pid = fork();
  if (pid < 0) {
    result.stderr_text = std::string("fork failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return result;
  }

  if (pid == 0) {
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    close(exec_pipe[0]);

    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(EXEC_FAILED_CODE);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // Drain both pipes to EOF before reaping the child
  struct pollfd fds[2];
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  std::string *sinks[2] = {&result.stdout_text, &result.stderr_text};
  int open_count = 2;
  char buf[4096];

  while (open_count > 0) {
    int rc = poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        close(fds[i].fd);
        fds[i].fd = -1;
        open_count--;
      }
    }
  }
  for (auto &pfd : fds) {
    if (pfd.fd >= 0)
      close(pfd.fd);
  }

  int exec_errno = 0;
  ssize_t got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  close_fd(exec_pipe[0]);

  result.exit_code = wait_for(pid);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.spawn_failed = true;
    result.exit_code = EXEC_FAILED_CODE;
    result.stderr_text = cmd + ": " + std::strerror(exec_errno);
  }

  LOG_DEBUG("exit " + std::to_string(result.exit_code) + ": " + cmd);
  return result;
}

int ProcessRunner::run_interactive(const std::string &cmd,
                                   const std::vector<std::string> &args) {
  LOG_DEBUG("exec (interactive): " + format_command(cmd, args));
  std::vector<char *> argv = build_argv(cmd, args);

  pid_t pid = fork();
  if (pid < 0) {
    LOG_ERROR("fork failed: " + std::string(std::strerror(errno)));
    return -1;
  }
  if (pid == 0) {
    execvp(argv[0], argv.data());
    _exit(EXEC_FAILED_CODE);
  }
  return wait_for(pid);
}

} // namespace converge
