#include "scheduler_query.h"

#include <cerrno>
#include <csignal>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// 50 ms between reaping attempts once stdout is closed
#define WAIT_POLL_NSEC 50000000L

static std::string join_argv(const command_argv_t &argv) {
  std::string cmd;
  for (const auto &arg : argv) {
    if (cmd.size()) {
      cmd += " ";
    }
    cmd += arg;
  }
  return cmd;
}

static inline time_t monotonic_now() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return ts.tv_sec;
}

bool subprocess_query_t::run(const command_argv_t &argv, int timeout,
                             query_result_t &result) {
  #define OP "(scheduler_query)"
  result = query_result_t();
  if (argv.empty()) {
    fputs("error" OP ": empty command\n", stderr);
    return false;
  }
  int fds[2];
  if (pipe(fds)) {
    perror("pipe" OP);
    return false;
  }
  SJOB_DEBUG("exec: %s\n", join_argv(argv).c_str());
  pid_t child = fork();
  if (child < 0) {
    perror("fork" OP);
    close(fds[0]);
    close(fds[1]);
    return false;
  }
  if (!child) {
    close(fds[0]);
    if (dup2(fds[1], STDOUT_FILENO) < 0) {
      _exit(127);
    }
    close(fds[1]);
    std::vector<char *> args;
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(NULL);
    execvp(args[0], args.data());
    fprintf(stderr, "execvp(%s): %s\n", args[0], strerror(errno));
    _exit(127);
  }
  close(fds[1]);

  const time_t deadline = monotonic_now() + timeout;
  char buf[READ_BUF_SIZE];
  struct pollfd pfd = {fds[0], POLLIN, 0};
  while (true) {
    int wait_ms = -1;
    if (timeout) {
      const time_t left = deadline - monotonic_now();
      if (left <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = left > 3600 ? 3600 * 1000 : (int) left * 1000;
    }
    const int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      perror("poll" OP);
      break;
    }
    if (!ready) {
      continue;
    }
    const ssize_t len = read(fds[0], buf, sizeof(buf));
    if (len < 0) {
      if (errno == EINTR) {
        continue;
      }
      perror("read" OP);
      break;
    }
    if (!len) {
      break;
    }
    result.output.append(buf, len);
  }
  close(fds[0]);

  // stdout may close long before the command exits; the deadline still holds
  int wstatus;
  while (!result.timed_out && timeout) {
    const pid_t pid = waitpid(child, &wstatus, WNOHANG);
    if (pid == child) {
      break;
    }
    if (pid < 0 && errno != EINTR) {
      perror("waitpid" OP);
      kill(child, SIGKILL);
      waitpid(child, &wstatus, 0);
      return false;
    }
    if (deadline - monotonic_now() <= 0) {
      result.timed_out = true;
      break;
    }
    const struct timespec pause = {0, WAIT_POLL_NSEC};
    nanosleep(&pause, NULL);
  }
  if (result.timed_out) {
    fprintf(stderr, "error" OP ": %s timed out after %d secs\n",
            argv[0].c_str(), timeout);
    kill(child, SIGKILL);
  }
  if (result.timed_out || !timeout) {
    while (waitpid(child, &wstatus, 0) < 0) {
      if (errno != EINTR) {
        perror("waitpid" OP);
        return false;
      }
    }
  }
  if (WIFEXITED(wstatus)) {
    result.exit_status = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus) && !result.timed_out) {
    fprintf(stderr, "error" OP ": %s killed by signal %d\n",
            argv[0].c_str(), WTERMSIG(wstatus));
  }
  if (result.timed_out) {
    return false;
  }
  if (result.exit_status) {
    fprintf(stderr, "error" OP ": %s exited with status %d\n",
            argv[0].c_str(), result.exit_status);
    return false;
  }
  return true;
  #undef OP
}

bool query_output(scheduler_query_t &query, const command_argv_t &argv,
                  int timeout, std::string &output) {
  query_result_t result;
  if (!query.run(argv, timeout, result)) {
    fprintf(stderr, "error: `%s` failed, continuing without its output\n",
            join_argv(argv).c_str());
    output.clear();
    return false;
  }
  output.swap(result.output);
  return true;
}
