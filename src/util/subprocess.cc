// util/subprocess.cc

// Copyright 2026  The speechseg Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include "util/subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>

#include "util/parse-options.h"

namespace speechseg {

// Keep at most this much of a command's stderr.
static const size_t kMaxStderrBytes = 4096;

std::string CommandToString(const std::vector<std::string> &argv) {
  std::string ans;
  for (size_t i = 0; i < argv.size(); i++) {
    if (i > 0) ans += ' ';
    ans += ParseOptions::Escape(argv[i]);
  }
  return ans;
}

bool RunCommand(const std::vector<std::string> &argv, CommandResult *result) {
  SPEECHSEG_ASSERT(!argv.empty() && result != NULL);
  *result = CommandResult();

  // Everything the child needs is prepared before fork(), so that the child
  // only makes async-signal-safe calls.
  std::vector<char*> c_argv;
  for (size_t i = 0; i < argv.size(); i++)
    c_argv.push_back(const_cast<char*>(argv[i].c_str()));
  c_argv.push_back(NULL);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    SPEECHSEG_WARN << "pipe() failed: " << strerror(errno);
    return false;
  }

  pid_t pid = fork();
  if (pid < 0) {
    SPEECHSEG_WARN << "fork() failed: " << strerror(errno);
    close(fds[0]);
    close(fds[1]);
    return false;
  }
  if (pid == 0) {
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      dup2(null_fd, STDOUT_FILENO);
    }
    dup2(fds[1], STDERR_FILENO);
    execvp(c_argv[0], &c_argv[0]);
    const char msg[] = "exec failed\n";
    ssize_t unused = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)unused;
    _exit(127);
  }

  close(fds[1]);
  char buf[1024];
  while (true) {
    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      result->stderr_tail.append(buf, n);
      if (result->stderr_tail.size() > 2 * kMaxStderrBytes)
        result->stderr_tail.erase(
            0, result->stderr_tail.size() - kMaxStderrBytes);
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close(fds[0]);
  if (result->stderr_tail.size() > kMaxStderrBytes)
    result->stderr_tail.erase(0, result->stderr_tail.size() - kMaxStderrBytes);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      SPEECHSEG_WARN << "waitpid() failed for " << argv[0] << ": "
                     << strerror(errno);
      return false;
    }
  }
  if (WIFEXITED(status)) {
    result->exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result->term_signal = WTERMSIG(status);
  }
  SPEECHSEG_VLOG(3) << "Command " << CommandToString(argv) << " exited with "
                    << "status " << result->exit_status;
  return result->Succeeded();
}

}  // namespace speechseg
