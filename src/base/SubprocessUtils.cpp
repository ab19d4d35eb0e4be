#include "SubprocessUtils.hpp"

#include "UnixProcessHandle.hpp"

namespace adbfwd {
namespace {
void closeBoth(int fds[2]) {
  ::close(fds[0]);
  ::close(fds[1]);
}

/**
 * Forks and execs `command` with stdout and stderr connected to a pipe. The
 * read end of that pipe is returned in `outputFd`. A second, close-on-exec
 * pipe reports exec failures back to the parent so that a missing binary is
 * a spawn failure rather than an empty stream.
 */
pid_t forkExec(const string& command, const vector<string>& args,
               int* outputFd) {
  int outputPipe[2];
  int execErrorPipe[2];
  if (::pipe(outputPipe) == -1) {
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             string("pipe: ") + strerror(GetErrno()));
  }
  if (::pipe(execErrorPipe) == -1) {
    int localErrno = GetErrno();
    closeBoth(outputPipe);
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             string("pipe: ") + strerror(localErrno));
  }
  FATAL_FAIL(::fcntl(outputPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(execErrorPipe[1], F_SETFD, FD_CLOEXEC));

  // Built before forking: the child may only make async-signal-safe calls.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == -1) {
    int localErrno = GetErrno();
    closeBoth(outputPipe);
    closeBoth(execErrorPipe);
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             string("fork: ") + strerror(localErrno));
  }
  if (pid == 0) {
    // child process
    ::setpgid(0, 0);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull != -1) {
      ::dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }
    ::dup2(outputPipe[1], STDOUT_FILENO);
    ::dup2(outputPipe[1], STDERR_FILENO);
    ::close(outputPipe[0]);
    ::close(outputPipe[1]);
    ::close(execErrorPipe[0]);
    ::execvp(command.c_str(), &argv[0]);

    int execErrno = errno;
    ssize_t written = ::write(execErrorPipe[1], &execErrno, sizeof(execErrno));
    (void)written;
    ::_exit(127);
  }

  // parent process
  ::setpgid(pid, pid);
  ::close(outputPipe[1]);
  ::close(execErrorPipe[1]);
  int execErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(execErrorPipe[0], &execErrno, sizeof(execErrno));
  } while (bytesRead == -1 && GetErrno() == EINTR);
  ::close(execErrorPipe[0]);
  if (bytesRead > 0) {
    ::close(outputPipe[0]);
    ::waitpid(pid, NULL, 0);
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             "Could not execute " +
                                 describeCommand(command, args) + ": " +
                                 strerror(execErrno));
  }
  *outputFd = outputPipe[0];
  return pid;
}
}  // namespace

string describeCommand(const string& command, const vector<string>& args) {
  string retval = command;
  for (auto& arg : args) {
    retval += " ";
    if (arg.find(' ') != string::npos || arg.empty()) {
      retval += "'" + arg + "'";
    } else {
      retval += arg;
    }
  }
  return retval;
}

string SubprocessUtils::subprocessToString(const string& command,
                                           const vector<string>& args,
                                           int* exitStatus) {
  int outputFd = -1;
  pid_t pid = forkExec(command, args, &outputFd);
  VLOG(1) << "Running (pid " << pid << "): " << describeCommand(command, args);

  char buf[4096];
  string output;
  while (true) {
    ssize_t nbytes = ::read(outputFd, buf, sizeof(buf));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    output += string(buf, nbytes);
  }
  ::close(outputFd);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      STERROR << "waitpid failed for " << pid << ": " << strerror(GetErrno());
      break;
    }
  }
  if (exitStatus) {
    if (WIFEXITED(status)) {
      *exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      *exitStatus = 128 + WTERMSIG(status);
    } else {
      *exitStatus = -1;
    }
  }
  return output;
}

shared_ptr<ProcessHandle> SubprocessUtils::spawn(const string& command,
                                                 const vector<string>& args) {
  int outputFd = -1;
  string description = describeCommand(command, args);
  pid_t pid = forkExec(command, args, &outputFd);
  LOG(INFO) << "Started pid " << pid << ": " << description;
  return shared_ptr<ProcessHandle>(
      new UnixProcessHandle(pid, outputFd, description));
}
}  // namespace adbfwd
