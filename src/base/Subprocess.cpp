#include "Subprocess.hpp"

#include "RawFdUtils.hpp"

extern char** environ;

namespace mcpv {
namespace {
std::once_flag ignoreSigpipeFlag;

void closeIfOpen(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

void closePair(int fds[2]) {
  closeIfOpen(&fds[0]);
  closeIfOpen(&fds[1]);
}

vector<string> buildEnvironment(const map<string, string>& envOverrides) {
  map<string, string> merged;
  for (char** entry = environ; entry && *entry; entry++) {
    string keyValue(*entry);
    auto equals = keyValue.find('=');
    if (equals == string::npos) {
      continue;
    }
    merged[keyValue.substr(0, equals)] = keyValue.substr(equals + 1);
  }
  for (const auto& it : envOverrides) {
    merged[it.first] = it.second;
  }
  vector<string> result;
  for (const auto& it : merged) {
    result.push_back(it.first + "=" + it.second);
  }
  return result;
}
}  // namespace

shared_ptr<Subprocess> Subprocess::spawn(
    const string& command, const vector<string>& args,
    const map<string, string>& envOverrides) {
  // A child that dies with a full pipe must not take us down with it
  std::call_once(ignoreSigpipeFlag, []() { ::signal(SIGPIPE, SIG_IGN); });

  int inPipe[2] = {-1, -1};
  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  int execPipe[2] = {-1, -1};
  if (::pipe(inPipe) == -1 || ::pipe(outPipe) == -1 ||
      ::pipe(errPipe) == -1 || ::pipe(execPipe) == -1) {
    int localErrno = GetErrno();
    closePair(inPipe);
    closePair(outPipe);
    closePair(errPipe);
    closePair(execPipe);
    throw SpawnError(string("Cannot create pipes for '") + command +
                     "': " + strerror(localErrno));
  }
  for (int* fds : {inPipe, outPipe, errPipe, execPipe}) {
    RawFdUtils::setCloseOnExec(fds[0]);
    RawFdUtils::setCloseOnExec(fds[1]);
  }

  // Everything the child needs is allocated before the fork
  vector<string> envStrings = buildEnvironment(envOverrides);
  vector<char*> envp;
  for (auto& s : envStrings) {
    envp.push_back(&s[0]);
  }
  envp.push_back(NULL);
  vector<string> argStrings;
  argStrings.push_back(command);
  argStrings.insert(argStrings.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& s : argStrings) {
    argv.push_back(&s[0]);
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == -1) {
    int localErrno = GetErrno();
    closePair(inPipe);
    closePair(outPipe);
    closePair(errPipe);
    closePair(execPipe);
    throw SpawnError(string("Cannot fork for '") + command +
                     "': " + strerror(localErrno));
  }

  if (pid == 0) {
    // child process: dup2 clears close-on-exec on the standard descriptors
    dup2(inPipe[0], STDIN_FILENO);
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    ::signal(SIGPIPE, SIG_DFL);
    environ = &envp[0];
    execvp(argv[0], &argv[0]);
    int execErrno = errno;
    ssize_t ignored = ::write(execPipe[1], &execErrno, sizeof(execErrno));
    (void)ignored;
    _exit(127);
  }

  // parent process
  closeIfOpen(&inPipe[0]);
  closeIfOpen(&outPipe[1]);
  closeIfOpen(&errPipe[1]);
  closeIfOpen(&execPipe[1]);

  int execErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(execPipe[0], &execErrno, sizeof(execErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  closeIfOpen(&execPipe[0]);

  if (rc == sizeof(execErrno)) {
    int throwaway;
    waitpid(pid, &throwaway, 0);
    closeIfOpen(&inPipe[1]);
    closeIfOpen(&outPipe[0]);
    closeIfOpen(&errPipe[0]);
    throw SpawnError(string("Failed to spawn '") + command +
                     "': " + strerror(execErrno));
  }

  RawFdUtils::setNonBlocking(inPipe[1]);
  RawFdUtils::setNonBlocking(outPipe[0]);
  RawFdUtils::setNonBlocking(errPipe[0]);
  VLOG(1) << "Spawned " << command << " as pid " << pid;
  return shared_ptr<Subprocess>(
      new Subprocess(pid, inPipe[1], outPipe[0], errPipe[0]));
}

Subprocess::Subprocess(pid_t _pid, int _stdinFd, int _stdoutFd,
                       int _stderrFd)
    : pid(_pid),
      stdinFd(_stdinFd),
      stdoutFd(_stdoutFd),
      stderrFd(_stderrFd),
      exited(false),
      exitStatus(0),
      stdinClosing(false) {}

Subprocess::~Subprocess() {
  {
    lock_guard<recursive_mutex> guard(processMutex);
    if (!exited) {
      VLOG(1) << "Killing leftover child " << pid;
      ::kill(pid, SIGKILL);
      int rc;
      do {
        rc = waitpid(pid, &exitStatus, 0);
      } while (rc == -1 && GetErrno() == EINTR);
      exited = true;
    }
  }
  closeStdin();
  closeOutputs();
}

void Subprocess::write(const string& data,
                       std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::timed_mutex> guard(writeMutex, deadline);
  if (!guard.owns_lock()) {
    throw WriteTimeoutError(
        "Child " + to_string(pid) + " stdin is busy with another message", 0);
  }
  if (stdinFd < 0 || stdinClosing) {
    throw std::runtime_error("Cannot write to child stdin: already closed");
  }
  size_t written = RawFdUtils::writeUntil(stdinFd, data.c_str(),
                                          data.length(), deadline,
                                          &stdinClosing);
  if (written == data.length()) {
    return;
  }
  if (stdinClosing) {
    throw std::runtime_error(
        "Cannot write to child stdin: closed while writing");
  }
  throw WriteTimeoutError("Child " + to_string(pid) + " accepted only " +
                              to_string(written) + " of " +
                              to_string(data.length()) + " bytes on stdin",
                          written);
}

void Subprocess::closeStdin() {
  stdinClosing = true;
  lock_guard<std::timed_mutex> guard(writeMutex);
  closeIfOpen(&stdinFd);
}

void Subprocess::closeOutputs() {
  closeIfOpen(&stdoutFd);
  closeIfOpen(&stderrFd);
}

bool Subprocess::poll() {
  lock_guard<recursive_mutex> guard(processMutex);
  if (exited) {
    return true;
  }
  int status;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == pid) {
    exited = true;
    exitStatus = status;
  } else if (rc == -1 && GetErrno() == ECHILD) {
    LOG(WARNING) << "Child " << pid << " was reaped elsewhere";
    exited = true;
    exitStatus = -1;
  }
  return exited;
}

bool Subprocess::waitForExit(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (poll()) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void Subprocess::sendSignal(int signum) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (exited) {
    return;
  }
  VLOG(1) << "Sending signal " << signum << " to " << pid;
  ::kill(pid, signum);
}

string Subprocess::describeExit() const {
  lock_guard<recursive_mutex> guard(processMutex);
  if (!exited) {
    return "still running";
  }
  if (exitStatus == -1) {
    return "exited with unknown status";
  }
  if (WIFEXITED(exitStatus)) {
    return string("exited with code ") + to_string(WEXITSTATUS(exitStatus));
  }
  if (WIFSIGNALED(exitStatus)) {
    return string("killed by signal ") + to_string(WTERMSIG(exitStatus));
  }
  return "exited";
}
}  // namespace mcpv
