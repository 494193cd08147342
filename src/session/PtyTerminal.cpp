#include "PtyTerminal.hpp"

namespace tt {
namespace {
int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
}  // namespace

PtyTerminal::PtyTerminal(const string &_program, const vector<string> &_args)
    : program(_program), args(_args), masterFd(-1), childPid(-1) {}

PtyTerminal::~PtyTerminal() { cleanup(); }

int PtyTerminal::start(const TerminalGeometry &geometry) {
  winsize tmpwin = geometry.toWinsize();
  pid_t pid = forkpty(&masterFd, NULL, NULL, &tmpwin);
  switch (pid) {
    case -1:
      throw std::runtime_error(string("forkpty failed: ") +
                               strerror(GetErrno()));
    case 0:
      runTerminal();
      ::_exit(127);
    default:
      break;
  }
  childPid = pid;
  VLOG(1) << "pty opened " << masterFd << " for " << program << " (pid "
          << childPid << ")";
  try {
    SetNonBlocking(masterFd);
  } catch (const std::runtime_error &) {
    terminate(0);
    cleanup();
    throw;
  }
  return masterFd;
}

void PtyTerminal::runTerminal() {
  passwd *pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL && chdir(pwd->pw_dir) == -1) {
    fprintf(stderr, "Could not enter %s: %s\n", pwd->pw_dir,
            strerror(GetErrno()));
  }
  setenv("TILETERM_VERSION", TT_VERSION, 1);
  setenv("TERM", "xterm-256color", 0);
  // Shells remember the SIGCHLD disposition they were started with, reset it
  // so children of the shell can wait() normally.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGHUP, SIG_DFL);

  vector<char *> argv;
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const string &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(NULL);
  execvp(program.c_str(), argv.data());
  // Only reached when exec failed; the parent sees EOF and exit code 127
  fprintf(stderr, "Could not launch %s: %s\n", program.c_str(),
          strerror(GetErrno()));
}

void PtyTerminal::setGeometry(const TerminalGeometry &geometry) {
  if (masterFd < 0) {
    return;
  }
  winsize tmpwin = geometry.toWinsize();
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    LOG(WARNING) << "Could not resize pty " << masterFd << ": "
                 << strerror(GetErrno());
  }
}

int PtyTerminal::reap(int options) {
  if (exitCode) {
    return *exitCode;
  }
  if (childPid <= 0) {
    exitCode = -1;
    return *exitCode;
  }
  int status = 0;
  pid_t rc = waitpid(childPid, &status, options);
  if (rc == childPid) {
    exitCode = decodeWaitStatus(status);
    VLOG(1) << "Reaped pid " << childPid << " with exit code " << *exitCode;
    return *exitCode;
  }
  if (rc == -1 && GetErrno() == ECHILD) {
    // Someone else already reaped the child
    exitCode = -1;
    return *exitCode;
  }
  if (rc == -1 && GetErrno() != EINTR) {
    STERROR << "waitpid failed: " << strerror(GetErrno());
    exitCode = -1;
    return *exitCode;
  }
  return -1;
}

bool PtyTerminal::waitForExit(int ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (true) {
    reap(WNOHANG);
    if (exitCode) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

int PtyTerminal::handleSessionEnd() {
  if (childPid <= 0 || waitForExit(SESSION_END_GRACE_MS)) {
    return reap(WNOHANG);
  }
  LOG(INFO) << "pid " << childPid
            << " closed its terminal but is still running";
  return terminate(SESSION_END_GRACE_MS);
}

int PtyTerminal::terminate(int graceMs) {
  if (exitCode || childPid <= 0) {
    return reap(WNOHANG);
  }
  kill(childPid, SIGHUP);
  if (!waitForExit(graceMs)) {
    LOG(INFO) << "pid " << childPid << " ignored SIGHUP, killing it";
    kill(childPid, SIGKILL);
    while (!exitCode) {
      reap(0);
    }
  }
  return *exitCode;
}

void PtyTerminal::cleanup() {
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

PtyTerminalFactory::PtyTerminalFactory(const TileTermConfig &config)
    : shell(config.shell) {
  if (config.loginShell) {
    shellArgs.push_back("-l");
  }
}

shared_ptr<PseudoTerminal> PtyTerminalFactory::create() {
  return shared_ptr<PseudoTerminal>(new PtyTerminal(shell, shellArgs));
}
}  // namespace tt
