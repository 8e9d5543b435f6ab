#include "DaemonCreator.hpp"

namespace relay {
void DaemonCreator::daemonize(const string& pidFile) {
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  FATAL_FAIL(setsid());
  signal(SIGHUP, SIG_IGN);

  pid = fork();
  FATAL_FAIL(pid);
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (!pidFile.empty()) {
    writePidFile(pidFile);
  }

  FATAL_FAIL(chdir("/"));

  int nullOut = open("/dev/null", O_WRONLY);
  FATAL_FAIL(nullOut);
  FATAL_FAIL(dup2(nullOut, STDOUT_FILENO));
  FATAL_FAIL(dup2(nullOut, STDERR_FILENO));
  int nullIn = open("/dev/null", O_RDONLY);
  FATAL_FAIL(nullIn);
  FATAL_FAIL(dup2(nullIn, STDIN_FILENO));
}

void DaemonCreator::writePidFile(const string& pidFile) {
  int fd = open(pidFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd == -1) {
    STFATAL << "Error opening pidfile for writing: " << pidFile;
  }
  string pidString = to_string(getpid()) + "\n";
  FATAL_FAIL(::write(fd, pidString.c_str(), pidString.length()));
  ::close(fd);
}
}  // namespace relay
