#include "RawFdUtils.hpp"

namespace mcpv {
size_t RawFdUtils::writeUntil(int fd, const char* buf, size_t count,
                              std::chrono::steady_clock::time_point deadline,
                              const std::atomic<bool>* abort) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeUntil");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc > 0) {
      bytesWritten += rc;
      continue;
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to pipe: pipe closed");
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      LOG(ERROR) << "Cannot write to pipe: " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to pipe: ") +
                               strerror(localErrno));
    }

    // The pipe is full: wait for the reader, but never past the deadline
    auto now = std::chrono::steady_clock::now();
    if ((abort && *abort) || now >= deadline) {
      break;
    }
    auto wait = std::min(
        std::chrono::duration_cast<std::chrono::microseconds>(deadline - now),
        std::chrono::microseconds(10000));
    fd_set wfd;
    FD_ZERO(&wfd);
    FD_SET(fd, &wfd);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = wait.count();
    if (select(fd + 1, NULL, &wfd, NULL, &tv) < 0 && GetErrno() != EINTR) {
      throw std::runtime_error(string("Cannot wait for pipe: ") +
                               strerror(GetErrno()));
    }
  }
  return bytesWritten;
}

bool RawFdUtils::readAvailable(int fd, string* out) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAvailable");
  }
  char buf[16 * 1024];
  while (true) {
    ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc > 0) {
      out->append(buf, rc);
      continue;
    }
    if (rc == 0) {
      return false;
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return true;
    }
    throw std::runtime_error(string("Cannot read from pipe: ") +
                             strerror(localErrno));
  }
}

void RawFdUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}

void RawFdUtils::setCloseOnExec(int fd) {
  int opts = fcntl(fd, F_GETFD);
  FATAL_FAIL(opts);
  opts |= FD_CLOEXEC;
  FATAL_FAIL(fcntl(fd, F_SETFD, opts));
}
}  // namespace mcpv
