#ifndef PROCESS_FD_H_
#define PROCESS_FD_H_

#include <unistd.h>

// Owning wrapper around a file descriptor. Closes the descriptor on
// destruction.
class Fd {
 public:
  Fd() = default;
  ~Fd() { reset(); }

  // Takes ownership of 'fd'.
  static Fd take(int fd) { return Fd(fd); }

  // Delete copies.
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  int operator*() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  void reset() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }

 private:
  explicit Fd(int fd) : fd_(fd) {}

  int fd_ = -1;
};

#endif
