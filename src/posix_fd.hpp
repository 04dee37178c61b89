#pragma once
/*
 * PosixFd
 *
 * Purpose: RAII owners for a file descriptor and a read-only mapping of it.
 * Note: move-only; close/munmap happen on every return path.
 */
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

class ReadOnlyMapping {
public:
  ReadOnlyMapping(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) mem_ = p;
  }
  ReadOnlyMapping(const ReadOnlyMapping&) = delete;
  ReadOnlyMapping& operator=(const ReadOnlyMapping&) = delete;
  ~ReadOnlyMapping() { if (mem_) ::munmap(mem_, len_); }
  bool valid() const { return mem_ != nullptr; }
  const char* data() const { return static_cast<const char*>(mem_); }
  size_t size() const { return len_; }
  void advise_sequential() const { if (mem_) (void)::madvise(mem_, len_, MADV_SEQUENTIAL); }
private:
  void* mem_ = nullptr;
  size_t len_;
};
