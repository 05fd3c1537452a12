#pragma once
/*
 * UniqueFd / MappedFile
 *
 * Purpose: RAII owners for a POSIX file descriptor and a read-only mmap.
 */
#include <sys/mman.h>
#include <unistd.h>
#include <cstddef>

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
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

class MappedFile {
public:
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { unmap(); }

  bool map(int fd, size_t size) {
    unmap();
    void* mem = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mem == MAP_FAILED) return false;
    data_ = static_cast<const char*>(mem);
    size_ = size;
    (void)::madvise(mem, size, MADV_SEQUENTIAL);
    return true;
  }
  const char* data() const { return data_; }
  size_t size() const { return size_; }

private:
  void unmap() {
    if (data_) { ::munmap(const_cast<char*>(data_), size_); data_ = nullptr; size_ = 0; }
  }
  const char* data_ = nullptr;
  size_t size_ = 0;
};
