#include "slimenv/io/file_stream.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "slimenv/common/errors.hpp"

namespace slimenv {
namespace {

int OpenFlags(FileMode mode) {
  switch (mode) {
    case FileMode::kReadOnly:
      return O_RDONLY;
    case FileMode::kReadWrite:
      return O_RDWR;
    case FileMode::kCreateTruncate:
      return O_RDWR | O_CREAT | O_TRUNC;
  }
  return O_RDONLY;
}

}  // namespace

FileStream::FileStream(std::string path, FileMode mode) : path_(std::move(path)) {
  do {
    fd_ = ::open(path_.c_str(), OpenFlags(mode) | O_CLOEXEC, 0644);
  } while (fd_ < 0 && errno == EINTR);

  if (fd_ < 0) {
    ThrowErrno("open");
  }
}

FileStream::~FileStream() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileStream::Read(std::span<uint8_t> out) {
  while (true) {
    const ssize_t n = ::read(fd_, out.data(), out.size());
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno != EINTR) {
      ThrowErrno("read");
    }
  }
}

void FileStream::Write(std::span<const uint8_t> data) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("write");
    }
    written += static_cast<size_t>(n);
  }
}

size_t FileStream::ReadAt(std::span<uint8_t> out, uint64_t offset) {
  size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = ::pread(fd_, out.data() + filled, out.size() - filled,
                              static_cast<off_t>(offset + filled));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("pread");
    }
    if (n == 0) {
      break;
    }
    filled += static_cast<size_t>(n);
  }
  return filled;
}

void FileStream::WriteAt(std::span<const uint8_t> data, uint64_t offset) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                               static_cast<off_t>(offset + written));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("pwrite");
    }
    written += static_cast<size_t>(n);
  }
}

uint64_t FileStream::Size() const {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    ThrowErrno("fstat");
  }
  return static_cast<uint64_t>(st.st_size);
}

void FileStream::Sync() {
  if (::fsync(fd_) != 0) {
    ThrowErrno("fsync");
  }
}

const std::string& FileStream::path() const {
  return path_;
}

void FileStream::ThrowErrno(const char* op) const {
  const int err = errno;
  throw IoError(std::string(op) + " " + path_ + ": " + std::strerror(err));
}

}  // namespace slimenv
