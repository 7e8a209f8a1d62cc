#pragma once

#include <cstdint>
#include <string>

#include "slimenv/io/stream.hpp"

namespace slimenv {

enum class FileMode {
  kReadOnly = 0,
  kReadWrite = 1,
  // Creates the file if missing and truncates it otherwise.
  kCreateTruncate = 2,
};

// POSIX file descriptor usable as any of the four stream kinds. Sequential
// calls share the descriptor's file offset; positional calls leave it alone.
class FileStream : public ISequentialReader,
                   public ISequentialWriter,
                   public IRandomAccessReader,
                   public IRandomAccessWriter {
 public:
  FileStream(std::string path, FileMode mode);
  ~FileStream() override;

  FileStream(const FileStream&) = delete;
  FileStream& operator=(const FileStream&) = delete;

  size_t Read(std::span<uint8_t> out) override;
  void Write(std::span<const uint8_t> data) override;
  size_t ReadAt(std::span<uint8_t> out, uint64_t offset) override;
  void WriteAt(std::span<const uint8_t> data, uint64_t offset) override;

  uint64_t Size() const;
  void Sync();

  const std::string& path() const;

 private:
  [[noreturn]] void ThrowErrno(const char* op) const;

  std::string path_;
  int fd_ = -1;
};

}  // namespace slimenv
