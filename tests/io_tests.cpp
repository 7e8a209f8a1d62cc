#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "slimenv/codec/raw_bytes_codec.hpp"
#include "slimenv/common/bytes.hpp"
#include "slimenv/common/errors.hpp"
#include "slimenv/common/random.hpp"
#include "slimenv/envelope/serializer.hpp"
#include "slimenv/io/file_stream.hpp"
#include "slimenv/io/memory_stream.hpp"
#include "slimenv/io/section_reader.hpp"
#include "slimenv/io/stream.hpp"

namespace {

using slimenv::Bytes;
using slimenv::Csprng;
using slimenv::EnvelopeSerializer;
using slimenv::FileMode;
using slimenv::FileStream;
using slimenv::ISequentialReader;
using slimenv::MemoryStream;
using slimenv::SectionReader;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

template <typename E>
void ExpectThrowAs(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const E&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Wrong exception (" + std::string(ex.what()) + "): " + message);
  }
  throw std::runtime_error("Expected exception: " + message);
}

// Hands out at most `step` bytes per call.
class TrickleReader : public ISequentialReader {
 public:
  TrickleReader(Bytes data, size_t step) : inner_(std::move(data)), step_(step) {}

  size_t Read(std::span<uint8_t> out) override {
    return inner_.Read(out.first(std::min(out.size(), step_)));
  }

 private:
  MemoryStream inner_;
  size_t step_;
};

class TempPath {
 public:
  TempPath() {
    static const char kHex[] = "0123456789abcdef";
    std::string name = "slimenv_io_";
    for (uint8_t b : Csprng::RandomBytes(8)) {
      name.push_back(kHex[b >> 4]);
      name.push_back(kHex[b & 0x0F]);
    }
    path_ = (std::filesystem::temp_directory_path() / name).string();
  }

  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  const std::string& str() const {
    return path_;
  }

 private:
  std::string path_;
};

void TestMemoryStreamSequential() {
  MemoryStream stream;
  stream.Write(Bytes{1, 2, 3});
  stream.Write(Bytes{4, 5});
  Expect(stream.data() == Bytes({1, 2, 3, 4, 5}), "Sequential writes append");

  Bytes out(4);
  Expect(stream.Read(out) == 4 && out == Bytes({1, 2, 3, 4}), "Read returns the first bytes");
  Expect(stream.remaining() == 1, "One byte remains");
  Expect(stream.Read(out) == 1 && out[0] == 5, "Short read at the end of data");
  Expect(stream.Read(out) == 0, "Exhausted stream reads zero bytes");

  stream.Rewind();
  Expect(stream.read_position() == 0 && stream.remaining() == 5, "Rewind resets the cursor");
}

void TestMemoryStreamPositional() {
  MemoryStream stream(Bytes{9, 9, 9});
  stream.WriteAt(Bytes{7, 7}, 5);
  Expect(stream.data() == Bytes({9, 9, 9, 0, 0, 7, 7}), "Positional write zero fills the gap");

  stream.WriteAt(Bytes{1}, 1);
  Expect(stream.data()[1] == 1 && stream.data().size() == 7, "Positional overwrite in place");

  Bytes out(4);
  Expect(stream.ReadAt(out, 4) == 3, "ReadAt is short at the end of data");
  Expect(out[0] == 0 && out[1] == 7 && out[2] == 7, "ReadAt returns the stored bytes");
  Expect(stream.ReadAt(out, 100) == 0, "ReadAt past the end reads nothing");
  Expect(stream.read_position() == 0, "Positional reads leave the cursor alone");
}

void TestReadFullRetries() {
  const Bytes data = Csprng::RandomBytes(100);

  TrickleReader trickle(data, 3);
  Bytes out(100);
  Expect(slimenv::ReadFull(&trickle, out) == 100, "ReadFull keeps reading small chunks");
  Expect(out == data, "ReadFull preserves bytes");

  TrickleReader short_source(Bytes(10, 0x42), 4);
  Bytes big(16);
  Expect(slimenv::ReadFull(&short_source, big) == 10, "ReadFull stops at end of stream");

  TrickleReader empty(Bytes{}, 4);
  ExpectThrowAs<slimenv::UnexpectedEofError>(
      [&]() { slimenv::ReadExactly(&empty, big, "field"); },
      "ReadExactly on an exhausted stream fails");

  TrickleReader partial(Bytes(5, 1), 2);
  ExpectThrowAs<slimenv::UnexpectedEofError>(
      [&]() { slimenv::ReadExactly(&partial, big, "field"); },
      "ReadExactly on a short stream fails");

  TrickleReader nothing_needed(Bytes{}, 1);
  slimenv::ReadExactly(&nothing_needed, std::span<uint8_t>(), "empty");
}

void TestSectionReaderBounds() {
  MemoryStream source(Bytes{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});

  SectionReader window(&source, 2, 3);
  Bytes out(8);
  Expect(window.Read(out) == 3, "Section stops at its limit");
  Expect(out[0] == 2 && out[1] == 3 && out[2] == 4, "Section starts at its base");
  Expect(window.position() == 3, "Section position counts consumed bytes");
  Expect(window.Read(out) == 0, "Section at its limit is exhausted");

  SectionReader tail(&source, 7, 1000);
  Expect(tail.Read(out) == 3, "Section stops early at the end of the source");
  Expect(tail.Read(out) == 0 && tail.position() == 3, "Section past the source end");

  SectionReader clamped(&source, UINT64_MAX - 4, UINT64_MAX);
  Expect(clamped.limit() == 4, "Section limit is clamped to avoid wrapping");

  ExpectThrowAs<std::invalid_argument>([&]() { SectionReader bad(nullptr, 0, 1); },
                                       "Section requires a source");
}

void TestFileStreamRoundTrip() {
  TempPath path;
  const Bytes first = Csprng::RandomBytes(1000);
  const Bytes second = Csprng::RandomBytes(24);

  {
    FileStream file(path.str(), FileMode::kCreateTruncate);
    file.Write(first);
    file.WriteAt(second, 1500);
    file.Sync();
    Expect(file.Size() == 1524, "Positional write past the end extends the file");
    Expect(file.path() == path.str(), "FileStream keeps its path");
  }

  FileStream file(path.str(), FileMode::kReadOnly);
  Bytes out(first.size());
  Expect(slimenv::ReadFull(&file, out) == first.size() && out == first,
         "Sequential read returns sequentially written bytes");

  Bytes tail(100);
  Expect(file.ReadAt(tail, 1500) == 24, "ReadAt is short at end of file");
  Expect(std::equal(second.begin(), second.end(), tail.begin()), "ReadAt returns stored bytes");

  Bytes hole(10);
  Expect(file.ReadAt(hole, 1100) == 10 && hole == Bytes(10, 0), "Gap reads back as zeros");

  ExpectThrowAs<slimenv::IoError>([&]() { file.Write(first); },
                                  "Writing a read-only file fails");
}

void TestFileStreamEnvelopeChain() {
  TempPath path;
  const EnvelopeSerializer<Bytes> serializer(std::make_shared<slimenv::RawBytesCodec>());

  std::vector<Bytes> payloads;
  for (size_t i = 0; i < 6; ++i) {
    payloads.push_back(Csprng::RandomBytes(i == 3 ? 0 : 1 + i * 4099));
  }

  uint64_t offset = 0;
  {
    FileStream file(path.str(), FileMode::kCreateTruncate);
    for (const Bytes& payload : payloads) {
      const uint64_t written = serializer.WriteAt(&file, offset, payload);
      Expect(written == serializer.TotalSize(payload), "WriteAt returns TotalSize");
      offset += written;
    }
    file.Sync();
    Expect(file.Size() == offset, "File holds exactly the written envelopes");
  }

  FileStream file(path.str(), FileMode::kReadOnly);
  uint64_t cursor = 0;
  for (const Bytes& payload : payloads) {
    Bytes decoded;
    cursor += serializer.ReadAt(&file, cursor, &decoded);
    Expect(decoded == payload, "ReadAt chain returns payloads in order");
  }
  Expect(cursor == file.Size(), "ReadAt chain ends at the end of the file");

  Bytes past_end;
  ExpectThrowAs<slimenv::EndOfStreamError>(
      [&]() { (void)serializer.ReadAt(&file, cursor, &past_end); },
      "ReadAt at the end of the file reports end of stream");

  // The same file read front to back with the sequential reader.
  size_t count = 0;
  Bytes decoded;
  while (serializer.ReadNext(&file, &decoded)) {
    Expect(count < payloads.size() && decoded == payloads[count],
           "Sequential read matches positional writes");
    ++count;
  }
  Expect(count == payloads.size(), "Sequential read sees every envelope");

  {
    FileStream rewrite(path.str(), FileMode::kReadWrite);
    const uint64_t second = serializer.TotalSize(payloads[0]);
    const Bytes replacement = Csprng::RandomBytes(payloads[1].size());
    serializer.WriteAt(&rewrite, second, replacement);
    Bytes reread;
    Expect(serializer.ReadAt(&rewrite, second, &reread) == serializer.TotalSize(replacement) &&
               reread == replacement,
           "An envelope of equal size can be rewritten in place");
  }
}

void TestFileStreamOpenFailure() {
  ExpectThrowAs<slimenv::IoError>(
      [&]() { FileStream missing("/nonexistent-dir/slimenv/none", FileMode::kReadOnly); },
      "Opening a missing file fails");
}

}  // namespace

int main() {
  try {
    TestMemoryStreamSequential();
    TestMemoryStreamPositional();
    TestReadFullRetries();
    TestSectionReaderBounds();
    TestFileStreamRoundTrip();
    TestFileStreamEnvelopeChain();
    TestFileStreamOpenFailure();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "IO tests passed" << '\n';
  return 0;
}
