#include "file_io.hpp"

#include <arrow/io/buffered.h>
#include <arrow/memory_pool.h>
#include <spdlog/fmt/fmt.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>

#include "internal/stores/file/record_codec.hpp"

namespace msgstore::stores::file {

int64_t ReadFull(arrow::io::InputStream& in, void* out, int64_t size) {
  auto*   dst  = static_cast<uint8_t*>(out);
  int64_t done = 0;
  while (done < size) {
    const int64_t n = Unwrap(in.Read(size - done, dst + done));
    if (n == 0) {
      break;
    }
    done += n;
  }
  return done;
}

void SyncFile(arrow::io::FileOutputStream& file) {
  if (::fsync(file.file_descriptor()) != 0) {
    throw util::IOError(fmt::format("fsync failed: {}", std::strerror(errno)));
  }
}

int64_t FileSize(const std::filesystem::path& path) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw util::IOError(fmt::format("unable to stat {}: {}", path.string(), ec.message()));
  }
  return static_cast<int64_t>(size);
}

std::shared_ptr<arrow::io::FileOutputStream> OpenFile(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return CreateFile(path);
  }
  {
    auto in = Unwrap(arrow::io::ReadableFile::Open(path.string()));
    CheckFileVersion(*in);
    Unwrap(in->Close());
  }
  return Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/true));
}

std::shared_ptr<arrow::io::FileOutputStream> CreateFile(const std::filesystem::path& path) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/false));
  WriteFileVersion(*out);
  return out;
}

std::shared_ptr<arrow::io::InputStream> OpenReader(const std::filesystem::path& path, int64_t buffer_size) {
  auto                                    raw = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  std::shared_ptr<arrow::io::InputStream> in =
      Unwrap(arrow::io::BufferedInputStream::Create(buffer_size, arrow::default_memory_pool(), raw));
  CheckFileVersion(*in);
  return in;
}

std::shared_ptr<arrow::io::ReadableFile> OpenRandomAccess(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  CheckFileVersion(*file);
  return file;
}

TempFile CreateTempFile(const std::filesystem::path& dir, const std::string& prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  for (int attempt = 0; attempt < 16; ++attempt) {
    auto path = dir / fmt::format("{}{:016x}", prefix, rng());
    if (std::filesystem::exists(path)) {
      continue;
    }
    return {path, CreateFile(path)};
  }
  throw util::IOError(fmt::format("unable to create a temporary file in {}", dir.string()));
}

void SwapFiles(TempFile& tmp, const std::filesystem::path& active_path, std::shared_ptr<arrow::io::FileOutputStream>& active) {
  struct RemoveTmp {
    const std::filesystem::path& path;
    ~RemoveTmp() {
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  } remove_tmp{tmp.path};

  Unwrap(tmp.stream->Close());
  Unwrap(active->Close());

  std::error_code ec;
  std::filesystem::rename(tmp.path, active_path, ec);
  // Reopen in any case, the original is still there if the rename failed.
  active = OpenFile(active_path);
  if (ec) {
    throw util::IOError(fmt::format("unable to rename {} to {}: {}", tmp.path.string(), active_path.string(), ec.message()));
  }
}

void RethrowWithContext(const std::string& context) {
  try {
    throw;
  } catch (const util::Corruption& e) {
    throw util::Corruption(context + e.what());
  } catch (const util::InvalidConfig& e) {
    throw util::InvalidConfig(context + e.what());
  } catch (const util::InvalidState& e) {
    throw util::InvalidState(context + e.what());
  } catch (const util::IOError& e) {
    throw util::IOError(context + e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::IOError(context + e.what());
  }
}

} // namespace msgstore::stores::file
