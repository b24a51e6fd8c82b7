#include "backend.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <system_error>

#include "log.hpp"

namespace fs = std::filesystem;

namespace tftpff {

namespace {

// True if `path` names something strictly below `root`. Both must already be
// normalized.
bool is_within(const fs::path &root, const fs::path &path) {
  auto root_it = root.begin();
  auto path_it = path.begin();
  for (; root_it != root.end(); ++root_it, ++path_it) {
    if (path_it == path.end() || *root_it != *path_it)
      return false;
  }
  return path_it != path.end();
}

std::string random_suffix() {
  static std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<int> letter('a', 'z');
  auto epoch_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  std::string suffix = std::to_string(epoch_seconds) + "-";
  for (int i = 0; i < 7; ++i)
    suffix.push_back(static_cast<char>(letter(generator)));
  return suffix;
}

} // namespace

TftpErrorCode io_error_code(int error) {
  if (error == ENOSPC || error == EDQUOT)
    return TftpErrorCode::DiskFull;
  return TftpErrorCode::NotDefined;
}

// --- FsBackend ---

FsBackend::FsBackend(const fs::path &root, bool allow_overwrite)
    : allow_overwrite_(allow_overwrite) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw std::invalid_argument("Served root is not a directory: " + root.string());
  }
  root_ = fs::canonical(root, ec);
  if (ec) {
    throw std::invalid_argument("Cannot resolve served root " + root.string() + ": " +
                                ec.message());
  }
}

fs::path FsBackend::resolve(const std::string &filename) const {
  // Clients commonly ask for "/name"; treat it as relative to the root.
  size_t start = filename.find_first_not_of('/');
  if (start == std::string::npos) {
    throw BackendError(TftpErrorCode::AccessViolation, "Empty filename");
  }

  fs::path requested = (root_ / filename.substr(start)).lexically_normal();
  if (!is_within(root_, requested)) {
    throw BackendError(TftpErrorCode::AccessViolation,
                       "Filename attempts to access outside base directory: " + filename);
  }

  // A symlink inside the root must not lead out of it either.
  std::error_code ec;
  fs::path real = fs::weakly_canonical(requested, ec);
  if (ec || !is_within(root_, real)) {
    throw BackendError(TftpErrorCode::AccessViolation,
                       "Filename resolves outside base directory: " + filename);
  }
  return requested;
}

std::unique_ptr<FileHandle> FsBackend::open_for_read(const fs::path &path) {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (!fs::exists(status)) {
    throw BackendError(TftpErrorCode::FileNotFound, "File not found: " + path.string());
  }
  if (!fs::is_regular_file(status)) {
    throw BackendError(TftpErrorCode::AccessViolation, "Not a regular file: " + path.string());
  }
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    throw BackendError(TftpErrorCode::AccessViolation,
                       "Cannot stat " + path.string() + ": " + ec.message());
  }

  std::ifstream input_file(path, std::ios::binary);
  if (!input_file) {
    throw BackendError(TftpErrorCode::AccessViolation, "Cannot open file: " + path.string());
  }
  return std::make_unique<FsReadHandle>(std::move(input_file), size);
}

std::unique_ptr<FileHandle> FsBackend::open_for_write(const fs::path &path, bool truncate) {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  bool target_exists = fs::exists(status);
  if (target_exists && !allow_overwrite_) {
    throw BackendError(TftpErrorCode::FileAlreadyExists, "File already exists: " + path.string());
  }
  if (target_exists && !fs::is_regular_file(status)) {
    throw BackendError(TftpErrorCode::AccessViolation, "Not a regular file: " + path.string());
  }
  if (!fs::is_directory(path.parent_path(), ec)) {
    throw BackendError(TftpErrorCode::FileNotFound,
                       "Directory not found: " + path.parent_path().string());
  }

  fs::path staging =
      path.parent_path() / ("." + path.filename().string() + ".tftpff-" + random_suffix());

  std::ios::openmode mode = std::ios::binary | std::ios::trunc;
  if (target_exists && !truncate) {
    fs::copy_file(path, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw BackendError(TftpErrorCode::AccessViolation,
                         "Cannot stage " + path.string() + ": " + ec.message());
    }
    mode = std::ios::binary | std::ios::app;
  }

  std::ofstream output_file(staging, mode);
  if (!output_file) {
    fs::remove(staging, ec);
    throw BackendError(TftpErrorCode::AccessViolation,
                       "Cannot create or open file for writing: " + path.string());
  }
  return std::make_unique<FsWriteHandle>(path, staging, std::move(output_file));
}

// --- FsReadHandle ---

FsReadHandle::FsReadHandle(std::ifstream stream, uint64_t size)
    : input_(std::move(stream)), size_(size) {}

size_t FsReadHandle::read_block(char *buffer, size_t size) {
  if (input_.eof())
    return 0;
  input_.read(buffer, static_cast<std::streamsize>(size));
  if (input_.bad()) {
    throw BackendError(TftpErrorCode::NotDefined, "Read error");
  }
  return static_cast<size_t>(input_.gcount());
}

void FsReadHandle::write_block(const char *, size_t) {
  throw BackendError(TftpErrorCode::IllegalOperation, "File is open for reading");
}

// --- FsWriteHandle ---

FsWriteHandle::FsWriteHandle(fs::path target, fs::path staging, std::ofstream stream)
    : target_(std::move(target)), staging_(std::move(staging)), output_(std::move(stream)) {}

FsWriteHandle::~FsWriteHandle() {
  if (committed_)
    return;
  output_.close();
  std::error_code ec;
  fs::remove(staging_, ec);
  if (ec) {
    log_stream(LogLevel::Warn) << "Failed to remove staging file " << staging_ << ": " << ec.message()
                     << std::endl;
  }
}

void FsWriteHandle::throw_io_error(const std::string &what) const {
  int error = errno;
  if (error == 0)
    throw BackendError(TftpErrorCode::NotDefined, what);
  throw BackendError(io_error_code(error), what + ": " + strerror(error));
}

size_t FsWriteHandle::read_block(char *, size_t) {
  throw BackendError(TftpErrorCode::IllegalOperation, "File is open for writing");
}

void FsWriteHandle::write_block(const char *data, size_t size) {
  errno = 0;
  output_.write(data, static_cast<std::streamsize>(size));
  if (!output_) {
    throw_io_error("Write to " + staging_.string() + " failed");
  }
  written_ += size;
}

void FsWriteHandle::commit() {
  if (committed_)
    return;
  errno = 0;
  output_.close();
  if (output_.fail()) {
    throw_io_error("Flushing " + staging_.string() + " failed");
  }
  std::error_code ec;
  fs::rename(staging_, target_, ec);
  if (ec) {
    throw BackendError(TftpErrorCode::NotDefined,
                       "Cannot move upload into place at " + target_.string() + ": " +
                           ec.message());
  }
  committed_ = true;
}

} // namespace tftpff
