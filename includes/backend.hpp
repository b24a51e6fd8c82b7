#ifndef TFTPFF_BACKEND_HPP
#define TFTPFF_BACKEND_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include "tftp_common.hpp"

namespace tftpff {

// Raised by the file backend. Carries the TFTP error code the peer should
// receive for this failure.
class BackendError : public std::runtime_error {
public:
  BackendError(TftpErrorCode code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  TftpErrorCode code() const noexcept { return code_; }

private:
  TftpErrorCode code_;
};

// TFTP code for a failed file operation: DiskFull for ENOSPC/EDQUOT,
// NotDefined for anything else.
TftpErrorCode io_error_code(int error);

// An open file owned by exactly one session.
class FileHandle {
public:
  virtual ~FileHandle() = default;

  // Reads up to `size` bytes. Returns fewer only at end of file.
  virtual size_t read_block(char *buffer, size_t size) = 0;
  virtual void write_block(const char *data, size_t size) = 0;
  virtual uint64_t size() const = 0;
  // Makes written data visible under the target name. No-op for reads.
  virtual void commit() = 0;
};

class FileBackend {
public:
  virtual ~FileBackend() = default;

  // Maps a client-supplied filename to a path inside the served root.
  // Throws BackendError(AccessViolation) for anything that escapes it.
  virtual std::filesystem::path resolve(const std::string &filename) const = 0;
  virtual std::unique_ptr<FileHandle> open_for_read(const std::filesystem::path &path) = 0;
  virtual std::unique_ptr<FileHandle> open_for_write(const std::filesystem::path &path,
                                                     bool truncate = true) = 0;
};

// Serves files from a directory on the local filesystem.
class FsBackend : public FileBackend {
public:
  // Throws std::invalid_argument if `root` is not an existing directory.
  explicit FsBackend(const std::filesystem::path &root, bool allow_overwrite = true);

  std::filesystem::path resolve(const std::string &filename) const override;
  std::unique_ptr<FileHandle> open_for_read(const std::filesystem::path &path) override;
  std::unique_ptr<FileHandle> open_for_write(const std::filesystem::path &path,
                                             bool truncate = true) override;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  bool allow_overwrite_;
};

class FsReadHandle : public FileHandle {
public:
  FsReadHandle(std::ifstream stream, uint64_t size);

  size_t read_block(char *buffer, size_t size) override;
  void write_block(const char *data, size_t size) override;
  uint64_t size() const override { return size_; }
  void commit() override {}

private:
  std::ifstream input_;
  uint64_t size_;
};

// Uploads land in a hidden staging file next to the target and are renamed
// over it on commit(). Destroying an uncommitted handle removes the staging
// file, so aborted transfers leave nothing behind.
class FsWriteHandle : public FileHandle {
public:
  FsWriteHandle(std::filesystem::path target, std::filesystem::path staging,
                std::ofstream stream);
  ~FsWriteHandle() override;

  FsWriteHandle(const FsWriteHandle &) = delete;
  FsWriteHandle &operator=(const FsWriteHandle &) = delete;

  size_t read_block(char *buffer, size_t size) override;
  void write_block(const char *data, size_t size) override;
  uint64_t size() const override { return written_; }
  void commit() override;

  const std::filesystem::path &staging_path() const { return staging_; }

private:
  void throw_io_error(const std::string &what) const;

  std::filesystem::path target_;
  std::filesystem::path staging_;
  std::ofstream output_;
  uint64_t written_ = 0;
  bool committed_ = false;
};

} // namespace tftpff

#endif // TFTPFF_BACKEND_HPP
