#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlmigrate::util {

/*
  Central error types of a migration run.

  Every one of them is fatal for the run. The CLI maps them to exit codes;
  the filename (when there is one) and the driver message travel with them.
*/

enum class ErrorKind {
  kStoreUnavailable,
  kSourceUnavailable,
  kReadError,
  kApplyError,
  kDuplicateRecord,
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kStoreUnavailable:
      return "StoreUnavailable";
    case ErrorKind::kSourceUnavailable:
      return "SourceUnavailable";
    case ErrorKind::kReadError:
      return "ReadError";
    case ErrorKind::kApplyError:
      return "ApplyError";
    case ErrorKind::kDuplicateRecord:
      return "DuplicateRecord";
  }
  return "Unknown";
}

class MigrationError : public std::runtime_error {
 public:
  MigrationError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Tracking table cannot be created or read.
class StoreUnavailable : public MigrationError {
 public:
  explicit StoreUnavailable(const std::string& msg) : MigrationError(ErrorKind::kStoreUnavailable, msg) {
  }
};

// Migration directory missing or unreadable.
class SourceUnavailable : public MigrationError {
 public:
  explicit SourceUnavailable(const std::string& msg) : MigrationError(ErrorKind::kSourceUnavailable, msg) {
  }
};

/*
  Errors tied to one migration file.
  what() reads "<filename>: <cause>"; Cause() is the bare driver/OS message.
*/
class FileError : public MigrationError {
 public:
  FileError(ErrorKind kind, std::string filename, std::string cause)
      : MigrationError(kind, filename + ": " + cause), filename_(std::move(filename)), cause_(std::move(cause)) {
  }

  const std::string& Filename() const {
    return filename_;
  }

  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::string filename_;
  std::string cause_;
};

class ReadError : public FileError {
 public:
  ReadError(std::string filename, std::string cause) : FileError(ErrorKind::kReadError, std::move(filename), std::move(cause)) {
  }
};

class ApplyError : public FileError {
 public:
  ApplyError(std::string filename, std::string cause) : FileError(ErrorKind::kApplyError, std::move(filename), std::move(cause)) {
  }

 protected:
  ApplyError(ErrorKind kind, std::string filename, std::string cause) : FileError(kind, std::move(filename), std::move(cause)) {
  }
};

// Handled exactly like ApplyError; only the kind differs.
class DuplicateRecord : public ApplyError {
 public:
  DuplicateRecord(std::string filename, std::string cause)
      : ApplyError(ErrorKind::kDuplicateRecord, std::move(filename), std::move(cause)) {
  }
};

} // namespace sqlmigrate::util
