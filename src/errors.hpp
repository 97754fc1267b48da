#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sendmer {

// Coarse grouping used for user-facing reports.
enum class ErrorCategory {
  Usage,
  LocalFilesystem,
  Connectivity,
  Protocol,
  Cancelled
};

const char* to_string(ErrorCategory category);

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
  virtual ErrorCategory category() const { return ErrorCategory::Usage; }
};

// A path component is illegal (separator inside a component, root/parent/current
// directory references where a relative name is required).
class PathValidationError : public Error {
public:
  using Error::Error;
  ErrorCategory category() const override { return ErrorCategory::LocalFilesystem; }
};

class ImportError : public Error {
public:
  using Error::Error;
  ErrorCategory category() const override { return ErrorCategory::LocalFilesystem; }
};

// Sub-kinds mirror the phases of a blob request where a failure can occur.
enum class NetworkErrorKind {
  Connection,
  Header,
  Decode,
  TransportSend,
  Closing,
  BadRequest,
  LocalFailure
};

const char* to_string(NetworkErrorKind kind);

class NetworkError : public Error {
public:
  NetworkError(NetworkErrorKind kind, const std::string& message);

  NetworkErrorKind kind() const noexcept { return kind_; }
  ErrorCategory category() const override;

private:
  NetworkErrorKind kind_;
};

class ExportConflictError : public Error {
public:
  explicit ExportConflictError(const std::filesystem::path& target);

  const std::filesystem::path& target() const noexcept { return target_; }
  ErrorCategory category() const override { return ErrorCategory::LocalFilesystem; }

private:
  std::filesystem::path target_;
};

class ExportError : public Error {
public:
  using Error::Error;
  ErrorCategory category() const override { return ErrorCategory::LocalFilesystem; }
};

class CancellationError : public Error {
public:
  CancellationError() : Error("Operation cancelled") {}
  ErrorCategory category() const override { return ErrorCategory::Cancelled; }
};

class TicketError : public Error {
public:
  using Error::Error;
  ErrorCategory category() const override { return ErrorCategory::Usage; }
};

// Raised by the blob store for local storage faults; callers translate it into
// ImportError / ExportError / NetworkError(LocalFailure) depending on the phase.
class StoreError : public Error {
public:
  using Error::Error;
  ErrorCategory category() const override { return ErrorCategory::LocalFilesystem; }
};

} // namespace sendmer
