#include "errors.hpp"

namespace sendmer {

const char* to_string(ErrorCategory category) {
  switch(category) {
    case ErrorCategory::Usage: return "usage";
    case ErrorCategory::LocalFilesystem: return "local filesystem";
    case ErrorCategory::Connectivity: return "connectivity";
    case ErrorCategory::Protocol: return "protocol";
    case ErrorCategory::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* to_string(NetworkErrorKind kind) {
  switch(kind) {
    case NetworkErrorKind::Connection: return "connection";
    case NetworkErrorKind::Header: return "header";
    case NetworkErrorKind::Decode: return "decode";
    case NetworkErrorKind::TransportSend: return "transport-send";
    case NetworkErrorKind::Closing: return "closing";
    case NetworkErrorKind::BadRequest: return "malformed-request";
    case NetworkErrorKind::LocalFailure: return "local-failure";
  }
  return "unknown";
}

NetworkError::NetworkError(NetworkErrorKind kind, const std::string& message)
  : Error(std::string(to_string(kind)) + " error: " + message),
    kind_(kind) {}

ErrorCategory NetworkError::category() const {
  switch(kind_) {
    case NetworkErrorKind::Connection:
    case NetworkErrorKind::TransportSend:
    case NetworkErrorKind::Closing:
      return ErrorCategory::Connectivity;
    case NetworkErrorKind::Header:
    case NetworkErrorKind::Decode:
    case NetworkErrorKind::BadRequest:
      return ErrorCategory::Protocol;
    case NetworkErrorKind::LocalFailure:
      return ErrorCategory::LocalFilesystem;
  }
  return ErrorCategory::Connectivity;
}

ExportConflictError::ExportConflictError(const std::filesystem::path& target)
  : Error("target " + target.string() +
          " already exists; export stopped and the data already fetched will not be transferred again"),
    target_(target) {}

} // namespace sendmer
