#include "errors.hpp"

namespace ipfspin {

namespace {
    google::cloud::ErrorInfo makeInfo(const char* reason, const std::string& key,
                                      const std::string& value) {
        return google::cloud::ErrorInfo(reason, kErrorDomain, {{key, value}});
    }

    bool hasReason(const Status& status, const char* reason) {
        return !status.ok() && status.error_info().domain() == kErrorDomain &&
               status.error_info().reason() == reason;
    }
}

Status RemoteCommandError(StatusCode code, std::string message,
                          const std::string& command) {
    return Status(code, std::move(message),
                  makeInfo(kRemoteCommandErrorReason, "command", command));
}

Status ParseError(std::string message, const std::string& command) {
    return Status(StatusCode::kInternal, std::move(message),
                  makeInfo(kParseErrorReason, "command", command));
}

Status EnumMappingError(const std::string& value) {
    return Status(StatusCode::kInternal, "Unknown pin mode '" + value + "'",
                  makeInfo(kEnumMappingErrorReason, "value", value));
}

Status CancelledError(const std::string& command) {
    return Status(StatusCode::kCancelled, command + " was cancelled",
                  makeInfo(kCancelledReason, "command", command));
}

bool IsRemoteCommandError(const Status& status) {
    return hasReason(status, kRemoteCommandErrorReason);
}

bool IsParseError(const Status& status) {
    return hasReason(status, kParseErrorReason);
}

bool IsEnumMappingError(const Status& status) {
    return hasReason(status, kEnumMappingErrorReason);
}

bool IsCancelled(const Status& status) {
    return status.code() == StatusCode::kCancelled;
}

} // namespace ipfspin
