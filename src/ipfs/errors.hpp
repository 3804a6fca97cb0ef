#pragma once

#include <string>
#include "google/cloud/status.h"

namespace ipfspin {

using google::cloud::Status;
using google::cloud::StatusCode;

// ErrorInfo domain attached to every status created by this library
inline constexpr char kErrorDomain[] = "ipfspin";

// ErrorInfo reasons, one per error category
inline constexpr char kRemoteCommandErrorReason[] = "REMOTE_COMMAND_ERROR";
inline constexpr char kParseErrorReason[] = "RESPONSE_PARSE_ERROR";
inline constexpr char kEnumMappingErrorReason[] = "UNKNOWN_PIN_MODE";
inline constexpr char kCancelledReason[] = "CANCELLED";

// The dispatcher call failed (transport, HTTP error status, daemon error)
Status RemoteCommandError(StatusCode code, std::string message,
                          const std::string& command);

// The response was not JSON or did not have the expected shape
Status ParseError(std::string message, const std::string& command);

// A "Type" value did not match any PinMode
Status EnumMappingError(const std::string& value);

// The caller abandoned the call
Status CancelledError(const std::string& command);

bool IsRemoteCommandError(const Status& status);
bool IsParseError(const Status& status);
bool IsEnumMappingError(const Status& status);
bool IsCancelled(const Status& status);

} // namespace ipfspin
