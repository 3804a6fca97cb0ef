#pragma once

#include <string>
#include <vector>
#include <optional>
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"
#include "cancellation.hpp"

using google::cloud::Status;
using google::cloud::StatusOr;

namespace ipfspin {

/**
 * ClientOptions - Where and how to reach the daemon's command API
 */
struct ClientOptions {
    std::string api_url = "http://127.0.0.1:5001";
    std::string base_path = "/api/v0";
    std::string user_agent = "ipfspin/1.0";
    long connect_timeout = 30;  // seconds
    long request_timeout = 0;   // seconds, 0 = no timeout
    bool debug_mode = false;
    bool verbose_logging = false;
};

/**
 * Raw command-dispatch interface for the daemon's HTTP API
 * PinApi holds the mapping logic; this only moves bytes, which lets tests
 * mock the daemon.
 */
class ICommandClient {
public:
    virtual ~ICommandClient() = default;

    // A single command invocation, e.g. pin/add?arg=<path>&recursive=true
    struct CommandRequest {
        std::string command;
        std::optional<std::string> argument;
        // Each option is "name=value"
        std::vector<std::string> options;

        bool operator==(const CommandRequest& other) const {
            return command == other.command && argument == other.argument &&
                   options == other.options;
        }
    };

    // Execute a command and return the response body (JSON text)
    virtual StatusOr<std::string> Execute(const CommandRequest& request,
                                          CancellationToken cancel) const = 0;
};

// Build the full request URL for a command
std::string BuildCommandUrl(const ClientOptions& options,
                            const ICommandClient::CommandRequest& request);

// Map an HTTP response to a status; 2xx is OK, anything else is a
// RemoteCommandError carrying the daemon's "Message" when there is one
Status StatusFromHttpResponse(long http_status, const std::string& body,
                              const std::string& command);

/**
 * Real implementation - one libcurl easy handle per call
 */
class CurlCommandClient : public ICommandClient {
public:
    CurlCommandClient();
    explicit CurlCommandClient(ClientOptions options);

    StatusOr<std::string> Execute(const CommandRequest& request,
                                  CancellationToken cancel) const override;

private:
    ClientOptions options_;
};

} // namespace ipfspin
