#pragma once

#include <memory>
#include "command_client.hpp"
#include "pin_api.hpp"

namespace ipfspin {

/**
 * IpfsClient - Entry point to the daemon's command API
 *
 * Owns the command client shared by the API facades. Uses dependency
 * injection with ICommandClient to enable unit testing.
 */
class IpfsClient {
public:
    IpfsClient();
    explicit IpfsClient(const ClientOptions& options);
    // Constructor for dependency injection (enables mocking in tests)
    IpfsClient(std::shared_ptr<const ICommandClient> command_client,
               const ClientOptions& options = {});

    // Manages pinned objects
    const PinApi& pin() const { return pin_; }

    const ClientOptions& options() const { return options_; }

private:
    ClientOptions options_;
    std::shared_ptr<const ICommandClient> command_client_;
    PinApi pin_;
};

} // namespace ipfspin
