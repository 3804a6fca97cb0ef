#include "ipfs_client.hpp"

namespace ipfspin {

IpfsClient::IpfsClient() : IpfsClient(ClientOptions{}) {}

IpfsClient::IpfsClient(const ClientOptions& options)
    : IpfsClient(std::make_shared<CurlCommandClient>(options), options) {}

IpfsClient::IpfsClient(std::shared_ptr<const ICommandClient> command_client,
                       const ClientOptions& options)
    : options_(options),
      command_client_(std::move(command_client)),
      pin_(command_client_, options_.debug_mode) {}

} // namespace ipfspin
