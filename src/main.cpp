// ipfs-pin main entry point

#include "config.hpp"
#include "ipfs/errors.hpp"
#include "interrupt.hpp"
#include "ipfs/ipfs_client.hpp"
#include <iostream>

namespace {
    int report(const google::cloud::Status& status) {
        if (ipfspin::IsCancelled(status)) {
            std::cerr << "Interrupted" << std::endl;
        } else {
            std::cerr << "Error: " << status.message() << std::endl;
        }
        return 1;
    }
}

int main(int argc, char *argv[])
{
    try {
        IpfsPinConfig config = IpfsPinConfig::load(argc, argv);
        if (config.help_requested) {
            IpfsPinConfig::printUsage(argv[0]);
            return 0;
        }

        ipfspin::CancellationSource cancel_source;
        InterruptCancellation interrupt(cancel_source);

        ipfspin::IpfsClient client(config.toClientOptions());
        const auto& pins = client.pin();

        if (config.command == "ls") {
            auto mode = ipfspin::ParsePinMode(config.pin_type);
            if (!mode) {
                return report(mode.status());
            }
            auto result = pins.list(*mode, cancel_source.token());
            if (!result) {
                return report(result.status());
            }
            for (const auto& pin : *result) {
                std::cout << pin.id << " " << ipfspin::ToString(*pin.mode) << "\n";
            }
            return 0;
        }

        for (const auto& path : config.paths) {
            auto result = config.command == "add"
                ? pins.add(path, config.recursive, cancel_source.token())
                : pins.remove(path, config.recursive, cancel_source.token());
            if (!result) {
                return report(result.status());
            }
            for (const auto& pin : *result) {
                std::cout << pin.id << "\n";
            }
        }
        return 0;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
