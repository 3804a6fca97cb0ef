#include "pin_api.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace ipfspin {

namespace {
    using json = nlohmann::json;

    // Remote vocabulary of the "type" option and the "Type" field
    const std::pair<const char*, PinMode> kPinModeNames[] = {
        {"direct", PinMode::kDirect},
        {"recursive", PinMode::kRecursive},
        {"indirect", PinMode::kIndirect},
        {"all", PinMode::kAll},
    };

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string recursiveOption(bool recursive) {
        return std::string("recursive=") + (recursive ? "true" : "false");
    }
}

std::string ToString(PinMode mode) {
    for (const auto& entry : kPinModeNames) {
        if (entry.second == mode) {
            return entry.first;
        }
    }
    return "all";
}

StatusOr<PinMode> ParsePinMode(const std::string& value) {
    const std::string lower = toLower(value);
    for (const auto& entry : kPinModeNames) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return EnumMappingError(value);
}

PinApi::PinApi(std::shared_ptr<const ICommandClient> client, bool debug_mode)
    : client_(std::move(client)), debug_mode_(debug_mode) {}

StatusOr<std::string> PinApi::dispatch(const ICommandClient::CommandRequest& request,
                                       const CancellationToken& cancel) const {
    if (cancel.isCancellationRequested()) {
        return CancelledError(request.command);
    }
    if (debug_mode_) {
        std::cout << "[DEBUG] " << request.command
                  << (request.argument ? " " + *request.argument : std::string())
                  << std::endl;
    }
    return client_->Execute(request, cancel);
}

StatusOr<std::vector<PinnedObject>> PinApi::modifyPins(
    const std::string& command,
    const std::string& path,
    bool recursive,
    const CancellationToken& cancel) const
{
    ICommandClient::CommandRequest request;
    request.command = command;
    request.argument = path;
    request.options = {recursiveOption(recursive)};

    auto response = dispatch(request, cancel);
    if (!response) {
        return response.status();
    }

    std::vector<PinnedObject> results;
    try {
        auto body = json::parse(*response);
        if (!body.is_object() || !body.contains("Pins") || !body["Pins"].is_array()) {
            std::cerr << "[ERROR] " << command << " response has no Pins array" << std::endl;
            return ParseError(command + " response has no \"Pins\" array", command);
        }

        for (const auto& pin : body["Pins"]) {
            if (!pin.is_string()) {
                return ParseError(command + " response has a non-string pin", command);
            }
            results.push_back(PinnedObject{pin.get<std::string>(), std::nullopt});
        }
    } catch (const json::exception& e) {
        std::cerr << "[ERROR] Invalid " << command << " response: " << e.what() << std::endl;
        return ParseError(std::string("Invalid JSON in ") + command + " response: " + e.what(),
                          command);
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] " << command << " affected " << results.size() << " pin(s)"
                  << std::endl;
    }
    return results;
}

StatusOr<std::vector<PinnedObject>> PinApi::add(
    const std::string& path,
    bool recursive,
    CancellationToken cancel) const
{
    return modifyPins("pin/add", path, recursive, cancel);
}

StatusOr<std::vector<PinnedObject>> PinApi::remove(
    const std::string& path,
    bool recursive,
    CancellationToken cancel) const
{
    return modifyPins("pin/rm", path, recursive, cancel);
}

StatusOr<std::vector<PinnedObject>> PinApi::list(
    PinMode mode,
    CancellationToken cancel) const
{
    const std::string command = "pin/ls";

    ICommandClient::CommandRequest request;
    request.command = command;
    request.options = {"type=" + ToString(mode)};

    auto response = dispatch(request, cancel);
    if (!response) {
        return response.status();
    }

    std::vector<PinnedObject> results;
    try {
        auto body = json::parse(*response);
        if (!body.is_object() || !body.contains("Keys")) {
            std::cerr << "[ERROR] pin/ls response has no Keys" << std::endl;
            return ParseError("pin/ls response has no \"Keys\" object", command);
        }

        const auto& keys = body["Keys"];
        // An empty pinset is reported as "Keys": null
        if (keys.is_null()) {
            return results;
        }
        if (!keys.is_object()) {
            return ParseError("pin/ls \"Keys\" is not an object", command);
        }

        for (auto it = keys.begin(); it != keys.end(); ++it) {
            const auto& entry = it.value();
            if (!entry.is_object() || !entry.contains("Type") || !entry["Type"].is_string()) {
                return ParseError("pin/ls entry " + it.key() + " has no \"Type\"", command);
            }

            auto pin_mode = ParsePinMode(entry["Type"].get<std::string>());
            if (!pin_mode) {
                std::cerr << "[ERROR] " << pin_mode.status().message() << " for " << it.key()
                          << std::endl;
                return pin_mode.status();
            }
            results.push_back(PinnedObject{it.key(), *pin_mode});
        }
    } catch (const json::exception& e) {
        std::cerr << "[ERROR] Invalid pin/ls response: " << e.what() << std::endl;
        return ParseError(std::string("Invalid JSON in pin/ls response: ") + e.what(), command);
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] pin/ls returned " << results.size() << " pin(s)" << std::endl;
    }
    return results;
}

} // namespace ipfspin
