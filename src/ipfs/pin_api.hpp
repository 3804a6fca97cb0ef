#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include "google/cloud/status_or.h"
#include "cancellation.hpp"
#include "command_client.hpp"

using google::cloud::StatusOr;

namespace ipfspin {

/**
 * PinMode - How an object is retained in the pinset
 */
enum class PinMode {
    kDirect,
    kRecursive,
    kIndirect,
    kAll
};

// Lower-case name used on the command API ("direct", "recursive", ...)
std::string ToString(PinMode mode);

// Case-insensitive; EnumMappingError for anything outside the vocabulary
StatusOr<PinMode> ParsePinMode(const std::string& value);

/**
 * PinnedObject - One entry of a pin command response
 * mode is only set for results of list().
 */
struct PinnedObject {
    std::string id;
    std::optional<PinMode> mode;

    bool operator==(const PinnedObject& other) const {
        return id == other.id && mode == other.mode;
    }
};

/**
 * PinApi - Manages pinned objects (stored locally by the daemon and never
 * garbage collected)
 *
 * Each call is a single stateless round trip through the shared command
 * client. Paths are anything the daemon accepts, such as
 * "QmXarR6rgkQ2fDSHjSY5nM2kuCXKYGViky5nohtwgF65Ec/about" or a bare
 * content identifier in its string form.
 */
class PinApi {
public:
    explicit PinApi(std::shared_ptr<const ICommandClient> client, bool debug_mode = false);
    virtual ~PinApi() = default;

    /**
     * Add an object to the pinset
     *
     * @param path Path or identifier of an existing object
     * @param recursive true to pin the links of the object as well
     * @param cancel Abandons the call when cancelled
     * @return Pinned identifiers (mode unset), or the failure status
     */
    virtual StatusOr<std::vector<PinnedObject>> add(
        const std::string& path,
        bool recursive = true,
        CancellationToken cancel = {}) const;

    /**
     * List pinned objects
     *
     * @param mode Only return pins of this type; kAll returns every pin
     * @param cancel Abandons the call when cancelled
     */
    virtual StatusOr<std::vector<PinnedObject>> list(
        PinMode mode = PinMode::kAll,
        CancellationToken cancel = {}) const;

    /**
     * Remove an object from the pinset
     *
     * @param path Path or identifier of a pinned object
     * @param recursive true to unpin the links of the object as well
     * @param cancel Abandons the call when cancelled
     */
    virtual StatusOr<std::vector<PinnedObject>> remove(
        const std::string& path,
        bool recursive = true,
        CancellationToken cancel = {}) const;

private:
    StatusOr<std::string> dispatch(const ICommandClient::CommandRequest& request,
                                   const CancellationToken& cancel) const;

    // Shared by add and remove: {"Pins": ["<id>", ...]}
    StatusOr<std::vector<PinnedObject>> modifyPins(const std::string& command,
                                                   const std::string& path,
                                                   bool recursive,
                                                   const CancellationToken& cancel) const;

    std::shared_ptr<const ICommandClient> client_;
    bool debug_mode_;
};

} // namespace ipfspin
