#pragma once

#include <string>
#include <vector>
#include <optional>
#include "ipfs/command_client.hpp"

/**
 * IpfsPinConfig - Configuration options for ipfs-pin
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables
 * 4. Command-line arguments (highest priority)
 */
struct IpfsPinConfig {
    // Daemon command API
    std::string api_url;
    int connect_timeout = 30;  // seconds
    int request_timeout = 0;   // seconds, 0 = no timeout

    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    // Pin options
    bool recursive = true;
    std::string pin_type;

    // Subcommand (add, ls, rm) and its paths
    std::string command;
    std::vector<std::string> paths;

    bool help_requested = false;

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     * @throws std::runtime_error if a source is invalid
     */
    static IpfsPinConfig load(int argc, char* argv[]);

    /**
     * Apply command-line arguments on top of the current values
     *
     * @throws std::runtime_error on malformed option values
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: IPFSPIN_* variables
     */
    void loadFromEnv();

    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    static void printUsage(const char* program_name);

    // Options for the command client
    ipfspin::ClientOptions toClientOptions() const;

private:
    /**
     * Extract --config flag from arguments before full parsing
     */
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};
