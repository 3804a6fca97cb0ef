#include "config.hpp"
#include "ipfs/pin_api.hpp"
#include <yaml-cpp/yaml.h>
#include <getopt.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool parseBool(const std::string& value, const std::string& name) {
        const std::string lower = toLower(value);
        if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
            return true;
        }
        if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
            return false;
        }
        throw std::runtime_error("Invalid boolean for " + name + ": '" + value + "'");
    }

    int parseInt(const std::string& value, const std::string& name) {
        size_t consumed = 0;
        int result = 0;
        try {
            result = std::stoi(value, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + name + ": '" + value + "'");
        }
        if (consumed != value.size()) {
            throw std::runtime_error("Invalid integer for " + name + ": '" + value + "'");
        }
        return result;
    }

    std::string yamlScalar(const YAML::Node& node, const std::string& name) {
        if (!node.IsScalar()) {
            throw std::runtime_error("Config key '" + name + "' must be a scalar");
        }
        return node.Scalar();
    }

    YAML::Node loadYAMLFile(const std::string& path) {
        try {
            return YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid YAML in " + path + ": " + e.what());
        }
    }

    // Name of the option getopt just rejected. optopt is 0 for an unknown
    // long option; for short options argv may hold a group such as "-dx".
    std::string optionName(const char* last_arg) {
        if (optopt == 0 || std::string(last_arg).rfind("--", 0) == 0) {
            std::string name = last_arg;
            return name.substr(0, name.find('='));
        }
        return std::string("-") + static_cast<char>(optopt);
    }

    const char* getEnv(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }
}

void IpfsPinConfig::loadDefaults() {
    api_url = "http://127.0.0.1:5001";
    connect_timeout = 30;
    request_timeout = 0;
    debug_mode = false;
    verbose_logging = false;
    recursive = true;
    pin_type = "all";
    command.clear();
    paths.clear();
    help_requested = false;
}

bool IpfsPinConfig::loadFromYAML(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.good()) {
        return false;
    }
    file.close();

    const YAML::Node root = loadYAMLFile(config_path);

    // Empty file or only comments
    if (root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + config_path + " must contain key: value pairs");
    }

    if (root["api_url"]) {
        api_url = yamlScalar(root["api_url"], "api_url");
    }
    if (root["connect_timeout"]) {
        connect_timeout = parseInt(yamlScalar(root["connect_timeout"], "connect_timeout"),
                                   "connect_timeout");
    }
    if (root["request_timeout"]) {
        request_timeout = parseInt(yamlScalar(root["request_timeout"], "request_timeout"),
                                   "request_timeout");
    }
    if (root["debug"]) {
        debug_mode = parseBool(yamlScalar(root["debug"], "debug"), "debug");
    }
    if (root["verbose"]) {
        verbose_logging = parseBool(yamlScalar(root["verbose"], "verbose"), "verbose");
    }
    if (root["recursive"]) {
        recursive = parseBool(yamlScalar(root["recursive"], "recursive"), "recursive");
    }
    if (root["pin_type"]) {
        pin_type = yamlScalar(root["pin_type"], "pin_type");
    }
    // Unknown keys are ignored

    return true;
}

void IpfsPinConfig::loadFromEnv() {
    if (const char* value = getEnv("IPFSPIN_API_URL")) {
        api_url = value;
    }
    if (const char* value = getEnv("IPFSPIN_CONNECT_TIMEOUT")) {
        connect_timeout = parseInt(value, "IPFSPIN_CONNECT_TIMEOUT");
    }
    if (const char* value = getEnv("IPFSPIN_REQUEST_TIMEOUT")) {
        request_timeout = parseInt(value, "IPFSPIN_REQUEST_TIMEOUT");
    }
    if (const char* value = getEnv("IPFSPIN_DEBUG")) {
        debug_mode = parseBool(value, "IPFSPIN_DEBUG");
    }
    if (const char* value = getEnv("IPFSPIN_VERBOSE")) {
        verbose_logging = parseBool(value, "IPFSPIN_VERBOSE");
    }
}

void IpfsPinConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",          required_argument, 0, 'c'},
        {"api",             required_argument, 0, 'a'},
        {"connect-timeout", required_argument, 0, 'C'},
        {"timeout",         required_argument, 0, 'T'},
        {"type",            required_argument, 0, 't'},
        {"no-recursive",    no_argument,       0, 'n'},
        {"debug",           no_argument,       0, 'd'},
        {"verbose",         no_argument,       0, 'v'},
        {"help",            no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 0 makes glibc reinitialize its scanner, so repeated calls work
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, ":c:a:t:ndvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                // Already consumed by extractConfigPath
                break;
            case 'a':
                api_url = optarg;
                break;
            case 'C':
                connect_timeout = parseInt(optarg, "--connect-timeout");
                break;
            case 'T':
                request_timeout = parseInt(optarg, "--timeout");
                break;
            case 't':
                pin_type = optarg;
                break;
            case 'n':
                recursive = false;
                break;
            case 'd':
                debug_mode = true;
                break;
            case 'v':
                verbose_logging = true;
                break;
            case 'h':
                help_requested = true;
                break;
            case ':':
                throw std::runtime_error("Option " + optionName(argv[optind - 1]) +
                                         " requires an argument");
            case '?':
            default:
                throw std::runtime_error("Unrecognized option: " + optionName(argv[optind - 1]));
        }
    }

    // Positional arguments: <command> [path...]
    if (optind < argc) {
        command = argv[optind++];
        paths.clear();
    }
    while (optind < argc) {
        paths.push_back(argv[optind++]);
    }
}

std::optional<std::string> IpfsPinConfig::extractConfigPath(int argc, char* argv[]) {
    const std::string prefix = "--config=";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    if (const char* value = getEnv("IPFSPIN_CONFIG")) {
        return std::string(value);
    }
    return std::nullopt;
}

IpfsPinConfig IpfsPinConfig::load(int argc, char* argv[]) {
    IpfsPinConfig config;
    config.loadDefaults();

    if (auto config_path = extractConfigPath(argc, argv)) {
        if (!config.loadFromYAML(*config_path)) {
            throw std::runtime_error("Config file not found: " + *config_path);
        }
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);

    if (!config.help_requested) {
        config.validate();
    }
    return config;
}

void IpfsPinConfig::validate() const {
    if (api_url.empty()) {
        throw std::runtime_error("api_url must not be empty");
    }
    if (api_url.rfind("http://", 0) != 0 && api_url.rfind("https://", 0) != 0) {
        throw std::runtime_error("api_url must start with http:// or https://: " + api_url);
    }
    if (connect_timeout < 0) {
        throw std::runtime_error("connect_timeout must be >= 0");
    }
    if (request_timeout < 0) {
        throw std::runtime_error("request_timeout must be >= 0");
    }
    if (!ipfspin::ParsePinMode(pin_type)) {
        throw std::runtime_error("Unknown pin type: " + pin_type);
    }

    if (command.empty()) {
        throw std::runtime_error("Missing required argument: command");
    }
    if (command == "add" || command == "rm") {
        if (paths.empty()) {
            throw std::runtime_error("Missing required argument: path");
        }
    } else if (command == "ls") {
        if (!paths.empty()) {
            throw std::runtime_error("ls does not take a path");
        }
    } else {
        throw std::runtime_error("Unknown command: " + command);
    }
}

void IpfsPinConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [path...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  add <path>...            Pin objects to local storage\n";
    std::cout << "  ls                       List pinned objects\n";
    std::cout << "  rm <path>...             Unpin objects\n\n";

    std::cout << "Options:\n";
    std::cout << "  --config=FILE            YAML config file (or IPFSPIN_CONFIG)\n";
    std::cout << "  --api=URL                Daemon API address (default: http://127.0.0.1:5001)\n";
    std::cout << "  --connect-timeout=N      Connect timeout in seconds (default: 30)\n";
    std::cout << "  --timeout=N              Request timeout in seconds (default: 0, none)\n";
    std::cout << "  -t, --type=TYPE          ls filter: all, direct, recursive, indirect\n";
    std::cout << "  -n, --no-recursive       add/rm only the given object, not its links\n";
    std::cout << "  -d, --debug              Enable debug logging\n";
    std::cout << "  -v, --verbose            Enable verbose HTTP output\n";
    std::cout << "  -h, --help               Display this help message\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " add QmZTR5bcpQD7cFgTorqxZDYaew1Wqgfbd2ud9QqGPAkK2V\n";
    std::cout << "  " << program_name << " ls --type=direct\n";
    std::cout << "  " << program_name << " --api=http://10.0.0.2:5001 rm -n QmXarR6rgkQ2fDSHjSY5nM2kuCXKYGViky5nohtwgF65Ec\n";
}

ipfspin::ClientOptions IpfsPinConfig::toClientOptions() const {
    ipfspin::ClientOptions options;
    options.api_url = api_url;
    options.connect_timeout = connect_timeout;
    options.request_timeout = request_timeout;
    options.debug_mode = debug_mode;
    options.verbose_logging = verbose_logging;
    return options;
}
