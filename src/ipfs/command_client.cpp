#include "command_client.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace ipfspin {

namespace {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    void globalInit() {
        static std::once_flag flag;
        std::call_once(flag, [] {
            CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
            if (code != CURLE_OK) {
                std::cerr << "[ERROR] curl_global_init failed: " << curl_easy_strerror(code)
                          << std::endl;
            }
        });
    }

    // Per-transfer state handed to the libcurl callbacks
    struct Transfer {
        std::string body;
        CancellationToken cancel;
    };

    size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
        auto* transfer = static_cast<Transfer*>(userp);
        transfer->body.append(data, size * nmemb);
        return size * nmemb;
    }

    // Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* transfer = static_cast<Transfer*>(userp);
        return transfer->cancel.isCancellationRequested() ? 1 : 0;
    }

    std::optional<std::string> escape(CURL* curl, const std::string& value) {
        char* encoded = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (encoded == nullptr) {
            return std::nullopt;
        }
        std::string result(encoded);
        curl_free(encoded);
        return result;
    }

    std::optional<std::string> buildUrl(CURL* curl, const ClientOptions& options,
                                        const ICommandClient::CommandRequest& request) {
        std::string url = options.api_url;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        url += options.base_path + "/" + request.command;

        std::string query;
        if (request.argument) {
            auto arg = escape(curl, *request.argument);
            if (!arg) {
                return std::nullopt;
            }
            query += "&arg=" + *arg;
        }
        for (const auto& option : request.options) {
            query += '&';
            auto eq = option.find('=');
            if (eq == std::string::npos) {
                auto name = escape(curl, option);
                if (!name) {
                    return std::nullopt;
                }
                query += *name;
                continue;
            }
            auto name = escape(curl, option.substr(0, eq));
            auto value = escape(curl, option.substr(eq + 1));
            if (!name || !value) {
                return std::nullopt;
            }
            query += *name + "=" + *value;
        }

        if (!query.empty()) {
            query[0] = '?';
            url += query;
        }
        return url;
    }

    StatusCode codeFromHttpStatus(long http_status) {
        switch (http_status) {
            case 400: return StatusCode::kInvalidArgument;
            case 401: return StatusCode::kUnauthenticated;
            case 403: return StatusCode::kPermissionDenied;
            case 404: return StatusCode::kNotFound;
            case 405: return StatusCode::kUnimplemented;
            case 408: return StatusCode::kDeadlineExceeded;
            case 429: return StatusCode::kResourceExhausted;
            case 501: return StatusCode::kUnimplemented;
            case 503: return StatusCode::kUnavailable;
            default:
                break;
        }
        return http_status >= 500 ? StatusCode::kUnknown : StatusCode::kFailedPrecondition;
    }

    StatusCode codeFromCurl(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
                return StatusCode::kUnavailable;
            case CURLE_OPERATION_TIMEDOUT:
                return StatusCode::kDeadlineExceeded;
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return StatusCode::kInvalidArgument;
            default:
                return StatusCode::kUnknown;
        }
    }
}

std::string BuildCommandUrl(const ClientOptions& options,
                            const ICommandClient::CommandRequest& request) {
    globalInit();
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Could not initialize curl handle");
    }
    auto url = buildUrl(curl.get(), options, request);
    if (!url) {
        throw std::runtime_error("Could not encode parameters for " + request.command);
    }
    return *url;
}

Status StatusFromHttpResponse(long http_status, const std::string& body,
                              const std::string& command) {
    if (http_status >= 200 && http_status < 300) {
        return Status();
    }

    // The daemon reports failures as {"Message": "...", "Code": 0, "Type": "error"}
    std::string detail;
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("Message") &&
        json["Message"].is_string()) {
        detail = json["Message"].get<std::string>();
    } else if (!body.empty()) {
        detail = body;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
    } else {
        detail = "no response body";
    }

    return RemoteCommandError(codeFromHttpStatus(http_status),
                              command + " failed with HTTP " + std::to_string(http_status) +
                              ": " + detail,
                              command);
}

CurlCommandClient::CurlCommandClient() : CurlCommandClient(ClientOptions{}) {}

CurlCommandClient::CurlCommandClient(ClientOptions options)
    : options_(std::move(options)) {
    globalInit();
}

StatusOr<std::string> CurlCommandClient::Execute(const CommandRequest& request,
                                                 CancellationToken cancel) const {
    if (cancel.isCancellationRequested()) {
        return CancelledError(request.command);
    }

    CurlHandle req(curl_easy_init(), &curl_easy_cleanup);
    if (!req) {
        return RemoteCommandError(StatusCode::kInternal, "Could not initialize curl handle",
                                  request.command);
    }

    auto url = buildUrl(req.get(), options_, request);
    if (!url) {
        return RemoteCommandError(StatusCode::kInvalidArgument,
                                  "Could not encode parameters for " + request.command,
                                  request.command);
    }

    if (options_.debug_mode) {
        std::cout << "[DEBUG] POST " << *url << std::endl;
    }

    Transfer transfer;
    transfer.cancel = cancel;

    curl_easy_setopt(req.get(), CURLOPT_URL, url->c_str());
    curl_easy_setopt(req.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(req.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(req.get(), CURLOPT_POSTFIELDS, "");
    curl_easy_setopt(req.get(), CURLOPT_POSTFIELDSIZE, 0L);
    curl_easy_setopt(req.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(req.get(), CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(req.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(req.get(), CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(req.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(req.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout);
    if (options_.request_timeout > 0) {
        curl_easy_setopt(req.get(), CURLOPT_TIMEOUT, options_.request_timeout);
    }
    if (options_.verbose_logging) {
        curl_easy_setopt(req.get(), CURLOPT_VERBOSE, 1L);
    }

    CURLcode code = curl_easy_perform(req.get());

    if (code == CURLE_ABORTED_BY_CALLBACK && cancel.isCancellationRequested()) {
        if (options_.debug_mode) {
            std::cout << "[DEBUG] " << request.command << " was cancelled" << std::endl;
        }
        return CancelledError(request.command);
    }

    if (code != CURLE_OK) {
        std::cerr << "[ERROR] Unable to POST '" << *url << "': "
                  << curl_easy_strerror(code) << " (" << code << ")" << std::endl;
        return RemoteCommandError(codeFromCurl(code),
                                  "Unable to reach daemon for " + request.command + ": " +
                                  curl_easy_strerror(code),
                                  request.command);
    }

    long http_status = 0;
    curl_easy_getinfo(req.get(), CURLINFO_RESPONSE_CODE, &http_status);

    if (options_.debug_mode) {
        std::cout << "[DEBUG] " << request.command << " returned HTTP " << http_status
                  << ", body = " << transfer.body.size() << " bytes" << std::endl;
    }

    auto status = StatusFromHttpResponse(http_status, transfer.body, request.command);
    if (!status.ok()) {
        std::cerr << "[ERROR] " << status.message() << std::endl;
        return status;
    }

    return std::move(transfer.body);
}

} // namespace ipfspin
