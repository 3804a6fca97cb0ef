#include "command_client.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using ::testing::HasSubstr;
using google::cloud::StatusCode;
using ipfspin::ClientOptions;
using ipfspin::ICommandClient;

class CommandUrlTest : public ::testing::Test {
protected:
    static ICommandClient::CommandRequest makeRequest(const std::string& command,
                                                      std::optional<std::string> argument,
                                                      std::vector<std::string> options) {
        ICommandClient::CommandRequest request;
        request.command = command;
        request.argument = std::move(argument);
        request.options = std::move(options);
        return request;
    }

    ClientOptions options;
};

TEST_F(CommandUrlTest, ArgumentAndOption) {
    auto url = ipfspin::BuildCommandUrl(
        options, makeRequest("pin/add", "QmXarR6rgkQ2fDSHjSY5nM2kuCXKYGViky5nohtwgF65Ec",
                             {"recursive=true"}));

    EXPECT_EQ(url, "http://127.0.0.1:5001/api/v0/pin/add"
                   "?arg=QmXarR6rgkQ2fDSHjSY5nM2kuCXKYGViky5nohtwgF65Ec&recursive=true");
}

TEST_F(CommandUrlTest, RecursiveFalseRenderedVerbatim) {
    auto url = ipfspin::BuildCommandUrl(options, makeRequest("pin/rm", "QmA", {"recursive=false"}));

    EXPECT_THAT(url, HasSubstr("&recursive=false"));
}

TEST_F(CommandUrlTest, ArgumentIsEscaped) {
    auto url = ipfspin::BuildCommandUrl(
        options, makeRequest("pin/add", "QmA/about me", {"recursive=true"}));

    EXPECT_EQ(url, "http://127.0.0.1:5001/api/v0/pin/add?arg=QmA%2Fabout%20me&recursive=true");
}

TEST_F(CommandUrlTest, OptionWithoutArgument) {
    auto url = ipfspin::BuildCommandUrl(options, makeRequest("pin/ls", std::nullopt, {"type=direct"}));

    EXPECT_EQ(url, "http://127.0.0.1:5001/api/v0/pin/ls?type=direct");
}

TEST_F(CommandUrlTest, NoParameters) {
    auto url = ipfspin::BuildCommandUrl(options, makeRequest("version", std::nullopt, {}));

    EXPECT_EQ(url, "http://127.0.0.1:5001/api/v0/version");
}

TEST_F(CommandUrlTest, TrailingSlashOnApiUrl) {
    options.api_url = "http://ipfs.local:5001/";
    auto url = ipfspin::BuildCommandUrl(options, makeRequest("pin/ls", std::nullopt, {"type=all"}));

    EXPECT_EQ(url, "http://ipfs.local:5001/api/v0/pin/ls?type=all");
}

TEST(HttpStatusTest, SuccessIsOk) {
    EXPECT_TRUE(ipfspin::StatusFromHttpResponse(200, R"({"Pins":[]})", "pin/add").ok());
}

TEST(HttpStatusTest, DaemonMessageIsExtracted) {
    auto status = ipfspin::StatusFromHttpResponse(
        500, R"({"Message":"invalid path \"bogus\": selected encoding not supported","Code":0,"Type":"error"})",
        "pin/add");

    EXPECT_EQ(status.code(), StatusCode::kUnknown);
    EXPECT_THAT(status.message(), HasSubstr("invalid path \"bogus\""));
    EXPECT_THAT(status.message(), HasSubstr("HTTP 500"));
    EXPECT_TRUE(ipfspin::IsRemoteCommandError(status));
    EXPECT_EQ(status.error_info().metadata().at("command"), "pin/add");
}

TEST(HttpStatusTest, PlainBodyIsKept) {
    auto status = ipfspin::StatusFromHttpResponse(400, "unknown option \"typ\"\n", "pin/ls");

    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
    EXPECT_THAT(status.message(), HasSubstr("unknown option \"typ\""));
}

TEST(HttpStatusTest, EmptyBody) {
    auto status = ipfspin::StatusFromHttpResponse(502, "", "pin/ls");

    EXPECT_EQ(status.code(), StatusCode::kUnknown);
    EXPECT_THAT(status.message(), HasSubstr("no response body"));
}

TEST(HttpStatusTest, CodeMapping) {
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(401, "", "c").code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(403, "", "c").code(), StatusCode::kPermissionDenied);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(404, "", "c").code(), StatusCode::kNotFound);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(405, "", "c").code(), StatusCode::kUnimplemented);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(429, "", "c").code(), StatusCode::kResourceExhausted);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(503, "", "c").code(), StatusCode::kUnavailable);
    EXPECT_EQ(ipfspin::StatusFromHttpResponse(418, "", "c").code(), StatusCode::kFailedPrecondition);
}

TEST(CurlCommandClientTest, CancelledBeforeRequest) {
    ipfspin::CurlCommandClient client;
    ipfspin::CancellationSource source;
    source.cancel();

    ICommandClient::CommandRequest request;
    request.command = "pin/ls";
    request.options = {"type=all"};

    auto result = client.Execute(request, source.token());

    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(ipfspin::IsCancelled(result.status()));
}

TEST(CurlCommandClientTest, UnreachableDaemon) {
    ClientOptions options;
    // Nothing listens on port 1
    options.api_url = "http://127.0.0.1:1";
    options.connect_timeout = 2;
    ipfspin::CurlCommandClient client(options);

    ICommandClient::CommandRequest request;
    request.command = "pin/ls";
    request.options = {"type=all"};

    auto result = client.Execute(request, {});

    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(ipfspin::IsRemoteCommandError(result.status()));
    EXPECT_EQ(result.status().code(), StatusCode::kUnavailable);
}

// Accepts connections into its backlog and never answers them, so a request
// against it stays in flight until it is cancelled or times out.
class SilentServer {
public:
    SilentServer() : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        if (fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 4) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            throw std::runtime_error("Could not listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
    }

    ~SilentServer() { ::close(fd_); }

    SilentServer(const SilentServer&) = delete;
    SilentServer& operator=(const SilentServer&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    int fd_;
    int port_ = 0;
};

class CurlCommandClientInFlightTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.api_url = server.url();
        options.connect_timeout = 5;
        request.command = "pin/add";
        request.argument = "QmZTR5bcpQD7cFgTorqxZDYaew1Wqgfbd2ud9QqGPAkK2V";
        request.options = {"recursive=true"};
    }

    SilentServer server;
    ClientOptions options;
    ICommandClient::CommandRequest request;
};

TEST_F(CurlCommandClientInFlightTest, CancelledDuringRequest) {
    // Overall timeout as a backstop so a broken abort fails instead of hanging
    options.request_timeout = 30;
    ipfspin::CurlCommandClient client(options);
    ipfspin::CancellationSource source;

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto result = client.Execute(request, source.token());
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(ipfspin::IsCancelled(result.status()));
    EXPECT_EQ(result.status().code(), StatusCode::kCancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(CurlCommandClientInFlightTest, RequestTimeout) {
    options.request_timeout = 1;
    ipfspin::CurlCommandClient client(options);

    auto result = client.Execute(request, {});

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), StatusCode::kDeadlineExceeded);
    EXPECT_TRUE(ipfspin::IsRemoteCommandError(result.status()));
    EXPECT_FALSE(ipfspin::IsCancelled(result.status()));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
