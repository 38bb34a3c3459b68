#include <catch2/catch_test_macros.hpp>
#include "c11n/transport/local_transport.hpp"
#include "c11n/core/constants.hpp"
#include "helpers/stub_node_server.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace c11n::core;
using namespace c11n::transport;
using namespace c11n::configuration;
using namespace c11n::test_helpers;

namespace {
    HttpRequest Get(const std::string& path) {
        return HttpRequest::Create("GET", NodeUrl(path)).Unwrap();
    }

    using Clock = std::chrono::steady_clock;

    /// Listening socket that never accepts, with its one-slot backlog taken
    class SaturatedListener {
    public:
        SaturatedListener() : path_(StubNodeServer::UniqueSocketPath()) {
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            path_.copy(addr.sun_path, path_.size());
            const auto* address = reinterpret_cast<const sockaddr*>(&addr);

            listener_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            REQUIRE(listener_ >= 0);
            REQUIRE(::bind(listener_, address, sizeof(addr)) == 0);
            REQUIRE(::listen(listener_, 0) == 0);

            filler_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            REQUIRE(filler_ >= 0);
            REQUIRE(::connect(filler_, address, sizeof(addr)) == 0);
        }

        ~SaturatedListener() {
            ::close(filler_);
            ::close(listener_);
            ::unlink(path_.c_str());
        }

        SaturatedListener(const SaturatedListener&) = delete;
        SaturatedListener& operator=(const SaturatedListener&) = delete;

        [[nodiscard]] const std::string& SocketPath() const noexcept { return path_; }

    private:
        std::string path_;
        int listener_ = -1;
        int filler_ = -1;
    };
}

TEST_CASE("LocalTransport - Exchange over the node socket", "[transport][integration]") {
    StubNodeServer server([](const RecordedRequest& request) {
        return StubResponse::Ok("echo:" + request.body);
    });
    const LocalTransport transport(server.SocketPath());

    SECTION("GET round trip carries Host c and closes the connection") {
        auto response = transport.RoundTrip(Get("upcheck"));
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().status_code == 200);
        REQUIRE(response.Unwrap().body == "echo:");

        const auto recorded = server.LastRequest();
        REQUIRE(recorded.method == "GET");
        REQUIRE(recorded.target == "/upcheck");
        REQUIRE(recorded.Header("Host") == "c");
        REQUIRE(recorded.Header("Connection") == "close");
    }

    SECTION("Large POST bodies arrive intact") {
        auto request = HttpRequest::Create("POST", NodeUrl("sendraw")).Unwrap();
        const std::string body(512 * 1024, 'x');
        request.SetBody(std::string_view(body));
        auto response = transport.RoundTrip(request);
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().body.size() == body.size() + 5);
        REQUIRE(server.LastRequest().body == body);
    }

    SECTION("Sequential requests each use a fresh connection") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(transport.RoundTrip(Get("upcheck")).IsOk());
        }
        REQUIRE(server.RequestCount() == 5);
    }

    SECTION("Requests to another virtual host never reach the socket") {
        auto request = HttpRequest::Create("GET", "http+unix://other/upcheck").Unwrap();
        auto response = transport.RoundTrip(request);
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(server.RequestCount() == 0);
    }

    SECTION("Header injection is rejected before any I/O") {
        auto request = Get("receiveraw");
        request.SetHeader("c11n-key", "a\nb");
        auto response = transport.RoundTrip(request);
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::InvalidInput);
        REQUIRE(server.RequestCount() == 0);
    }
}

TEST_CASE("LocalTransport - Response framing from the node", "[transport][integration]") {
    SECTION("Chunked response") {
        StubNodeServer server([](const RecordedRequest&) {
            return StubResponse::Raw(
                "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                "3\r\na,b\r\n2\r\n,c\r\n0\r\n\r\n");
        });
        auto response = LocalTransport(server.SocketPath()).RoundTrip(Get("participants"));
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().body == "a,b,c");
    }

    SECTION("Close-delimited response") {
        StubNodeServer server([](const RecordedRequest&) {
            return StubResponse::Raw("HTTP/1.1 200 OK\r\n\r\ntrue");
        });
        auto response = LocalTransport(server.SocketPath()).RoundTrip(Get("isSender"));
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().body == "true");
    }

    SECTION("Non-200 is returned as a response, not a failure") {
        StubNodeServer server([](const RecordedRequest&) {
            return StubResponse::Status(500, "Internal Server Error", "boom");
        });
        auto response = LocalTransport(server.SocketPath()).RoundTrip(Get("upcheck"));
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().status_code == 500);
    }

    SECTION("Truncated response is a transport failure") {
        StubNodeServer server([](const RecordedRequest&) {
            return StubResponse::Raw("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
        });
        auto response = LocalTransport(server.SocketPath()).RoundTrip(Get("upcheck"));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
    }

    SECTION("Garbage response is a transport failure") {
        StubNodeServer server([](const RecordedRequest&) {
            return StubResponse::Raw("not http at all\r\n\r\n");
        });
        auto response = LocalTransport(server.SocketPath()).RoundTrip(Get("upcheck"));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
    }
}

TEST_CASE("LocalTransport - Unreachable node", "[transport][integration][timeout]") {
    SECTION("Missing socket fails fast") {
        const LocalTransport transport(StubNodeServer::UniqueSocketPath());
        const auto started = Clock::now();
        auto response = transport.RoundTrip(Get("upcheck"));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(response.UnwrapErr().IsRetryable());
        REQUIRE(Clock::now() - started < 1s);
    }

    SECTION("Full listener backlog hits the dial timeout") {
        const SaturatedListener listener;
        const LocalTransport transport(listener.SocketPath(), TransportConfig(200ms, 2000ms, 2000ms));
        const auto started = Clock::now();
        auto response = transport.RoundTrip(Get("upcheck"));
        const auto elapsed = Clock::now() - started;
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(response.UnwrapErr().message.find(ErrorMessages::CONNECT_TIMEOUT) != std::string::npos);
        REQUIRE(elapsed >= 150ms);
        REQUIRE(elapsed < 1s);
    }

    SECTION("Socket path longer than sockaddr_un allows") {
        const LocalTransport transport("/tmp/" + std::string(200, 'p') + ".sock");
        auto response = transport.RoundTrip(Get("upcheck"));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(response.UnwrapErr().message.find(ErrorMessages::SOCKET_PATH_TOO_LONG) != std::string::npos);
    }

    SECTION("Slow headers hit the header timeout") {
        StubNodeServer server([](const RecordedRequest&) {
            std::this_thread::sleep_for(800ms);
            return StubResponse::Ok("late");
        });
        const LocalTransport transport(server.SocketPath(), TransportConfig(200ms, 2000ms, 150ms));
        const auto started = Clock::now();
        auto response = transport.RoundTrip(Get("upcheck"));
        const auto elapsed = Clock::now() - started;
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(response.UnwrapErr().message == ErrorMessages::HEADER_TIMEOUT);
        REQUIRE(elapsed >= 150ms);
        REQUIRE(elapsed < 800ms);
    }

    SECTION("Whole-request timeout caps a slow node") {
        StubNodeServer server([](const RecordedRequest&) {
            std::this_thread::sleep_for(800ms);
            return StubResponse::Ok("late");
        });
        const LocalTransport transport(server.SocketPath(), TransportConfig(200ms, 250ms, 5000ms));
        const auto started = Clock::now();
        auto response = transport.RoundTrip(Get("upcheck"));
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == NodeClientFailureType::Transport);
        REQUIRE(Clock::now() - started < 800ms);
    }
}
