/**
 * @file payload_roundtrip_example.cpp
 * @brief Store a payload in a local constellation node and read it back
 *
 * Usage: payload_roundtrip_example <socket-path> <recipient-b64> [node-config]
 *
 * With a node config the node is launched first and polled until its socket
 * answers; otherwise an already running node is expected.
 */

#include "c11n/client/payload_client.hpp"
#include "c11n/node/health_prober.hpp"
#include "c11n/node/node_supervisor.hpp"
#include "c11n/transport/local_transport.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace c11n;

namespace {
    int Fail(const std::string& step, const core::NodeClientFailure& failure) {
        std::cerr << step << " failed [" << core::FailureTypeName(failure.type) << "]: "
                  << failure.message << std::endl;
        return 1;
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <socket-path> <recipient-b64> [node-config]" << std::endl;
        return 2;
    }
    const std::string socket_path = argv[1];
    const std::string recipient = argv[2];

    std::cout << "=== Constellation Node Client - Payload Round Trip ===" << std::endl;
    std::cout << std::endl;

    // Launch the node when a config is given
    std::optional<node::NodeProcess> process;
    if (argc > 3) {
        std::cout << "1. Launching constellation-node " << argv[3] << "..." << std::endl;
        const node::NodeSupervisor supervisor(
            configuration::SupervisorConfig::Default().WithReadinessPolling(socket_path));
        auto launched = supervisor.Launch(argv[3]);
        if (launched.IsErr()) {
            return Fail("Launch", launched.UnwrapErr());
        }
        process.emplace(std::move(launched).Unwrap());
        std::cout << "   ✓ Node running as pid " << process->Pid() << std::endl;
    } else {
        std::cout << "1. Using the node already listening on " << socket_path << std::endl;
    }
    std::cout << std::endl;

    // Check liveness
    std::cout << "2. Probing /upcheck..." << std::endl;
    auto node_transport = transport::LocalTransport::Create(socket_path);
    const node::HealthProber prober(node_transport);
    if (auto probe = prober.Probe(); probe.IsErr()) {
        return Fail("Probe", probe.UnwrapErr());
    }
    std::cout << "   ✓ Node is up" << std::endl;
    std::cout << std::endl;

    // Send and receive
    const client::PayloadClient client(node_transport);
    const std::string text = "hello from the node client example";
    const std::vector<uint8_t> payload(text.begin(), text.end());

    std::cout << "3. Sending " << payload.size() << " bytes to " << recipient << "..." << std::endl;
    auto key = client.SendPayload(payload, "", {recipient});
    if (key.IsErr()) {
        return Fail("SendPayload", key.UnwrapErr());
    }
    std::cout << "   ✓ Stored under a " << key.Unwrap().size() << "-byte key" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Receiving the payload back..." << std::endl;
    auto received = client.ReceivePayload(key.Unwrap());
    if (received.IsErr()) {
        return Fail("ReceivePayload", received.UnwrapErr());
    }
    const auto& bytes = received.Unwrap();
    std::cout << "   ✓ Received: " << std::string(bytes.begin(), bytes.end()) << std::endl;
    std::cout << std::endl;

    if (bytes != payload) {
        std::cerr << "Round trip mismatch" << std::endl;
        return 1;
    }
    std::cout << "=== Round trip complete ===" << std::endl;
    return 0;
}
