#include <catch2/catch_test_macros.hpp>
#include "c11n/client/payload_client.hpp"
#include "c11n/encoding/base64.hpp"
#include "c11n/encoding/path_segment.hpp"
#include "c11n/node_api.pb.h"
#include "helpers/mock_transport.hpp"
#include <google/protobuf/util/json_util.h>
#include <memory>
#include <string>
#include <vector>

using namespace c11n::core;
using namespace c11n::client;
using namespace c11n::encoding;
using namespace c11n::models;
using namespace c11n::test_helpers;

namespace {
    std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    EncryptedPayloadHash HashWithPunctuation() {
        // 0xFB 0xFF 0xBF encodes to "+/+/" so the base64 form needs escaping
        std::vector<uint8_t> bytes(EncryptedPayloadHash::SIZE, 0x00);
        for (size_t i = 0; i + 2 < bytes.size(); i += 3) {
            bytes[i] = 0xFB;
            bytes[i + 1] = 0xFF;
            bytes[i + 2] = 0xBF;
        }
        return EncryptedPayloadHash::FromBytes(bytes).Unwrap();
    }

    struct ClientFixture {
        std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
        PayloadClient client{transport};
    };
}

TEST_CASE("PayloadClient - SendPayload", "[client][payload]") {
    REQUIRE(Base64::Initialize().IsOk());
    ClientFixture fx;
    fx.transport->RespondWith(200, "a2V5LWJ5dGVz");

    SECTION("Posts the raw payload to /sendraw with routing headers") {
        auto key = fx.client.SendPayload(Bytes("payload"), "RlJPTQ==", {"VE8x", "VE8y"});
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap() == Bytes("key-bytes"));

        const auto request = fx.transport->LastRequest();
        REQUIRE(request.Method() == "POST");
        REQUIRE(request.Host() == "c");
        REQUIRE(request.Target() == "sendraw");
        REQUIRE(request.Body() == "payload");
        REQUIRE(request.GetHeader("c11n-from") == "RlJPTQ==");
        REQUIRE(request.GetHeader("c11n-to") == "VE8x,VE8y");
        REQUIRE(request.GetHeader("Content-Type") == "application/octet-stream");
    }

    SECTION("Empty sender omits c11n-from entirely") {
        REQUIRE(fx.client.SendPayload(Bytes("p"), "", {"VE8x"}).IsOk());
        const auto request = fx.transport->LastRequest();
        REQUIRE_FALSE(request.GetHeader("c11n-from").has_value());
        REQUIRE(request.GetHeader("c11n-to") == "VE8x");
    }

    SECTION("No recipients sends an empty c11n-to") {
        REQUIRE(fx.client.SendPayload(Bytes("p"), "", {}).IsOk());
        REQUIRE(fx.transport->LastRequest().GetHeader("c11n-to") == "");
    }

    SECTION("Response body that is not base64 is a decoding failure") {
        fx.transport->RespondWith(200, "%%%not-base64%%%");
        auto key = fx.client.SendPayload(Bytes("p"), "", {"VE8x"});
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().type == NodeClientFailureType::Decoding);
    }

    SECTION("Line breaks in the response body are ignored") {
        fx.transport->RespondWith(200, "a2V5LWJ5\r\ndGVz\n");
        auto key = fx.client.SendPayload(Bytes("p"), "", {"VE8x"});
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap() == Bytes("key-bytes"));
    }
}

TEST_CASE("PayloadClient - SendSignedPayload and ReceivePayload", "[client][payload]") {
    REQUIRE(Base64::Initialize().IsOk());
    ClientFixture fx;

    SECTION("Signed payload goes to /sendsignedtx without a sender") {
        fx.transport->RespondWith(200, "Zm9v");
        auto key = fx.client.SendSignedPayload(Bytes("signed"), {"VE8x"});
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap() == Bytes("foo"));
        const auto request = fx.transport->LastRequest();
        REQUIRE(request.Target() == "sendsignedtx");
        REQUIRE(request.Body() == "signed");
        REQUIRE_FALSE(request.GetHeader("c11n-from").has_value());
        REQUIRE(request.GetHeader("c11n-to") == "VE8x");
    }

    SECTION("Receive sends the key as base64 and returns the body raw") {
        fx.transport->RespondWith(200, std::string("raw\x00\xffpayload", 12));
        auto payload = fx.client.ReceivePayload(Bytes("foo"));
        REQUIRE(payload.IsOk());
        REQUIRE(payload.Unwrap().size() == 12);
        REQUIRE(payload.Unwrap()[4] == 0xFF);
        const auto request = fx.transport->LastRequest();
        REQUIRE(request.Method() == "GET");
        REQUIRE(request.Target() == "receiveraw");
        REQUIRE(request.GetHeader("c11n-key") == "Zm9v");
        REQUIRE(request.Body().empty());
    }

    SECTION("Empty body receives an empty payload") {
        fx.transport->RespondWith(200, "");
        auto payload = fx.client.ReceivePayload(Bytes("foo"));
        REQUIRE(payload.IsOk());
        REQUIRE(payload.Unwrap().empty());
    }
}

TEST_CASE("PayloadClient - Transaction queries", "[client][transaction]") {
    REQUIRE(Base64::Initialize().IsOk());
    ClientFixture fx;
    const auto hash = HashWithPunctuation();

    SECTION("IsSender is true only for the exact body true") {
        fx.transport->RespondWith(200, "true");
        REQUIRE(fx.client.IsSender(hash).Unwrap());

        for (const std::string body : {"false", "True", "TRUE", "1", "true\n", " true", ""}) {
            fx.transport->RespondWith(200, body);
            auto result = fx.client.IsSender(hash);
            REQUIRE(result.IsOk());
            REQUIRE_FALSE(result.Unwrap());
        }
    }

    SECTION("Hash is escaped into a single path segment") {
        fx.transport->RespondWith(200, "true");
        REQUIRE(fx.client.IsSender(hash).IsOk());
        const auto target = fx.transport->LastRequest().Target();
        const auto b64 = hash.ToBase64();
        REQUIRE(b64.find('+') != std::string::npos);
        REQUIRE(b64.find('/') != std::string::npos);
        REQUIRE(target == "transaction/" + PathSegment::Escape(b64) + "/isSender");
        REQUIRE(target.find('+') == std::string::npos);
    }

    SECTION("Participants are split on commas") {
        fx.transport->RespondWith(200, "a,b,c");
        auto participants = fx.client.GetParticipants(hash);
        REQUIRE(participants.IsOk());
        REQUIRE(participants.Unwrap() == std::vector<std::string>{"a", "b", "c"});
        const auto target = fx.transport->LastRequest().Target();
        REQUIRE(target == "transaction/" + PathSegment::Escape(hash.ToBase64()) + "/participants");
    }

    SECTION("Empty participants body yields one empty entry") {
        fx.transport->RespondWith(200, "");
        auto participants = fx.client.GetParticipants(hash);
        REQUIRE(participants.IsOk());
        REQUIRE(participants.Unwrap() == std::vector<std::string>{""});
    }
}

TEST_CASE("PayloadClient - Non-200 responses", "[client][errors]") {
    REQUIRE(Base64::Initialize().IsOk());
    ClientFixture fx;
    const auto hash = HashWithPunctuation();
    fx.transport->RespondWith(404, "!!not base64 and not true!!", {{"X-Node-Error", "missing"}});

    const auto require_unexpected_status = [](const NodeClientFailure& failure) {
        REQUIRE(failure.type == NodeClientFailureType::UnexpectedStatus);
        REQUIRE(failure.status_code == 404);
        REQUIRE(failure.headers.size() == 1);
        REQUIRE(failure.headers[0].second == "missing");
        REQUIRE(failure.message.find("Non-200 status code") != std::string::npos);
    };

    SECTION("SendPayload") {
        auto result = fx.client.SendPayload(Bytes("p"), "", {"VE8x"});
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("SendSignedPayload") {
        auto result = fx.client.SendSignedPayload(Bytes("p"), {"VE8x"});
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("ReceivePayload") {
        auto result = fx.client.ReceivePayload(Bytes("k"));
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("IsSender") {
        auto result = fx.client.IsSender(hash);
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("GetParticipants") {
        auto result = fx.client.GetParticipants(hash);
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("Send") {
        auto result = fx.client.Send(Bytes("p"), "", {"VE8x"});
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("Receive") {
        auto result = fx.client.Receive(Bytes("k"), "VE8x");
        REQUIRE(result.IsErr());
        require_unexpected_status(result.UnwrapErr());
    }
    SECTION("Status 201 is not success either") {
        fx.transport->RespondWith(201, "Zm9v");
        auto result = fx.client.SendPayload(Bytes("p"), "", {"VE8x"});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().status_code == 201);
    }
}

TEST_CASE("PayloadClient - Transport failures pass through", "[client][errors]") {
    ClientFixture fx;
    fx.transport->FailWith(NodeClientFailure::Transport("connect(/tmp/x.ipc) failed: Connection refused"));

    auto result = fx.client.ReceivePayload(Bytes("k"));
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == NodeClientFailureType::Transport);
    REQUIRE(result.UnwrapErr().message == "connect(/tmp/x.ipc) failed: Connection refused");
    REQUIRE(result.UnwrapErr().IsRetryable());
}

TEST_CASE("PayloadClient - Structured JSON endpoints", "[client][json]") {
    REQUIRE(Base64::Initialize().IsOk());
    ClientFixture fx;

    SECTION("Send posts a SendRequest and decodes the key") {
        fx.transport->RespondWith(200, R"({"key":"Zm9v","ignored":1})");
        auto key = fx.client.Send(Bytes("payload"), "RlJPTQ==", {"VE8x", "VE8y"});
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap() == Bytes("foo"));

        const auto request = fx.transport->LastRequest();
        REQUIRE(request.Method() == "POST");
        REQUIRE(request.Target() == "send");
        REQUIRE(request.GetHeader("Content-Type") == "application/json");

        c11n::proto::node::SendRequest sent;
        REQUIRE(google::protobuf::util::JsonStringToMessage(request.Body(), &sent).ok());
        REQUIRE(sent.payload() == "payload");
        REQUIRE(sent.from() == "RlJPTQ==");
        REQUIRE(sent.to_size() == 2);
        REQUIRE(sent.to(1) == "VE8y");
    }

    SECTION("Receive posts a ReceiveRequest and decodes the payload") {
        fx.transport->RespondWith(200, R"({"payload":"YmFy"})");
        auto payload = fx.client.Receive(Bytes("foo"), "VE8x");
        REQUIRE(payload.IsOk());
        REQUIRE(payload.Unwrap() == Bytes("bar"));

        c11n::proto::node::ReceiveRequest sent;
        REQUIRE(google::protobuf::util::JsonStringToMessage(fx.transport->LastRequest().Body(), &sent).ok());
        REQUIRE(sent.key() == "foo");
        REQUIRE(sent.to() == "VE8x");
    }

    SECTION("Malformed JSON is a decoding failure") {
        fx.transport->RespondWith(200, "{not json");
        auto key = fx.client.Send(Bytes("payload"), "", {"VE8x"});
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().type == NodeClientFailureType::Decoding);
    }

    SECTION("SendJson returns the raw successful response") {
        fx.transport->RespondWith(200, "{}");
        c11n::proto::node::ReceiveRequest message;
        message.set_to("VE8x");
        auto response = fx.client.SendJson("custom/path", message);
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().body == "{}");
        REQUIRE(fx.transport->LastRequest().Target() == "custom/path");
    }
}
