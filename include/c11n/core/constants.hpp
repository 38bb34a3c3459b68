#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace c11n::core {
struct ApiPaths {
    static constexpr std::string_view UPCHECK = "upcheck";
    static constexpr std::string_view SEND_RAW = "sendraw";
    static constexpr std::string_view SEND_SIGNED_TX = "sendsignedtx";
    static constexpr std::string_view RECEIVE_RAW = "receiveraw";
    static constexpr std::string_view SEND = "send";
    static constexpr std::string_view RECEIVE = "receive";
    static constexpr std::string_view TRANSACTION_PREFIX = "transaction/";
    static constexpr std::string_view IS_SENDER_SUFFIX = "/isSender";
    static constexpr std::string_view PARTICIPANTS_SUFFIX = "/participants";
};
struct HeaderNames {
    static constexpr std::string_view FROM = "c11n-from";
    static constexpr std::string_view TO = "c11n-to";
    static constexpr std::string_view KEY = "c11n-key";
    static constexpr std::string_view CONTENT_TYPE = "Content-Type";
    static constexpr std::string_view CONTENT_LENGTH = "Content-Length";
    static constexpr std::string_view TRANSFER_ENCODING = "Transfer-Encoding";
    static constexpr std::string_view HOST = "Host";
    static constexpr std::string_view CONNECTION = "Connection";
};
struct ContentTypes {
    static constexpr std::string_view JSON = "application/json";
    static constexpr std::string_view OCTET_STREAM = "application/octet-stream";
};
struct HttpConstants {
    static constexpr int STATUS_OK = 200;
    static constexpr std::string_view VERSION = "HTTP/1.1";
    static constexpr std::string_view CRLF = "\r\n";
    static constexpr std::string_view HEADER_TERMINATOR = "\r\n\r\n";
    static constexpr std::string_view METHOD_GET = "GET";
    static constexpr std::string_view METHOD_POST = "POST";
    static constexpr std::string_view SCHEME = "http+unix://";
    static constexpr std::string_view CHUNKED = "chunked";
    static constexpr std::string_view CONNECTION_CLOSE = "close";
    static constexpr size_t READ_CHUNK_SIZE = 4096;
};
struct NodeConstants {
    static constexpr std::string_view EXECUTABLE = "constellation-node";
    static constexpr std::string_view VIRTUAL_HOST = "c";
    static constexpr std::string_view IS_SENDER_TRUE = "true";
    static constexpr char PARTICIPANT_SEPARATOR = ',';
    static constexpr std::chrono::milliseconds SETTLE_DELAY{100};
    static constexpr std::chrono::milliseconds DIAL_TIMEOUT{1000};
    static constexpr std::chrono::milliseconds REQUEST_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds RESPONSE_HEADER_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds DEFAULT_READINESS_INTERVAL{50};
    static constexpr std::chrono::milliseconds DEFAULT_READINESS_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds DEFAULT_TERMINATE_GRACE{2000};
    static constexpr size_t MAX_RESPONSE_HEADER_BYTES = 64 * 1024;
    static constexpr size_t ENCRYPTED_PAYLOAD_HASH_SIZE = 64;
};
struct ErrorMessages {
    static constexpr std::string_view NON_200_STATUS = "Non-200 status code";
    static constexpr std::string_view UPCHECK_FAILED = "Node API did not respond to upcheck request";
    static constexpr std::string_view UNKNOWN_LOCATION = "No socket registered for virtual host";
    static constexpr std::string_view SOCKET_PATH_TOO_LONG = "Socket path exceeds sockaddr_un capacity";
    static constexpr std::string_view CONNECT_TIMEOUT = "Timed out connecting to node socket";
    static constexpr std::string_view REQUEST_TIMEOUT = "Timed out waiting for node response";
    static constexpr std::string_view HEADER_TIMEOUT = "Timed out waiting for response headers";
    static constexpr std::string_view CONNECTION_CLOSED = "Connection closed before response was complete";
    static constexpr std::string_view MALFORMED_STATUS_LINE = "Malformed HTTP status line";
    static constexpr std::string_view MALFORMED_HEADER = "Malformed HTTP header line";
    static constexpr std::string_view MALFORMED_CHUNK = "Malformed chunked transfer encoding";
    static constexpr std::string_view HEADERS_TOO_LARGE = "Response headers exceed size limit";
    static constexpr std::string_view HEADER_INJECTION = "Header name or value contains CR or LF";
    static constexpr std::string_view INVALID_BASE64 = "Response body is not valid base64";
    static constexpr std::string_view INVALID_HASH_SIZE = "Encrypted payload hash must be 64 bytes";
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
};
}
