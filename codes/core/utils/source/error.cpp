#include "utils/error.hpp"

namespace stream_http {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_PORT: return "CONFIG_INVALID_PORT";
        case ErrorCode::CONFIG_INVALID_MODE: return "CONFIG_INVALID_MODE";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "NETWORK_SOCKET_ERROR";
        case ErrorCode::NETWORK_BIND_ERROR: return "NETWORK_BIND_ERROR";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "NETWORK_LISTEN_ERROR";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "NETWORK_ACCEPT_ERROR";
        case ErrorCode::NETWORK_READ_ERROR: return "NETWORK_READ_ERROR";
        case ErrorCode::NETWORK_WRITE_ERROR: return "NETWORK_WRITE_ERROR";
        case ErrorCode::NETWORK_CLOSED: return "NETWORK_CLOSED";

        case ErrorCode::HTTP_BAD_REQUEST: return "HTTP_BAD_REQUEST";
        case ErrorCode::HTTP_HEADER_TOO_LARGE: return "HTTP_HEADER_TOO_LARGE";
        case ErrorCode::HTTP_BAD_CONTENT_LENGTH: return "HTTP_BAD_CONTENT_LENGTH";
        case ErrorCode::HTTP_BAD_CHUNK: return "HTTP_BAD_CHUNK";
        case ErrorCode::HTTP_UNEXPECTED_EOF: return "HTTP_UNEXPECTED_EOF";
        case ErrorCode::HTTP_BODY_NOT_ALLOWED: return "HTTP_BODY_NOT_ALLOWED";
        case ErrorCode::HTTP_NOT_FOUND: return "HTTP_NOT_FOUND";
        case ErrorCode::HTTP_METHOD_NOT_ALLOWED: return "HTTP_METHOD_NOT_ALLOWED";
        case ErrorCode::HTTP_NOT_IMPLEMENTED: return "HTTP_NOT_IMPLEMENTED";
        case ErrorCode::HTTP_HANDLER_ERROR: return "HTTP_HANDLER_ERROR";

        case ErrorCode::RESPONSE_HEADER_CONFLICT: return "RESPONSE_HEADER_CONFLICT";
        case ErrorCode::RESPONSE_LENGTH_MISMATCH: return "RESPONSE_LENGTH_MISMATCH";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_READ_ERROR: return "File read error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_PORT: return "Invalid port number";
        case ErrorCode::CONFIG_INVALID_MODE: return "Invalid server mode";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "Socket error";
        case ErrorCode::NETWORK_BIND_ERROR: return "Bind error";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "Listen error";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "Accept error";
        case ErrorCode::NETWORK_READ_ERROR: return "Network read error";
        case ErrorCode::NETWORK_WRITE_ERROR: return "Network write error";
        case ErrorCode::NETWORK_CLOSED: return "Connection closed";

        case ErrorCode::HTTP_BAD_REQUEST: return "Bad request";
        case ErrorCode::HTTP_HEADER_TOO_LARGE: return "header is too large";
        case ErrorCode::HTTP_BAD_CONTENT_LENGTH: return "bad Content-Length";
        case ErrorCode::HTTP_BAD_CHUNK: return "bad chunk";
        case ErrorCode::HTTP_UNEXPECTED_EOF: return "Unexpected EOF";
        case ErrorCode::HTTP_BODY_NOT_ALLOWED: return "HTTP body not allowed";
        case ErrorCode::HTTP_NOT_FOUND: return "Not found";
        case ErrorCode::HTTP_METHOD_NOT_ALLOWED: return "Method not allowed";
        case ErrorCode::HTTP_NOT_IMPLEMENTED: return "Not implemented";
        case ErrorCode::HTTP_HANDLER_ERROR: return "Handler failed";

        case ErrorCode::RESPONSE_HEADER_CONFLICT: return "Response headers already declare body framing";
        case ErrorCode::RESPONSE_LENGTH_MISMATCH: return "Response body does not match its declared length";

        default: return "Unknown error";
    }
}

} // namespace utils
} // namespace stream_http
