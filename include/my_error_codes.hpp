// Error codes grouped by subsystem.
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
}  // namespace GENERAL

namespace CONFIG {  // Configuration errors

constexpr int NOT_A_DIRECTORY = 5300;  // The specified path is not a directory
constexpr int DIRECTORY_CREATION = 5301;  // Failed to create directory
constexpr int INVALID_PATH = 5302;  // Invalid path
constexpr int MALFORMED = 5303;  // Malformed configuration file
}  // namespace CONFIG

namespace PERSISTENCE {  // Persistence errors

constexpr int FILE_READ_WRITE = 5400;  // File read/write error
constexpr int SERIALIZATION = 5401;  // Failed to serialize/deserialize report
}  // namespace PERSISTENCE

namespace PROTOCOL {  // Discovery protocol errors

constexpr int BIND_FAILED = 5500;  // Socket bind failed
constexpr int SEND_FAILED = 5501;  // Datagram send failed
constexpr int MULTICAST_JOIN_FAILED = 5503;  // Joining multicast group failed
constexpr int INVALID_ADDRESS = 5504;  // Invalid group or interface address
constexpr int CANCELLED = 5505;  // Operation cancelled
}  // namespace PROTOCOL

namespace TRUST {  // Certificate trust errors

constexpr int UNKNOWN_SERVER = 5600;  // Unknown server
constexpr int FINGERPRINT_MISMATCH = 5601;  // Certificate fingerprint mismatch
constexpr int INVALID_SERVER_NAME = 5602;  // Invalid server name format
constexpr int CHAIN_VALIDATION = 5603;  // Certificate chain validation failed
constexpr int CERTIFICATE_PARSING = 5604;  // Failed to parse certificate
}  // namespace TRUST

namespace OPENSSL {  // OPENSSL errors

constexpr int UNEXPECTED_RESULT = 8000;  // Unexpected result
}  // namespace OPENSSL

}  // namespace my_errors
