#ifndef POW_LEDGER_UTILITIES_H
#define POW_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace powledger {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch with sub-second precision
 * @return Current time in seconds as a floating point value
 */
double getCurrentTimeSeconds();

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 * @param str String to parse
 * @param port Output parameter for the parsed port
 * @return true if parsing succeeded and port is in valid range, false otherwise
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @param hostPort String in format "host:port"
 * @param host Output parameter for the host part
 * @param port Output parameter for the port part
 * @return true if parsing succeeded, false otherwise
 */
bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON document or error
 */
powledger::Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Parse a JSON document from a string, converting parse exceptions to errors
 */
powledger::Roe<nlohmann::json> parseJson(const std::string &text);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Lowercase hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Generate random bytes with Libsodium and return them hex encoded
 * @param numBytes Number of random bytes
 */
std::string randomHex(size_t numBytes);

} // namespace utl
} // namespace powledger

#endif // POW_LEDGER_UTILITIES_H
