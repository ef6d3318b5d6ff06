#include "Utilities.h"
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace powledger {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

double getCurrentTimeSeconds() {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return static_cast<double>(us) / 1e6;
}

bool parseInt(const std::string &str, int &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parsePort(const std::string &str, uint16_t &port) {
  int portInt = 0;
  if (!parseInt(str, portInt)) {
    return false;
  }
  if (portInt < 0 || portInt > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(portInt);
  return true;
}

bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port) {
  size_t colonPos = hostPort.find_last_of(':');
  if (colonPos == std::string::npos || colonPos == 0 ||
      colonPos == hostPort.length() - 1) {
    return false;
  }

  std::string portStr = hostPort.substr(colonPos + 1);
  if (!parsePort(portStr, port)) {
    return false;
  }
  host = hostPort.substr(0, colonPos);
  return true;
}

powledger::Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  auto parsed = parseJson(content);
  if (!parsed) {
    return Error(3, parsed.error().message);
  }
  return parsed;
}

powledger::Roe<nlohmann::json> parseJson(const std::string &text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Failed to parse JSON: " + std::string(e.what()));
  }
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.c_str()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  char hex[crypto_hash_sha256_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
  return std::string(hex);
}

std::string randomHex(size_t numBytes) {
  std::vector<unsigned char> buf(numBytes);
  randombytes_buf(buf.data(), buf.size());
  std::string hex(numBytes * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.size(), buf.data(), buf.size());
  hex.resize(numBytes * 2);
  return hex;
}

} // namespace utl
} // namespace powledger
