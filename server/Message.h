#pragma once

#include "../ledger/Block.h"
#include "../lib/Utilities.h"
#include "../network/Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace powledger {

struct NewBlock {
  Block block;
};

struct NewTransaction {
  Transaction tx;
};

struct RequestChain {};

struct RespondChain {
  Chain chain;
  uint64_t length{ 0 };
};

// Well-formed envelope with a type this node does not handle
struct UnknownMessage {
  std::string type;
};

using MessageBody =
    std::variant<NewBlock, NewTransaction, RequestChain, RespondChain, UnknownMessage>;

/**
 * Peer-to-peer message. On the wire this is one JSON envelope:
 * {"type", "payload", "sender_host"?, "sender_port"?, "relayed"?,
 *  "origin_host"?, "origin_port"?}
 */
struct Message {
  static constexpr const char *NEW_BLOCK = "NEW_BLOCK";
  static constexpr const char *NEW_TRANSACTION = "NEW_TRANSACTION";
  static constexpr const char *REQUEST_CHAIN = "REQUEST_CHAIN";
  static constexpr const char *RESPOND_CHAIN = "RESPOND_CHAIN";

  static constexpr int32_t E_MALFORMED = 1;

  MessageBody body;
  // P2P endpoint of the node that sent this message
  std::optional<network::TcpEndpoint> sender;
  // Set on NEW_TRANSACTION copies forwarded by a receiving node
  bool relayed{ false };
  // On relayed copies, the P2P endpoint of the node that first sent it
  std::optional<network::TcpEndpoint> origin;

  std::string getType() const;

  nlohmann::json toJson() const;
  std::string encode() const { return toJson().dump(); }

  static Roe<Message> fromJson(const nlohmann::json &j);
  static Roe<Message> decode(const std::string &text);
};

} // namespace powledger
