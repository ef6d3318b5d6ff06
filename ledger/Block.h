#ifndef POW_LEDGER_BLOCK_H
#define POW_LEDGER_BLOCK_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace powledger {

/**
 * Value transfer recorded in a block. Sender "0" marks a mining reward.
 */
struct Transaction {
  std::string sender;
  std::string recipient;
  double amount{ 0 };

  nlohmann::json toJson() const;

  /**
   * Parse from a JSON object. Unknown keys are ignored.
   * @return Error if a field is missing or has the wrong type
   */
  static Roe<Transaction> fromJson(const nlohmann::json &j);

  bool operator==(const Transaction &other) const {
    return sender == other.sender && recipient == other.recipient &&
           amount == other.amount;
  }
  bool operator!=(const Transaction &other) const { return !(*this == other); }
};

struct Block {
  static constexpr int32_t E_FORMAT = 1;

  static constexpr uint64_t GENESIS_INDEX = 1;
  static constexpr uint64_t GENESIS_PROOF = 100;
  static constexpr const char *GENESIS_PREVIOUS_HASH = "1";

  uint64_t index{ 0 };
  double timestamp{ 0 };
  std::vector<Transaction> transactions;
  uint64_t proof{ 0 };
  std::string previousHash;

  /**
   * Canonical JSON form. Keys come out sorted since nlohmann::json objects
   * are ordered maps, so dump() is stable across nodes.
   */
  nlohmann::json toJson() const;

  // Ignores unknown keys, including a "hash" key some peers attach
  static Roe<Block> fromJson(const nlohmann::json &j);

  /**
   * SHA-256 hex digest over the compact canonical JSON dump.
   */
  std::string calculateHash() const;

  // Fixed first block shared by every node
  static Block genesis();

  bool operator==(const Block &other) const {
    return index == other.index && timestamp == other.timestamp &&
           transactions == other.transactions && proof == other.proof &&
           previousHash == other.previousHash;
  }
  bool operator!=(const Block &other) const { return !(*this == other); }
};

using Chain = std::vector<Block>;

nlohmann::json chainToJson(const Chain &chain);
Roe<Chain> chainFromJson(const nlohmann::json &j);

} // namespace powledger

#endif // POW_LEDGER_BLOCK_H
