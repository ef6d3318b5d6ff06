#include "Block.h"

namespace powledger {

namespace {

Error formatError(const std::string &what) {
  return Error(Block::E_FORMAT, what);
}

bool isUnsigned(const nlohmann::json &value) {
  if (value.is_number_unsigned()) {
    return true;
  }
  return value.is_number_integer() && value.get<int64_t>() >= 0;
}

// Account identifiers are strings; other scalars are kept in their JSON text form
bool readAccount(const nlohmann::json &value, std::string &out) {
  if (value.is_string()) {
    out = value.get<std::string>();
    return true;
  }
  if (value.is_number() || value.is_boolean()) {
    out = value.dump();
    return true;
  }
  return false;
}

} // namespace

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["sender"] = sender;
  j["recipient"] = recipient;
  j["amount"] = amount;
  return j;
}

Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return formatError("Transaction must be a JSON object");
  }

  auto sender = j.find("sender");
  auto recipient = j.find("recipient");
  auto amount = j.find("amount");
  if (sender == j.end() || recipient == j.end() || amount == j.end()) {
    return formatError("Missing values");
  }
  Transaction tx;
  if (!readAccount(*sender, tx.sender) || !readAccount(*recipient, tx.recipient)) {
    return formatError("sender and recipient must be scalar values");
  }
  if (!amount->is_number()) {
    return formatError("amount must be a number");
  }

  tx.amount = amount->get<double>();
  return tx;
}

nlohmann::json Block::toJson() const {
  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txs.push_back(tx.toJson());
  }

  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["transactions"] = txs;
  j["proof"] = proof;
  j["previous_hash"] = previousHash;
  return j;
}

Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return formatError("Block must be a JSON object");
  }

  for (const char *key :
       { "index", "timestamp", "transactions", "proof", "previous_hash" }) {
    if (!j.contains(key)) {
      return formatError(std::string("Block is missing field: ") + key);
    }
  }

  const auto &index = j.at("index");
  const auto &timestamp = j.at("timestamp");
  const auto &transactions = j.at("transactions");
  const auto &proof = j.at("proof");
  const auto &previousHash = j.at("previous_hash");

  if (!isUnsigned(index)) {
    return formatError("Block index must be an unsigned integer");
  }
  if (!timestamp.is_number()) {
    return formatError("Block timestamp must be a number");
  }
  if (!transactions.is_array()) {
    return formatError("Block transactions must be an array");
  }
  if (!isUnsigned(proof)) {
    return formatError("Block proof must be an unsigned integer");
  }
  if (!previousHash.is_string()) {
    return formatError("Block previous_hash must be a string");
  }

  Block block;
  block.index = index.get<uint64_t>();
  block.timestamp = timestamp.get<double>();
  block.proof = proof.get<uint64_t>();
  block.previousHash = previousHash.get<std::string>();
  block.transactions.reserve(transactions.size());
  for (const auto &item : transactions) {
    auto tx = Transaction::fromJson(item);
    if (!tx) {
      return formatError("Block " + std::to_string(block.index) +
                         " has a bad transaction: " + tx.error().message);
    }
    block.transactions.push_back(std::move(tx.value()));
  }
  return block;
}

std::string Block::calculateHash() const { return utl::sha256(toJson().dump()); }

Block Block::genesis() {
  Block block;
  block.index = GENESIS_INDEX;
  block.timestamp = 0;
  block.proof = GENESIS_PROOF;
  block.previousHash = GENESIS_PREVIOUS_HASH;
  return block;
}

nlohmann::json chainToJson(const Chain &chain) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &block : chain) {
    j.push_back(block.toJson());
  }
  return j;
}

Roe<Chain> chainFromJson(const nlohmann::json &j) {
  if (!j.is_array()) {
    return formatError("Chain must be a JSON array");
  }

  Chain chain;
  chain.reserve(j.size());
  for (const auto &item : j) {
    auto block = Block::fromJson(item);
    if (!block) {
      return block.error();
    }
    chain.push_back(std::move(block.value()));
  }
  return chain;
}

} // namespace powledger
