#pragma once

#include "Block.h"
#include "ChainValidator.h"
#include "ProofOfWork.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace powledger {

/**
 * The node's canonical chain plus the buffer of transactions waiting for the
 * next block. One mutex guards both; every mutation is a single critical
 * section and reads hand out copies.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_STALE_PREVIOUS_HASH = 1;
  static constexpr int32_t E_INVALID_PROOF = 2;
  static constexpr int32_t E_INVALID_CHAIN = 3;
  static constexpr int32_t E_NOT_LONGER = 4;

  explicit Ledger(uint32_t difficulty = ProofOfWork::DEFAULT_DIFFICULTY);
  ~Ledger() override = default;

  /**
   * Queue a transaction for the next block.
   * @return Index of the block that will carry it
   */
  uint64_t recordTransaction(const std::string &sender,
                             const std::string &recipient, double amount);
  uint64_t recordTransaction(const Transaction &tx);

  /**
   * Append a block carrying every pending transaction.
   * @param proof Proof solved against the current last block
   * @param previousHash Hash the caller mined against; defaults to the hash of
   *                     the current last block
   * @param reward Appended after the pending transactions when given
   * @return The appended block, or an error when proof or previousHash no
   *         longer match the last block (chain unchanged)
   */
  Roe<Block> mineBlock(uint64_t proof,
                       const std::optional<std::string> &previousHash = std::nullopt,
                       const std::optional<Transaction> &reward = std::nullopt);

  /**
   * Replace the chain with a valid candidate that is strictly longer than the
   * current one. Pending transactions are kept.
   */
  Roe<void> replaceChain(const Chain &candidate);

  static std::string hash(const Block &block) { return block.calculateHash(); }

  Block lastBlock() const;
  Chain getChain() const;
  size_t getLength() const;
  std::vector<Transaction> getPendingTransactions() const;

  const ProofOfWork &getProofOfWork() const { return pow_; }
  const ChainValidator &getValidator() const { return validator_; }

private:
  ProofOfWork pow_;
  ChainValidator validator_;

  mutable std::mutex mutex_;
  Chain chain_;
  std::vector<Transaction> pending_;
};

} // namespace powledger
