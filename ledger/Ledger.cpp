#include "Ledger.h"
#include "../lib/Utilities.h"

namespace powledger {

Ledger::Ledger(uint32_t difficulty)
    : Module("pow.ledger"), pow_(difficulty), validator_(pow_) {
  chain_.push_back(Block::genesis());
}

uint64_t Ledger::recordTransaction(const std::string &sender,
                                   const std::string &recipient, double amount) {
  Transaction tx;
  tx.sender = sender;
  tx.recipient = recipient;
  tx.amount = amount;
  return recordTransaction(tx);
}

uint64_t Ledger::recordTransaction(const Transaction &tx) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back(tx);
  return chain_.back().index + 1;
}

Ledger::Roe<Block> Ledger::mineBlock(uint64_t proof,
                                     const std::optional<std::string> &previousHash,
                                     const std::optional<Transaction> &reward) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Block &last = chain_.back();
  std::string lastHash = last.calculateHash();

  if (previousHash && *previousHash != lastHash) {
    return Error(E_STALE_PREVIOUS_HASH,
                 "Chain moved on: last block is now " + std::to_string(last.index));
  }
  if (!pow_.verify(last.proof, proof)) {
    return Error(E_INVALID_PROOF, "Proof " + std::to_string(proof) +
                                      " does not solve last proof " +
                                      std::to_string(last.proof));
  }

  Block block;
  block.index = last.index + 1;
  block.timestamp = utl::getCurrentTimeSeconds();
  block.transactions = std::move(pending_);
  pending_.clear();
  if (reward) {
    block.transactions.push_back(*reward);
  }
  block.proof = proof;
  block.previousHash = lastHash;

  chain_.push_back(block);
  log().info << "Forged block " << block.index << " with "
             << block.transactions.size() << " transactions";
  return block;
}

Ledger::Roe<void> Ledger::replaceChain(const Chain &candidate) {
  // Validation is pure, keep it out of the critical section
  auto valid = validator_.validate(candidate);
  if (!valid) {
    log().debug << "Candidate chain rejected: " << valid.error().message;
    return Error(E_INVALID_CHAIN, valid.error().message);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (candidate.size() <= chain_.size()) {
    return Error(E_NOT_LONGER, "Candidate length " + std::to_string(candidate.size()) +
                                   " is not longer than " +
                                   std::to_string(chain_.size()));
  }

  log().info << "Replacing chain of length " << chain_.size()
             << " with chain of length " << candidate.size();
  chain_ = candidate;
  return {};
}

Block Ledger::lastBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back();
}

Chain Ledger::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

size_t Ledger::getLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

std::vector<Transaction> Ledger::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

} // namespace powledger
