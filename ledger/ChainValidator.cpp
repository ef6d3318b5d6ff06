#include "ChainValidator.h"

namespace powledger {

ChainValidator::ChainValidator(const ProofOfWork &pow)
    : Module("pow.ledger.validator"), pow_(pow),
      genesisHash_(Block::genesis().calculateHash()) {}

ChainValidator::Roe<void> ChainValidator::validate(const Chain &candidate) const {
  if (candidate.empty()) {
    return Error(E_EMPTY, "Chain is empty");
  }

  if (candidate.front().calculateHash() != genesisHash_) {
    return Error(E_GENESIS, "Genesis block does not match");
  }

  std::string previousHash = genesisHash_;
  for (size_t i = 1; i < candidate.size(); ++i) {
    const Block &previous = candidate[i - 1];
    const Block &current = candidate[i];

    if (current.index != previous.index + 1) {
      return Error(E_INDEX, "Block " + std::to_string(i + 1) +
                                " has non-contiguous index " +
                                std::to_string(current.index));
    }

    if (current.previousHash != previousHash) {
      return Error(E_LINK, "Block " + std::to_string(current.index) +
                               " does not link to its predecessor");
    }

    if (!pow_.verify(previous.proof, current.proof)) {
      return Error(E_PROOF, "Block " + std::to_string(current.index) +
                                " has an invalid proof " +
                                std::to_string(current.proof));
    }

    previousHash = current.calculateHash();
  }

  return {};
}

bool ChainValidator::isValid(const Chain &candidate) const {
  auto result = validate(candidate);
  if (!result) {
    log().debug << "Rejected chain of length " << candidate.size() << ": "
                << result.error().message;
    return false;
  }
  return true;
}

} // namespace powledger
