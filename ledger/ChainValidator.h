#pragma once

#include "Block.h"
#include "ProofOfWork.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <string>

namespace powledger {

/**
 * Stateless check of an untrusted chain against the local genesis block and
 * the proof-of-work rule.
 */
class ChainValidator : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_EMPTY = 1;
  static constexpr int32_t E_GENESIS = 2;
  static constexpr int32_t E_INDEX = 3;
  static constexpr int32_t E_LINK = 4;
  static constexpr int32_t E_PROOF = 5;

  explicit ChainValidator(const ProofOfWork &pow);

  /**
   * Validate a candidate chain.
   * @return The first failure found, or success
   */
  Roe<void> validate(const Chain &candidate) const;

  bool isValid(const Chain &candidate) const;

private:
  ProofOfWork pow_;
  std::string genesisHash_;
};

} // namespace powledger
