#pragma once

#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace powledger {

/**
 * Brute-force hash puzzle linking consecutive blocks.
 *
 * A proof p is valid against the previous proof q when
 * sha256(decimal(q) + decimal(p)) starts with `difficulty` hex zeros.
 */
class ProofOfWork {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CANCELLED = 1;
  static constexpr int32_t E_EXHAUSTED = 2;

  static constexpr uint32_t DEFAULT_DIFFICULTY = 4;
  static constexpr uint32_t MAX_DIFFICULTY = 64;

  explicit ProofOfWork(uint32_t difficulty = DEFAULT_DIFFICULTY);

  uint32_t getDifficulty() const { return difficulty_; }

  /**
   * Search candidates from 0 upward and return the first valid one.
   * @param lastProof Proof of the current last block
   * @param cancel Checked before each candidate; when it reads true the
   *               search stops with E_CANCELLED
   */
  Roe<uint64_t> solve(uint64_t lastProof,
                      const std::atomic<bool> *cancel = nullptr) const;

  bool verify(uint64_t lastProof, uint64_t proof) const;

private:
  uint32_t difficulty_;
  std::string target_;
};

} // namespace powledger
