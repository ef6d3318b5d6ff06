#include "ProofOfWork.h"
#include "../lib/Utilities.h"

#include <limits>

namespace powledger {

ProofOfWork::ProofOfWork(uint32_t difficulty)
    : difficulty_(difficulty), target_(difficulty, '0') {}

bool ProofOfWork::verify(uint64_t lastProof, uint64_t proof) const {
  std::string guess = std::to_string(lastProof) + std::to_string(proof);
  std::string digest = utl::sha256(guess);
  return digest.compare(0, target_.size(), target_) == 0;
}

ProofOfWork::Roe<uint64_t>
ProofOfWork::solve(uint64_t lastProof, const std::atomic<bool> *cancel) const {
  uint64_t candidate = 0;
  while (true) {
    if (cancel && cancel->load()) {
      return Error(E_CANCELLED, "Proof search cancelled");
    }
    if (verify(lastProof, candidate)) {
      return candidate;
    }
    if (candidate == std::numeric_limits<uint64_t>::max()) {
      return Error(E_EXHAUSTED, "No proof found for " + std::to_string(lastProof));
    }
    ++candidate;
  }
}

} // namespace powledger
