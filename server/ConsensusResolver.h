#pragma once

#include "ChainSource.h"
#include "PeerRegistry.h"
#include "../ledger/Ledger.h"
#include "../lib/Module.h"

namespace powledger {

/**
 * Longest-valid-chain rule: poll every registered peer and adopt the longest
 * valid chain that is strictly longer than ours.
 */
class ConsensusResolver : public Module {
public:
  ConsensusResolver(Ledger &ledger, const PeerRegistry &peers, ChainSource &source);

  /**
   * @return true if the local chain was replaced
   */
  bool resolve();

private:
  Ledger &ledger_;
  const PeerRegistry &peers_;
  ChainSource &source_;
};

} // namespace powledger
