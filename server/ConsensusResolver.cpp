#include "ConsensusResolver.h"

#include <optional>

namespace powledger {

ConsensusResolver::ConsensusResolver(Ledger &ledger, const PeerRegistry &peers,
                                     ChainSource &source)
    : Module("pow.node.consensus"), ledger_(ledger), peers_(peers), source_(source) {}

bool ConsensusResolver::resolve() {
  size_t bestLength = ledger_.getLength();
  std::optional<Chain> bestChain;
  std::string bestPeer;

  for (const auto &peer : peers_.list()) {
    auto fetched = source_.fetchChain(peer);
    if (!fetched) {
      log().warning << "Skipping peer " << peer << ": " << fetched.error().message;
      continue;
    }

    if (fetched->length != fetched->chain.size()) {
      log().warning << "Skipping peer " << peer << ": reported length "
                    << fetched->length << " but sent " << fetched->chain.size()
                    << " blocks";
      continue;
    }

    if (fetched->length <= bestLength) {
      continue;
    }

    if (!ledger_.getValidator().isValid(fetched->chain)) {
      log().info << "Ignoring invalid chain of length " << fetched->length
                 << " from " << peer;
      continue;
    }

    bestLength = fetched->length;
    bestChain = std::move(fetched->chain);
    bestPeer = peer;
  }

  if (!bestChain) {
    return false;
  }

  auto replaced = ledger_.replaceChain(*bestChain);
  if (!replaced) {
    // Local chain grew past the candidate while peers were polled
    log().info << "Chain from " << bestPeer << " not adopted: "
               << replaced.error().message;
    return false;
  }

  log().info << "Adopted chain of length " << bestLength << " from " << bestPeer;
  return true;
}

} // namespace powledger
