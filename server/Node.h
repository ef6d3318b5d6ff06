#ifndef POW_LEDGER_NODE_H
#define POW_LEDGER_NODE_H

#include "ChainSource.h"
#include "ConsensusResolver.h"
#include "PeerRegistry.h"
#include "PeerTransport.h"
#include "../ledger/Ledger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace powledger {

/**
 * A ledger node: owns the chain, the peer set and the P2P transport, and
 * implements the operations exposed on the HTTP control surface.
 */
class Node : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CANCELLED = 1;
  static constexpr int32_t E_CONFIG = 2;
  static constexpr int32_t E_PEER = 3;
  static constexpr int32_t E_START = 4;
  static constexpr int32_t E_MINE = 5;

  // Reward paid to the miner of each block
  static constexpr const char *REWARD_SENDER = "0";
  static constexpr double REWARD_AMOUNT = 1;

  struct Config {
    std::string host{ "127.0.0.1" };
    // Host peers should use to reach this node; empty means `host`
    std::string advertiseHost;
    uint16_t port{ 5000 };
    // Defaults to port + PeerRegistry::P2P_PORT_OFFSET
    std::optional<uint16_t> p2pPort;
    std::vector<std::string> peers;
    uint32_t difficulty{ ProofOfWork::DEFAULT_DIFFICULTY };
    // Random when empty
    std::string nodeId;
    uint64_t connectTimeoutMs{ 3000 };
    uint64_t ioTimeoutMs{ 5000 };
    uint64_t httpTimeoutMs{ 5000 };
    uint64_t maxMessageBytes{ PeerTransport::DEFAULT_MAX_MESSAGE_BYTES };

    Roe<uint16_t> getP2pPort() const;

    /**
     * Overlay the keys present in `j` onto this config.
     * Unknown keys are ignored; known keys with the wrong type are an error.
     */
    Roe<void> merge(const nlohmann::json &j);

    static Roe<Config> load(const std::string &path);
  };

  explicit Node(const Config &config);
  ~Node() override;

  /**
   * Register configured peers, start the P2P listener and ask every peer to
   * push its chain.
   */
  Roe<void> start();
  void stop();

  /**
   * Solve the next proof, forge a block with the pending transactions plus the
   * mining reward and announce it to peers. Searches again when the chain
   * changes under a running search.
   */
  Roe<Block> mine();

  // Abort a running mine() and make later calls fail with E_CANCELLED
  void cancelMining();

  /**
   * Queue a transaction and broadcast it to peers.
   * @return Index of the block that will carry it
   */
  uint64_t newTransaction(const Transaction &tx);

  /**
   * Register several peers. Nothing is registered if any address is invalid.
   * @return Number of registered peers afterwards
   */
  Roe<size_t> registerNodes(const std::vector<std::string> &addresses);

  // Longest-valid-chain resolution against all peers
  bool resolve();

  Chain getChain() const { return ledger_.getChain(); }

  const Config &getConfig() const { return config_; }
  const std::string &getNodeId() const { return config_.nodeId; }
  Ledger &getLedger() { return ledger_; }
  const PeerRegistry &getPeers() const { return peers_; }
  PeerTransport &getTransport() { return transport_; }

private:
  static PeerTransport::Config makeTransportConfig(const Config &config);

  Config config_;
  Ledger ledger_;
  PeerRegistry peers_;
  HttpChainSource chainSource_;
  ConsensusResolver resolver_;
  PeerTransport transport_;

  std::atomic<bool> miningCancelled_{ false };
};

} // namespace powledger

#endif // POW_LEDGER_NODE_H
