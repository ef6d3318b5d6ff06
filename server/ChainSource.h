#pragma once

#include "../ledger/Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace powledger {

/**
 * Where the consensus resolver gets a peer's view of the chain from.
 */
class ChainSource {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_UNREACHABLE = 1;
  static constexpr int32_t E_STATUS = 2;
  static constexpr int32_t E_MALFORMED = 3;

  struct FetchedChain {
    uint64_t length{ 0 };
    Chain chain;
  };

  virtual ~ChainSource() = default;

  /**
   * Fetch the chain held by the peer at a "host:port" control address.
   */
  virtual Roe<FetchedChain> fetchChain(const std::string &address) = 0;

  // Decode a `{chain, length}` document
  static Roe<FetchedChain> parseChainResponse(const std::string &body);
};

/**
 * Fetches `GET /chain` from the peer's HTTP control surface.
 */
class HttpChainSource : public ChainSource, public Module {
public:
  explicit HttpChainSource(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  Roe<FetchedChain> fetchChain(const std::string &address) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace powledger
