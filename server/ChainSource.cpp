#include "ChainSource.h"
#include "../lib/Utilities.h"

#include <httplib.h>

namespace powledger {

ChainSource::Roe<ChainSource::FetchedChain>
ChainSource::parseChainResponse(const std::string &body) {
  auto parsed = utl::parseJson(body);
  if (!parsed) {
    return Error(E_MALFORMED, parsed.error().message);
  }

  const nlohmann::json &j = parsed.value();
  if (!j.is_object() || !j.contains("length") || !j.contains("chain")) {
    return Error(E_MALFORMED, "Response lacks chain or length");
  }
  if (!j["length"].is_number_unsigned()) {
    return Error(E_MALFORMED, "Response length is not an unsigned integer");
  }

  auto chain = chainFromJson(j["chain"]);
  if (!chain) {
    return Error(E_MALFORMED, chain.error().message);
  }

  FetchedChain fetched;
  fetched.length = j["length"].get<uint64_t>();
  fetched.chain = std::move(chain.value());
  return fetched;
}

HttpChainSource::HttpChainSource(std::chrono::milliseconds timeout)
    : Module("pow.node.fetch"), timeout_(timeout) {}

ChainSource::Roe<ChainSource::FetchedChain>
HttpChainSource::fetchChain(const std::string &address) {
  httplib::Client client("http://" + address);
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout_);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout_ - seconds);
  client.set_connection_timeout(seconds.count(), micros.count());
  client.set_read_timeout(seconds.count(), micros.count());

  auto response = client.Get("/chain");
  if (!response) {
    return Error(E_UNREACHABLE, "GET /chain from " + address +
                                    " failed: " + httplib::to_string(response.error()));
  }
  if (response->status != 200) {
    return Error(E_STATUS, "GET /chain from " + address + " returned " +
                               std::to_string(response->status));
  }

  auto fetched = parseChainResponse(response->body);
  if (!fetched) {
    return Error(E_MALFORMED, "Bad /chain body from " + address + ": " +
                                  fetched.error().message);
  }
  log().debug << "Fetched chain of length " << fetched->length << " from " << address;
  return fetched;
}

} // namespace powledger
