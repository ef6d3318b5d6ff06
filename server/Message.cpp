#include "Message.h"

namespace powledger {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

Error malformed(const std::string &what) { return Error(Message::E_MALFORMED, what); }

// Optional endpoint stored as "<prefix>_host" and "<prefix>_port"
Roe<std::optional<network::TcpEndpoint>> readEndpoint(const nlohmann::json &j,
                                                      const std::string &prefix) {
  const std::string hostKey = prefix + "_host";
  const std::string portKey = prefix + "_port";
  if (!j.contains(hostKey) && !j.contains(portKey)) {
    return std::optional<network::TcpEndpoint>();
  }
  nlohmann::json host = j.contains(hostKey) ? j[hostKey] : nlohmann::json();
  nlohmann::json port = j.contains(portKey) ? j[portKey] : nlohmann::json();
  if (!host.is_string() || host.get<std::string>().empty() || !port.is_number_unsigned() ||
      port.get<uint64_t>() == 0 || port.get<uint64_t>() > 65535) {
    return malformed("Bad " + prefix + " endpoint");
  }
  return std::optional<network::TcpEndpoint>(network::TcpEndpoint{
      host.get<std::string>(), static_cast<uint16_t>(port.get<uint64_t>()) });
}

} // namespace

std::string Message::getType() const {
  return std::visit(Overloaded{
                        [](const NewBlock &) { return std::string(NEW_BLOCK); },
                        [](const NewTransaction &) { return std::string(NEW_TRANSACTION); },
                        [](const RequestChain &) { return std::string(REQUEST_CHAIN); },
                        [](const RespondChain &) { return std::string(RESPOND_CHAIN); },
                        [](const UnknownMessage &m) { return m.type; },
                    },
                    body);
}

nlohmann::json Message::toJson() const {
  nlohmann::json payload = std::visit(
      Overloaded{
          [](const NewBlock &m) { return m.block.toJson(); },
          [](const NewTransaction &m) { return m.tx.toJson(); },
          [](const RequestChain &) { return nlohmann::json(); },
          [](const RespondChain &m) {
            nlohmann::json j;
            j["chain"] = chainToJson(m.chain);
            j["length"] = m.length;
            return j;
          },
          [](const UnknownMessage &) { return nlohmann::json(); },
      },
      body);

  nlohmann::json j;
  j["type"] = getType();
  j["payload"] = payload;
  if (sender) {
    j["sender_host"] = sender->address;
    j["sender_port"] = sender->port;
  }
  if (relayed) {
    j["relayed"] = true;
  }
  if (origin) {
    j["origin_host"] = origin->address;
    j["origin_port"] = origin->port;
  }
  return j;
}

Roe<Message> Message::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return malformed("Message must be a JSON object");
  }
  if (!j.contains("type") || !j["type"].is_string()) {
    return malformed("Message has no type");
  }

  Message message;
  const std::string type = j["type"].get<std::string>();
  nlohmann::json payload;
  auto payloadIt = j.find("payload");
  if (payloadIt != j.end()) {
    payload = *payloadIt;
  }

  if (type == NEW_BLOCK) {
    auto block = Block::fromJson(payload);
    if (!block) {
      return malformed("Bad NEW_BLOCK payload: " + block.error().message);
    }
    message.body = NewBlock{ std::move(block.value()) };
  } else if (type == NEW_TRANSACTION) {
    auto tx = Transaction::fromJson(payload);
    if (!tx) {
      return malformed("Bad NEW_TRANSACTION payload: " + tx.error().message);
    }
    message.body = NewTransaction{ std::move(tx.value()) };
  } else if (type == REQUEST_CHAIN) {
    message.body = RequestChain{};
  } else if (type == RESPOND_CHAIN) {
    if (!payload.is_object() || !payload.contains("chain") ||
        !payload.contains("length") || !payload["length"].is_number_unsigned()) {
      return malformed("Bad RESPOND_CHAIN payload");
    }
    auto chain = chainFromJson(payload["chain"]);
    if (!chain) {
      return malformed("Bad RESPOND_CHAIN chain: " + chain.error().message);
    }
    RespondChain respond;
    respond.chain = std::move(chain.value());
    respond.length = payload["length"].get<uint64_t>();
    message.body = std::move(respond);
  } else {
    message.body = UnknownMessage{ type };
  }

  auto sender = readEndpoint(j, "sender");
  if (!sender) {
    return sender.error();
  }
  message.sender = sender.value();

  auto origin = readEndpoint(j, "origin");
  if (!origin) {
    return origin.error();
  }
  message.origin = origin.value();

  if (j.contains("relayed")) {
    if (!j["relayed"].is_boolean()) {
      return malformed("relayed must be a boolean");
    }
    message.relayed = j["relayed"].get<bool>();
  }

  return message;
}

Roe<Message> Message::decode(const std::string &text) {
  auto parsed = utl::parseJson(text);
  if (!parsed) {
    return malformed(parsed.error().message);
  }
  return fromJson(parsed.value());
}

} // namespace powledger
