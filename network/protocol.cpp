#include "network/protocol.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace ledger {
namespace network {
namespace protocol {

namespace {

std::string requiredString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    throw ProtocolError(std::string("Missing field: ") + key);
  }
  return it->get<std::string>();
}

Amount requiredAmount(const nlohmann::json& payload, const char* key) {
  auto amount = parseAmount(requiredString(payload, key));
  if (!amount) {
    throw ProtocolError(std::string("Malformed amount in field: ") + key);
  }
  return *amount;
}

}  // namespace

std::string toString(MessageType type) {
  switch (type) {
    case MessageType::TRANSFER: return "TRANSFER";
    case MessageType::BALANCE: return "BALANCE";
    case MessageType::STATEMENT: return "STATEMENT";
    case MessageType::TRANSACTION: return "TRANSACTION";
    case MessageType::OPEN_ACCOUNT: return "OPEN_ACCOUNT";
    case MessageType::FREEZE_ACCOUNT: return "FREEZE_ACCOUNT";
    case MessageType::RECONCILE: return "RECONCILE";
    case MessageType::METRICS: return "METRICS";
    case MessageType::HEARTBEAT: return "HEARTBEAT";
  }
  return "UNKNOWN";
}

std::string toString(Status status) {
  switch (status) {
    case Status::OK: return "OK";
    case Status::ERROR: return "ERROR";
    case Status::INVALID_REQUEST: return "INVALID_REQUEST";
    case Status::NOT_FOUND: return "NOT_FOUND";
  }
  return "UNKNOWN";
}

std::optional<MessageType> parseMessageType(const std::string& text) {
  for (auto type : {MessageType::TRANSFER, MessageType::BALANCE, MessageType::STATEMENT,
                    MessageType::TRANSACTION, MessageType::OPEN_ACCOUNT,
                    MessageType::FREEZE_ACCOUNT, MessageType::RECONCILE, MessageType::METRICS,
                    MessageType::HEARTBEAT}) {
    if (toString(type) == text) return type;
  }
  return std::nullopt;
}

std::optional<Status> parseStatus(const std::string& text) {
  for (auto status : {Status::OK, Status::ERROR, Status::INVALID_REQUEST, Status::NOT_FOUND}) {
    if (toString(status) == text) return status;
  }
  return std::nullopt;
}

// Request helper methods
Request Request::transfer(const std::string& client_id, const TransferRequest& transfer) {
  Request req;
  req.type = MessageType::TRANSFER;
  req.client_id = client_id;
  req.payload["txn_id"] = transfer.txn_id;
  req.payload["payer_id"] = transfer.payer_id;
  req.payload["payee_id"] = transfer.payee_id;
  req.payload["amount"] = formatAmount(transfer.amount);
  req.payload["verdict"] = toString(transfer.verdict);
  if (transfer.risk_score) {
    req.payload["risk_score"] = *transfer.risk_score;
  }
  return req;
}

Request Request::balance(const std::string& client_id, const std::string& account_id) {
  Request req;
  req.type = MessageType::BALANCE;
  req.client_id = client_id;
  req.payload["account_id"] = account_id;
  return req;
}

Request Request::statement(const std::string& client_id, const std::string& account_id,
                           const std::string& page_token, size_t page_size) {
  Request req;
  req.type = MessageType::STATEMENT;
  req.client_id = client_id;
  req.payload["account_id"] = account_id;
  req.payload["page_token"] = page_token;
  req.payload["page_size"] = page_size;
  return req;
}

Request Request::transaction(const std::string& client_id, const std::string& txn_id) {
  Request req;
  req.type = MessageType::TRANSACTION;
  req.client_id = client_id;
  req.payload["txn_id"] = txn_id;
  return req;
}

Request Request::openAccount(const std::string& client_id, const std::string& account_id,
                             Amount opening_balance) {
  Request req;
  req.type = MessageType::OPEN_ACCOUNT;
  req.client_id = client_id;
  req.payload["account_id"] = account_id;
  req.payload["opening_balance"] = formatAmount(opening_balance);
  return req;
}

Request Request::freezeAccount(const std::string& client_id, const std::string& account_id,
                               bool frozen) {
  Request req;
  req.type = MessageType::FREEZE_ACCOUNT;
  req.client_id = client_id;
  req.payload["account_id"] = account_id;
  req.payload["frozen"] = frozen;
  return req;
}

Request Request::reconcile(const std::string& client_id, const std::string& txn_id) {
  Request req;
  req.type = MessageType::RECONCILE;
  req.client_id = client_id;
  if (!txn_id.empty()) {
    req.payload["txn_id"] = txn_id;
  }
  return req;
}

Request Request::metrics(const std::string& client_id) {
  Request req;
  req.type = MessageType::METRICS;
  req.client_id = client_id;
  return req;
}

Request Request::heartbeat(const std::string& client_id) {
  Request req;
  req.type = MessageType::HEARTBEAT;
  req.client_id = client_id;
  return req;
}

// Response helper methods
Response Response::success(const std::string& message, const nlohmann::json& payload) {
  Response resp;
  resp.status = Status::OK;
  resp.message = message;
  resp.payload = payload;
  return resp;
}

Response Response::error(Status status, const std::string& message) {
  Response resp;
  resp.status = status;
  resp.message = message;
  return resp;
}

nlohmann::json toJson(const TransferResult& result) {
  nlohmann::json j;
  j["txn_id"] = result.txn_id;
  j["status"] = toString(result.status);
  j["message"] = result.message;
  j["retryable"] = result.retryable;
  if (result.risk_score) {
    j["risk_score"] = *result.risk_score;
  } else {
    j["risk_score"] = nullptr;
  }
  return j;
}

nlohmann::json toJson(const LedgerEntry& entry) {
  nlohmann::json j;
  j["entry_id"] = entry.entry_id;
  j["txn_id"] = entry.txn_id;
  j["account_id"] = entry.account_id;
  j["amount"] = formatAmount(entry.amount);
  j["direction"] = toString(entry.direction);
  j["counterparty_id"] = entry.counterparty_id;
  j["balance_after"] = formatAmount(entry.balance_after);
  if (entry.risk_score) {
    j["risk_score"] = *entry.risk_score;
  }
  j["created_at_us"] = toEpochMicros(entry.created_at);
  return j;
}

nlohmann::json toJson(const Transaction& txn) {
  nlohmann::json j;
  j["txn_id"] = txn.txn_id;
  j["payer_id"] = txn.payer_id;
  j["payee_id"] = txn.payee_id;
  j["amount"] = formatAmount(txn.amount);
  j["status"] = toString(txn.status);
  j["verdict"] = toString(txn.verdict);
  if (txn.risk_score) {
    j["risk_score"] = *txn.risk_score;
  }
  j["message"] = txn.message;
  j["credit_attempts"] = txn.credit_attempts;
  j["created_at_us"] = toEpochMicros(txn.created_at);
  j["updated_at_us"] = toEpochMicros(txn.updated_at);
  return j;
}

TransferRequest transferFromPayload(const nlohmann::json& payload) {
  TransferRequest transfer;
  if (payload.contains("txn_id")) {
    if (!payload["txn_id"].is_string()) {
      throw ProtocolError("Field txn_id must be a string");
    }
    transfer.txn_id = payload["txn_id"].get<std::string>();
  }
  transfer.payer_id = requiredString(payload, "payer_id");
  transfer.payee_id = requiredString(payload, "payee_id");
  transfer.amount = requiredAmount(payload, "amount");

  auto verdict = parseRiskVerdict(requiredString(payload, "verdict"));
  if (!verdict) {
    throw ProtocolError("Unknown risk verdict");
  }
  transfer.verdict = *verdict;

  auto score = payload.find("risk_score");
  if (score != payload.end() && !score->is_null()) {
    if (!score->is_number()) {
      throw ProtocolError("Field risk_score must be numeric");
    }
    transfer.risk_score = score->get<double>();
  }
  return transfer;
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["type"] = toString(request.type);
  j["request_id"] = request.request_id;
  j["client_id"] = request.client_id;
  j["payload"] = request.payload;
  return j.dump();
}

Request deserializeRequest(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw ProtocolError("Request is not a JSON object");
  }

  auto type = parseMessageType(j.value("type", std::string()));
  if (!type) {
    throw ProtocolError("Unknown message type");
  }

  Request req;
  req.type = *type;
  req.request_id = j.value("request_id", std::string());
  req.client_id = j.value("client_id", std::string());
  if (j.contains("payload")) {
    if (!j["payload"].is_object()) {
      throw ProtocolError("Payload must be an object");
    }
    req.payload = j["payload"];
  }
  return req;
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = toString(response.status);
  j["message"] = response.message;
  j["request_id"] = response.request_id;
  j["payload"] = response.payload;
  return j.dump();
}

Response deserializeResponse(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw ProtocolError("Response is not a JSON object");
  }

  auto status = parseStatus(j.value("status", std::string()));
  if (!status) {
    throw ProtocolError("Unknown response status");
  }

  Response resp;
  resp.status = *status;
  resp.message = j.value("message", std::string());
  resp.request_id = j.value("request_id", std::string());
  if (j.contains("payload")) {
    resp.payload = j["payload"];
  }
  return resp;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  if (message.size() > kMaxMessageSize) {
    throw ProtocolError("Message too large to frame");
  }
  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

std::optional<std::string> MessageFramer::extractMessage(std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    return std::nullopt;
  }

  size_t message_size = 0;
  for (size_t i = 0; i < kHeaderSize; ++i) {
    char c = buffer[i];
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw ProtocolError("Invalid frame header");
    }
    int digit = std::isdigit(static_cast<unsigned char>(c))
                    ? c - '0'
                    : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    message_size = message_size * 16 + static_cast<size_t>(digit);
  }
  if (message_size > kMaxMessageSize) {
    throw ProtocolError("Frame exceeds maximum message size");
  }
  if (buffer.size() < kHeaderSize + message_size) {
    return std::nullopt;
  }

  std::string message = buffer.substr(kHeaderSize, message_size);
  buffer.erase(0, kHeaderSize + message_size);
  return message;
}

}  // namespace protocol
}  // namespace network
}  // namespace ledger
