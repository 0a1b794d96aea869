#include "ledger_server.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <stdexcept>

namespace ledger {

namespace protocol = network::protocol;

namespace {

std::string requireString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw protocol::ProtocolError(std::string("Missing field: ") + key);
  }
  return it->get<std::string>();
}

}  // namespace

LedgerServer::LedgerServer(int port, LedgerEngine& engine) : engine_(engine) {
  tcp_server_ = std::make_unique<network::TCPServer>(
      port, [this](const std::string& request) { return handleRequest(request); });
}

LedgerServer::~LedgerServer() {
  stop();
}

bool LedgerServer::start() {
  if (!engine_.start()) {
    LEDGER_LOG_ERROR("Failed to start ledger engine");
    return false;
  }

  if (!tcp_server_->start()) {
    LEDGER_LOG_ERROR("Failed to start TCP server");
    engine_.stop();
    return false;
  }

  LEDGER_LOG_BUILDER(INFO, "Ledger server started").field("port", tcp_server_->getPort());
  return true;
}

void LedgerServer::stop() {
  // Stop components in reverse order
  if (tcp_server_) {
    tcp_server_->stop();
  }
  engine_.stop();
}

int LedgerServer::getPort() const {
  return tcp_server_->getPort();
}

LedgerServer::Stats LedgerServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_ && tcp_server_->isRunning();
  stats.active_connections = tcp_server_ ? tcp_server_->getConnectionCount() : 0;
  stats.notifications = engine_.publisher().getStats();
  return stats;
}

std::string LedgerServer::handleRequest(const std::string& request_json) {
  protocol::Request request;
  try {
    request = protocol::deserializeRequest(request_json);
  } catch (const protocol::ProtocolError& e) {
    LEDGER_LOG_BUILDER(WARN, "Rejected malformed request").field("error", e.what());
    return protocol::serializeResponse(
        protocol::Response::error(protocol::Status::INVALID_REQUEST, e.what()));
  }

  observability::getGlobalMetrics().incrementCounter(
      "ledger_requests_total", {{"type", protocol::toString(request.type)}});

  protocol::Response response;
  try {
    response = dispatch(request);
  } catch (const protocol::ProtocolError& e) {
    response = protocol::Response::error(protocol::Status::INVALID_REQUEST, e.what());
  } catch (const std::invalid_argument& e) {
    response = protocol::Response::error(protocol::Status::INVALID_REQUEST, e.what());
  } catch (const StoreUnavailable& e) {
    LEDGER_LOG_BUILDER(WARN, "Store unavailable while handling request")
        .field("type", protocol::toString(request.type))
        .field("error", e.what());
    response = protocol::Response::error(protocol::Status::ERROR,
                                         "Service temporarily unavailable; retry later");
  } catch (const LockTimeout&) {
    response = protocol::Response::error(protocol::Status::ERROR,
                                         "Accounts are busy; retry later");
  } catch (const std::exception& e) {
    LEDGER_LOG_BUILDER(ERROR, "Request processing failed")
        .field("type", protocol::toString(request.type))
        .field("error", e.what());
    response = protocol::Response::error(protocol::Status::ERROR, "Request processing failed");
  }

  response.request_id = request.request_id;
  return protocol::serializeResponse(response);
}

protocol::Response LedgerServer::dispatch(const protocol::Request& request) {
  switch (request.type) {
    case protocol::MessageType::TRANSFER:
      return handleTransfer(request);
    case protocol::MessageType::BALANCE:
      return handleBalance(request);
    case protocol::MessageType::STATEMENT:
      return handleStatement(request);
    case protocol::MessageType::TRANSACTION:
      return handleTransaction(request);
    case protocol::MessageType::OPEN_ACCOUNT:
      return handleOpenAccount(request);
    case protocol::MessageType::FREEZE_ACCOUNT:
      return handleFreezeAccount(request);
    case protocol::MessageType::RECONCILE:
      return handleReconcile(request);
    case protocol::MessageType::METRICS: {
      nlohmann::json payload;
      payload["prometheus"] = observability::getGlobalMetrics().exportMetrics();
      return protocol::Response::success("Metrics exported", payload);
    }
    case protocol::MessageType::HEARTBEAT:
      return protocol::Response::success("Heartbeat acknowledged");
  }
  return protocol::Response::error(protocol::Status::INVALID_REQUEST, "Unknown operation");
}

protocol::Response LedgerServer::handleTransfer(const protocol::Request& request) {
  TransferRequest transfer = protocol::transferFromPayload(request.payload);
  transfer.caller_id = request.client_id;
  TransferResult result = engine_.transfer(transfer);
  return protocol::Response::success(result.message, protocol::toJson(result));
}

protocol::Response LedgerServer::handleBalance(const protocol::Request& request) {
  std::string account_id = requireString(request.payload, "account_id");
  auto balance = engine_.balance(account_id, request.client_id);
  if (!balance) {
    return protocol::Response::error(protocol::Status::NOT_FOUND, "Account not found");
  }
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["balance"] = formatAmount(*balance);
  return protocol::Response::success("Balance retrieved", payload);
}

protocol::Response LedgerServer::handleStatement(const protocol::Request& request) {
  storage::HistoryQuery query;
  query.account_id = requireString(request.payload, "account_id");
  query.page_token = request.payload.value("page_token", std::string());
  query.page_size = request.payload.value("page_size", static_cast<size_t>(50));
  if (query.page_size == 0 || query.page_size > 500) {
    throw protocol::ProtocolError("page_size must be between 1 and 500");
  }
  if (request.payload.contains("from_us")) {
    query.from = fromEpochMicros(request.payload["from_us"].get<std::int64_t>());
  }
  if (request.payload.contains("to_us")) {
    query.to = fromEpochMicros(request.payload["to_us"].get<std::int64_t>());
  }

  storage::LedgerPage page = engine_.statement(query, request.client_id);
  nlohmann::json payload;
  payload["account_id"] = query.account_id;
  payload["entries"] = nlohmann::json::array();
  for (const auto& entry : page.entries) {
    payload["entries"].push_back(protocol::toJson(entry));
  }
  payload["next_page_token"] = page.next_page_token;
  return protocol::Response::success("Statement retrieved", payload);
}

protocol::Response LedgerServer::handleTransaction(const protocol::Request& request) {
  auto txn = engine_.transaction(requireString(request.payload, "txn_id"));
  if (!txn) {
    return protocol::Response::error(protocol::Status::NOT_FOUND, "Transaction not found");
  }
  return protocol::Response::success("Transaction retrieved", protocol::toJson(*txn));
}

protocol::Response LedgerServer::handleOpenAccount(const protocol::Request& request) {
  std::string account_id = requireString(request.payload, "account_id");
  auto opening = parseAmount(request.payload.value("opening_balance", std::string("0")));
  if (!opening || *opening < 0) {
    throw protocol::ProtocolError("Malformed opening balance");
  }
  if (!engine_.openAccount(account_id, *opening)) {
    return protocol::Response::error(protocol::Status::ERROR, "Account already exists");
  }
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["balance"] = formatAmount(*opening);
  return protocol::Response::success("Account opened", payload);
}

protocol::Response LedgerServer::handleFreezeAccount(const protocol::Request& request) {
  std::string account_id = requireString(request.payload, "account_id");
  bool frozen = request.payload.value("frozen", true);
  if (!engine_.setFrozen(account_id, frozen)) {
    return protocol::Response::error(protocol::Status::NOT_FOUND, "Account not found");
  }
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["frozen"] = frozen;
  return protocol::Response::success(frozen ? "Account frozen" : "Account unfrozen", payload);
}

protocol::Response LedgerServer::handleReconcile(const protocol::Request& request) {
  std::string txn_id = request.payload.value("txn_id", std::string());
  if (txn_id.empty()) {
    auto stats = engine_.reconcileOnce();
    nlohmann::json payload;
    payload["examined"] = stats.examined;
    payload["completed"] = stats.completed;
    payload["reversed"] = stats.reversed;
    payload["pending"] = stats.pending;
    payload["errors"] = stats.errors;
    return protocol::Response::success("Reconciliation pass finished", payload);
  }

  auto result = engine_.reconcile(txn_id);
  if (!result) {
    return protocol::Response::error(protocol::Status::NOT_FOUND, "Transaction not found");
  }
  return protocol::Response::success(result->message, protocol::toJson(*result));
}

}  // namespace ledger
