#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include "ledger_types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ledger {
namespace network {
namespace protocol {

// Message types
enum class MessageType {
  TRANSFER,
  BALANCE,
  STATEMENT,
  TRANSACTION,
  OPEN_ACCOUNT,
  FREEZE_ACCOUNT,
  RECONCILE,
  METRICS,
  HEARTBEAT
};

// Response status
enum class Status {
  OK,
  ERROR,
  INVALID_REQUEST,
  NOT_FOUND
};

std::string toString(MessageType type);
std::string toString(Status status);
std::optional<MessageType> parseMessageType(const std::string& text);
std::optional<Status> parseStatus(const std::string& text);

/**
 * Malformed frame or message.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// Request base structure
struct Request {
  MessageType type = MessageType::HEARTBEAT;
  std::string request_id;
  std::string client_id;
  nlohmann::json payload = nlohmann::json::object();

  // Helper methods for specific request types
  static Request transfer(const std::string& client_id, const TransferRequest& transfer);

  static Request balance(const std::string& client_id, const std::string& account_id);

  static Request statement(const std::string& client_id, const std::string& account_id,
                           const std::string& page_token = "", size_t page_size = 50);

  static Request transaction(const std::string& client_id, const std::string& txn_id);

  static Request openAccount(const std::string& client_id, const std::string& account_id,
                             Amount opening_balance);

  static Request freezeAccount(const std::string& client_id, const std::string& account_id,
                               bool frozen);

  // Without txn_id, runs one reconciliation pass.
  static Request reconcile(const std::string& client_id, const std::string& txn_id = "");

  static Request metrics(const std::string& client_id);

  static Request heartbeat(const std::string& client_id);
};

// Response base structure
struct Response {
  Status status = Status::OK;
  std::string message;
  std::string request_id;
  nlohmann::json payload = nlohmann::json::object();

  static Response success(const std::string& message,
                          const nlohmann::json& payload = nlohmann::json::object());

  static Response error(Status status, const std::string& message);
};

nlohmann::json toJson(const TransferResult& result);
nlohmann::json toJson(const LedgerEntry& entry);
nlohmann::json toJson(const Transaction& txn);

/**
 * Reads a TransferRequest from a TRANSFER payload. Amounts travel as decimal
 * strings ("12.34"). Throws ProtocolError on missing or malformed fields.
 */
TransferRequest transferFromPayload(const nlohmann::json& payload);

// Serialization functions
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

/**
 * Length-prefixed framing: 8 hex digits of body length, then the body.
 */
class MessageFramer {
 public:
  static constexpr size_t kHeaderSize = 8;
  static constexpr size_t kMaxMessageSize = 1 << 20;

  static std::string frameMessage(const std::string& message);

  /**
   * Removes and returns the first complete message in `buffer`. Empty if the
   * buffer does not hold one yet. Throws ProtocolError on a bad header.
   */
  static std::optional<std::string> extractMessage(std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace ledger

#endif  // PROTOCOL_HPP_
