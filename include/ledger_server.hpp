#ifndef LEDGER_SERVER_HPP_
#define LEDGER_SERVER_HPP_

#include "ledger_engine.hpp"
#include "network/protocol.hpp"
#include "network/tcp_server.hpp"

#include <memory>
#include <string>

namespace ledger {

/**
 * Network front end of the ledger engine. Decodes framed JSON requests,
 * calls the engine and encodes the answer. Internal errors never reach the
 * client verbatim.
 */
class LedgerServer {
 public:
  LedgerServer(int port, LedgerEngine& engine);
  ~LedgerServer();

  // Non-copyable
  LedgerServer(const LedgerServer&) = delete;
  LedgerServer& operator=(const LedgerServer&) = delete;

  /**
   * Start the engine and the TCP listener.
   */
  bool start();

  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
    notify::NotificationPublisher::Stats notifications;
  };
  Stats getStats() const;

  int getPort() const;

  /**
   * Handles one serialized request. Public so it can be driven without a
   * socket.
   */
  std::string handleRequest(const std::string& request_json);

 private:
  network::protocol::Response dispatch(const network::protocol::Request& request);

  network::protocol::Response handleTransfer(const network::protocol::Request& request);
  network::protocol::Response handleBalance(const network::protocol::Request& request);
  network::protocol::Response handleStatement(const network::protocol::Request& request);
  network::protocol::Response handleTransaction(const network::protocol::Request& request);
  network::protocol::Response handleOpenAccount(const network::protocol::Request& request);
  network::protocol::Response handleFreezeAccount(const network::protocol::Request& request);
  network::protocol::Response handleReconcile(const network::protocol::Request& request);

  LedgerEngine& engine_;
  std::unique_ptr<network::TCPServer> tcp_server_;
};

}  // namespace ledger

#endif  // LEDGER_SERVER_HPP_
