#ifndef TCP_SERVER_HPP_
#define TCP_SERVER_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ledger {
namespace network {

/**
 * TCP server speaking length-framed messages. Each connection gets its own
 * thread; each complete request frame is passed to the handler and the
 * returned string is framed and sent back.
 */
class TCPServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  // Port 0 binds an ephemeral port; getPort() reports it after start().
  TCPServer(int port, RequestHandler handler);
  ~TCPServer();

  // Non-copyable
  TCPServer(const TCPServer&) = delete;
  TCPServer& operator=(const TCPServer&) = delete;

  /**
   * Start the server and begin accepting connections.
   */
  bool start();

  /**
   * Stop the server and close all connections.
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  int getPort() const { return port_; }

  /**
   * Get number of active connections.
   */
  size_t getConnectionCount() const;

 private:
  struct Connection {
    int socket = -1;
    std::string address;
    std::atomic<bool> finished{false};
    std::unique_ptr<std::thread> thread;
  };

  void acceptLoop();
  void handleClient(Connection* connection);
  void reapFinished();

  int port_;
  int server_socket_;
  RequestHandler request_handler_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> accept_thread_;
  std::unordered_map<int, std::unique_ptr<Connection>> connections_;
  mutable std::mutex connections_mutex_;
};

/**
 * Blocking request/response client for the framed protocol.
 */
class TCPClient {
 public:
  TCPClient(const std::string& host, int port);
  ~TCPClient();

  // Non-copyable
  TCPClient(const TCPClient&) = delete;
  TCPClient& operator=(const TCPClient&) = delete;

  bool connect();

  void disconnect();

  bool isConnected() const { return socket_ >= 0; }

  /**
   * Sends one request and waits for its response.
   * Throws std::runtime_error when the connection fails.
   */
  std::string sendRequest(const std::string& request);

 private:
  std::string host_;
  int port_;
  int socket_;
  std::string buffer_;
  std::mutex mutex_;
};

}  // namespace network
}  // namespace ledger

#endif  // TCP_SERVER_HPP_
