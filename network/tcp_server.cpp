#include "network/tcp_server.hpp"

#include "network/protocol.hpp"
#include "observability/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace ledger {
namespace network {

namespace {

bool writeAll(int socket, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

TCPServer::TCPServer(int port, RequestHandler handler)
    : port_(port),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      running_(false) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::start() {
  // Create socket
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to create socket").field("error", std::strerror(errno));
    return false;
  }

  // Set socket options
  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to set socket options").field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Bind socket
  struct sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(static_cast<uint16_t>(port_));

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to bind socket")
        .field("port", port_)
        .field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  socklen_t address_len = sizeof(address);
  if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address), &address_len) == 0) {
    port_ = ntohs(address.sin_port);
  }

  // Listen for connections
  if (listen(server_socket_, 64) < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to listen on socket").field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LEDGER_LOG_BUILDER(INFO, "TCP server started").field("port", port_);
  return true;
}

void TCPServer::stop() {
  if (!running_.exchange(false)) return;

  // Close server socket to break accept loop
  if (server_socket_ >= 0) {
    shutdown(server_socket_, SHUT_RDWR);
    close(server_socket_);
    server_socket_ = -1;
  }

  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }

  // Unblock client reads, then join outside the lock.
  std::unordered_map<int, std::unique_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& pair : connections_) {
      shutdown(pair.second->socket, SHUT_RDWR);
    }
    connections.swap(connections_);
  }
  for (auto& pair : connections) {
    if (pair.second->thread && pair.second->thread->joinable()) {
      pair.second->thread->join();
    }
  }

  LEDGER_LOG_INFO("TCP server stopped");
}

void TCPServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address;
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    if (client_socket < 0) {
      if (running_ && errno != EINTR) {
        LEDGER_LOG_BUILDER(WARN, "Failed to accept connection").field("error", std::strerror(errno));
      }
      continue;
    }

    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);

    auto connection = std::make_unique<Connection>();
    connection->socket = client_socket;
    connection->address = std::string(client_ip) + ":" +
                          std::to_string(ntohs(client_address.sin_port));
    LEDGER_LOG_BUILDER(DEBUG, "Accepted connection").field("client", connection->address);

    reapFinished();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!running_) {
      close(client_socket);
      break;
    }
    Connection* raw = connection.get();
    connections_[client_socket] = std::move(connection);
    raw->thread = std::make_unique<std::thread>(&TCPServer::handleClient, this, raw);
  }
}

void TCPServer::reapFinished() {
  std::vector<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->second->finished) {
        finished.push_back(std::move(it->second));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread && connection->thread->joinable()) {
      connection->thread->join();
    }
  }
}

void TCPServer::handleClient(Connection* connection) {
  char buffer[4096];
  std::string message_buffer;
  bool open = true;

  while (running_ && open) {
    ssize_t bytes_read = read(connection->socket, buffer, sizeof(buffer));

    if (bytes_read <= 0) {
      if (bytes_read < 0 && errno == EINTR) continue;
      if (bytes_read < 0 && running_) {
        LEDGER_LOG_BUILDER(WARN, "Error reading from client")
            .field("client", connection->address)
            .field("error", std::strerror(errno));
      }
      break;
    }

    message_buffer.append(buffer, static_cast<size_t>(bytes_read));

    try {
      while (auto request_json = protocol::MessageFramer::extractMessage(message_buffer)) {
        std::string response_json = request_handler_(*request_json);
        if (!writeAll(connection->socket, protocol::MessageFramer::frameMessage(response_json))) {
          LEDGER_LOG_BUILDER(WARN, "Error writing to client").field("client", connection->address);
          open = false;
          break;
        }
      }
    } catch (const protocol::ProtocolError& e) {
      // The stream cannot be resynchronised after a bad frame.
      LEDGER_LOG_BUILDER(WARN, "Dropping client after framing error")
          .field("client", connection->address)
          .field("error", e.what());
      auto error_response =
          protocol::Response::error(protocol::Status::INVALID_REQUEST, "Malformed frame");
      if (!writeAll(connection->socket, protocol::MessageFramer::frameMessage(
                                            protocol::serializeResponse(error_response)))) {
        LEDGER_LOG_DEBUG("Could not report framing error to client");
      }
      open = false;
    }
  }

  close(connection->socket);
  LEDGER_LOG_BUILDER(DEBUG, "Closed connection").field("client", connection->address);
  connection->finished = true;
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  size_t active = 0;
  for (const auto& pair : connections_) {
    if (!pair.second->finished) ++active;
  }
  return active;
}

TCPClient::TCPClient(const std::string& host, int port)
    : host_(host), port_(port), socket_(-1) {
}

TCPClient::~TCPClient() {
  disconnect();
}

bool TCPClient::connect() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (socket_ >= 0) return true;

  socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socket_ < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to create socket").field("error", std::strerror(errno));
    return false;
  }

  struct sockaddr_in server_address;
  std::memset(&server_address, 0, sizeof(server_address));
  server_address.sin_family = AF_INET;
  server_address.sin_port = htons(static_cast<uint16_t>(port_));

  if (inet_pton(AF_INET, host_.c_str(), &server_address.sin_addr) <= 0) {
    LEDGER_LOG_BUILDER(ERROR, "Invalid address").field("host", host_);
    close(socket_);
    socket_ = -1;
    return false;
  }

  if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&server_address),
                sizeof(server_address)) < 0) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to connect")
        .field("host", host_)
        .field("port", port_)
        .field("error", std::strerror(errno));
    close(socket_);
    socket_ = -1;
    return false;
  }
  return true;
}

void TCPClient::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (socket_ < 0) return;
  shutdown(socket_, SHUT_RDWR);
  close(socket_);
  socket_ = -1;
  buffer_.clear();
}

std::string TCPClient::sendRequest(const std::string& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (socket_ < 0) {
    throw std::runtime_error("Not connected to server");
  }

  if (!writeAll(socket_, protocol::MessageFramer::frameMessage(request))) {
    throw std::runtime_error("Failed to send request");
  }

  char chunk[4096];
  while (true) {
    if (auto response = protocol::MessageFramer::extractMessage(buffer_)) {
      return *response;
    }
    ssize_t bytes_read = read(socket_, chunk, sizeof(chunk));
    if (bytes_read < 0 && errno == EINTR) continue;
    if (bytes_read <= 0) {
      throw std::runtime_error("Connection closed while waiting for response");
    }
    buffer_.append(chunk, static_cast<size_t>(bytes_read));
  }
}

}  // namespace network
}  // namespace ledger
