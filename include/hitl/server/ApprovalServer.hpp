#pragma once

#include "hitl/server/ApprovalApi.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hitl {

class Coordinator;

namespace server {

class HttpSession;

// Accepts connections and hands each one to an HttpSession bound to a shared
// ApprovalApi.
class ApprovalServer {
public:
  using tcp = boost::asio::ip::tcp;

  // Binds and listens immediately; throws boost::system::system_error on failure.
  ApprovalServer(boost::asio::io_context& ioc,
                 Coordinator& coordinator,
                 const std::string& address,
                 unsigned short port);

  void run();

  // Stop accepting new connections (idempotent).
  void stopAccept() noexcept;

  // Close all live sessions (idempotent).
  void closeAll() noexcept;

  unsigned short port() const;

  void registerSession(const std::shared_ptr<HttpSession>& s);
  void unregisterSession(HttpSession* s) noexcept;

private:
  void doAccept();
  void onAccept(boost::system::error_code ec, tcp::socket socket);

private:
  boost::asio::io_context& ioc_;
  tcp::acceptor            acceptor_;
  ApprovalApi              api_;
  std::atomic<bool>        accepting_{false};

  std::mutex sessions_mu_;
  std::unordered_map<HttpSession*, std::weak_ptr<HttpSession>> sessions_;
};

} // namespace server
} // namespace hitl
