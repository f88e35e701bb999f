#include "hitl/server/ApprovalServer.hpp"
#include "hitl/server/HttpSession.hpp"

#include "hitl/util/Logger.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>

#include <vector>

namespace hitl::server {

ApprovalServer::ApprovalServer(boost::asio::io_context& ioc,
                               Coordinator& coordinator,
                               const std::string& address,
                               unsigned short port)
  : ioc_(ioc),
    acceptor_(ioc),
    api_(coordinator)
{
  boost::system::error_code ec;
  tcp::endpoint ep{boost::asio::ip::make_address(address, ec), port};
  if (ec) throw boost::system::system_error(ec, "bad listen address '" + address + "'");

  acceptor_.open(ep.protocol(), ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.bind(ep, ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) throw boost::system::system_error(ec);
}

void ApprovalServer::run() {
  bool expected = false;
  if (!accepting_.compare_exchange_strong(expected, true)) return;
  doAccept();
}

unsigned short ApprovalServer::port() const {
  boost::system::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void ApprovalServer::doAccept() {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  acceptor_.async_accept(
    boost::asio::make_strand(ioc_),
    [this](boost::system::error_code ec, tcp::socket socket) {
      onAccept(ec, std::move(socket));
    });
}

void ApprovalServer::onAccept(boost::system::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_relaxed)) return;

  if (ec) {
    util::logger().log(util::LogLevel::Warn, "http.accept_failed", { {"error", ec.message()} });
  } else {
    auto session = std::make_shared<HttpSession>(std::move(socket), api_, this);
    registerSession(session);
    session->run();
  }
  doAccept();
}

void ApprovalServer::registerSession(const std::shared_ptr<HttpSession>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[s.get()] = s;
}

void ApprovalServer::unregisterSession(HttpSession* s) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(s);
}

void ApprovalServer::stopAccept() noexcept {
  accepting_.store(false, std::memory_order_relaxed);
  boost::system::error_code ec;
  // Both are no-ops on an already closed acceptor.
  acceptor_.cancel(ec);
  acceptor_.close(ec);
}

void ApprovalServer::closeAll() noexcept {
  // Snapshot so close() runs without the mutex held.
  std::vector<std::shared_ptr<HttpSession>> to_close;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    to_close.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) to_close.emplace_back(std::move(sp));
    }
    sessions_.clear();
  }
  for (auto& s : to_close) s->close();
}

} // namespace hitl::server
