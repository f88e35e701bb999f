#pragma once

#include "hitl/server/ApprovalApi.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>

namespace hitl::server {

class ApprovalServer;

// One keep-alive HTTP/1.1 connection. Requests are answered in order; the
// API never blocks, so handling happens inline on the session's strand.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  using tcp = boost::asio::ip::tcp;

  HttpSession(tcp::socket socket, const ApprovalApi& api, ApprovalServer* server);

  void run();

  // Idempotent; safe from any thread.
  void close();

private:
  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);
  void onWrite(bool keepAlive, boost::beast::error_code ec, std::size_t bytes);
  void finish();

private:
  boost::beast::tcp_stream   stream_;
  boost::beast::flat_buffer  buffer_;
  Request                    req_;
  std::shared_ptr<Response>  res_;
  const ApprovalApi&         api_;
  ApprovalServer*            server_{nullptr};   // not owned
};

} // namespace hitl::server
