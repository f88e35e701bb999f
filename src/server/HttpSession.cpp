#include "hitl/server/HttpSession.hpp"
#include "hitl/server/ApprovalServer.hpp"

#include "hitl/util/Logger.hpp"
#include "hitl/util/Metrics.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <chrono>

namespace hitl::server {

namespace beast = boost::beast;

HttpSession::HttpSession(tcp::socket socket, const ApprovalApi& api, ApprovalServer* server)
  : stream_(std::move(socket))
  , api_(api)
  , server_(server)
{}

void HttpSession::run() {
  // Start on the stream's strand.
  boost::asio::dispatch(stream_.get_executor(),
                        [self = shared_from_this()]{ self->doRead(); });
}

void HttpSession::doRead() {
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));

  http::async_read(stream_, buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
      });
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    finish();
    return;
  }
  if (ec) {
    if (ec != boost::asio::error::operation_aborted && ec != beast::error::timeout) {
      util::logger().log(util::LogLevel::Debug, "http.read_failed", { {"error", ec.message()} });
    }
    finish();
    return;
  }

  HITL_METRIC_HIT("http.request");
  res_ = std::make_shared<Response>(api_.handle(req_));

  const bool keepAlive = res_->keep_alive();
  http::async_write(stream_, *res_,
      [self = shared_from_this(), keepAlive](beast::error_code wec, std::size_t bytes) {
        self->onWrite(keepAlive, wec, bytes);
      });
}

void HttpSession::onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
  res_.reset();
  if (ec) {
    util::logger().log(util::LogLevel::Debug, "http.write_failed", { {"error", ec.message()} });
    finish();
    return;
  }
  if (!keepAlive) {
    finish();
    return;
  }
  doRead();
}

void HttpSession::close() {
  boost::asio::post(stream_.get_executor(), [self = shared_from_this()]{
    beast::error_code ec;
    self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    self->stream_.socket().close(ec);
  });
}

void HttpSession::finish() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  stream_.socket().close(ec);
  if (server_) server_->unregisterSession(this);
}

} // namespace hitl::server
