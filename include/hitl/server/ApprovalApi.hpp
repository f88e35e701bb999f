#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <string>

namespace hitl {

class Coordinator;

namespace server {

namespace http = boost::beast::http;

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Header carrying the caller identity, set by whatever authenticates the
// request in front of us.
inline constexpr const char* kOwnerHeader = "X-Owner";

// JSON routes over a Coordinator. Stateless, so one instance is shared by
// every session and called from any io thread.
//
//   GET  /approvals          (X-Owner required)  -> pending rows for that owner
//   POST /approvals/<id>     {"approved": bool}   -> resolve; 404 if unknown
//   GET  /healthz                                 -> liveness + pending count
class ApprovalApi {
public:
  explicit ApprovalApi(Coordinator& coordinator) : coord_(coordinator) {}

  Response handle(const Request& req) const;

private:
  Response listApprovals(const Request& req) const;
  Response resolveApproval(const Request& req, const std::string& id) const;
  Response health(const Request& req) const;

  Coordinator& coord_;
};

// Shared response helpers (also used by sessions for transport-level errors).
Response makeJson(const Request& req, http::status status, std::string body);
Response makeError(const Request& req, http::status status, const std::string& message);

} // namespace server
} // namespace hitl
