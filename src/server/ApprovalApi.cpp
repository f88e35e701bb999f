#include "hitl/server/ApprovalApi.hpp"

#include "hitl/Coordinator.hpp"
#include "hitl/util/Logger.hpp"
#include "hitl/util/Metrics.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/version.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <chrono>
#include <cstdint>
#include <string_view>

namespace hitl::server {

namespace {

constexpr std::string_view kApprovalsPath   = "/approvals";
constexpr std::string_view kApprovalsPrefix = "/approvals/";

std::string pathOf(const Request& req) {
  std::string_view t(req.target().data(), req.target().size());
  auto q = t.find('?');
  if (q != std::string_view::npos) t = t.substr(0, q);
  return std::string(t);
}

std::string ownerOf(const Request& req) {
  auto it = req.find(kOwnerHeader);
  if (it == req.end()) return {};
  return std::string(it->value().data(), it->value().size());
}

std::int64_t epochMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void writeArgs(rapidjson::Writer<rapidjson::StringBuffer>& w, const std::string& argsJson) {
  rapidjson::Document args;
  args.Parse(argsJson.c_str());
  if (args.HasParseError()) {
    // Not ours to fix; hand it through as text.
    w.String(argsJson.c_str(), static_cast<rapidjson::SizeType>(argsJson.size()));
    return;
  }
  args.Accept(w);
}

} // namespace

Response makeJson(const Request& req, http::status status, std::string body) {
  Response res{status, req.version()};
  res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " hitl");
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

Response makeError(const Request& req, http::status status, const std::string& message) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("error");
  w.String(message.c_str(), static_cast<rapidjson::SizeType>(message.size()));
  w.EndObject();
  return makeJson(req, status, sb.GetString());
}

Response ApprovalApi::handle(const Request& req) const {
  const std::string path = pathOf(req);

  if (path == "/healthz") {
    if (req.method() != http::verb::get) return makeError(req, http::status::method_not_allowed, "use GET");
    return health(req);
  }
  if (path == kApprovalsPath) {
    if (req.method() != http::verb::get) return makeError(req, http::status::method_not_allowed, "use GET");
    return listApprovals(req);
  }
  if (path.size() > kApprovalsPrefix.size() &&
      path.compare(0, kApprovalsPrefix.size(), kApprovalsPrefix) == 0) {
    const std::string id = path.substr(kApprovalsPrefix.size());
    if (id.find('/') != std::string::npos) return makeError(req, http::status::not_found, "no such route");
    if (req.method() != http::verb::post) return makeError(req, http::status::method_not_allowed, "use POST");
    return resolveApproval(req, id);
  }
  return makeError(req, http::status::not_found, "no such route");
}

Response ApprovalApi::listApprovals(const Request& req) const {
  const std::string owner = ownerOf(req);
  if (owner.empty()) {
    return makeError(req, http::status::bad_request, std::string("missing ") + kOwnerHeader + " header");
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartArray();
  for (const auto& p : coord_.listPending(owner)) {
    w.StartObject();
    w.Key("id");          w.String(p.id.c_str(), static_cast<rapidjson::SizeType>(p.id.size()));
    w.Key("name");        w.String(p.payload.name.c_str(), static_cast<rapidjson::SizeType>(p.payload.name.size()));
    w.Key("description"); w.String(p.payload.description.c_str(),
                                   static_cast<rapidjson::SizeType>(p.payload.description.size()));
    w.Key("args");        writeArgs(w, p.payload.argsJson);
    w.Key("metadata");
    w.StartObject();
    for (const auto& kv : p.payload.metadata) {
      w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
      w.String(kv.second.c_str(), static_cast<rapidjson::SizeType>(kv.second.size()));
    }
    w.EndObject();
    w.Key("createdAt");   w.Int64(epochMillis(p.createdAt));
    w.EndObject();
  }
  w.EndArray();

  HITL_METRIC_HIT("http.list");
  return makeJson(req, http::status::ok, sb.GetString());
}

Response ApprovalApi::resolveApproval(const Request& req, const std::string& id) const {
  rapidjson::Document doc;
  doc.Parse(req.body().c_str());
  if (doc.HasParseError()) {
    HITL_METRIC_HIT("http.bad_request");
    return makeError(req, http::status::bad_request,
                     std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject() || !doc.HasMember("approved") || !doc["approved"].IsBool()) {
    HITL_METRIC_HIT("http.bad_request");
    return makeError(req, http::status::bad_request, "body must be {\"approved\": bool}");
  }
  const Decision decision = decisionFromBool(doc["approved"].GetBool());

  // With an identity present only that owner's requests are addressable.
  const std::string owner = ownerOf(req);
  const bool found = owner.empty() ? coord_.resolve(id, decision)
                                   : coord_.resolveFor(owner, id, decision);

  util::logger().log(util::LogLevel::Info, "http.resolve",
                     { {"id", id}, {"owner", owner}, {"decision", toString(decision)},
                       {"found", found ? "true" : "false"} });
  if (!found) {
    return makeError(req, http::status::not_found, "no such request: " + id);
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("id");    w.String(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
  w.Key("found"); w.Bool(true);
  w.EndObject();
  return makeJson(req, http::status::ok, sb.GetString());
}

Response ApprovalApi::health(const Request& req) const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("status");  w.String("ok");
  w.Key("pending"); w.Uint64(coord_.pendingCount());
  w.EndObject();
  return makeJson(req, http::status::ok, sb.GetString());
}

} // namespace hitl::server
