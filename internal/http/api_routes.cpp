#include "api_routes.hpp"

#include <google/protobuf/util/json_util.h>
#include <openssl/crypto.h>

#include <chrono>

#include "http_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/contact_service.hpp"
#include "internal/service/license_service.hpp"
#include "internal/util/errors.hpp"
#include "nove/v1.hpp"

namespace nove::http {

using observability::StringField;

namespace {

constexpr const char* kServerName = "nove-api";

std::string_view ToStd(boost::beast::string_view sv) {
  return {sv.data(), sv.size()};
}

template <typename Message>
Message ParseBody(const Request& request) {
  Message message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto& body   = request.body();
  auto        status = google::protobuf::util::JsonStringToMessage(body.empty() ? "{}" : body, &message, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid JSON body: " + std::string(status.message()));
  }
  return message;
}

Response JsonResponse(const Request& request, const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("response encode failed: " + std::string(status.message()));
  }

  Response response{beast_http::status::ok, request.version()};
  response.set(beast_http::field::content_type, "application/json");
  response.body() = std::move(json);
  response.prepare_payload();
  return response;
}

std::string AllowHeader(const std::vector<beast_http::verb>& methods) {
  std::string out;
  for (auto method : methods) {
    if (!out.empty()) out += ", ";
    out += ToStd(beast_http::to_string(method));
  }
  return out;
}

} // namespace

ApiHandler::ApiHandler(std::shared_ptr<service::LicenseService> licenses, std::shared_ptr<service::ContactService> contacts,
                       ApiOptions options)
    : licenses_(std::move(licenses)),
      contacts_(std::move(contacts)),
      admin_token_(std::move(options.admin_token)),
      cors_(std::move(options.allowed_origins)) {
  RegisterRoutes();
}

void ApiHandler::RegisterRoutes() {
  using beast_http::verb;
  constexpr bool kAdmin = true;

  router_.Add(verb::get, "/", "health", [](const Request& req, const PathParams&) {
    nove::v1::HealthResponse health;
    health.set_status("ok");
    health.set_service("NOVE OS API v1.0");
    return JsonResponse(req, health);
  });

  // ---------------------------------------------------------------------
  // Contacts
  // ---------------------------------------------------------------------

  router_.Add(verb::post, "/api/contact", "contact.submit", [this](const Request& req, const PathParams&) {
    return JsonResponse(req, contacts_->Submit(ParseBody<nove::v1::ContactForm>(req)));
  });

  router_.Add(
      verb::get, "/api/contacts", "contact.list", [this](const Request& req, const PathParams&) { return JsonResponse(req, contacts_->List()); },
      kAdmin);

  // ---------------------------------------------------------------------
  // Licenses
  // ---------------------------------------------------------------------

  router_.Add(verb::post, "/api/trial/request", "trial.request", [this](const Request& req, const PathParams&) {
    return JsonResponse(req, licenses_->RequestTrial(ParseBody<nove::v1::TrialRequest>(req)));
  });

  router_.Add(
      verb::post, "/api/license/generate", "license.generate",
      [this](const Request& req, const PathParams&) {
        return JsonResponse(req, licenses_->Generate(ParseBody<nove::v1::GenerateLicenseRequest>(req)));
      },
      kAdmin);

  router_.Add(verb::post, "/api/license/activate", "license.activate", [this](const Request& req, const PathParams&) {
    return JsonResponse(req, licenses_->Activate(ParseBody<nove::v1::ActivateRequest>(req)));
  });

  router_.Add(verb::get, "/api/license/validate/{key}", "license.validate", [this](const Request& req, const PathParams& params) {
    return JsonResponse(req, licenses_->Validate(params.at("key")));
  });

  router_.Add(
      verb::get, "/api/licenses", "license.list", [this](const Request& req, const PathParams&) { return JsonResponse(req, licenses_->List()); },
      kAdmin);

  router_.Add(
      verb::get, "/api/license/{key}/activations", "license.activations.list",
      [this](const Request& req, const PathParams& params) { return JsonResponse(req, licenses_->ListActivations(params.at("key"))); },
      kAdmin);

  router_.Add(
      verb::delete_, "/api/license/{key}/activations/{machine_id}", "license.activations.remove",
      [this](const Request& req, const PathParams& params) {
        return JsonResponse(req, licenses_->RemoveActivation(params.at("key"), params.at("machine_id")));
      },
      kAdmin);

  router_.Add(
      verb::delete_, "/api/license/{key}", "license.revoke",
      [this](const Request& req, const PathParams& params) { return JsonResponse(req, licenses_->Revoke(params.at("key"))); }, kAdmin);
}

bool ApiHandler::IsAuthorized(const Request& request) const {
  if (admin_token_.empty()) return false;

  const auto presented = request[kAdminTokenHeader];
  if (presented.size() != admin_token_.size()) return false;
  return CRYPTO_memcmp(presented.data(), admin_token_.data(), admin_token_.size()) == 0;
}

Response ApiHandler::Dispatch(const Request& request, std::string& route_name, std::string& error) const {
  auto match = router_.Resolve(request.method(), ToStd(request.target()));

  if (match.kind == Router::MatchKind::kNotFound) {
    nove::v1::ErrorResponse body;
    body.set_detail("Not Found");
    return ErrorResponseFor(request, beast_http::status::not_found, body);
  }
  if (match.kind == Router::MatchKind::kMethodNotAllowed) {
    nove::v1::ErrorResponse body;
    body.set_detail("Method Not Allowed");
    auto response = ErrorResponseFor(request, beast_http::status::method_not_allowed, body);
    response.set(beast_http::field::allow, AllowHeader(match.allowed));
    return response;
  }

  route_name = match.route->name;
  try {
    if (match.route->admin && !IsAuthorized(request)) {
      throw util::Unauthorized("認証エラー");
    }
    return match.route->handler(request, match.params);
  } catch (const std::exception& e) {
    error             = e.what();
    const auto status = ToHttpStatus(e);
    if (status == beast_http::status::internal_server_error) {
      NOVE_LOG_ERROR("request failed", {StringField("route", route_name), StringField("error", e.what())});
    }
    return ErrorResponseFor(request, status, ToErrorResponse(e));
  }
}

Response ApiHandler::Handle(const Request& request) const {
  const auto started_at = std::chrono::steady_clock::now();

  std::string route_name = "unmatched";
  std::string error;
  Response    response;
  if (CorsPolicy::IsPreflight(request)) {
    route_name = "cors.preflight";
    response   = cors_.Preflight(request);
  } else {
    response = Dispatch(request, route_name, error);
    cors_.Apply(request, response);
  }
  response.set(beast_http::field::server, kServerName);
  response.keep_alive(request.keep_alive());

  const auto latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  const auto status     = response.result_int();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordRequest(route_name, status < 400);
  metrics.ObserveRequestLatencyMs(route_name, latency_ms);

  const auto method = ToStd(request.method_string());
  const auto path   = PathOf(ToStd(request.target()));
  if (error.empty()) {
    NOVE_LOG_INFO("http request", {StringField("method", method), StringField("path", path), observability::IntField("status", status),
                                   observability::DurationMsField("latency_ms", latency_ms)});
  } else {
    NOVE_LOG_INFO("http request", {StringField("method", method), StringField("path", path), observability::IntField("status", status),
                                   observability::DurationMsField("latency_ms", latency_ms), StringField("error", error)});
  }
  return response;
}

} // namespace nove::http
