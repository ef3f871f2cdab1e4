#include <cassert>

#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/license_key.hpp"
#include "internal/core/license_registry.hpp"
#include "internal/core/plan_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/http/api_routes.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/service/contact_service.hpp"
#include "internal/service/license_service.hpp"
#include "internal/service/service_context.hpp"
#include "nove/v1.hpp"

namespace {

namespace beast_http = nove::http::beast_http;

using nove::http::ApiHandler;
using nove::http::Request;
using nove::http::Response;

constexpr const char* kToken    = "admin-secret";
constexpr const char* kOperator = "ops@noveos.jp";

class RecordingSink final : public nove::notify::NotificationSink {
 public:
  void Notify(nove::notify::EmailMessage message) override {
    std::lock_guard lock(mutex_);
    messages_.push_back(std::move(message));
  }

  std::vector<nove::notify::EmailMessage> Messages() const {
    std::lock_guard lock(mutex_);
    return messages_;
  }

  std::size_t CountTo(const std::string& to) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& m : messages_) {
      if (m.to == to) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex                      mutex_;
  std::vector<nove::notify::EmailMessage> messages_;
};

struct Harness {
  std::shared_ptr<nove::db::memory::MemoryRepository> repository = std::make_shared<nove::db::memory::MemoryRepository>();
  std::shared_ptr<RecordingSink>                      sink       = std::make_shared<RecordingSink>();
  std::unique_ptr<ApiHandler>                         handler;

  explicit Harness(std::string admin_token = kToken) {
    nove::service::ServiceContext ctx;
    ctx.registry = std::make_shared<nove::core::LicenseRegistry>(repository, nove::core::PlanCatalog::Default(), [](std::string_view plan) {
      return nove::core::GenerateLicenseKey("NOVE", plan);
    });
    ctx.repository               = repository;
    ctx.notifier                 = sink;
    ctx.operator_address         = kOperator;
    ctx.install_command_template = "curl -fsSL https://noveos.jp/install.sh | sudo bash -s -- --license {key}";

    nove::http::ApiOptions options;
    options.admin_token     = std::move(admin_token);
    options.allowed_origins = {"https://noveos.jp", "https://*.netlify.app"};

    handler = std::make_unique<ApiHandler>(std::make_shared<nove::service::LicenseService>(ctx),
                                           std::make_shared<nove::service::ContactService>(ctx), std::move(options));
  }

  Response Call(beast_http::verb method, const std::string& target, const std::string& body = {}, bool admin = false) const {
    Request request{method, target, 11};
    request.set(beast_http::field::host, "api.noveos.jp");
    if (!body.empty()) {
      request.set(beast_http::field::content_type, "application/json");
      request.body() = body;
    }
    if (admin) {
      request.set(nove::http::kAdminTokenHeader, kToken);
    }
    request.prepare_payload();
    return handler->Handle(request);
  }
};

template <typename Message>
Message Parse(const Response& response) {
  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(response.body(), &message);
  assert(status.ok());
  return message;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string IssueStartup(const Harness& h, const std::string& email = "hanako@example.com") {
  auto response = h.Call(beast_http::verb::post, "/api/license/generate",
                         R"({"plan":"startup","customer_name":"Hanako","customer_email":")" + email + R"(","months":1})", true);
  assert(response.result() == beast_http::status::ok);
  return Parse<nove::v1::GenerateLicenseResponse>(response).license_key();
}

// ------------------------------------------------------------------

void TestHealth() {
  Harness h;
  auto    response = h.Call(beast_http::verb::get, "/");
  assert(response.result() == beast_http::status::ok);
  assert(response[beast_http::field::content_type] == "application/json");
  assert(response[beast_http::field::server] == "nove-api");
  assert(response.body() == R"({"status":"ok","service":"NOVE OS API v1.0"})");
}

void TestUnknownRouteAndMethod() {
  Harness h;
  auto    missing = h.Call(beast_http::verb::get, "/api/nothing");
  assert(missing.result() == beast_http::status::not_found);
  assert(missing.body() == R"({"detail":"Not Found"})");

  auto wrong_method = h.Call(beast_http::verb::put, "/api/contact", "{}");
  assert(wrong_method.result() == beast_http::status::method_not_allowed);
  assert(wrong_method[beast_http::field::allow] == "POST");
  assert(wrong_method.body() == R"({"detail":"Method Not Allowed"})");
}

void TestAdminRoutesRequireToken() {
  Harness h;
  for (const auto* target : {"/api/licenses", "/api/contacts", "/api/license/NOVE-X/activations"}) {
    auto response = h.Call(beast_http::verb::get, target);
    assert(response.result() == beast_http::status::unauthorized);
    assert(response.body() == R"({"detail":"認証エラー"})");
  }

  Request wrong{beast_http::verb::get, "/api/licenses", 11};
  wrong.set(nove::http::kAdminTokenHeader, "admin-secreT");
  assert(h.handler->Handle(wrong).result() == beast_http::status::unauthorized);
  assert(!h.handler->IsAuthorized(wrong));

  auto generate = h.Call(beast_http::verb::post, "/api/license/generate", R"({"plan":"startup"})");
  assert(generate.result() == beast_http::status::unauthorized);

  auto ok = h.Call(beast_http::verb::get, "/api/licenses", {}, true);
  assert(ok.result() == beast_http::status::ok);
  assert(Parse<nove::v1::LicenseList>(ok).licenses_size() == 0);
}

void TestEmptyTokenDisablesAdmin() {
  Harness h("");
  Request request{beast_http::verb::get, "/api/licenses", 11};
  request.set(nove::http::kAdminTokenHeader, "");
  assert(h.handler->Handle(request).result() == beast_http::status::unauthorized);
}

void TestGenerateAndActivate() {
  Harness h;
  auto    generate = h.Call(beast_http::verb::post, "/api/license/generate",
                            R"({"plan":"startup","customer_name":"Hanako","customer_email":"Hanako@Example.com","months":1,"note":"PO-1"})", true);
  assert(generate.result() == beast_http::status::ok);
  const auto issued = Parse<nove::v1::GenerateLicenseResponse>(generate);
  assert(issued.status() == "ok");
  assert(issued.plan() == "startup");
  assert(issued.plan_name() == "スタートアップ");
  assert(issued.server_limit() == 50);
  assert(issued.customer_email() == "hanako@example.com");
  assert(issued.license_key().rfind("NOVE-STA-", 0) == 0);
  assert(h.sink->CountTo("hanako@example.com") == 1);
  assert(h.sink->CountTo(kOperator) == 1);

  const auto activate_body = R"({"license_key":")" + issued.license_key() + R"(","machine_id":"m1"})";
  auto       first         = Parse<nove::v1::ActivateResponse>(h.Call(beast_http::verb::post, "/api/license/activate", activate_body));
  assert(first.is_valid());
  assert(first.status() == "activated");
  assert(first.activated_count() == 1);
  assert(first.customer_name() == "Hanako");

  auto again_response = h.Call(beast_http::verb::post, "/api/license/activate", activate_body);
  assert(Contains(again_response.body(), R"("status":"valid")"));
  assert(Parse<nove::v1::ActivateResponse>(again_response).activated_count() == 1);

  auto validate = h.Call(beast_http::verb::get, "/api/license/validate/" + issued.license_key());
  assert(validate.result() == beast_http::status::ok);
  const auto license = Parse<nove::v1::License>(validate);
  assert(license.is_valid());
  assert(!license.is_expired());
  assert(license.activated_count() == 1);
  assert(license.note() == "PO-1");
  assert(Contains(validate.body(), R"("is_active":true)"));

  auto list = Parse<nove::v1::LicenseList>(h.Call(beast_http::verb::get, "/api/licenses", {}, true));
  assert(list.licenses_size() == 1);
  assert(list.licenses(0).license_key() == issued.license_key());
}

void TestActivationErrors() {
  Harness h;
  auto unknown = h.Call(beast_http::verb::post, "/api/license/activate", R"({"license_key":"NOVE-NOPE","machine_id":"m1"})");
  assert(unknown.result() == beast_http::status::not_found);
  assert(Parse<nove::v1::ErrorResponse>(unknown).detail() == "ライセンスキーが見つかりません");

  auto missing_machine = h.Call(beast_http::verb::post, "/api/license/activate", R"({"license_key":"NOVE-NOPE"})");
  assert(missing_machine.result() == beast_http::status::bad_request);

  auto not_json = h.Call(beast_http::verb::post, "/api/license/activate", "{license_key:");
  assert(not_json.result() == beast_http::status::bad_request);

  auto validate_unknown = h.Call(beast_http::verb::get, "/api/license/validate/NOVE-NOPE");
  assert(validate_unknown.result() == beast_http::status::not_found);
}

void TestGenerateValidation() {
  Harness h;
  auto bad_plan = h.Call(beast_http::verb::post, "/api/license/generate",
                         R"({"plan":"gold","customer_name":"A","customer_email":"a@b.co"})", true);
  assert(bad_plan.result() == beast_http::status::bad_request);

  auto bad_months = h.Call(beast_http::verb::post, "/api/license/generate",
                           R"({"plan":"startup","customer_name":"A","customer_email":"a@b.co","months":0})", true);
  assert(bad_months.result() == beast_http::status::bad_request);

  auto bad_email = h.Call(beast_http::verb::post, "/api/license/generate",
                          R"({"plan":"startup","customer_name":"A","customer_email":"nope"})", true);
  assert(bad_email.result() == beast_http::status::bad_request);
  assert(h.sink->Messages().empty());
}

void TestTrialFlow() {
  Harness h;
  auto    response = h.Call(beast_http::verb::post, "/api/trial/request", R"({"name":"Taro","email":"taro@example.com","company":"Acme"})");
  assert(response.result() == beast_http::status::ok);
  const auto trial = Parse<nove::v1::TrialResponse>(response);
  assert(trial.plan() == "trial14");
  assert(trial.server_limit() == 1);
  assert(trial.license_key().rfind("NOVE-TRI-", 0) == 0);
  assert(trial.install_command() == "curl -fsSL https://noveos.jp/install.sh | sudo bash -s -- --license " + trial.license_key());
  assert(h.sink->CountTo("taro@example.com") == 1);
  assert(h.sink->CountTo(kOperator) == 1);

  auto duplicate = h.Call(beast_http::verb::post, "/api/trial/request", R"({"name":"Taro","email":"TARO@example.com"})");
  assert(duplicate.result() == beast_http::status::conflict);
  assert(Parse<nove::v1::ErrorResponse>(duplicate).reason() == "duplicate_trial");

  const auto key = trial.license_key();
  h.Call(beast_http::verb::post, "/api/license/activate", R"({"license_key":")" + key + R"(","machine_id":"m1"})");
  auto limited = h.Call(beast_http::verb::post, "/api/license/activate", R"({"license_key":")" + key + R"(","machine_id":"m2"})");
  assert(limited.result() == beast_http::status::forbidden);
  const auto error = Parse<nove::v1::ErrorResponse>(limited);
  assert(error.reason() == "limit_reached");
  assert(error.server_limit() == 1);
  assert(error.detail() == "サーバー台数の上限に達しています");

  // The trial shows up in the admin contact list.
  auto contacts = Parse<nove::v1::ContactList>(h.Call(beast_http::verb::get, "/api/contacts", {}, true));
  assert(contacts.contacts_size() == 1);
  assert(contacts.contacts(0).user_type() == "trial");
}

void TestActivationAdministration() {
  Harness h;
  const auto key = IssueStartup(h);
  for (const auto* machine : {"m1", "host 2"}) {
    nove::v1::ActivateRequest request;
    request.set_license_key(key);
    request.set_machine_id(machine);
    std::string body;
    assert(google::protobuf::util::MessageToJsonString(request, &body).ok());
    assert(h.Call(beast_http::verb::post, "/api/license/activate", body).result() == beast_http::status::ok);
  }

  auto list = Parse<nove::v1::ActivationList>(h.Call(beast_http::verb::get, "/api/license/" + key + "/activations", {}, true));
  assert(list.license_key() == key);
  assert(list.server_limit() == 50);
  assert(list.activations_size() == 2);
  for (const auto& activation : list.activations()) {
    assert(activation.machine_id() == "m1" || activation.machine_id() == "host 2");
    assert(!activation.activated_at().empty());
  }

  auto removed = h.Call(beast_http::verb::delete_, "/api/license/" + key + "/activations/host%202", {}, true);
  assert(removed.result() == beast_http::status::ok);
  const auto status = Parse<nove::v1::StatusResponse>(removed);
  assert(status.status() == "ok");
  assert(status.message() == key + " の host 2 を解除しました");

  list = Parse<nove::v1::ActivationList>(h.Call(beast_http::verb::get, "/api/license/" + key + "/activations", {}, true));
  assert(list.activations_size() == 1);

  auto unknown = h.Call(beast_http::verb::get, "/api/license/NOVE-NOPE/activations", {}, true);
  assert(unknown.result() == beast_http::status::not_found);
}

void TestRevoke() {
  Harness h;
  const auto key = IssueStartup(h);

  auto revoked = h.Call(beast_http::verb::delete_, "/api/license/" + key, {}, true);
  assert(revoked.result() == beast_http::status::ok);
  assert(Parse<nove::v1::StatusResponse>(revoked).message() == key + " を無効化しました");

  auto activate = h.Call(beast_http::verb::post, "/api/license/activate", R"({"license_key":")" + key + R"(","machine_id":"m1"})");
  assert(activate.result() == beast_http::status::forbidden);
  assert(Parse<nove::v1::ErrorResponse>(activate).reason() == "revoked");

  const auto license = Parse<nove::v1::License>(h.Call(beast_http::verb::get, "/api/license/validate/" + key));
  assert(!license.is_active());
  assert(!license.is_valid());

  assert(h.Call(beast_http::verb::delete_, "/api/license/NOVE-NOPE", {}, true).result() == beast_http::status::not_found);
}

void TestContactForm() {
  Harness h;
  auto    response = h.Call(beast_http::verb::post, "/api/contact",
                            R"({"user_type":"business","name":"Jiro","email":"jiro@example.com","business_name":"Jiro Shoten",)"
                            R"("plan":"standard","servers":12,"message":"見積もりをお願いします","extra":"ignored"})");
  assert(response.result() == beast_http::status::ok);
  assert(response.body() == R"({"status":"ok","message":"送信完了しました"})");
  assert(h.sink->CountTo("jiro@example.com") == 1);
  assert(h.sink->CountTo(kOperator) == 1);

  auto contacts = Parse<nove::v1::ContactList>(h.Call(beast_http::verb::get, "/api/contacts", {}, true));
  assert(contacts.contacts_size() == 1);
  assert(contacts.contacts(0).company() == "Jiro Shoten");
  assert(contacts.contacts(0).plan() == "standard");

  auto missing = h.Call(beast_http::verb::post, "/api/contact", R"({"user_type":"business","name":"Jiro","email":"jiro@example.com"})");
  assert(missing.result() == beast_http::status::bad_request);

  auto bad_email = h.Call(beast_http::verb::post, "/api/contact", R"({"user_type":"x","name":"Jiro","email":"jiro","message":"m"})");
  assert(bad_email.result() == beast_http::status::bad_request);
}

void TestCors() {
  Harness h;

  Request preflight{beast_http::verb::options, "/api/license/activate", 11};
  preflight.set(beast_http::field::origin, "https://preview-42.netlify.app");
  preflight.set(beast_http::field::access_control_request_method, "POST");
  preflight.set(beast_http::field::access_control_request_headers, "content-type");
  auto allowed = h.handler->Handle(preflight);
  assert(allowed.result() == beast_http::status::ok);
  assert(allowed[beast_http::field::access_control_allow_origin] == "https://preview-42.netlify.app");
  assert(allowed[beast_http::field::access_control_allow_methods] == "GET, POST, DELETE");
  assert(allowed[beast_http::field::access_control_allow_headers] == "content-type");
  assert(allowed[beast_http::field::access_control_max_age] == "600");

  preflight.set(beast_http::field::origin, "https://evil.example.com");
  auto refused = h.handler->Handle(preflight);
  assert(refused.result() == beast_http::status::bad_request);
  assert(refused.body() == "Disallowed CORS origin");
  assert(refused[beast_http::field::access_control_allow_origin].empty());

  preflight.set(beast_http::field::origin, "https://noveos.jp");
  preflight.set(beast_http::field::access_control_request_method, "PUT");
  auto bad_method = h.handler->Handle(preflight);
  assert(bad_method.result() == beast_http::status::bad_request);
  assert(bad_method.body() == "Disallowed CORS method");

  Request simple{beast_http::verb::get, "/", 11};
  simple.set(beast_http::field::origin, "https://noveos.jp");
  auto echoed = h.handler->Handle(simple);
  assert(echoed[beast_http::field::access_control_allow_origin] == "https://noveos.jp");
  assert(echoed[beast_http::field::vary] == "Origin");

  simple.set(beast_http::field::origin, "https://evil.example.com");
  auto not_echoed = h.handler->Handle(simple);
  assert(not_echoed.result() == beast_http::status::ok);
  assert(not_echoed[beast_http::field::access_control_allow_origin].empty());
}

void TestOriginPatterns() {
  using nove::http::CorsPolicy;
  assert(CorsPolicy::MatchOrigin("https://*.netlify.app", "https://site.netlify.app"));
  assert(!CorsPolicy::MatchOrigin("https://*.netlify.app", "https://.netlify.app"));
  assert(!CorsPolicy::MatchOrigin("https://*.netlify.app", "https://a/b.netlify.app"));
  assert(!CorsPolicy::MatchOrigin("https://*.netlify.app", "https://evil.com:1.netlify.app"));
  assert(!CorsPolicy::MatchOrigin("https://*.netlify.app", "http://site.netlify.app"));
  assert(CorsPolicy::MatchOrigin("*", "https://anything.example"));
  assert(CorsPolicy::MatchOrigin("https://noveos.jp", "https://noveos.jp"));
  assert(!CorsPolicy::MatchOrigin("https://noveos.jp", "https://noveos.jp.evil.com"));
}

} // namespace

int main() {
  TestHealth();
  TestUnknownRouteAndMethod();
  TestAdminRoutesRequireToken();
  TestEmptyTokenDisablesAdmin();
  TestGenerateAndActivate();
  TestActivationErrors();
  TestGenerateValidation();
  TestTrialFlow();
  TestActivationAdministration();
  TestRevoke();
  TestContactForm();
  TestCors();
  TestOriginPatterns();

  std::cout << "nove_unit_http_routes: pass\n";
  return 0;
}
