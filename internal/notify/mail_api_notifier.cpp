#include "mail_api_notifier.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <stdexcept>

#include "nove/v1.hpp"

namespace nove::notify {

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

size_t CollectBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

} // namespace

MailApiNotifier::MailApiNotifier(MailApiOptions options) : options_(std::move(options)) {
}

bool MailApiNotifier::Configured() const {
  return !options_.endpoint.empty() && !options_.api_key.empty();
}

std::string MailApiNotifier::BuildRequestBody(const EmailMessage& message) const {
  nove::v1::MailApiRequest request;
  request.set_from(options_.from_address);
  request.add_to(message.to);
  request.set_subject(message.subject);
  request.set_html(message.html);

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;

  std::string body;
  auto        status = google::protobuf::util::MessageToJsonString(request, &body, print_options);
  if (!status.ok()) {
    throw std::runtime_error("mail api request encode failed: " + status.ToString());
  }
  return body;
}

void MailApiNotifier::Send(const EmailMessage& message) {
  const auto payload = BuildRequestBody(message);

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }

  const auto authorization = "Authorization: Bearer " + options_.api_key;
  curl_slist* raw_headers  = nullptr;
  raw_headers              = curl_slist_append(raw_headers, "Accept: application/json");
  raw_headers              = curl_slist_append(raw_headers, "Content-Type: application/json; charset=utf-8");
  raw_headers              = curl_slist_append(raw_headers, authorization.c_str());
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.endpoint.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "nove-api/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CollectBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

  const auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(fmt::format("mail api request failed: {}", curl_easy_strerror(res)));
  }

  long status_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
  if (status_code < 200 || status_code >= 300) {
    throw std::runtime_error(fmt::format("mail api returned HTTP {}: {}", status_code, response.substr(0, 256)));
  }
}

} // namespace nove::notify
