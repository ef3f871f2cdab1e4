#include "smtp_notifier.hpp"

#include <curl/curl.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <memory>
#include <stdexcept>

namespace nove::notify {

namespace {

constexpr std::size_t kBodyLineLength = 76;

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

struct UploadCursor {
  const std::string* data   = nullptr;
  std::size_t        offset = 0;
};

size_t ReadPayload(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto*       cursor    = static_cast<UploadCursor*>(userdata);
  const auto  remaining = cursor->data->size() - cursor->offset;
  const auto  n         = std::min(remaining, size * nitems);
  std::memcpy(buffer, cursor->data->data() + cursor->offset, n);
  cursor->offset += n;
  return n;
}

std::string Base64(std::string_view input) {
  std::string out(4 * ((input.size() + 2) / 3), '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

bool IsAscii(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::string EncodeHeader(std::string_view value) {
  if (IsAscii(value)) return std::string(value);
  return "=?UTF-8?B?" + Base64(value) + "?=";
}

std::string AngleAddress(const std::string& address) {
  return "<" + address + ">";
}

} // namespace

std::string BuildMimeMessage(const std::string& from, const EmailMessage& message, util::TimePoint date) {
  const std::time_t seconds = util::Clock::to_time_t(date);

  std::string out;
  out += fmt::format("Date: {:%a, %d %b %Y %H:%M:%S} +0000\r\n", fmt::gmtime(seconds));
  out += fmt::format("From: {}\r\n", AngleAddress(from));
  out += fmt::format("To: {}\r\n", AngleAddress(message.to));
  out += fmt::format("Subject: {}\r\n", EncodeHeader(message.subject));
  out += "MIME-Version: 1.0\r\n";
  out += "Content-Type: text/html; charset=UTF-8\r\n";
  out += "Content-Transfer-Encoding: base64\r\n";
  out += "\r\n";

  const auto body = Base64(message.html);
  for (std::size_t i = 0; i < body.size(); i += kBodyLineLength) {
    out.append(body, i, kBodyLineLength);
    out += "\r\n";
  }
  return out;
}

SmtpNotifier::SmtpNotifier(SmtpOptions options) : options_(std::move(options)) {
}

bool SmtpNotifier::Configured() const {
  return !options_.host.empty() && !options_.username.empty() && !options_.password.empty();
}

const std::string& SmtpNotifier::FromAddress() const {
  return options_.from_address.empty() ? options_.username : options_.from_address;
}

void SmtpNotifier::Send(const EmailMessage& message) {
  const auto   payload = BuildMimeMessage(FromAddress(), message, util::Now());
  UploadCursor cursor{&payload, 0};

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }

  const auto url       = fmt::format("smtp://{}:{}", options_.host, options_.port);
  const auto mail_from = AngleAddress(FromAddress());
  const auto rcpt      = AngleAddress(message.to);
  std::unique_ptr<curl_slist, SlistDeleter> recipients(curl_slist_append(nullptr, rcpt.c_str()));

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(options_.starttls ? CURLUSESSL_ALL : CURLUSESSL_NONE));
  curl_easy_setopt(curl.get(), CURLOPT_USERNAME, options_.username.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, options_.password.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mail_from.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
  curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, ReadPayload);
  curl_easy_setopt(curl.get(), CURLOPT_READDATA, &cursor);
  curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

  const auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(fmt::format("smtp delivery to {} failed: {}", options_.host, curl_easy_strerror(res)));
  }
}

} // namespace nove::notify
