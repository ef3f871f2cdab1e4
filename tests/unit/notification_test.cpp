#include <cassert>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/plan_catalog.hpp"
#include "internal/notify/fallback_notifier.hpp"
#include "internal/notify/mail_api_notifier.hpp"
#include "internal/notify/mail_templates.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/notify/notification_worker.hpp"
#include "internal/notify/smtp_notifier.hpp"
#include "internal/util/time.hpp"

namespace {

using nove::notify::EmailMessage;
using nove::notify::FallbackNotifier;
using nove::notify::NotificationQueue;
using nove::notify::NotificationWorker;
using nove::notify::Notifier;

class FakeNotifier final : public Notifier {
 public:
  FakeNotifier(std::string name, bool configured, bool fails) : name_(std::move(name)), configured_(configured), fails_(fails) {
  }

  std::string_view Name() const override {
    return name_;
  }

  bool Configured() const override {
    return configured_;
  }

  void Send(const EmailMessage& message) override {
    std::lock_guard lock(mutex_);
    attempts_.push_back(message);
    if (fails_) {
      throw std::runtime_error(name_ + " unavailable");
    }
  }

  std::vector<EmailMessage> Attempts() const {
    std::lock_guard lock(mutex_);
    return attempts_;
  }

 private:
  std::string               name_;
  bool                      configured_;
  bool                      fails_;
  mutable std::mutex        mutex_;
  std::vector<EmailMessage> attempts_;
};

EmailMessage Mail(std::string to, std::string subject = "subject") {
  return EmailMessage{std::move(to), std::move(subject), "<p>body</p>"};
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ------------------------------------------------------------------
// Fallback chain
// ------------------------------------------------------------------

void TestFallsBackToNextChannel() {
  auto primary   = std::make_shared<FakeNotifier>("primary", true, true);
  auto secondary = std::make_shared<FakeNotifier>("secondary", true, false);
  FallbackNotifier notifier({primary, secondary});

  assert(notifier.Deliver(Mail("a@b.co")));
  assert(primary->Attempts().size() == 1);
  assert(secondary->Attempts().size() == 1);
  assert(secondary->Attempts()[0].to == "a@b.co");
}

void TestStopsAtFirstSuccess() {
  auto primary   = std::make_shared<FakeNotifier>("primary", true, false);
  auto secondary = std::make_shared<FakeNotifier>("secondary", true, false);
  FallbackNotifier notifier({primary, secondary});

  assert(notifier.Deliver(Mail("a@b.co")));
  assert(primary->Attempts().size() == 1);
  assert(secondary->Attempts().empty());
}

void TestUnconfiguredChannelsSkipped() {
  auto unconfigured = std::make_shared<FakeNotifier>("api", false, false);
  auto smtp         = std::make_shared<FakeNotifier>("smtp", true, false);
  FallbackNotifier notifier({unconfigured, nullptr, smtp});

  assert(notifier.AnyConfigured());
  assert(notifier.Deliver(Mail("a@b.co")));
  assert(unconfigured->Attempts().empty());
  assert(smtp->Attempts().size() == 1);
}

void TestNothingConfiguredIsSkipped() {
  auto unconfigured = std::make_shared<FakeNotifier>("api", false, false);
  FallbackNotifier notifier({unconfigured});

  assert(!notifier.AnyConfigured());
  assert(!notifier.Deliver(Mail("a@b.co")));
  assert(unconfigured->Attempts().empty());
}

void TestEveryChannelFailingIsAbsorbed() {
  auto first  = std::make_shared<FakeNotifier>("first", true, true);
  auto second = std::make_shared<FakeNotifier>("second", true, true);
  FallbackNotifier notifier({first, second});

  assert(!notifier.Deliver(Mail("a@b.co")));
  assert(first->Attempts().size() == 1);
  assert(second->Attempts().size() == 1);
}

// ------------------------------------------------------------------
// Queue and worker
// ------------------------------------------------------------------

void TestQueueCapacityAndShutdown() {
  NotificationQueue queue(2);
  assert(queue.TryEnqueue(Mail("1@b.co")));
  assert(queue.TryEnqueue(Mail("2@b.co")));
  assert(!queue.TryEnqueue(Mail("3@b.co")));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.TryEnqueue(Mail("4@b.co")));

  // Already queued messages drain after shutdown.
  auto first = queue.Dequeue();
  assert(first && first->to == "1@b.co");
  auto second = queue.Dequeue();
  assert(second && second->to == "2@b.co");
  assert(!queue.Dequeue().has_value());
}

void TestWorkerDeliversAsynchronously() {
  auto channel = std::make_shared<FakeNotifier>("smtp", true, false);
  auto worker  = std::make_shared<NotificationWorker>(std::make_shared<NotificationQueue>(64),
                                                     std::make_shared<FallbackNotifier>(std::vector<std::shared_ptr<Notifier>>{channel}));
  worker->Start(2);

  for (int i = 0; i < 10; ++i) {
    worker->Notify(Mail("user" + std::to_string(i) + "@b.co"));
  }
  worker->Notify(Mail("")); // no recipient: dropped

  worker->Stop();
  assert(channel->Attempts().size() == 10);

  // Stopped workers drop new messages instead of blocking.
  worker->Notify(Mail("late@b.co"));
  assert(channel->Attempts().size() == 10);
}

void TestWorkerSurvivesFailingChannels() {
  auto channel = std::make_shared<FakeNotifier>("api", true, true);
  NotificationWorker worker(std::make_shared<NotificationQueue>(8),
                            std::make_shared<FallbackNotifier>(std::vector<std::shared_ptr<Notifier>>{channel}));
  worker.Start(1);
  worker.Notify(Mail("a@b.co"));
  worker.Notify(Mail("c@d.co"));
  worker.Stop();
  assert(channel->Attempts().size() == 2);
}

void TestFullQueueDropsWithoutBlocking() {
  // No worker threads: nothing drains the queue.
  auto channel = std::make_shared<FakeNotifier>("smtp", true, false);
  auto queue   = std::make_shared<NotificationQueue>(1);
  NotificationWorker worker(queue, std::make_shared<FallbackNotifier>(std::vector<std::shared_ptr<Notifier>>{channel}));

  worker.Notify(Mail("a@b.co"));
  worker.Notify(Mail("b@b.co"));
  assert(queue->Size() == 1);
}

// ------------------------------------------------------------------
// Templates
// ------------------------------------------------------------------

void TestEscapeHtml() {
  assert(nove::notify::EscapeHtml(R"(<a href="x">Tom & 'Jerry'</a>)") ==
         "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
  assert(nove::notify::EscapeHtml("line1\nline2") == "line1<br>line2");
}

void TestContactMailsEscapeUserInput() {
  nove::notify::ContactDetails details;
  details.user_type = "business";
  details.name      = "<script>alert(1)</script>";
  details.email     = "evil@example.com";
  details.message   = "hi & bye";

  const auto received = nove::util::FromUnixMillis(1735787045678ULL);
  auto       op       = nove::notify::ContactOperatorMail(details, "ops@noveos.jp", received);
  assert(op.to == "ops@noveos.jp");
  assert(!Contains(op.html, "<script>"));
  assert(Contains(op.html, "&lt;script&gt;"));
  assert(Contains(op.html, "hi &amp; bye"));
  assert(Contains(op.html, "2025-01-02 03:04:05"));
  assert(Contains(op.subject, "business"));

  auto reply = nove::notify::ContactAutoReplyMail(details);
  assert(reply.to == "evil@example.com");
  assert(reply.subject == "【受付完了】お問い合わせありがとうございます - NOVE OS");
  assert(!Contains(reply.html, "<script>"));
}

void TestLicenseAndTrialMails() {
  nove::db::model::LicenseRecord license;
  license.license_key    = "NOVE-STA-AAAA-BBBB-CCCC";
  license.plan           = "startup";
  license.customer_name  = "Hanako";
  license.customer_email = "hanako@example.com";
  license.server_limit   = 50;
  license.valid_from     = "2025-03-01";
  license.valid_until    = "2025-03-31";

  const auto& plan     = nove::core::PlanCatalog::Default().Get("startup");
  auto        customer = nove::notify::LicenseCustomerMail(license, plan);
  assert(customer.to == "hanako@example.com");
  assert(Contains(customer.subject, plan.display_name));
  assert(Contains(customer.html, license.license_key));
  assert(Contains(customer.html, "50台"));
  assert(Contains(customer.html, "2025-03-01 〜 2025-03-31"));

  auto unlimited         = license;
  unlimited.server_limit = 0;
  assert(Contains(nove::notify::LicenseCustomerMail(unlimited, plan).html, "無制限"));

  auto op = nove::notify::LicenseOperatorMail(license, plan, "ops@noveos.jp");
  assert(op.to == "ops@noveos.jp");
  assert(Contains(op.html, license.license_key));

  const std::string command = "curl -fsSL https://noveos.jp/install.sh | sudo bash -s -- --license " + license.license_key;
  auto              trial   = nove::notify::TrialCustomerMail(license, command);
  assert(trial.subject == "【NOVE OS】14日間トライアルのご案内");
  assert(Contains(trial.html, command));

  auto trial_op = nove::notify::TrialOperatorMail(license, "", "ops@noveos.jp");
  assert(Contains(trial_op.html, "会社: -"));
}

// ------------------------------------------------------------------
// Channel wire formats
// ------------------------------------------------------------------

void TestMimeMessage() {
  const auto date = nove::util::FromUnixMillis(1735787045678ULL);

  EmailMessage ascii{"to@example.com", "Hello", "hello"};
  const auto   mime = nove::notify::BuildMimeMessage("from@example.com", ascii, date);
  assert(Contains(mime, "Date: Thu, 02 Jan 2025 03:04:05 +0000\r\n"));
  assert(Contains(mime, "From: <from@example.com>\r\n"));
  assert(Contains(mime, "To: <to@example.com>\r\n"));
  assert(Contains(mime, "Subject: Hello\r\n"));
  assert(Contains(mime, "Content-Type: text/html; charset=UTF-8\r\n"));
  assert(Contains(mime, "Content-Transfer-Encoding: base64\r\n"));
  assert(Contains(mime, "\r\n\r\naGVsbG8=\r\n"));

  EmailMessage japanese{"to@example.com", "【受付完了】", std::string(500, 'x')};
  const auto   encoded = nove::notify::BuildMimeMessage("from@example.com", japanese, date);
  assert(Contains(encoded, "Subject: =?UTF-8?B?"));

  const auto body = encoded.substr(encoded.find("\r\n\r\n") + 4);
  std::size_t start = 0;
  while (start < body.size()) {
    const auto end = body.find("\r\n", start);
    assert(end != std::string::npos);
    assert(end - start <= 76);
    start = end + 2;
  }
}

void TestMailApiRequestBody() {
  nove::notify::MailApiOptions options;
  options.endpoint     = "https://api.resend.com/emails";
  options.from_address = "noreply@noveos.jp";

  nove::notify::MailApiNotifier unconfigured(options);
  assert(!unconfigured.Configured());

  options.api_key = "re_test";
  nove::notify::MailApiNotifier notifier(options);
  assert(notifier.Configured());
  assert(notifier.Name() == "mail_api");

  const auto body = notifier.BuildRequestBody(EmailMessage{"a@b.co", "Hi", "<p>x</p>"});
  assert(Contains(body, R"("from":"noreply@noveos.jp")"));
  assert(Contains(body, R"("to":["a@b.co"])"));
  assert(Contains(body, R"("subject":"Hi")"));
}

void TestSmtpConfiguration() {
  nove::notify::SmtpOptions options;
  options.host     = "smtp.gmail.com";
  options.username = "robot@noveos.jp";
  assert(!nove::notify::SmtpNotifier(options).Configured());

  options.password = "app-password";
  nove::notify::SmtpNotifier notifier(options);
  assert(notifier.Configured());
  assert(notifier.FromAddress() == "robot@noveos.jp");

  options.from_address = "info@noveos.jp";
  assert(nove::notify::SmtpNotifier(options).FromAddress() == "info@noveos.jp");
}

} // namespace

int main() {
  TestFallsBackToNextChannel();
  TestStopsAtFirstSuccess();
  TestUnconfiguredChannelsSkipped();
  TestNothingConfiguredIsSkipped();
  TestEveryChannelFailingIsAbsorbed();
  TestQueueCapacityAndShutdown();
  TestWorkerDeliversAsynchronously();
  TestWorkerSurvivesFailingChannels();
  TestFullQueueDropsWithoutBlocking();
  TestEscapeHtml();
  TestContactMailsEscapeUserInput();
  TestLicenseAndTrialMails();
  TestMimeMessage();
  TestMailApiRequestBody();
  TestSmtpConfiguration();

  std::cout << "nove_unit_notification: pass\n";
  return 0;
}
