#include "mail_templates.hpp"

#include <fmt/format.h>

namespace nove::notify {

namespace {

constexpr const char* kFooter = R"(<p style="color:#666;font-size:12px;">
NOVE OS Systems | <a href="https://noveos.jp">https://noveos.jp</a>
</p>)";

std::string OrDash(std::string_view value) {
  return value.empty() ? std::string("-") : EscapeHtml(value);
}

std::string ServerLimitLabel(std::uint32_t server_limit) {
  return server_limit == 0 ? std::string("無制限") : fmt::format("{}台", server_limit);
}

} // namespace

std::string EscapeHtml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      case '\n':
        out += "<br>";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Contact form
// ------------------------------------------------------------------

EmailMessage ContactOperatorMail(const ContactDetails& contact, const std::string& operator_address, util::TimePoint received_at) {
  EmailMessage mail;
  mail.to      = operator_address;
  mail.subject = fmt::format("【お問い合わせ】{} / {}様", contact.user_type, contact.name);
  mail.html    = fmt::format(R"(<h2>新しいお問い合わせ</h2>
<table border="1" cellpadding="8" style="border-collapse:collapse;">
<tr><th>種別</th><td>{}</td></tr>
<tr><th>お名前</th><td>{}</td></tr>
<tr><th>メール</th><td>{}</td></tr>
<tr><th>会社/屋号</th><td>{}</td></tr>
<tr><th>プラン</th><td>{}</td></tr>
<tr><th>台数</th><td>{}</td></tr>
<tr><th>時期</th><td>{}</td></tr>
<tr><th>内容</th><td>{}</td></tr>
</table>
<p style="color:#666;font-size:12px;">NOVE OS API - {} UTC</p>
)",
                            EscapeHtml(contact.user_type), EscapeHtml(contact.name), EscapeHtml(contact.email), OrDash(contact.company),
                            OrDash(contact.plan), OrDash(contact.servers), OrDash(contact.timeline), EscapeHtml(contact.message),
                            util::FormatTimestamp(received_at));
  return mail;
}

EmailMessage ContactAutoReplyMail(const ContactDetails& contact) {
  EmailMessage mail;
  mail.to      = contact.email;
  mail.subject = "【受付完了】お問い合わせありがとうございます - NOVE OS";
  mail.html    = fmt::format(R"(<p>{} 様</p>
<p>お問い合わせありがとうございます。<br>
Rocky Linux NOVE OS v13.2 チームです。</p>
<p>以下の内容でお問い合わせを受け付けました。<br>
<strong>1営業日以内</strong>にご返信いたします。</p>
<hr>
<p><strong>ご送信内容：</strong><br>{}</p>
<hr>
{}
)",
                            EscapeHtml(contact.name), EscapeHtml(contact.message), kFooter);
  return mail;
}

// ------------------------------------------------------------------
// License issuance
// ------------------------------------------------------------------

EmailMessage LicenseCustomerMail(const db::model::LicenseRecord& license, const core::PlanInfo& plan) {
  EmailMessage mail;
  mail.to      = license.customer_email;
  mail.subject = fmt::format("【NOVE OS】ライセンスキーのご案内 - {}", plan.display_name);
  mail.html    = fmt::format(R"(<h2>NOVE OS v13.2 ライセンスキーのご案内</h2>
<p>{} 様</p>
<p>この度はNOVE OS v13.2をご購入いただきありがとうございます。</p>
<table border="1" cellpadding="10" style="border-collapse:collapse; min-width:400px;">
<tr style="background:#0071e3;color:#fff;"><th colspan="2">ライセンス情報</th></tr>
<tr><th>ライセンスキー</th><td><strong style="font-size:18px;font-family:monospace;">{}</strong></td></tr>
<tr><th>プラン</th><td>{}（{}）</td></tr>
<tr><th>サーバー上限</th><td>{}</td></tr>
<tr><th>有効期間</th><td>{} 〜 {}</td></tr>
</table>
<br>
<p>ライセンスキーは大切に保管してください。<br>
ご不明な点はお気軽にお問い合わせください。</p>
{}
)",
                            EscapeHtml(license.customer_name), license.license_key, plan.display_name, plan.price_label,
                            ServerLimitLabel(license.server_limit), license.valid_from, license.valid_until, kFooter);
  return mail;
}

EmailMessage LicenseOperatorMail(const db::model::LicenseRecord& license, const core::PlanInfo& plan, const std::string& operator_address) {
  EmailMessage mail;
  mail.to      = operator_address;
  mail.subject = fmt::format("【発行完了】{}様 / {}", license.customer_name, plan.display_name);
  mail.html    = fmt::format("Key: {}<br>Email: {}<br>有効期限: {}", license.license_key, EscapeHtml(license.customer_email),
                             license.valid_until);
  return mail;
}

// ------------------------------------------------------------------
// Trial
// ------------------------------------------------------------------

EmailMessage TrialCustomerMail(const db::model::LicenseRecord& license, const std::string& install_command) {
  EmailMessage mail;
  mail.to      = license.customer_email;
  mail.subject = "【NOVE OS】14日間トライアルのご案内";
  mail.html    = fmt::format(R"(<h2>NOVE OS v13.2 14日間トライアル</h2>
<p>{} 様</p>
<p>トライアルのお申し込みありがとうございます。以下のキーで1台のサーバーを有効化できます。</p>
<table border="1" cellpadding="10" style="border-collapse:collapse; min-width:400px;">
<tr><th>ライセンスキー</th><td><strong style="font-size:18px;font-family:monospace;">{}</strong></td></tr>
<tr><th>有効期間</th><td>{} 〜 {}</td></tr>
</table>
<p>インストール：</p>
<pre style="background:#f4f4f4;padding:12px;">{}</pre>
{}
)",
                            EscapeHtml(license.customer_name), license.license_key, license.valid_from, license.valid_until,
                            EscapeHtml(install_command), kFooter);
  return mail;
}

EmailMessage TrialOperatorMail(const db::model::LicenseRecord& license, const std::string& company, const std::string& operator_address) {
  EmailMessage mail;
  mail.to      = operator_address;
  mail.subject = fmt::format("【トライアル発行】{}様", license.customer_name);
  mail.html    = fmt::format("Key: {}<br>Email: {}<br>会社: {}<br>有効期限: {}", license.license_key, EscapeHtml(license.customer_email),
                             OrDash(company), license.valid_until);
  return mail;
}

} // namespace nove::notify
