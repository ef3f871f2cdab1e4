#include "server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <csignal>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace nove::http {

namespace beast = boost::beast;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using observability::StringField;

namespace {

class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(tcp::socket&& socket, std::shared_ptr<const ApiHandler> handler, const ServerOptions& options)
      : stream_(std::move(socket)), handler_(std::move(handler)), timeout_(options.request_timeout), body_limit_(options.max_body_bytes) {
  }

  void Run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(body_limit_);
    stream_.expires_after(timeout_);
    beast_http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == beast_http::error::end_of_stream) {
      return DoClose();
    }
    if (ec == beast_http::error::body_limit) {
      return SendTooLarge();
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        NOVE_LOG_WARN("http read failed", {StringField("error", ec.message())});
      }
      return;
    }

    auto request = parser_->release();
    Send(handler_->Handle(request));
  }

  void SendTooLarge() {
    Response response{beast_http::status::payload_too_large, 11};
    response.set(beast_http::field::server, "nove-api");
    response.set(beast_http::field::content_type, "application/json");
    response.body() = R"({"detail":"Request body too large"})";
    response.keep_alive(false);
    response.prepare_payload();
    Send(std::move(response));
  }

  void Send(Response&& response) {
    response_ = std::make_shared<Response>(std::move(response));
    stream_.expires_after(timeout_);
    beast_http::async_write(stream_, *response_, beast::bind_front_handler(&Session::OnWrite, shared_from_this(), response_->need_eof()));
  }

  void OnWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      NOVE_LOG_WARN("http write failed", {StringField("error", ec.message())});
      return;
    }
    if (close) {
      return DoClose();
    }
    response_.reset();
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream                                    stream_;
  beast::flat_buffer                                   buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  std::shared_ptr<Response>                            response_;
  std::shared_ptr<const ApiHandler>                    handler_;
  std::chrono::milliseconds                            timeout_;
  std::uint64_t                                        body_limit_;
};

} // namespace

Server::Server(ServerOptions options, std::shared_ptr<const ApiHandler> handler)
    : options_(std::move(options)), handler_(std::move(handler)), acceptor_(net::make_strand(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  if (!handler_) {
    throw std::invalid_argument("Server requires an ApiHandler");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  const auto     address = net::ip::make_address(options_.bind_address);
  tcp::endpoint  endpoint{address, options_.port};

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  DoAccept();

  signals_.async_wait([this](beast::error_code ec, int signal_number) {
    if (ec) return;
    NOVE_LOG_INFO("shutdown signal received", {observability::IntField("signal", signal_number)});
    ioc_.stop();
  });

  std::size_t threads = options_.threads;
  if (threads == 0) threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back([this] { ioc_.run(); });
  }

  NOVE_LOG_INFO("nove-api listening", {StringField("address", options_.bind_address), observability::IntField("port", port_),
                                       observability::IntField("threads", static_cast<std::int64_t>(threads))});
}

void Server::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted) return;
      NOVE_LOG_WARN("accept failed", {StringField("error", ec.message())});
    } else {
      std::make_shared<Session>(std::move(socket), handler_, options_)->Run();
    }
    DoAccept();
  });
}

void Server::Wait() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void Server::Stop() {
  ioc_.stop();
  Wait();
  threads_.clear();

  beast::error_code ec;
  signals_.cancel(ec);
  acceptor_.close(ec);
}

std::uint16_t Server::Port() const {
  return port_;
}

} // namespace nove::http
