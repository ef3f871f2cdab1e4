#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "api_routes.hpp"

namespace nove::http {

struct ServerOptions {
  std::string               bind_address = "0.0.0.0";
  std::uint16_t             port         = 8000; // 0 picks an ephemeral port
  std::size_t               threads      = 0;    // 0 = hardware concurrency
  std::chrono::milliseconds request_timeout{30000};
  std::uint64_t             max_body_bytes = 1 << 20;
};

/*
  Asynchronous HTTP/1.1 server (Boost.Beast).

  One acceptor; each connection is a session that reads a request,
  passes it to ApiHandler::Handle and writes the response, honouring
  keep-alive. Reads and writes share one per-request deadline.
*/
class Server {
 public:
  Server(ServerOptions options, std::shared_ptr<const ApiHandler> handler);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Binds and starts the worker threads. Throws on bind failure.
  void Start();

  // Blocks until SIGINT/SIGTERM arrives or Stop() is called.
  void Wait();

  // Closes the acceptor and joins the io threads. Safe to call twice.
  void Stop();

  // Bound port; useful when ServerOptions::port is 0.
  std::uint16_t Port() const;

 private:
  void DoAccept();

  ServerOptions                     options_;
  std::shared_ptr<const ApiHandler> handler_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::signal_set        signals_;
  std::vector<std::thread>       threads_;
  std::uint16_t                  port_ = 0;
};

} // namespace nove::http
