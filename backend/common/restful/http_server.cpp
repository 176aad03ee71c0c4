#include "http_server.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace common {

namespace {

void throwOnError(const beast::error_code& ec, const std::string& step) {
  if (ec) {
    throw std::runtime_error("HTTP listener failed to " + step + ": " + ec.message());
  }
}

} // namespace

HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::chrono::seconds read_timeout)
  : ioc_(ioc), acceptor_(net::make_strand(ioc)), api_handler_(std::move(api_handler)),
    read_timeout_(read_timeout) {
  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  throwOnError(ec, "open socket");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  throwOnError(ec, "set SO_REUSEADDR");
  acceptor_.bind(endpoint, ec);
  throwOnError(ec, "bind " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()));
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  throwOnError(ec, "listen");
}

void HttpServer::run() {
  doAccept();
}

// Closing on the acceptor's strand cancels the pending accept.
void HttpServer::stop() {
  net::post(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  if (!ec) {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, read_timeout_)->run();
  } else {
    std::cerr << "Error: accept failed: " << ec.message() << std::endl;
  }
  doAccept();
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::chrono::seconds read_timeout)
  : stream_(std::move(socket)), api_handler_(std::move(api_handler)), read_timeout_(read_timeout) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};
  stream_.expires_after(read_timeout_);
  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    return doClose();
  }
  if (ec) {
    if (ec != beast::error::timeout) {
      std::cerr << "Error: request read failed: " << ec.message() << std::endl;
    }
    return;
  }

  // The handler may answer later from another thread; nothing else runs on
  // this connection until the response comes back to the strand.
  stream_.expires_never();
  api_handler_->handleRequest(std::move(req_),
    [self = shared_from_this()](RestApiHandlerBase::Response response) {
      net::post(self->stream_.get_executor(),
                [self, response = std::move(response)]() mutable {
                  self->sendResponse(std::move(response));
                });
    });
}

void HttpSession::sendResponse(RestApiHandlerBase::Response&& response) {
  res_ = std::make_shared<RestApiHandlerBase::Response>(std::move(response));
  // Video bodies can be large; writes run without a deadline.
  http::async_write(stream_, *res_,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                              res_->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t) {
  if (ec) {
    std::cerr << "Error: response write failed: " << ec.message() << std::endl;
    return;
  }
  if (close) {
    return doClose();
  }
  res_.reset();
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
