#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"

using namespace tally::protocols::http;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint, const Router& router, const std::uint64_t bodyLimit)
    : TcpServerBase(ioc, endpoint, TcpServerOptions{.acceptConcurrency = 1, .useStrand = true}),
      router_(router), bodyLimit_(bodyLimit) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, bodyLimit_)->run();
}
