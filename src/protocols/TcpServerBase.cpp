#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace tally::protocols {

namespace {

void check(const beast::error_code& ec, const char* step, const tcp::endpoint& endpoint) {
    if (ec)
        throw std::runtime_error(fmt::format("{} {}:{} failed: {}", step, endpoint.address().to_string(),
                                             endpoint.port(), ec.message()));
}

}

TcpServerBase::TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) {
    listen(endpoint);
}

void TcpServerBase::listen(const tcp::endpoint& endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    check(ec, "Opening", endpoint);
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    check(ec, "Setting reuse_address on", endpoint);
    acceptor_.bind(endpoint, ec);
    check(ec, "Binding", endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    check(ec, "Listening on", endpoint);
}

void TcpServerBase::run() {
    const auto ep = acceptor_.local_endpoint();
    logger()->info("[{}] Listening on {}:{}", serverName(), ep.address().to_string(), ep.port());

    for (unsigned int i = 0; i < std::max(1u, opts_.acceptConcurrency); ++i) doAccept();
}

void TcpServerBase::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) logger()->debug("[{}] Close error: {}", serverName(), ec.message());
}

void TcpServerBase::onAcceptError(const beast::error_code& ec) {
    logger()->debug("[{}] Accept error: {}", serverName(), ec.message());
}

std::shared_ptr<spdlog::logger> TcpServerBase::logger() {
    return log::Registry::http();
}

void TcpServerBase::doAccept() {
    auto handler = [self = shared_from_this()](const beast::error_code& ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return;
        self->doAccept();

        if (ec) self->onAcceptError(ec);
        else self->onAccept(std::move(socket));
    };

    if (opts_.useStrand) acceptor_.async_accept(asio::make_strand(ioc_), std::move(handler));
    else acceptor_.async_accept(std::move(handler));
}

}
