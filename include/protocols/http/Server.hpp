#pragma once

#include "protocols/TcpServerBase.hpp"
#include "protocols/http/Router.hpp"

namespace tally::protocols::http {

class Server final : public TcpServerBase {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint, const Router& router, std::uint64_t bodyLimit);

private:
    const Router& router_;
    std::uint64_t bodyLimit_;

    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
