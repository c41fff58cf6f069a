#pragma once

#include "protocols/http/Router.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <optional>

namespace tally::protocols::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp = boost::asio::ip::tcp;

// One keep-alive connection: read a request, route it, write the response.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const Router& router, std::uint64_t bodyLimit);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void write(string_response&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    const Router& router_;
    std::uint64_t bodyLimit_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
};

}
