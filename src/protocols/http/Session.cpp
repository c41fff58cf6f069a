#include "protocols/http/Session.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace tally::protocols::http;
using namespace tally::log;

Session::Session(tcp::socket socket, const Router& router, const std::uint64_t bodyLimit)
    : stream_(std::move(socket)), router_(router), bodyLimit_(bodyLimit) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);
    stream_.expires_after(std::chrono::seconds(60));

    auto self = shared_from_this();
    bhttp::async_read(stream_, buffer_, *parser_,
                      [self](beast::error_code ec, std::size_t bytes) {
                          self->on_read(ec, bytes);
                      });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == bhttp::error::end_of_stream) return do_close();

    if (ec == bhttp::error::body_limit) {
        Registry::http()->warn("[Session] Request body over {} bytes rejected", bodyLimit_);
        request req{verb::post, "", 11};
        req.keep_alive(false);
        return write(Router::makeErrorResponse(req, "Request body too large", status::payload_too_large));
    }

    if (ec) {
        if (ec != beast::error::timeout) Registry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    const auto req = parser_->release();
    Registry::http()->debug("[Session] {} {} ({} bytes)", std::string(req.method_string()),
                            std::string(req.target()), bytes);

    write(router_.route(req));
}

void Session::write(string_response&& res) {
    auto self = shared_from_this();
    auto msg = std::make_shared<string_response>(std::move(res));
    const bool close = msg->need_eof();

    if (msg->result_int() >= 400)
        Registry::http()->info("[Session] Responding {}", msg->result_int());

    bhttp::async_write(stream_, *msg,
                       [self, msg, close](beast::error_code ec, std::size_t bytes) {
                           self->on_write(close, ec, bytes);
                       });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t) {
    if (ec) {
        Registry::http()->debug("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
