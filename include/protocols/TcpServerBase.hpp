#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace spdlog { class logger; }

namespace tally::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

struct TcpServerOptions {
    unsigned int acceptConcurrency{1};
    bool useStrand{true};
};

// Listening socket plus an accept loop that re-arms itself. Subclasses own
// what happens to an accepted connection.
class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    // Binds and listens immediately; throws std::runtime_error naming the failed step.
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, TcpServerOptions opts);
    virtual ~TcpServerBase() = default;

    void run();

    // Closes the acceptor. Pending accepts complete with operation_aborted.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    virtual void onAcceptError(const beast::error_code& ec);

    static std::shared_ptr<spdlog::logger> logger();

private:
    void listen(const tcp::endpoint& endpoint);
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    TcpServerOptions opts_;
};

}
