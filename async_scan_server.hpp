#pragma once

#include "scan_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace scan2dav {

/// called once per completely received scan, must not block
using scan_handler = std::function<void(std::unique_ptr<incoming_scan>)>;

/// accepts scanner connections, one scan_session per connection
///
/// @note all connections run on the io_context given, a slow device never
///       blocks the acceptance of another one
class scan_server
{
public:
    /// @throw boost::system::system_error if the port can't be bound
    scan_server(boost::asio::io_context &io_context, uint16_t port, session_options options,
                std::chrono::seconds io_timeout, scan_handler handler);

    scan_server(const scan_server &) = delete;
    scan_server &operator=(const scan_server &) = delete;

    /// the bound port, useful if port 0 was requested
    uint16_t local_port() const;

    /// stop accepting, running transfers are not interrupted
    void close();

private:
    void do_accept();

    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer accept_timer_; // delays the next accept after an error
    session_options options_;
    std::chrono::seconds io_timeout_;
    std::shared_ptr<scan_handler> handler_;
};

} // namespace scan2dav
