//
// async_scan_server.cpp
// ~~~~~~~~~~~~~~~~~~~~~
//
// Transport listener: accepts scanner connections and runs one scan_session
// per connection.  A connection lives as long as an asynchronous operation
// holds a reference to it.
//

#include "async_scan_server.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <exception>
#include <string>
#include <syslog.h>
#include <utility>

namespace scan2dav {

using boost::asio::ip::tcp;

namespace {
constexpr size_t rxbuf_size{16 * 1024};
constexpr std::chrono::milliseconds accept_retry_delay{100};

struct status_line
{
    int s_code;
    const char *s_reason;
};

const status_line status_lines[] = {{100, "Continue"},
                                    {200, "OK"},
                                    {400, "Bad Request"},
                                    {404, "Not Found"},
                                    {405, "Method Not Allowed"},
                                    {411, "Length Required"},
                                    {413, "Payload Too Large"},
                                    {431, "Request Header Fields Too Large"},
                                    {500, "Internal Server Error"},
                                    {501, "Not Implemented"},
                                    {503, "Service Unavailable"},
                                    {-1, nullptr}};

const char *reason_phrase(int status)
{
    for (const status_line *ps = status_lines; ps->s_code >= 0; ps++) {
        if (ps->s_code == status) {
            return ps->s_reason;
        }
    }
    return "Unknown";
}

/*
 * Map a decode error to the status sent to the device, 0 means just close.
 */
int error_status(decode_error error)
{
    switch (error) {
    case decode_error::malformed_request:
    case decode_error::bad_chunk:
        return 400;
    case decode_error::header_too_large:
        return 431;
    case decode_error::length_required:
        return 411;
    case decode_error::not_implemented:
        return 501;
    case decode_error::payload_too_large:
        return 413;
    case decode_error::spool_failure:
        return 500;
    case decode_error::truncated:
    case decode_error::none:
        break;
    }
    return 0;
}

class connection : public std::enable_shared_from_this<connection>
{
public:
    connection(tcp::socket socket, const session_options &options, std::chrono::seconds timeout,
               std::shared_ptr<scan_handler> handler)
        : socket_(std::move(socket)), timer_(socket_.get_executor()), timeout_(timeout), handler_(std::move(handler)),
          session_(options)
    {
    }

    connection(const connection &) = delete;
    connection &operator=(const connection &) = delete;

    void start()
    {
        boost::system::error_code ec;
        tcp::endpoint remote = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string("unknown peer") : remote.address().to_string() + ":" + std::to_string(remote.port());
        syslog(LOG_INFO, "scan2dav: connection from %s\n", peer_.c_str());

        do_read();
    }

private:
    void start_timeout()
    {
        timer_.expires_after(timeout_);
        auto self(shared_from_this());
        timer_.async_wait([this, self](const boost::system::error_code &error) {
            if (!error) {
                syslog(LOG_WARNING, "scan2dav: %s: timeout\n", peer_.c_str());
                timed_out_ = true;
                boost::system::error_code ignored;
                (void)socket_.close(ignored); // the pending operation ends with operation_aborted
            }
        });
    }

    void do_read()
    {
        start_timeout();
        auto self(shared_from_this());
        socket_.async_read_some(boost::asio::buffer(rxbuf_), [this, self](boost::system::error_code ec,
                                                                          std::size_t bytes_recvd) {
            if (ec && ec != boost::asio::error::eof) {
                timer_.cancel();
                if (!timed_out_) {
                    syslog(LOG_WARNING, "scan2dav: %s: read: %s\n", peer_.c_str(), ec.message().c_str());
                }
                session_.finish_input(); // discards a partial transfer
                close();
                return;
            }

            if (bytes_recvd > 0) {
                (void)session_.consume(rxbuf_.data(), bytes_recvd);
            }
            if (ec == boost::asio::error::eof) {
                session_.finish_input();
            }
            on_progress();
        });
    }

    void on_progress()
    {
        switch (session_.state()) {
        case session_state::completed:
            timer_.cancel();
            dispatch();
            break;

        case session_state::aborted:
            timer_.cancel();
            reject();
            break;

        default:
            if (session_.expects_continue() && !continue_sent_) {
                send_continue();
            } else {
                do_read();
            }
            break;
        }
    }

    void send_continue()
    {
        continue_sent_ = true;
        static const std::string interim{"HTTP/1.1 100 Continue\r\n\r\n"};
        auto self(shared_from_this());
        boost::asio::async_write(socket_, boost::asio::buffer(interim),
                                 [this, self](boost::system::error_code ec, std::size_t /*bytes_sent*/) {
                                     if (ec) {
                                         syslog(LOG_WARNING, "scan2dav: %s: write: %s\n", peer_.c_str(),
                                                ec.message().c_str());
                                         session_.finish_input();
                                         close();
                                         return;
                                     }
                                     do_read();
                                 });
    }

    /*
     * Route a complete request.
     */
    void dispatch()
    {
        const request_head &head = session_.head();
        const std::string path = head.target.substr(0, head.target.find('?'));

        try {
            if (session_.is_upload()) {
                (*handler_)(session_.take_scan());
                send_response(200, "OK\n");
            } else if (head.method == "HEAD") {
                send_response(path == "/" ? 200 : 404, "");
            } else if (head.method == "GET") {
                if (path == "/health") {
                    send_response(200, "OK\n");
                } else {
                    send_response(404, "");
                }
            } else {
                send_response(405, "", "Allow: PUT, HEAD, GET\r\n");
            }
        } catch (const std::exception &e) {
            syslog(LOG_ERR, "scan2dav: %s: %s %s failed: %s\n", peer_.c_str(), head.method.c_str(),
                   head.target.c_str(), e.what());
            send_response(500, "");
        }
    }

    void reject()
    {
        int status = error_status(session_.error());
        if (status == 0) {
            close(); // nobody is waiting for an answer
            return;
        }
        send_response(status, "");
    }

    void send_response(int status, const std::string &body, const char *extra_fields = "")
    {
        const request_head &head = session_.head();
        const bool with_body = head.method != "HEAD";

        response_ = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
        response_ += "Server: scan2dav\r\n";
        response_ += "Content-Length: " + std::to_string(with_body ? body.size() : 0) + "\r\n";
        response_ += "Connection: close\r\n";
        response_ += extra_fields;
        response_ += "\r\n";
        if (with_body) {
            response_ += body;
        }

        syslog(LOG_INFO, "scan2dav: %s: %s %s -> %d\n", peer_.c_str(), head.method.c_str(), head.target.c_str(),
               status);

        start_timeout();
        auto self(shared_from_this());
        boost::asio::async_write(socket_, boost::asio::buffer(response_),
                                 [this, self](boost::system::error_code ec, std::size_t /*bytes_sent*/) {
                                     if (ec) {
                                         timer_.cancel();
                                         syslog(LOG_WARNING, "scan2dav: %s: write: %s\n", peer_.c_str(),
                                                ec.message().c_str());
                                         close();
                                         return;
                                     }
                                     boost::system::error_code ignored;
                                     (void)socket_.shutdown(tcp::socket::shutdown_send, ignored);
                                     start_timeout();
                                     drain();
                                 });
    }

    /// read and discard until the device closes, so an unread request body
    /// does not turn the close into a reset that destroys the response
    void drain()
    {
        auto self(shared_from_this());
        socket_.async_read_some(boost::asio::buffer(rxbuf_),
                                [this, self](boost::system::error_code ec, std::size_t /*bytes_recvd*/) {
                                    if (ec) {
                                        timer_.cancel();
                                        close();
                                        return;
                                    }
                                    drain();
                                });
    }

    void close()
    {
        boost::system::error_code ignored;
        (void)socket_.shutdown(tcp::socket::shutdown_both, ignored);
        (void)socket_.close(ignored);
    }

    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::chrono::seconds timeout_;
    std::shared_ptr<scan_handler> handler_;
    scan_session session_;
    std::array<char, rxbuf_size> rxbuf_ = {};
    std::string response_;
    std::string peer_;
    bool continue_sent_{false};
    bool timed_out_{false};
};
} // namespace

scan_server::scan_server(boost::asio::io_context &io_context, uint16_t port, session_options options,
                         std::chrono::seconds io_timeout, scan_handler handler)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port)), accept_timer_(io_context), options_(std::move(options)),
      io_timeout_(io_timeout), handler_(std::make_shared<scan_handler>(std::move(handler)))
{
    syslog(LOG_NOTICE, "scan2dav: listening on port %u\n", static_cast<unsigned>(local_port()));
    do_accept();
}

uint16_t scan_server::local_port() const
{
    boost::system::error_code ec;
    tcp::endpoint local = acceptor_.local_endpoint(ec);
    return ec ? 0 : local.port();
}

void scan_server::close()
{
    (void)accept_timer_.cancel();
    boost::system::error_code ec;
    (void)acceptor_.close(ec);
    if (ec) {
        syslog(LOG_WARNING, "scan2dav: close listener: %s\n", ec.message().c_str());
    }
}

void scan_server::do_accept()
{
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return; // closed
        }

        if (ec) {
            // EMFILE and friends persist until a descriptor is freed
            syslog(LOG_ERR, "scan2dav: accept: %s\n", ec.message().c_str());
            accept_timer_.expires_after(accept_retry_delay);
            accept_timer_.async_wait([this](const boost::system::error_code &error) {
                if (!error && acceptor_.is_open()) {
                    do_accept();
                }
            });
            return;
        }

        std::make_shared<connection>(std::move(socket), options_, io_timeout_, handler_)->start();
        do_accept();
    });
}

} // namespace scan2dav
