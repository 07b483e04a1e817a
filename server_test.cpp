#ifdef NDEBUG
#    undef NDEBUG
#endif

#include "async_scan_server.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/filesystem/operations.hpp>

#include <array>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace fs = boost::filesystem;
using boost::asio::ip::tcp;
using namespace scan2dav;

namespace {
struct received_scan
{
    std::string filename;
    std::string payload;
};

class scan_sink
{
public:
    void operator()(std::unique_ptr<incoming_scan> scan)
    {
        std::vector<char> data = scan->payload->contents();
        std::lock_guard<std::mutex> lock(mutex_);
        scans_.push_back({scan->filename, std::string(data.begin(), data.end())});
    }

    std::vector<received_scan> scans()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return scans_;
    }

private:
    std::mutex mutex_;
    std::vector<received_scan> scans_;
};

class device
{
public:
    explicit device(uint16_t port) : socket_(io_context_)
    {
        socket_.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));
    }

    void send(const std::string &data) { (void)boost::asio::write(socket_, boost::asio::buffer(data)); }

    /// the server may stop reading at any time
    void send_lenient(const std::string &data)
    {
        boost::system::error_code ec;
        (void)boost::asio::write(socket_, boost::asio::buffer(data), ec);
    }

    void close_sending()
    {
        boost::system::error_code ec;
        (void)socket_.shutdown(tcp::socket::shutdown_send, ec);
    }

    /// read one response head
    std::string read_head()
    {
        size_t n = boost::asio::read_until(socket_, buf_, "\r\n\r\n");
        std::string head(boost::asio::buffers_begin(buf_.data()), boost::asio::buffers_begin(buf_.data()) + n);
        buf_.consume(n);
        return head;
    }

    /// read everything until the server closes
    std::string read_all()
    {
        std::string response(boost::asio::buffers_begin(buf_.data()), boost::asio::buffers_end(buf_.data()));
        buf_.consume(buf_.size());

        std::array<char, 1024> chunk;
        boost::system::error_code ec;
        for (;;) {
            size_t n = socket_.read_some(boost::asio::buffer(chunk), ec);
            response.append(chunk.data(), n);
            if (ec) {
                break;
            }
        }
        return response;
    }

private:
    boost::asio::io_context io_context_;
    tcp::socket socket_;
    boost::asio::streambuf buf_;
};

std::string exchange(uint16_t port, const std::string &request)
{
    device d(port);
    d.send(request);
    return d.read_all();
}

/// user and system time of the whole process
std::chrono::microseconds cpu_time()
{
    struct rusage usage = {};
    (void)::getrusage(RUSAGE_SELF, &usage);
    auto micros = [](const struct timeval &tv) {
        return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
    };
    return micros(usage.ru_utime) + micros(usage.ru_stime);
}

bool starts_with(const std::string &text, const std::string &prefix) { return text.compare(0, prefix.size(), prefix) == 0; }
} // namespace

int main()
{
    const fs::path dir = fs::temp_directory_path() / fs::unique_path("scan2dav-server-%%%%-%%%%");
    (void)fs::create_directories(dir);

    try {
        boost::asio::io_context io_context;
        scan_sink sink;

        session_options options;
        options.spool_dir = dir;
        options.max_payload = 64 * 1024;

        scan_server server(io_context, 0, options, std::chrono::seconds(2),
                           [&sink](std::unique_ptr<incoming_scan> scan) { sink(std::move(scan)); });
        const uint16_t port = server.local_port();
        assert(port != 0);

        std::thread runner([&io_context]() { io_context.run(); });

        {
            std::string response = exchange(port, "PUT /scans/doc.pdf HTTP/1.1\r\n"
                                                  "Host: relay\r\n"
                                                  "Content-Type: application/pdf\r\n"
                                                  "Content-Length: 5\r\n"
                                                  "\r\n"
                                                  "hello");
            std::cout << response << std::endl;
            assert(starts_with(response, "HTTP/1.1 200 OK\r\n"));
            assert(response.find("Connection: close\r\n") != std::string::npos);

            std::vector<received_scan> scans = sink.scans();
            assert(scans.size() == 1);
            assert(scans[0].filename == "doc.pdf");
            assert(scans[0].payload == "hello");
        }

        {
            std::string response = exchange(port, "PUT /img.jpg HTTP/1.1\r\n"
                                                  "Transfer-Encoding: chunked\r\n"
                                                  "\r\n"
                                                  "3\r\nabc\r\n3\r\ndef\r\n0\r\n\r\n");
            assert(starts_with(response, "HTTP/1.1 200 OK\r\n"));
            std::vector<received_scan> scans = sink.scans();
            assert(scans.size() == 2);
            assert(scans[1].filename == "img.jpg");
            assert(scans[1].payload == "abcdef");
        }

        {
            // the device disconnects mid payload: no scan, no response
            device d(port);
            d.send("PUT /cut.pdf HTTP/1.1\r\nContent-Length: 100\r\n\r\n0123456789");
            d.close_sending();
            std::string response = d.read_all();
            assert(response.empty());
            assert(sink.scans().size() == 2);
        }

        {
            std::string response = exchange(port, "PUT /big.pdf HTTP/1.1\r\nContent-Length: 1000000\r\n\r\n");
            assert(starts_with(response, "HTTP/1.1 413 "));
            assert(sink.scans().size() == 2);
        }

        {
            // the device keeps sending its body after the 413, the response still arrives
            device d(port);
            d.send_lenient("PUT /big.pdf HTTP/1.1\r\nContent-Length: 1000000\r\n\r\n" + std::string(256 * 1024, 'x'));
            d.close_sending();
            std::string response = d.read_all();
            assert(starts_with(response, "HTTP/1.1 413 "));
            assert(sink.scans().size() == 2);
        }

        {
            assert(starts_with(exchange(port, "PUT /doc.pdf HTTP/1.1\r\n\r\n"), "HTTP/1.1 411 "));
            assert(starts_with(exchange(port, "NONSENSE\r\n\r\n"), "HTTP/1.1 400 "));
            assert(starts_with(exchange(port, "PUT /x HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n"), "HTTP/1.1 501 "));
        }

        {
            std::string response = exchange(port, "HEAD / HTTP/1.1\r\n\r\n");
            assert(starts_with(response, "HTTP/1.1 200 OK\r\n"));
            assert(response.find("Content-Length: 0\r\n") != std::string::npos);

            assert(starts_with(exchange(port, "HEAD /other HTTP/1.1\r\n\r\n"), "HTTP/1.1 404 "));

            response = exchange(port, "GET /health HTTP/1.1\r\n\r\n");
            assert(starts_with(response, "HTTP/1.1 200 OK\r\n"));
            assert(response.substr(response.size() - 3) == "OK\n");

            assert(starts_with(exchange(port, "GET /index.html HTTP/1.1\r\n\r\n"), "HTTP/1.1 404 "));

            response = exchange(port, "DELETE /doc.pdf HTTP/1.1\r\n\r\n");
            assert(starts_with(response, "HTTP/1.1 405 "));
            assert(response.find("Allow: PUT, HEAD, GET\r\n") != std::string::npos);
        }

        {
            // 100-continue before the body
            device d(port);
            d.send("PUT /wait.pdf HTTP/1.1\r\nExpect: 100-continue\r\nContent-Length: 4\r\n\r\n");
            std::string interim = d.read_head();
            assert(interim == "HTTP/1.1 100 Continue\r\n\r\n");
            d.send("data");
            assert(starts_with(d.read_all(), "HTTP/1.1 200 OK\r\n"));
            assert(sink.scans().size() == 3);
        }

        {
            // a stalled device does not hold up another one
            device slow(port);
            slow.send("PUT /slow.pdf HTTP/1.1\r\nContent-Length: 10\r\n\r\n01");

            std::string response = exchange(port, "PUT /fast.pdf HTTP/1.1\r\nContent-Length: 2\r\n\r\nok");
            assert(starts_with(response, "HTTP/1.1 200 OK\r\n"));
            assert(sink.scans().back().filename == "fast.pdf");

            // the idle timeout ends the stalled transfer
            assert(slow.read_all().empty());
            assert(sink.scans().size() == 4);
        }

        {
            // out of descriptors while a device connects: the listener recovers
            device d(port);
            int lowest_free = ::open("/dev/null", O_RDONLY);
            assert(lowest_free >= 0);
            (void)::close(lowest_free);

            struct rlimit saved = {};
            assert(::getrlimit(RLIMIT_NOFILE, &saved) == 0);
            struct rlimit exhausted = saved;
            exhausted.rlim_cur = static_cast<rlim_t>(lowest_free);
            assert(::setrlimit(RLIMIT_NOFILE, &exhausted) == 0);

            const std::chrono::microseconds cpu_before = cpu_time();
            d.send("PUT /later.pdf HTTP/1.1\r\nContent-Length: 2\r\n\r\nok");
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            const std::chrono::microseconds busy = cpu_time() - cpu_before;
            assert(::setrlimit(RLIMIT_NOFILE, &saved) == 0);

            // failed accepts are retried at a slow pace, not in a busy loop
            std::cout << "cpu while out of descriptors: " << busy.count() << " us" << std::endl;
            assert(busy < std::chrono::milliseconds(150));

            assert(starts_with(d.read_all(), "HTTP/1.1 200 OK\r\n"));
            assert(sink.scans().back().filename == "later.pdf");
            assert(sink.scans().size() == 5);
        }

        server.close();
        io_context.stop();
        runner.join();
    } catch (std::exception &e) {
        std::cerr << "Exception: " << e.what() << "\n\n";
        exit(EXIT_FAILURE);
    }

    boost::system::error_code ec;
    (void)fs::remove_all(dir, ec);

    exit(EXIT_SUCCESS);
}
