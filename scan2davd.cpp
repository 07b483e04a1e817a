//
// scan2davd.cpp
// ~~~~~~~~~~~~~
//
// Receives documents pushed by network scanners and relays them to a WebDAV
// server.  Connections run on one io_context thread, relays on a worker pool.
//

#include "scan2davd.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/filesystem/operations.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <syslog.h>

int main(int argc, char *argv[])
{
    openlog("scan2davd", LOG_PID | LOG_PERROR, LOG_DAEMON);

    if (argc > 2) {
        std::cerr << "Usage: scan2davd [port]\n\n";
        exit(EXIT_FAILURE);
    }

    try {
        scan2dav::daemon_config config = scan2dav::load_config();
        if (argc == 2) {
            config.port = scan2dav::parse_port(argv[1]);
        }
        (void)setlogmask(LOG_UPTO(config.log_level));

        // NOTE: an already existing spool dir is not an error
        (void)boost::filesystem::create_directories(config.session.spool_dir);

        scan2dav::curl_dav_client client(config.target, config.http);
        scan2dav::relay_engine engine(config.target, client, config.relay);
        boost::asio::thread_pool workers(config.workers);
        boost::asio::io_context io_context;

        scan2dav::scan_server server(
            io_context, config.port, config.session, config.io_timeout,
            [&workers, &engine](std::unique_ptr<scan2dav::incoming_scan> scan) {
                std::shared_ptr<scan2dav::incoming_scan> job(std::move(scan));
                boost::asio::post(workers, [&engine, job]() {
                    try {
                        (void)engine.relay(*job);
                    } catch (const std::exception &e) {
                        syslog(LOG_ERR, "scan2davd: relay of %s failed: %s\n", job->filename.c_str(), e.what());
                    }
                });
            });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&server, &io_context](const boost::system::error_code &error, int signo) {
            if (!error) {
                syslog(LOG_NOTICE, "scan2davd: signal %d received, shutting down\n", signo);
                server.close();
                io_context.stop();
            }
        });

        syslog(LOG_NOTICE, "scan2davd: relaying to %s with %u worker(s)\n",
               scan2dav::redact_url(engine.collection_url()).c_str(), config.workers);

        io_context.run(); // the server runs here ...

        workers.join(); // running relays finish
    } catch (scan2dav::config_error &e) {
        syslog(LOG_ERR, "scan2davd: configuration: %s\n", e.what());
        closelog();
        exit(EXIT_FAILURE);
    } catch (std::exception &e) {
        syslog(LOG_ERR, "scan2davd: %s\n", e.what());
        closelog();
        exit(EXIT_FAILURE);
    }

    closelog();
    exit(EXIT_SUCCESS);
}
