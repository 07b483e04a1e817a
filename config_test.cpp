#ifdef NDEBUG
#    undef NDEBUG
#endif

#include "scan2davd.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>

using namespace scan2dav;

namespace {
using environment = std::map<std::string, std::string>;

env_lookup lookup_in(const environment &env)
{
    return [&env](const char *name) -> const char * {
        auto it = env.find(name);
        return (it == env.end()) ? nullptr : it->second.c_str();
    };
}

environment minimal()
{
    return {{"WEBDAV_URL", "https://dav.example.com/scans/"}, {"WEBDAV_USER", "user"}, {"WEBDAV_PASS", "s3cret"}};
}

std::string config_problem(const environment &env)
{
    try {
        (void)load_config(lookup_in(env));
    } catch (const config_error &e) {
        return e.what();
    }
    return {};
}
} // namespace

int main()
{
    try {
        {
            // every missing variable is reported at once
            environment env;
            std::string problem = config_problem(env);
            std::cout << problem << std::endl;
            assert(problem.find("WEBDAV_URL") != std::string::npos);
            assert(problem.find("WEBDAV_USER") != std::string::npos);
            assert(problem.find("WEBDAV_PASS") != std::string::npos);
        }

        {
            environment env = minimal();
            env["WEBDAV_PASS"] = "";
            assert(config_problem(env).find("WEBDAV_PASS") != std::string::npos);
        }

        {
            const environment env = minimal();
            daemon_config config = load_config(lookup_in(env));
            assert(config.target.base_url == "https://dav.example.com/scans");
            assert(config.target.auth.user == "user");
            assert(config.target.auth.password == "s3cret");
            assert(config.target.subdir.empty());
            assert(config.port == 3030);
            assert(config.session.max_payload == 256UL * 1024 * 1024);
            assert(config.session.spool_dir == "/tmp/scan2dav");
            assert(config.session.naming == naming_policy::device);
            assert(config.io_timeout == std::chrono::seconds(30));
            assert(config.relay.max_attempts == 5);
            assert(config.relay.initial_backoff == std::chrono::milliseconds(1000));
            assert(config.relay.max_backoff == std::chrono::milliseconds(30000));
            assert(config.http.connect == std::chrono::seconds(10));
            assert(config.http.stall == std::chrono::seconds(60));
            assert(config.workers == 4);
            assert(config.log_level == LOG_NOTICE);
        }

        {
            environment env = minimal();
            env["WEBDAV_SUBDIR"] = "/inbox/2026/";
            env["SCAN_PORT"] = "8080";
            env["SCAN_MAX_SIZE"] = "1048576";
            env["SCAN_SPOOL_DIR"] = "/var/spool/scan2dav";
            env["SCAN_NAMING"] = "Timestamp";
            env["SCAN_IO_TIMEOUT"] = "5";
            env["RELAY_MAX_ATTEMPTS"] = "3";
            env["RELAY_BACKOFF_MS"] = "250";
            env["RELAY_MAX_BACKOFF_MS"] = "2000";
            env["RELAY_CONNECT_TIMEOUT"] = "3";
            env["RELAY_STALL_TIMEOUT"] = "20";
            env["RELAY_WORKERS"] = "8";
            env["LOG_LEVEL"] = "debug";

            daemon_config config = load_config(lookup_in(env));
            assert((config.target.subdir == std::vector<std::string>{"inbox", "2026"}));
            assert(config.port == 8080);
            assert(config.session.max_payload == 1048576);
            assert(config.session.spool_dir == "/var/spool/scan2dav");
            assert(config.session.naming == naming_policy::timestamp);
            assert(config.io_timeout == std::chrono::seconds(5));
            assert(config.relay.max_attempts == 3);
            assert(config.relay.initial_backoff == std::chrono::milliseconds(250));
            assert(config.relay.max_backoff == std::chrono::milliseconds(2000));
            assert(config.http.connect == std::chrono::seconds(3));
            assert(config.http.stall == std::chrono::seconds(20));
            assert(config.workers == 8);
            assert(config.log_level == LOG_DEBUG);
        }

        {
            const char *bad_urls[] = {"ftp://dav.example.com", "dav.example.com/scans", "https://", "http:///x"};
            for (const char *url : bad_urls) {
                environment env = minimal();
                env["WEBDAV_URL"] = url;
                assert(config_problem(env).find("WEBDAV_URL") != std::string::npos);
            }
            environment env = minimal();
            env["WEBDAV_URL"] = "HTTP://nas.local:5005";
            assert(load_config(lookup_in(env)).target.base_url == "HTTP://nas.local:5005");
        }

        {
            environment env = minimal();
            env["WEBDAV_SUBDIR"] = "inbox/../../private";
            assert(config_problem(env).find("WEBDAV_SUBDIR") != std::string::npos);
        }

        {
            const char *bad_ports[] = {"abc", "0", "70000", "-1", "80x", " "};
            for (const char *port : bad_ports) {
                environment env = minimal();
                env["SCAN_PORT"] = port;
                assert(config_problem(env).find("SCAN_PORT") != std::string::npos);
            }
        }

        {
            // several problems in one message, never the password
            environment env = minimal();
            env["SCAN_NAMING"] = "random";
            env["RELAY_WORKERS"] = "0";
            env["LOG_LEVEL"] = "loud";
            std::string problem = config_problem(env);
            assert(problem.find("SCAN_NAMING") != std::string::npos);
            assert(problem.find("RELAY_WORKERS") != std::string::npos);
            assert(problem.find("LOG_LEVEL") != std::string::npos);
            assert(problem.find("s3cret") == std::string::npos);
        }

        {
            environment env = minimal();
            env["RELAY_BACKOFF_MS"] = "5000";
            env["RELAY_MAX_BACKOFF_MS"] = "1000";
            assert(config_problem(env).find("RELAY_MAX_BACKOFF_MS") != std::string::npos);
        }

        assert(parse_port("3030") == 3030);
        assert(parse_port("65535") == 65535);
        bool thrown = false;
        try {
            (void)parse_port("65536");
        } catch (const config_error &) {
            thrown = true;
        }
        assert(thrown);

        assert(parse_log_level("info") == LOG_INFO);
        assert(parse_log_level("WARNING") == LOG_WARNING);
        assert(parse_log_level("err") == LOG_ERR);
    } catch (std::exception &e) {
        std::cerr << "Exception: " << e.what() << "\n\n";
        exit(EXIT_FAILURE);
    }

    exit(EXIT_SUCCESS);
}
