#include <memory>
#include <string>
#include <csignal>
#include <cstdio>
#include <cstring>

#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "echo_server.h"
#include "context_pool.h"

namespace
{

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config>  Run the echo server with a configuration file\n", prog);
    std::fprintf(stdout, "%s config       Dump default configuration\n", prog);
}

int run_server(const nett::config& cfg)
{
    boost::system::error_code ec;
    nett::io_context_pool pool(nett::normalize_workers(cfg.workers), ec);
    if (ec)
    {
        LOG_ERROR("create io context pool failed error {}", ec.message());
        return 1;
    }

    auto server = std::make_shared<nett::echo_server>(pool, cfg);
    server->start(ec);
    if (ec)
    {
        return 1;
    }

    boost::asio::signal_set signals(pool.get_io_context(), SIGINT, SIGTERM);
    signals.async_wait(
        [&pool, server](const boost::system::error_code& sig_ec, int sig)
        {
            if (sig_ec)
            {
                return;
            }
            LOG_INFO("signal {} received, shutting down", sig);
            server->stop();
            pool.stop();
        });

    pool.run();
    LOG_INFO("echo server exited");
    return 0;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc == 2 && std::strcmp(argv[1], "config") == 0)
    {
        std::fputs(nett::dump_default_config().c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }
    if (argc != 3 || std::strcmp(argv[1], "-c") != 0)
    {
        print_usage(argv[0]);
        return 1;
    }

    const auto parsed = nett::parse_config_with_error(argv[2]);
    if (!parsed)
    {
        std::fprintf(stderr, "invalid config %s at %s: %s\n", argv[2], parsed.error().path.c_str(), parsed.error().reason.c_str());
        return 1;
    }

    nett::init_log(parsed->log.file, parsed->log.level);
    const int rc = run_server(*parsed);
    nett::shutdown_log();
    return rc;
}
