#include "config.hpp"
#include "controller.hpp"
#include "errors.hpp"
#include "transport.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <cstdio>
#include <string>
#include <thread>

// --------------------------------------------------
// MAIN
// --------------------------------------------------

int main(int argc, char** argv)
{
    Config cfg;

    try {
        if (!parse_args(argc, argv, cfg))
            return 0;
    } catch (const ConfigError& e) {
        std::fprintf(stderr, "[CONFIG] %s\n", e.what());
        std::fprintf(stderr, "[CONFIG] try '%s --help'\n", argv[0]);
        return 2;
    }

    Controller ctl(cfg, make_transport(cfg));

    // SIGINT / SIGTERM -> orderly stop
    boost::asio::io_context sig_io;
    boost::asio::signal_set signals(sig_io, SIGINT, SIGTERM);
    signals.async_wait(
        [&ctl](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            std::printf("\n");
            ctl.request_stop(signo == SIGINT ? "interrupted (SIGINT)"
                                             : "terminated (SIGTERM)");
        });
    std::thread sig_thread([&sig_io]() { sig_io.run(); });

    int rc = ctl.run();

    boost::asio::post(sig_io, [&signals]() {
        boost::system::error_code ignored;
        signals.cancel(ignored);
    });
    sig_thread.join();

    return rc;
}
