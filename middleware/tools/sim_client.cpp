// Interrogator stand-in: connects to the logger and streams FBG records for
// one (channel, sensor) pair, then closes the connection.

#include "protocol.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;

struct ClientOptions
{
    std::string host = "127.0.0.1";
    std::string port = "4578";
    unsigned long count = 100;
    double rate_hz = 100.0;
    uint8_t channel = 1;
    uint8_t fiber = 0;
    uint8_t sensor = 0;
    double base = 1534.63;
};

static void usage(const char* prog)
{
    std::printf(
        "Usage: %s [--host h] [--port p] [--count n] [--rate hz]\n"
        "          [--channel c] [--fiber f] [--sensor s] [--base nm]\n",
        prog);
}

static bool parse(int argc, char** argv, ClientOptions& o)
{
    for (int i = 1; i < argc; ++i)
    {
        const char* a = argv[i];
        if (std::strcmp(a, "--help") == 0)
            return false;
        if (i + 1 >= argc) {
            std::fprintf(stderr, "missing value for %s\n", a);
            return false;
        }
        const char* v = argv[++i];

        if      (std::strcmp(a, "--host") == 0)    o.host = v;
        else if (std::strcmp(a, "--port") == 0)    o.port = v;
        else if (std::strcmp(a, "--count") == 0)   o.count = std::strtoul(v, nullptr, 10);
        else if (std::strcmp(a, "--rate") == 0)    o.rate_hz = std::strtod(v, nullptr);
        else if (std::strcmp(a, "--channel") == 0) o.channel = (uint8_t)std::atoi(v);
        else if (std::strcmp(a, "--fiber") == 0)   o.fiber = (uint8_t)std::atoi(v);
        else if (std::strcmp(a, "--sensor") == 0)  o.sensor = (uint8_t)std::atoi(v);
        else if (std::strcmp(a, "--base") == 0)    o.base = std::strtod(v, nullptr);
        else {
            std::fprintf(stderr, "unknown option %s\n", a);
            return false;
        }
    }
    return o.rate_hz > 0.0;
}

int main(int argc, char** argv)
{
    ClientOptions opt;
    if (!parse(argc, argv, opt)) {
        usage(argv[0]);
        return 2;
    }

    try {
        asio::io_context io;
        tcp::resolver resolver(io);
        tcp::socket sock(io);

        asio::connect(sock, resolver.resolve(opt.host, opt.port));
        std::printf("Connected to %s:%s\n", opt.host.c_str(), opt.port.c_str());

        const auto period = std::chrono::duration<double>(1.0 / opt.rate_hz);
        auto next = std::chrono::steady_clock::now();

        for (unsigned long i = 0; i < opt.count; ++i)
        {
            Reading r;
            r.channel = opt.channel;
            r.fiber = opt.fiber;
            r.sensor = opt.sensor;
            r.value = opt.base + 0.01 * std::sin(0.1 * (double)i);

            auto rec = encode_record(r);
            asio::write(sock, asio::buffer(rec));

            std::printf("Sensor#%u, Fiber#%u, Channel#%u\tFBGs:%.5f nm\n",
                (unsigned)r.sensor, (unsigned)r.fiber, (unsigned)r.channel, r.value);

            next += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
            std::this_thread::sleep_until(next);
        }

        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
    } catch (const boost::system::system_error& e) {
        std::fprintf(stderr, "Connection failed: %s\n", e.what());
        return 1;
    }

    return 0;
}
