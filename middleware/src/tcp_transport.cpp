#include "transport.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using asio::ip::tcp;

// tune this
static const size_t IN_XFER_SIZE = 1024;

const size_t TcpTransport::RX_QUEUE_CHUNKS;

enum class Link { Idle, Listening, Connected, PeerClosed, Failed, Closed };

class TcpTransport::Impl {
public:
    Impl(std::string addr, uint16_t p)
        : bind_address(std::move(addr)),
          port(p),
          acceptor(io),
          socket(io),
          work(asio::make_work_guard(io))
    {}

    std::string bind_address;
    uint16_t port;

    asio::io_context io;
    tcp::acceptor acceptor;
    tcp::socket socket;
    asio::executor_work_guard<asio::io_context::executor_type> work;

    std::thread event_thread;
    std::array<uint8_t, IN_XFER_SIZE> in_buf{};
    std::atomic<uint16_t> bound_port{0};

    // everything below is guarded by m
    mutable std::mutex m;
    std::condition_variable cv;
    Link link = Link::Idle;
    bool accepted = false;
    bool closed = false;
    bool read_paused = false;   // rx_q full, no async read armed
    std::deque<std::vector<uint8_t>> rx_q;
    std::string error;
    std::string peer;

    void fail(Link next, const std::string& what)
    {
        link = closed ? Link::Closed : next;
        if (!closed && error.empty())
            error = what;
        cv.notify_all();
    }

    void on_accept(const boost::system::error_code& ec)
    {
        std::lock_guard<std::mutex> lk(m);

        if (ec || closed) {
            fail(Link::Failed, "accept failed: " + ec.message());
            return;
        }

        boost::system::error_code ignored;
        acceptor.close(ignored);

        auto ep = socket.remote_endpoint(ignored);
        peer = ep.address().to_string() + ":" + std::to_string(ep.port());

        accepted = true;
        link = Link::Connected;
        std::printf("[TCP] connection from %s\n", peer.c_str());
        cv.notify_all();

        start_read();
    }

    void start_read()
    {
        socket.async_read_some(
            asio::buffer(in_buf),
            [this](const boost::system::error_code& ec, size_t n) {
                on_read(ec, n);
            });
    }

    void on_read(const boost::system::error_code& ec, size_t n)
    {
        std::lock_guard<std::mutex> lk(m);

        if (n > 0)
            rx_q.emplace_back(in_buf.begin(), in_buf.begin() + n);

        if (!ec) {
            cv.notify_all();
            if (closed)
                return;
            // Stop reading when full so the kernel window closes on the peer.
            if (rx_q.size() < RX_QUEUE_CHUNKS)
                start_read();
            else
                read_paused = true;
            return;
        }

        if (ec == asio::error::eof) {
            link = closed ? Link::Closed : Link::PeerClosed;
            cv.notify_all();
        } else {
            fail(Link::Failed, "receive failed: " + ec.message());
        }
    }

    void event_loop()
    {
        try {
            io.run();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lk(m);
            fail(Link::Failed, std::string("event loop: ") + e.what());
        }
    }

    bool open()
    {
        std::unique_lock<std::mutex> lk(m);

        if (closed || link != Link::Idle) {
            if (error.empty())
                error = "transport already used";
            return false;
        }

        boost::system::error_code ec;
        auto addr = asio::ip::make_address(bind_address, ec);
        if (ec) {
            error = "bad bind address '" + bind_address + "': " + ec.message();
            link = Link::Failed;
            return false;
        }

        tcp::endpoint ep(addr, port);
        acceptor.open(ep.protocol(), ec);
        if (!ec) acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor.bind(ep, ec);
        if (!ec) acceptor.listen(1, ec);
        if (ec) {
            error = "listen on " + bind_address + ":" + std::to_string(port) +
                    " failed: " + ec.message();
            link = Link::Failed;
            boost::system::error_code ignored;
            acceptor.close(ignored);
            return false;
        }

        bound_port.store(acceptor.local_endpoint(ec).port());
        link = Link::Listening;

        std::printf("[TCP] waiting for client connection on %s:%u\n",
            bind_address.c_str(), (unsigned)bound_port.load());

        acceptor.async_accept(socket,
            [this](const boost::system::error_code& e) { on_accept(e); });

        event_thread = std::thread([this]() { event_loop(); });

        cv.wait(lk, [&] { return link != Link::Listening; });
        return accepted && !closed;
    }

    int read(uint8_t* out, int maxlen)
    {
        std::unique_lock<std::mutex> lk(m);

        cv.wait(lk, [&] {
            return closed || !rx_q.empty() ||
                   (link != Link::Connected && link != Link::Listening);
        });

        if (closed) {
            if (error.empty())
                error = "connection closed locally";
            return -1;
        }

        if (!rx_q.empty()) {
            auto& front = rx_q.front();
            int n = (int)front.size();
            if (n > maxlen) n = maxlen;

            std::memcpy(out, front.data(), (size_t)n);

            // if chunk larger than maxlen, keep remainder
            if ((size_t)n < front.size()) {
                front.erase(front.begin(), front.begin() + n);
            } else {
                rx_q.pop_front();
            }

            if (read_paused && rx_q.size() <= RX_QUEUE_CHUNKS / 2) {
                read_paused = false;
                asio::post(io, [this]() {
                    std::lock_guard<std::mutex> g(m);
                    if (!closed && link == Link::Connected)
                        start_read();
                });
            }
            return n;
        }

        if (link == Link::PeerClosed)
            return 0;

        if (error.empty())
            error = "not connected";
        return -1;
    }

    void close()
    {
        bool was_connected;
        {
            std::lock_guard<std::mutex> lk(m);
            if (closed)
                return;
            closed = true;
            was_connected = accepted;
            link = Link::Closed;
            cv.notify_all();
        }

        auto shut = [this]() {
            boost::system::error_code ignored;
            acceptor.close(ignored);
            socket.shutdown(tcp::socket::shutdown_both, ignored);
            socket.close(ignored);
        };

        if (event_thread.joinable()) {
            asio::post(io, shut);
            work.reset();
            event_thread.join();
        } else {
            shut();
        }

        if (was_connected)
            std::printf("[TCP] connection released\n");
    }
};

// --------------------------------------------------

TcpTransport::TcpTransport(std::string bind_address, uint16_t port)
    : impl(std::make_unique<Impl>(std::move(bind_address), port))
{}

TcpTransport::~TcpTransport() { impl->close(); }

bool TcpTransport::open() { return impl->open(); }
int  TcpTransport::read(uint8_t* b, int n) { return impl->read(b, n); }
void TcpTransport::close() { impl->close(); }

uint16_t TcpTransport::listening_port() const { return impl->bound_port.load(); }

size_t TcpTransport::queued_chunks() const
{
    std::lock_guard<std::mutex> lk(impl->m);
    return impl->rx_q.size();
}

std::string TcpTransport::describe() const
{
    std::lock_guard<std::mutex> lk(impl->m);
    if (!impl->peer.empty())
        return "tcp client " + impl->peer;
    return "tcp " + impl->bind_address + ":" + std::to_string(impl->port);
}

std::string TcpTransport::last_error() const
{
    std::lock_guard<std::mutex> lk(impl->m);
    return impl->error;
}

// --------------------------------------------------

std::unique_ptr<ITransport> make_transport(const Config& cfg)
{
    if (cfg.transport == TransportKind::Sim)
        return std::make_unique<SimTransport>(cfg.channels, cfg.sim);
    return std::make_unique<TcpTransport>(cfg.bind_address, cfg.port);
}
