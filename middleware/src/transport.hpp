#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "config.hpp"

// Byte source for the ingest loop.
//
// read() blocks until data arrives and returns the byte count, 0 once the
// peer has closed and everything queued was delivered, or -1 on error or
// after close(). close() may be called from any thread, more than once,
// and unblocks a pending open() or read().
class ITransport {
public:
    virtual bool open() = 0;
    virtual int  read(uint8_t* buf, int len) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
    virtual std::string last_error() const = 0;
    virtual ~ITransport() {}
};

// Listens once, accepts one client, streams it.
class TcpTransport : public ITransport {
public:
    TcpTransport(std::string bind_address, uint16_t port);
    ~TcpTransport() override;

    bool open() override;
    int  read(uint8_t*, int) override;
    void close() override;
    std::string describe() const override;
    std::string last_error() const override;

    // Received chunks held before reads pause and TCP flow control takes over.
    static const size_t RX_QUEUE_CHUNKS = 256;

    // Actual port once listening (useful with port 0), else 0.
    uint16_t listening_port() const;

    // Chunks received but not yet handed out by read().
    size_t queued_chunks() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

// Generates records for the configured slots in odd-sized chunks.
class SimTransport : public ITransport {
public:
    SimTransport(std::vector<ChannelConfig> channels, SimConfig sim);
    ~SimTransport() override;

    bool open() override;
    int  read(uint8_t*, int) override;
    void close() override;
    std::string describe() const override;
    std::string last_error() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

std::unique_ptr<ITransport> make_transport(const Config& cfg);
