#pragma once
#include <stdexcept>
#include <string>

// Fewer than one full record handed to the decoder.
class MalformedPacketError : public std::runtime_error {
public:
    explicit MalformedPacketError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Peer closed the stream, the socket failed, or it was closed locally.
class ConnectionClosedError : public std::runtime_error {
public:
    explicit ConnectionClosedError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class LogWriteError : public std::runtime_error {
public:
    explicit LogWriteError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg) {}
};
