#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>

// Blocking TCP client where every connect/read/write is bounded by the same
// timeout. Each operation runs the private io_context until the handler
// fires or the budget runs out; on timeout the socket is closed and
// std::system_error(asio::error::timed_out) is thrown. Transport errors are
// thrown as std::system_error too.
class Client {
public:
    explicit Client(std::chrono::milliseconds timeout);
    ~Client();

    void connect(const std::string& host, unsigned short port);
    void write_all(const void* data, std::size_t size);
    void write_all(const std::string& data) { write_all(data.data(), data.size()); }

    // 0 means the peer closed its side.
    std::size_t read_some(void* data, std::size_t size);

    // Reads until the peer closes. Throws if more than `limit` bytes arrive.
    std::string read_to_eof(std::size_t limit);

    // Half-close: tells the peer no more bytes are coming.
    void shutdown_send();
    void close();

private:
    void run_until_done();

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
};
