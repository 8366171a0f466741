#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "checksum_store.hpp"
#include "log.hpp"

// Applies one registry request line to the store and returns the reply
// (OK, ERR, length|checksum or 0|). Socket-free so it can be driven directly.
std::string handle_registry_line(ChecksumStore& store, std::string_view line, Logger* logger = nullptr);

// Checksum registry: one request per connection, reply, close.
class RegistryServer {
public:
    struct Options {
        std::string listen_ip = "127.0.0.1";
        uint16_t listen_port = 0;          // 0 picks a free port
        std::size_t io_threads = 1;
        std::chrono::milliseconds io_timeout{30000};
        std::chrono::seconds sweep_interval{0}; // 0 disables the sweep
        bool handle_signals = false;       // SIGINT/SIGTERM stop the server
    };

    RegistryServer(std::shared_ptr<ChecksumStore> store,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);
    ~RegistryServer();

    RegistryServer(const RegistryServer&) = delete;
    RegistryServer& operator=(const RegistryServer&) = delete;

    // Binds and starts accepting. Throws std::system_error if the address
    // cannot be bound.
    void start();
    // Serves on the calling thread (plus io_threads - 1 helpers) until stop.
    void run();
    void start_background();
    void stop();

    uint16_t listen_port() const { return listen_port_; }

private:
    using tcp = asio::ip::tcp;

    void do_accept();
    void schedule_sweep();

    Options options_;
    std::shared_ptr<ChecksumStore> store_;
    std::shared_ptr<Logger> logger_;
    asio::io_context io_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::unique_ptr<asio::steady_timer> sweep_timer_;
    std::unique_ptr<asio::signal_set> signals_;
    std::vector<std::thread> threads_;
    std::atomic<bool> started_{false};
    uint16_t listen_port_ = 0;
};
