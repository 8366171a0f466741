#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "verdict.hpp"

class TransferConnection;

// Where a transfer announcing `file_id` is written. `out_path` is either an
// existing directory (file written as out_path/file_id) or a file path used
// as is. nullopt when the id does not match `expected_file_id` (if set) or
// cannot be used as a file name inside a directory.
std::optional<std::filesystem::path> resolve_output_path(const std::filesystem::path& out_path,
                                                         const std::string& file_id,
                                                         const std::string& expected_file_id = "");

class TransferReceiver {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 0;
    std::string registry_host = "127.0.0.1";
    uint16_t registry_port = 0;
    std::string expected_file_id;
    std::filesystem::path out_path = std::filesystem::current_path();
    bool once = false;
    std::chrono::milliseconds io_timeout{30000};
    std::chrono::milliseconds registry_timeout{5000};
    std::size_t verify_threads = 2;
    bool handle_signals = false;
  };

  using VerdictCallback = std::function<void(const TransferReport&)>;

  struct Stats {
    std::size_t verdicts = 0;
    std::size_t abandoned = 0;
  };

  explicit TransferReceiver(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~TransferReceiver();

  TransferReceiver(const TransferReceiver&) = delete;
  TransferReceiver& operator=(const TransferReceiver&) = delete;

  // Called on a verification thread after the verdict is printed.
  void set_verdict_callback(VerdictCallback callback);

  void start();
  // Blocks until stop(), a signal, or in once mode until the first
  // verdicted connection has closed.
  void run();
  void start_background();
  void stop();

  uint16_t listen_port() const { return listen_port_; }
  Stats stats() const;
  // First verdict reached; what once mode exits with.
  std::optional<TransferReport> first_report() const;

private:
  using tcp = asio::ip::tcp;

  void do_accept();
  void verify(std::shared_ptr<TransferConnection> conn);
  void report(const TransferReport& report);

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::thread_pool> verify_pool_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;

  mutable std::mutex report_mutex_;
  VerdictCallback callback_;
  std::optional<TransferReport> first_report_;
  std::atomic<std::size_t> verdicts_{0};
  std::atomic<std::size_t> abandoned_{0};
};
