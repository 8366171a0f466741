#pragma once
#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "checksum.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "verdict.hpp"

// One inbound transfer: "file_id\n" then raw bytes until the peer half-closes.
// Every block is written to the output file and then fed to the MD5
// accumulator. At end-of-stream the connection hands itself to `verify` and
// stays open until finish() reports the verdict.
class TransferConnection : public std::enable_shared_from_this<TransferConnection> {
public:
    enum class State {
        AwaitingFileId,
        Receiving,
        Verifying,
        Ok,
        Corrupted,
        Unverifiable,
        RegistryUnreachable,
        Abandoned
    };

    struct Hooks {
        // Maps an announced id to the file to write; nullopt rejects the id.
        std::function<std::optional<std::filesystem::path>(const std::string&)> resolve_output;
        std::function<void(std::shared_ptr<TransferConnection>)> verify;
        std::function<void(const TransferConnection&, const std::string& reason)> abandoned;
        // Runs on the connection's strand once a verdicted session has closed.
        std::function<void(const TransferConnection&)> finished;
    };

    static std::shared_ptr<TransferConnection> create_incoming(asio::ip::tcp::socket sock,
                                                               std::chrono::milliseconds idle_timeout,
                                                               Hooks hooks,
                                                               std::shared_ptr<Logger> logger);

    ~TransferConnection();

    void start();

    // Thread-safe. Moves to the verdict's terminal state and closes.
    void finish(Verdict verdict);

    State state() const { return state_; }
    const std::string& file_id() const { return file_id_; }
    const std::string& peer() const { return peer_; }
    const std::filesystem::path& output_path() const { return output_path_; }
    uint64_t bytes_received() const { return bytes_received_; }
    // Valid once the connection is Verifying.
    const std::string& local_md5() const { return local_md5_; }

private:
    TransferConnection(asio::ip::tcp::socket sock,
                       std::chrono::milliseconds idle_timeout,
                       Hooks hooks,
                       std::shared_ptr<Logger> logger);

    void arm_deadline();
    void read_file_id();
    void handle_file_id(const std::error_code& ec);
    void do_read();
    bool consume(const char* data, std::size_t size);
    void end_of_stream();
    void abandon(const std::string& reason);
    void close();
    bool terminal() const;

    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_;
    std::chrono::milliseconds idle_timeout_;
    Hooks hooks_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf id_buf_;
    std::array<char, kTransferBlockSize> block_{};
    std::ofstream out_;
    Md5Accumulator md5_;
    State state_ = State::AwaitingFileId;
    std::string peer_;
    std::string file_id_;
    std::filesystem::path output_path_;
    uint64_t bytes_received_ = 0;
    std::string local_md5_;
};

const char* connection_state_name(TransferConnection::State state);
