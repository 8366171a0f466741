#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "checksum.hpp"
#include "log.hpp"
#include "protocol.hpp"

enum class SendStatus {
  Sent,
  FileError,            // source file missing or unreadable
  InvalidFileId,
  RegistryRejected,     // registry answered ERR or garbage to BE
  RegistryUnreachable,
  TransferFailed        // receiver connect/write failed
};

const char* send_status_name(SendStatus status);

struct SendResult {
  SendStatus status = SendStatus::TransferFailed;
  FileDigest digest;
  uint64_t bytes_sent = 0;
  std::string error;
};

// Registers the file's MD5 with the registry, then streams it to the
// receiver. Nothing is sent to the receiver unless the registry said OK.
class TransferSender {
public:
  struct Options {
    std::string server_host = "127.0.0.1";
    uint16_t server_port = 0;
    std::string registry_host = "127.0.0.1";
    uint16_t registry_port = 0;
    std::string file_id;
    std::filesystem::path file_path;
    std::chrono::seconds checksum_ttl{kDefaultChecksumTtl};
    std::chrono::milliseconds io_timeout{30000};
  };

  explicit TransferSender(Options options, std::shared_ptr<Logger> logger = nullptr);

  SendResult send() const;

private:
  SendResult stream_file(SendResult result) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
};
