#include "transfer_sender.hpp"

#include <array>
#include <fstream>
#include <system_error>

#include "client.hpp"
#include "registry_client.hpp"

const char* send_status_name(SendStatus status) {
  switch(status) {
    case SendStatus::Sent:                return "sent";
    case SendStatus::FileError:           return "file error";
    case SendStatus::InvalidFileId:       return "invalid file id";
    case SendStatus::RegistryRejected:    return "registry rejected checksum";
    case SendStatus::RegistryUnreachable: return "registry unreachable";
    case SendStatus::TransferFailed:      return "transfer failed";
  }
  return "unknown";
}

TransferSender::TransferSender(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("netcopy-sender")) {}

SendResult TransferSender::send() const {
  SendResult result;

  if(!is_valid_file_id(options_.file_id)) {
    result.status = SendStatus::InvalidFileId;
    result.error = "file id must be 1-" + std::to_string(kMaxFileIdLength) +
                   " printable characters without '|'";
    return result;
  }

  auto digest = compute_file_digest(options_.file_path);
  if(!digest) {
    result.status = SendStatus::FileError;
    result.error = "cannot read " + options_.file_path.string();
    return result;
  }
  result.digest = *digest;
  logger_->debug("{}: {} bytes, md5 {}", options_.file_path.string(), digest->size, digest->md5);

  RegisterRequest request;
  request.file_id = options_.file_id;
  request.ttl_seconds = options_.checksum_ttl.count();
  request.length = digest->size;
  request.checksum = digest->md5;

  RegistryClient registry(options_.registry_host, options_.registry_port,
                          options_.io_timeout, logger_.get());
  auto registered = registry.register_checksum(request);
  switch(registered.status) {
    case RegistryStatus::Ok:
      break;
    case RegistryStatus::Unreachable:
      result.status = SendStatus::RegistryUnreachable;
      result.error = registered.error;
      return result;
    case RegistryStatus::Rejected:
    case RegistryStatus::BadReply:
      result.status = SendStatus::RegistryRejected;
      result.error = registered.error;
      return result;
  }
  logger_->info("Registered checksum {} for '{}' (ttl {}s)",
                digest->md5, options_.file_id, request.ttl_seconds);

  return stream_file(std::move(result));
}

SendResult TransferSender::stream_file(SendResult result) const {
  std::ifstream in(options_.file_path, std::ios::binary);
  if(!in) {
    result.status = SendStatus::FileError;
    result.error = "cannot reopen " + options_.file_path.string();
    return result;
  }

  Client receiver(options_.io_timeout);
  try {
    receiver.connect(options_.server_host, options_.server_port);
    receiver.write_all(options_.file_id + "\n");

    std::array<char, kTransferBlockSize> block{};
    while(in) {
      in.read(block.data(), block.size());
      auto n = in.gcount();
      if(n <= 0) break;
      receiver.write_all(block.data(), static_cast<std::size_t>(n));
      result.bytes_sent += static_cast<uint64_t>(n);
    }
    if(in.bad()) {
      result.status = SendStatus::FileError;
      result.error = "read error on " + options_.file_path.string();
      return result;
    }
    receiver.shutdown_send();
  } catch(const std::system_error& e) {
    result.status = SendStatus::TransferFailed;
    result.error = e.what();
    return result;
  }

  // The receiver closes once it has its verdict; wait so our bytes are not
  // cut off by an early exit. Its verdict is not sent back.
  try {
    char ignored[64];
    while(receiver.read_some(ignored, sizeof(ignored)) > 0) {}
  } catch(const std::system_error& e) {
    logger_->debug("Receiver did not close cleanly: {}", e.what());
  }

  result.status = SendStatus::Sent;
  logger_->info("File {} transferred successfully with ID {} ({} bytes)",
                options_.file_path.string(), options_.file_id, result.bytes_sent);
  return result;
}
