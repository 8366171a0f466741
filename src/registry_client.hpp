#pragma once
#include <chrono>
#include <string>

#include "protocol.hpp"

class Logger;

enum class RegistryStatus {
  Ok,           // OK to BE, or a well-formed reply to KI (found or not)
  Rejected,     // registry answered ERR
  Unreachable,  // connect/write/read failed or timed out
  BadReply      // registry answered something unparseable
};

const char* registry_status_name(RegistryStatus status);

struct RegisterResult {
  RegistryStatus status = RegistryStatus::Unreachable;
  std::string error;
};

struct QueryResult {
  RegistryStatus status = RegistryStatus::Unreachable;
  QueryReply reply;
  std::string error;
};

// One request per call, each on a fresh connection. Never retries.
class RegistryClient {
public:
  RegistryClient(std::string host,
                 unsigned short port,
                 std::chrono::milliseconds timeout,
                 Logger* logger = nullptr);

  RegisterResult register_checksum(const RegisterRequest& request) const;
  QueryResult query(const std::string& file_id) const;

  const std::string& host() const { return host_; }
  unsigned short port() const { return port_; }

private:
  // Sends one request line and returns everything the registry wrote
  // before closing.
  std::string exchange(const std::string& request) const;

  std::string host_;
  unsigned short port_;
  std::chrono::milliseconds timeout_;
  Logger* logger_;
};
