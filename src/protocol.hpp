#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// protocol.hpp
inline constexpr std::size_t kTransferBlockSize = 4096;
inline constexpr int kDefaultChecksumTtl = 60;
inline constexpr std::size_t kMd5HexLength = 32;
inline constexpr std::size_t kMaxFileIdLength = 255;
inline constexpr std::size_t kMaxRequestLine = 1024;
inline constexpr int64_t kMaxChecksumTtl = 2147483647;

inline constexpr char kFieldSeparator = '|';
inline constexpr std::string_view kRegisterVerb = "BE";
inline constexpr std::string_view kQueryVerb = "KI";
inline constexpr std::string_view kReplyOk = "OK";
inline constexpr std::string_view kReplyErr = "ERR";
inline constexpr std::string_view kReplyNotFound = "0|";

// BE|file_id|ttl_seconds|length|checksum
struct RegisterRequest {
  std::string file_id;
  int64_t ttl_seconds = kDefaultChecksumTtl;
  uint64_t length = 0;
  std::string checksum;
};

// KI|file_id
struct QueryRequest {
  std::string file_id;
};

using RegistryRequest = std::variant<RegisterRequest, QueryRequest>;

// Reply to KI. `found` is false for the 0| sentinel.
struct QueryReply {
  bool found = false;
  uint64_t length = 0;
  std::string checksum;
};

// Non-empty, bounded, free of the field separator and control characters.
bool is_valid_file_id(std::string_view file_id);

// Parses one request line (without its terminating newline; a trailing \r is
// tolerated). nullopt means the registry must answer ERR; `error` receives
// the reason when given.
std::optional<RegistryRequest> parse_registry_request(std::string_view line,
                                                      std::string* error = nullptr);

std::string make_register_request(const RegisterRequest& request);
std::string make_query_request(const std::string& file_id);

std::string make_query_reply(const QueryReply& reply);
std::optional<QueryReply> parse_query_reply(std::string_view reply);

std::string trim_line_ending(std::string line);
