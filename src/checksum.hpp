#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string md5_hex(std::string_view data);

// True for exactly 32 hex digits, either case.
bool is_md5_hex(std::string_view text);

// Case-insensitive comparison of two hex digests.
bool digests_equal(std::string_view a, std::string_view b);

// Incremental MD5 over a byte stream. Not copyable; one per transfer.
class Md5Accumulator {
public:
  Md5Accumulator();
  ~Md5Accumulator();
  Md5Accumulator(const Md5Accumulator&) = delete;
  Md5Accumulator& operator=(const Md5Accumulator&) = delete;

  void update(const void* data, std::size_t size);
  // Finishes the digest. Further updates throw.
  std::string hex_digest();

  uint64_t bytes() const { return bytes_; }

private:
  struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const; };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  uint64_t bytes_ = 0;
  bool finished_ = false;
};

struct FileDigest {
  std::string md5;
  uint64_t size = 0;
};

// Reads the file in transfer-sized blocks. nullopt if it cannot be read.
std::optional<FileDigest> compute_file_digest(const std::filesystem::path& file);
