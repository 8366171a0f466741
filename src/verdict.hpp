#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "registry_client.hpp"

// Terminal outcome of one transfer that reached end-of-stream.
enum class Verdict {
  Ok,                  // registry checksum matches the received bytes
  Corrupted,           // registry checksum differs
  Unverifiable,        // registry has no live checksum (never registered or expired)
  RegistryUnreachable  // the registry could not be asked, or answered garbage
};

// "CSUM OK", "CSUM CORRUPTED", "CSUM UNVERIFIABLE", "REGISTRY UNREACHABLE".
const char* verdict_label(Verdict verdict);

struct TransferReport {
  std::string file_id;
  std::filesystem::path output_path;
  uint64_t bytes_received = 0;
  std::string local_md5;
  std::string expected_md5;      // empty unless the registry had a record
  uint64_t expected_length = 0;
  Verdict verdict = Verdict::RegistryUnreachable;
  std::string detail;
};

// Fills verdict, expected_* and detail of `report` from the registry answer.
void classify_transfer(TransferReport& report, const QueryResult& query);
