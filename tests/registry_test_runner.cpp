#include "checksum.hpp"
#include "checksum_store.hpp"
#include "protocol.hpp"
#include "server.hpp"
#include "test_runner_utils.hpp"
#include "transfer_receiver.hpp"
#include "verdict.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace netcopy::test;

namespace {

constexpr const char* kHelloMd5 = "5d41402abc4b2a76b9719d911017c592";

// Steady clock that only moves when told to.
struct ManualClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
    std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

  ChecksumStore::Clock fn() const {
    auto shared = now;
    return [shared](){ return *shared; };
  }
  void advance(std::chrono::milliseconds by) { *now += by; }
};

bool test_md5_known_vectors() {
  bool ok = expect_eq(md5_hex("hello"), std::string(kHelloMd5), "md5(hello)");
  ok &= expect_eq(md5_hex(""), std::string("d41d8cd98f00b204e9800998ecf8427e"), "md5(empty)");

  auto data = random_bytes(3 * kTransferBlockSize + 17, 7);
  Md5Accumulator acc;
  for(std::size_t pos = 0; pos < data.size(); pos += 1000) {
    auto n = std::min<std::size_t>(1000, data.size() - pos);
    acc.update(data.data() + pos, n);
  }
  ok &= expect_eq(acc.bytes(), static_cast<uint64_t>(data.size()), "accumulated byte count");
  ok &= expect_eq(acc.hex_digest(), md5_hex(data), "chunked digest equals one-shot digest");
  return ok;
}

// A finished digest refuses more input with an exception.
bool test_md5_misuse_throws() {
  Md5Accumulator acc;
  acc.update("abc", 3);
  acc.hex_digest();
  bool threw = false;
  try { acc.update("d", 1); } catch(const std::exception&) { threw = true; }
  bool ok = expect(threw, "update after digest throws");
  threw = false;
  try { acc.hex_digest(); } catch(const std::exception&) { threw = true; }
  ok &= expect(threw, "second digest throws");
  return ok;
}

bool test_md5_hex_helpers() {
  bool ok = expect(is_md5_hex(kHelloMd5), "lower-case digest accepted");
  ok &= expect(is_md5_hex("5D41402ABC4B2A76B9719D911017C592"), "upper-case digest accepted");
  ok &= expect(!is_md5_hex("5d41402abc4b2a76b9719d911017c59"), "31 digits rejected");
  ok &= expect(!is_md5_hex("zz41402abc4b2a76b9719d911017c592"), "non-hex rejected");
  ok &= expect(digests_equal(kHelloMd5, "5D41402ABC4B2A76B9719D911017C592"), "case-insensitive compare");
  ok &= expect(!digests_equal(kHelloMd5, "d41d8cd98f00b204e9800998ecf8427e"), "different digests differ");
  return ok;
}

bool test_file_digest() {
  TempDir dir("netcopy-digest");
  auto content = random_bytes(10000, 3);
  write_file(dir / "blob", content);
  auto digest = compute_file_digest(dir / "blob");
  bool ok = expect(digest.has_value(), "digest computed");
  if(!ok) return false;
  ok &= expect_eq(digest->size, static_cast<uint64_t>(content.size()), "file size");
  ok &= expect_eq(digest->md5, md5_hex(content), "file md5");
  ok &= expect(!compute_file_digest(dir / "missing").has_value(), "missing file yields nullopt");
  return ok;
}

bool test_parse_register_request() {
  auto req = parse_registry_request(std::string("BE|report|60|11|") + kHelloMd5);
  bool ok = expect(req.has_value(), "BE parsed");
  if(!ok) return false;
  const auto* reg = std::get_if<RegisterRequest>(&*req);
  ok &= expect(reg != nullptr, "BE yields RegisterRequest");
  if(!reg) return false;
  ok &= expect_eq(reg->file_id, std::string("report"), "file id");
  ok &= expect_eq(reg->ttl_seconds, int64_t{60}, "ttl");
  ok &= expect_eq(reg->length, uint64_t{11}, "length");
  ok &= expect_eq(reg->checksum, std::string(kHelloMd5), "checksum");

  auto crlf = parse_registry_request(std::string("KI|report\r"));
  ok &= expect(crlf && std::holds_alternative<QueryRequest>(*crlf), "trailing CR tolerated");
  return ok;
}

bool test_parse_rejects_malformed() {
  const std::vector<std::string> bad = {
    "",
    "BE",
    "BE|report|60|11",
    std::string("BE|report|60|11|") + kHelloMd5 + "|extra",
    std::string("BE|report|sixty|11|") + kHelloMd5,
    std::string("BE|report|-5|11|") + kHelloMd5,
    std::string("BE|report|60|-1|") + kHelloMd5,
    std::string("BE|report|60|11x|") + kHelloMd5,
    "BE|report|60|11|not-a-digest",
    std::string("BE||60|11|") + kHelloMd5,
    "KI",
    "KI|",
    "KI|a|b",
    "XX|report",
    "ki|report"
  };
  bool ok = true;
  for(const auto& line : bad) {
    std::string error;
    ok &= expect(!parse_registry_request(line, &error).has_value(), "rejects '" + line + "'");
    ok &= expect(!error.empty(), "reason given for '" + line + "'");
  }
  return ok;
}

bool test_request_and_reply_formatting() {
  RegisterRequest req;
  req.file_id = "report";
  req.ttl_seconds = 60;
  req.length = 11;
  req.checksum = kHelloMd5;
  bool ok = expect_eq(make_register_request(req),
                      std::string("BE|report|60|11|") + kHelloMd5 + "\n", "BE line");
  ok &= expect_eq(make_query_request("report"), std::string("KI|report\n"), "KI line");

  QueryReply missing;
  ok &= expect_eq(make_query_reply(missing), std::string("0|"), "not-found sentinel");

  auto found = parse_query_reply(std::string("11|") + kHelloMd5);
  ok &= expect(found && found->found && found->length == 11 && found->checksum == kHelloMd5,
               "found reply parsed");
  auto sentinel = parse_query_reply("0|");
  ok &= expect(sentinel && !sentinel->found, "0| parsed as not found");
  auto empty_file = parse_query_reply("0|d41d8cd98f00b204e9800998ecf8427e");
  ok &= expect(empty_file && empty_file->found && empty_file->length == 0,
               "registered empty file is distinct from the sentinel");
  ok &= expect(!parse_query_reply("ERR").has_value(), "ERR is not a query reply");
  ok &= expect(!parse_query_reply("5|").has_value(), "length without checksum rejected");
  ok &= expect(!parse_query_reply("x|abc").has_value(), "garbage rejected");
  return ok;
}

bool test_store_expiry() {
  ManualClock clock;
  ChecksumStore store(clock.fn());
  store.register_checksum("report", std::chrono::seconds(2), 11, kHelloMd5);

  bool ok = expect(store.lookup("report").has_value(), "visible right after register");
  clock.advance(std::chrono::milliseconds(2000));
  ok &= expect(store.lookup("report").has_value(), "visible exactly at expiry");
  clock.advance(std::chrono::milliseconds(1));
  ok &= expect(!store.lookup("report").has_value(), "gone once past expiry");
  ok &= expect_eq(store.size(), std::size_t{0}, "expired record erased on lookup");
  return ok;
}

bool test_store_overwrite() {
  ManualClock clock;
  ChecksumStore store(clock.fn());
  store.register_checksum("report", std::chrono::seconds(1), 11, kHelloMd5);
  store.register_checksum("report", std::chrono::seconds(60), 0, "d41d8cd98f00b204e9800998ecf8427e");
  clock.advance(std::chrono::seconds(5));
  auto rec = store.lookup("report");
  bool ok = expect(rec.has_value(), "second registration's ttl applies");
  if(!ok) return false;
  ok &= expect_eq(rec->checksum, std::string("d41d8cd98f00b204e9800998ecf8427e"), "last write wins");
  ok &= expect_eq(rec->length, uint64_t{0}, "length overwritten");
  ok &= expect(store.lookup("report").has_value(), "reads do not consume the record");
  return ok;
}

bool test_store_sweep() {
  ManualClock clock;
  ChecksumStore store(clock.fn());
  store.register_checksum("short", std::chrono::seconds(1), 1, kHelloMd5);
  store.register_checksum("long", std::chrono::seconds(100), 1, kHelloMd5);
  clock.advance(std::chrono::seconds(2));
  bool ok = expect_eq(store.sweep_expired(), std::size_t{1}, "one record swept");
  ok &= expect_eq(store.size(), std::size_t{1}, "live record kept");
  ok &= expect(store.lookup("long").has_value(), "live record still served");
  return ok;
}

bool test_store_concurrent_registration() {
  ChecksumStore store;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  std::vector<std::thread> threads;
  for(int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, t](){
      for(int i = 0; i < kPerThread; ++i) {
        auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
        store.register_checksum(id, std::chrono::seconds(60), static_cast<uint64_t>(i), md5_hex(id));
        store.lookup("t0-0");
      }
    });
  }
  for(auto& th : threads) th.join();

  bool ok = expect_eq(store.size(), std::size_t{kThreads * kPerThread}, "every id stored");
  for(int t = 0; t < kThreads && ok; ++t) {
    for(int i = 0; i < kPerThread && ok; ++i) {
      auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
      auto rec = store.lookup(id);
      ok &= expect(rec && rec->checksum == md5_hex(id) && rec->length == static_cast<uint64_t>(i),
                   "record intact for " + id);
    }
  }
  return ok;
}

bool test_registry_example_scenario() {
  ChecksumStore store;
  bool ok = expect_eq(handle_registry_line(store, std::string("BE|report|60|11|") + kHelloMd5),
                      std::string("OK"), "register");
  ok &= expect_eq(handle_registry_line(store, "KI|report"),
                  std::string("11|") + kHelloMd5, "query registered id");
  ok &= expect_eq(handle_registry_line(store, "KI|unknown"), std::string("0|"), "query unknown id");
  return ok;
}

bool test_malformed_request_isolation() {
  ChecksumStore store;
  handle_registry_line(store, std::string("BE|report|60|11|") + kHelloMd5);

  bool ok = expect_eq(handle_registry_line(store, "BE|report|60|11"), std::string("ERR"), "short BE");
  ok &= expect_eq(handle_registry_line(store, "BE|report|x|11|d41d8cd98f00b204e9800998ecf8427e"),
                  std::string("ERR"), "bad ttl");
  ok &= expect_eq(handle_registry_line(store, "KI|report|extra"), std::string("ERR"), "long KI");
  ok &= expect_eq(handle_registry_line(store, "HELLO"), std::string("ERR"), "unknown verb");
  ok &= expect_eq(handle_registry_line(store, "KI|report"),
                  std::string("11|") + kHelloMd5, "existing record untouched");
  ok &= expect_eq(store.size(), std::size_t{1}, "no record added");
  return ok;
}

bool test_classify_transfer() {
  TransferReport base;
  base.file_id = "report";
  base.bytes_received = 5;
  base.local_md5 = kHelloMd5;

  QueryResult match;
  match.status = RegistryStatus::Ok;
  match.reply.found = true;
  match.reply.length = 5;
  match.reply.checksum = "5D41402ABC4B2A76B9719D911017C592";
  auto r = base;
  classify_transfer(r, match);
  bool ok = expect(r.verdict == Verdict::Ok, "matching digest is OK");

  auto mismatch = match;
  mismatch.reply.checksum = "d41d8cd98f00b204e9800998ecf8427e";
  r = base;
  classify_transfer(r, mismatch);
  ok &= expect(r.verdict == Verdict::Corrupted, "different digest is CORRUPTED");

  QueryResult missing;
  missing.status = RegistryStatus::Ok;
  r = base;
  classify_transfer(r, missing);
  ok &= expect(r.verdict == Verdict::Unverifiable, "not-found is UNVERIFIABLE, not CORRUPTED");

  for(auto status : {RegistryStatus::Unreachable, RegistryStatus::BadReply, RegistryStatus::Rejected}) {
    QueryResult failed;
    failed.status = status;
    r = base;
    classify_transfer(r, failed);
    ok &= expect(r.verdict == Verdict::RegistryUnreachable,
                 std::string("registry fault '") + registry_status_name(status) + "' is not a corruption verdict");
  }
  ok &= expect_eq(std::string(verdict_label(Verdict::Ok)), std::string("CSUM OK"), "OK label");
  ok &= expect_eq(std::string(verdict_label(Verdict::Corrupted)), std::string("CSUM CORRUPTED"), "CORRUPTED label");
  return ok;
}

bool test_resolve_output_path() {
  TempDir dir("netcopy-resolve");
  bool ok = expect(resolve_output_path(dir.path(), "report") == dir / "report", "directory target");
  ok &= expect(!resolve_output_path(dir.path(), "../escape"), "path separators rejected");
  ok &= expect(!resolve_output_path(dir.path(), ".."), "dot-dot rejected");
  ok &= expect(!resolve_output_path(dir.path(), "a..b"), "embedded dot-dot rejected");
  ok &= expect(!resolve_output_path(dir.path(), "."), "dot rejected");
  ok &= expect(resolve_output_path(dir.path(), "report.v2.txt") == dir / "report.v2.txt",
               "single dots allowed");
  ok &= expect(!resolve_output_path(dir.path(), "report", "other"), "unexpected id rejected");
  ok &= expect(resolve_output_path(dir / "out.bin", "any/thing") == dir / "out.bin",
               "file target used as is");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"md5_known_vectors", test_md5_known_vectors},
    {"md5_misuse_throws", test_md5_misuse_throws},
    {"md5_hex_helpers", test_md5_hex_helpers},
    {"file_digest", test_file_digest},
    {"parse_register_request", test_parse_register_request},
    {"parse_rejects_malformed", test_parse_rejects_malformed},
    {"request_and_reply_formatting", test_request_and_reply_formatting},
    {"store_expiry", test_store_expiry},
    {"store_overwrite", test_store_overwrite},
    {"store_sweep", test_store_sweep},
    {"store_concurrent_registration", test_store_concurrent_registration},
    {"registry_example_scenario", test_registry_example_scenario},
    {"malformed_request_isolation", test_malformed_request_isolation},
    {"classify_transfer", test_classify_transfer},
    {"resolve_output_path", test_resolve_output_path}
  };
  return run_test_cases("registry", tests, argc, argv);
}
