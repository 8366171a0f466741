#include "checksum.hpp"
#include "protocol.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string md5_hex(std::string_view data){
    Md5Accumulator acc;
    acc.update(data.data(), data.size());
    return acc.hex_digest();
}

bool is_md5_hex(std::string_view text){
    if(text.size() != kMd5HexLength) return false;
    return std::all_of(text.begin(), text.end(),
        [](unsigned char ch){ return std::isxdigit(ch) != 0; });
}

bool digests_equal(std::string_view a, std::string_view b){
    if(a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(),
        [](unsigned char x, unsigned char y){ return std::tolower(x) == std::tolower(y); });
}

void Md5Accumulator::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if(EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest init failed");
    }
}

Md5Accumulator::~Md5Accumulator() = default;

void Md5Accumulator::update(const void* data, std::size_t size){
    if(finished_) throw std::logic_error("MD5 digest already finalized");
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("MD5 digest update failed");
    }
    bytes_ += size;
}

std::string Md5Accumulator::hex_digest(){
    if(finished_) throw std::logic_error("MD5 digest already finalized");
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("MD5 digest final failed");
    }
    finished_ = true;
    return hex_from_bytes(std::vector<unsigned char>(digest, digest + length));
}

std::optional<FileDigest> compute_file_digest(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    Md5Accumulator acc;
    std::array<char, kTransferBlockSize> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0) {
            acc.update(buffer.data(), static_cast<std::size_t>(read));
        }
    }
    if(in.bad()) return std::nullopt;

    FileDigest out;
    out.size = acc.bytes();
    out.md5 = acc.hex_digest();
    return out;
}
