#include "protocol.hpp"
#include "checksum.hpp"

#include <cctype>
#include <charconv>
#include <vector>

namespace {

std::vector<std::string_view> split_fields(std::string_view line){
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while(true) {
        auto pos = line.find(kFieldSeparator, start);
        if(pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

template<typename Int>
bool parse_integer(std::string_view text, Int& out){
    if(text.empty()) return false;
    auto first = text.data();
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool fail(std::string* error, const char* reason){
    if(error) *error = reason;
    return false;
}

} // namespace

bool is_valid_file_id(std::string_view file_id){
    if(file_id.empty() || file_id.size() > kMaxFileIdLength) return false;
    for(unsigned char ch : file_id) {
        if(ch == static_cast<unsigned char>(kFieldSeparator)) return false;
        if(std::iscntrl(ch)) return false;
    }
    return true;
}

std::string trim_line_ending(std::string line){
    while(!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    return line;
}

std::optional<RegistryRequest> parse_registry_request(std::string_view line, std::string* error){
    if(!line.empty() && line.back() == '\r') line.remove_suffix(1);
    auto fields = split_fields(line);
    const auto verb = fields.front();

    if(verb == kRegisterVerb) {
        if(fields.size() != 5) {
            fail(error, "BE expects 5 fields");
            return std::nullopt;
        }
        RegisterRequest req;
        req.file_id = std::string(fields[1]);
        if(!is_valid_file_id(req.file_id)) {
            fail(error, "invalid file id");
            return std::nullopt;
        }
        if(!parse_integer(fields[2], req.ttl_seconds) ||
           req.ttl_seconds < 0 || req.ttl_seconds > kMaxChecksumTtl) {
            fail(error, "invalid expiry");
            return std::nullopt;
        }
        if(!parse_integer(fields[3], req.length)) {
            fail(error, "invalid length");
            return std::nullopt;
        }
        if(!is_md5_hex(fields[4])) {
            fail(error, "checksum is not 32 hex digits");
            return std::nullopt;
        }
        req.checksum = std::string(fields[4]);
        return RegistryRequest{std::move(req)};
    }

    if(verb == kQueryVerb) {
        if(fields.size() != 2) {
            fail(error, "KI expects 2 fields");
            return std::nullopt;
        }
        QueryRequest req;
        req.file_id = std::string(fields[1]);
        if(!is_valid_file_id(req.file_id)) {
            fail(error, "invalid file id");
            return std::nullopt;
        }
        return RegistryRequest{std::move(req)};
    }

    fail(error, "unknown command");
    return std::nullopt;
}

std::string make_register_request(const RegisterRequest& request){
    std::string out(kRegisterVerb);
    out += kFieldSeparator;
    out += request.file_id;
    out += kFieldSeparator;
    out += std::to_string(request.ttl_seconds);
    out += kFieldSeparator;
    out += std::to_string(request.length);
    out += kFieldSeparator;
    out += request.checksum;
    out += '\n';
    return out;
}

std::string make_query_request(const std::string& file_id){
    std::string out(kQueryVerb);
    out += kFieldSeparator;
    out += file_id;
    out += '\n';
    return out;
}

std::string make_query_reply(const QueryReply& reply){
    if(!reply.found) return std::string(kReplyNotFound);
    return std::to_string(reply.length) + kFieldSeparator + reply.checksum;
}

std::optional<QueryReply> parse_query_reply(std::string_view reply){
    while(!reply.empty() && (reply.back() == '\n' || reply.back() == '\r')) {
        reply.remove_suffix(1);
    }
    auto pos = reply.find(kFieldSeparator);
    if(pos == std::string_view::npos) return std::nullopt;

    QueryReply out;
    if(!parse_integer(reply.substr(0, pos), out.length)) return std::nullopt;
    auto checksum = reply.substr(pos + 1);
    if(checksum.empty()) {
        // 0| is the only legal empty form.
        if(out.length != 0) return std::nullopt;
        out.found = false;
        return out;
    }
    if(!is_md5_hex(checksum)) return std::nullopt;
    out.found = true;
    out.checksum = std::string(checksum);
    return out;
}
