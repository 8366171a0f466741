#include "registry_client.hpp"
#include "client.hpp"
#include "log.hpp"

#include <system_error>

const char* registry_status_name(RegistryStatus status){
    switch(status){
        case RegistryStatus::Ok:          return "ok";
        case RegistryStatus::Rejected:    return "rejected";
        case RegistryStatus::Unreachable: return "unreachable";
        case RegistryStatus::BadReply:    return "bad reply";
    }
    return "unknown";
}

RegistryClient::RegistryClient(std::string host,
                               unsigned short port,
                               std::chrono::milliseconds timeout,
                               Logger* logger)
: host_(std::move(host)), port_(port), timeout_(timeout), logger_(logger)
{
}

std::string RegistryClient::exchange(const std::string& request) const {
    Client client(timeout_);
    client.connect(host_, port_);
    client.write_all(request);
    // Tolerate a registry that only answers on half-close.
    client.shutdown_send();
    return client.read_to_eof(kMaxRequestLine);
}

RegisterResult RegistryClient::register_checksum(const RegisterRequest& request) const {
    RegisterResult result;
    std::string reply;
    try {
        reply = exchange(make_register_request(request));
    } catch(const std::system_error& e) {
        result.status = RegistryStatus::Unreachable;
        result.error = e.what();
        log_warn(logger_, "Registry {}:{} unreachable for BE {}: {}", host_, port_, request.file_id, e.what());
        return result;
    }

    reply = trim_line_ending(std::move(reply));
    if(reply == kReplyOk){
        result.status = RegistryStatus::Ok;
    } else if(reply == kReplyErr){
        result.status = RegistryStatus::Rejected;
        result.error = "registry rejected the request";
    } else {
        result.status = RegistryStatus::BadReply;
        result.error = "unexpected reply '" + reply + "'";
    }
    log_debug(logger_, "BE {} -> {}", request.file_id, reply);
    return result;
}

QueryResult RegistryClient::query(const std::string& file_id) const {
    QueryResult result;
    std::string reply;
    try {
        reply = exchange(make_query_request(file_id));
    } catch(const std::system_error& e) {
        result.status = RegistryStatus::Unreachable;
        result.error = e.what();
        log_warn(logger_, "Registry {}:{} unreachable for KI {}: {}", host_, port_, file_id, e.what());
        return result;
    }

    reply = trim_line_ending(std::move(reply));
    log_debug(logger_, "KI {} -> {}", file_id, reply);
    if(reply == kReplyErr){
        result.status = RegistryStatus::Rejected;
        result.error = "registry rejected the request";
        return result;
    }
    auto parsed = parse_query_reply(reply);
    if(!parsed){
        result.status = RegistryStatus::BadReply;
        result.error = "unexpected reply '" + reply + "'";
        return result;
    }
    result.status = RegistryStatus::Ok;
    result.reply = std::move(*parsed);
    return result;
}
