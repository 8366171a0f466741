#include "connection.hpp"

#include <exception>
#include <istream>

const char* connection_state_name(TransferConnection::State state){
    switch(state){
        case TransferConnection::State::AwaitingFileId:      return "awaiting-file-id";
        case TransferConnection::State::Receiving:           return "receiving";
        case TransferConnection::State::Verifying:           return "verifying";
        case TransferConnection::State::Ok:                  return "ok";
        case TransferConnection::State::Corrupted:           return "corrupted";
        case TransferConnection::State::Unverifiable:        return "unverifiable";
        case TransferConnection::State::RegistryUnreachable: return "registry-unreachable";
        case TransferConnection::State::Abandoned:           return "abandoned";
    }
    return "unknown";
}

std::shared_ptr<TransferConnection> TransferConnection::create_incoming(asio::ip::tcp::socket sock,
                                                                       std::chrono::milliseconds idle_timeout,
                                                                       Hooks hooks,
                                                                       std::shared_ptr<Logger> logger)
{
    return std::shared_ptr<TransferConnection>(
        new TransferConnection(std::move(sock), idle_timeout, std::move(hooks), std::move(logger)));
}

TransferConnection::TransferConnection(asio::ip::tcp::socket sock,
                                       std::chrono::milliseconds idle_timeout,
                                       Hooks hooks,
                                       std::shared_ptr<Logger> logger)
: socket_(std::move(sock)),
  deadline_(socket_.get_executor()),
  idle_timeout_(idle_timeout),
  hooks_(std::move(hooks)),
  logger_(std::move(logger)),
  id_buf_(kMaxFileIdLength + 2)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    peer_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
}

TransferConnection::~TransferConnection(){
    close();
}

bool TransferConnection::terminal() const {
    return state_ != State::AwaitingFileId &&
           state_ != State::Receiving &&
           state_ != State::Verifying;
}

void TransferConnection::start(){
    arm_deadline();
    read_file_id();
}

void TransferConnection::arm_deadline(){
    deadline_.expires_after(idle_timeout_);
    auto self = shared_from_this();
    deadline_.async_wait([this, self](const std::error_code& ec){
        if(ec) return;
        if(state_ == State::AwaitingFileId || state_ == State::Receiving){
            abandon("idle for " + std::to_string(idle_timeout_.count()) + "ms");
        }
    });
}

void TransferConnection::read_file_id(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, id_buf_, '\n',
        [this, self](std::error_code ec, std::size_t){
            handle_file_id(ec);
        });
}

void TransferConnection::handle_file_id(const std::error_code& ec){
    if(terminal()) return;
    if(ec == asio::error::not_found){
        abandon("file id line longer than " + std::to_string(kMaxFileIdLength) + " bytes");
        return;
    }
    if(ec){
        abandon("disconnected before file id: " + ec.message());
        return;
    }

    std::string line;
    std::istream is(&id_buf_);
    std::getline(is, line);
    file_id_ = trim_line_ending(std::move(line));

    if(!is_valid_file_id(file_id_)){
        abandon("invalid file id");
        return;
    }
    std::optional<std::filesystem::path> target;
    if(hooks_.resolve_output) target = hooks_.resolve_output(file_id_);
    if(!target){
        abandon("file id '" + file_id_ + "' not accepted");
        return;
    }
    output_path_ = *target;
    out_.open(output_path_, std::ios::binary | std::ios::trunc);
    if(!out_){
        abandon("cannot open " + output_path_.string());
        return;
    }

    state_ = State::Receiving;
    log_info(logger_.get(), "Receiving '{}' from {} into {}", file_id_, peer_, output_path_.string());

    // Payload bytes that arrived together with the id line.
    if(id_buf_.size() > 0){
        std::string head(asio::buffers_begin(id_buf_.data()), asio::buffers_end(id_buf_.data()));
        id_buf_.consume(id_buf_.size());
        if(!consume(head.data(), head.size())) return;
    }
    do_read();
}

void TransferConnection::do_read(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(block_),
        [this, self](std::error_code ec, std::size_t n){
            if(terminal()) return;
            if(n > 0 && !consume(block_.data(), n)) return;
            if(ec == asio::error::eof){
                end_of_stream();
                return;
            }
            if(ec){
                abandon("transfer interrupted: " + ec.message());
                return;
            }
            arm_deadline();
            do_read();
        });
}

bool TransferConnection::consume(const char* data, std::size_t size){
    out_.write(data, static_cast<std::streamsize>(size));
    if(!out_){
        abandon("write to " + output_path_.string() + " failed");
        return false;
    }
    try {
        md5_.update(data, size);
    } catch(const std::exception& e) {
        abandon(std::string("hashing failed: ") + e.what());
        return false;
    }
    bytes_received_ += size;
    return true;
}

void TransferConnection::end_of_stream(){
    out_.close();
    if(out_.fail()){
        abandon("flushing " + output_path_.string() + " failed");
        return;
    }
    try {
        local_md5_ = md5_.hex_digest();
    } catch(const std::exception& e) {
        abandon(std::string("hashing failed: ") + e.what());
        return;
    }
    deadline_.cancel();
    state_ = State::Verifying;
    log_debug(logger_.get(), "'{}' complete: {} bytes, md5 {}", file_id_, bytes_received_, local_md5_);
    if(hooks_.verify){
        hooks_.verify(shared_from_this());
    } else {
        finish(Verdict::RegistryUnreachable);
    }
}

void TransferConnection::finish(Verdict verdict){
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self, verdict](){
        if(state_ != State::Verifying) return;
        switch(verdict){
            case Verdict::Ok:                  state_ = State::Ok; break;
            case Verdict::Corrupted:           state_ = State::Corrupted; break;
            case Verdict::Unverifiable:        state_ = State::Unverifiable; break;
            case Verdict::RegistryUnreachable: state_ = State::RegistryUnreachable; break;
        }
        log_debug(logger_.get(), "'{}' from {} closed as {}", file_id_, peer_, connection_state_name(state_));
        close();
        if(hooks_.finished) hooks_.finished(*this);
    });
}

void TransferConnection::abandon(const std::string& reason){
    if(terminal()) return;
    auto from = state_;
    bool had_output = out_.is_open() || state_ == State::Receiving;
    state_ = State::Abandoned;
    if(out_.is_open()) out_.close();
    if(had_output && !output_path_.empty()){
        std::error_code ec;
        std::filesystem::remove(output_path_, ec);
    }
    log_warn(logger_.get(), "Abandoned transfer from {}{} while {}: {}",
             peer_, file_id_.empty() ? std::string() : " ('" + file_id_ + "')",
             connection_state_name(from), reason);
    close();
    if(hooks_.abandoned) hooks_.abandoned(*this, reason);
}

void TransferConnection::close(){
    deadline_.cancel();
    std::error_code ignored;
    if(socket_.is_open()){
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}
