#include "server.hpp"
#include "protocol.hpp"

#include <csignal>
#include <istream>
#include <variant>

namespace {

using tcp = asio::ip::tcp;

std::string describe_peer(const tcp::socket& sock){
    std::error_code ec;
    auto ep = sock.remote_endpoint(ec);
    if(ec) return "<unknown>";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// One request per connection: read a line, answer, close. Runs on its own
// strand, so the deadline and the read never race.
class RegistrySession : public std::enable_shared_from_this<RegistrySession> {
public:
    RegistrySession(tcp::socket sock,
                    std::shared_ptr<ChecksumStore> store,
                    std::chrono::milliseconds timeout,
                    std::shared_ptr<Logger> logger)
    : socket_(std::move(sock)),
      deadline_(socket_.get_executor()),
      request_(kMaxRequestLine),
      store_(std::move(store)),
      timeout_(timeout),
      logger_(std::move(logger)),
      peer_(describe_peer(socket_))
    {
    }

    void start(){
        arm_deadline();
        auto self = shared_from_this();
        asio::async_read_until(socket_, request_, '\n',
            [this, self](std::error_code ec, std::size_t){
                on_request(ec);
            });
    }

private:
    void arm_deadline(){
        deadline_.expires_after(timeout_);
        auto self = shared_from_this();
        deadline_.async_wait([this, self](const std::error_code& ec){
            if(ec || closed_) return;
            log_warn(logger_.get(), "Registry client {} timed out", peer_);
            close();
        });
    }

    void on_request(const std::error_code& ec){
        if(closed_) return;
        std::string line;
        if(!ec){
            std::istream is(&request_);
            std::getline(is, line);
        } else if(ec == asio::error::eof && request_.size() > 0){
            // Request ended by half-close instead of a newline.
            line.assign(asio::buffers_begin(request_.data()), asio::buffers_end(request_.data()));
        } else if(ec == asio::error::not_found){
            log_warn(logger_.get(), "Request from {} exceeds {} bytes", peer_, kMaxRequestLine);
            respond(std::string(kReplyErr));
            return;
        } else {
            log_debug(logger_.get(), "Registry client {} left without a request: {}", peer_, ec.message());
            close();
            return;
        }
        respond(handle_registry_line(*store_, line, logger_.get()));
    }

    void respond(std::string reply){
        response_ = std::move(reply);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(response_),
            [this, self](std::error_code ec, std::size_t){
                if(ec && !closed_){
                    log_warn(logger_.get(), "Reply to {} failed: {}", peer_, ec.message());
                }
                close();
            });
    }

    void close(){
        if(closed_) return;
        closed_ = true;
        deadline_.cancel();
        std::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    tcp::socket socket_;
    asio::steady_timer deadline_;
    asio::streambuf request_;
    std::string response_;
    std::shared_ptr<ChecksumStore> store_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Logger> logger_;
    std::string peer_;
    bool closed_ = false;
};

} // namespace

std::string handle_registry_line(ChecksumStore& store, std::string_view line, Logger* logger){
    std::string error;
    auto request = parse_registry_request(line, &error);
    if(!request){
        log_warn(logger, "Rejected request '{}': {}", line, error);
        return std::string(kReplyErr);
    }

    if(const auto* reg = std::get_if<RegisterRequest>(&*request)){
        store.register_checksum(reg->file_id,
                                std::chrono::seconds(reg->ttl_seconds),
                                reg->length,
                                reg->checksum);
        log_info(logger, "Stored checksum for {} ({} bytes, ttl {}s)",
                 reg->file_id, reg->length, reg->ttl_seconds);
        return std::string(kReplyOk);
    }

    const auto& query = std::get<QueryRequest>(*request);
    QueryReply reply;
    if(auto record = store.lookup(query.file_id)){
        reply.found = true;
        reply.length = record->length;
        reply.checksum = record->checksum;
        log_info(logger, "Served checksum for {}", query.file_id);
    } else {
        log_info(logger, "No live checksum for {}", query.file_id);
    }
    return make_query_reply(reply);
}

RegistryServer::RegistryServer(std::shared_ptr<ChecksumStore> store,
                               Options options,
                               std::shared_ptr<Logger> logger)
: options_(std::move(options)),
  store_(store ? std::move(store) : std::make_shared<ChecksumStore>()),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("checksum-registry"))
{
    if(options_.io_threads == 0) options_.io_threads = 1;
}

RegistryServer::~RegistryServer(){
    stop();
}

void RegistryServer::start(){
    if(started_) return;

    auto address = asio::ip::make_address(options_.listen_ip);
    tcp::endpoint endpoint(address, options_.listen_port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();
    started_ = true;

    logger_->info("Checksum registry listening on {}:{}", options_.listen_ip, listen_port_);

    do_accept();

    if(options_.sweep_interval.count() > 0){
        sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
        schedule_sweep();
    }

    if(options_.handle_signals){
        signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
        signals_->async_wait([this](const std::error_code& ec, int signo){
            if(ec) return;
            logger_->info("Signal {} received, shutting down", signo);
            io_.stop();
        });
    }
}

void RegistryServer::do_accept(){
    acceptor_->async_accept(asio::make_strand(io_),
        [this](std::error_code ec, tcp::socket sock){
            if(!started_) return;
            if(ec){
                logger_->error("Accept failed: {}", ec.message());
            } else {
                logger_->debug("Accepted connection from {}", describe_peer(sock));
                std::make_shared<RegistrySession>(std::move(sock), store_,
                                                  options_.io_timeout, logger_)->start();
            }
            do_accept();
        });
}

void RegistryServer::schedule_sweep(){
    sweep_timer_->expires_after(options_.sweep_interval);
    sweep_timer_->async_wait([this](const std::error_code& ec){
        if(ec || !started_) return;
        auto removed = store_->sweep_expired();
        if(removed > 0){
            logger_->debug("Swept {} expired checksum(s)", removed);
        }
        schedule_sweep();
    });
}

void RegistryServer::run(){
    if(!started_) start();
    for(std::size_t i = 1; i < options_.io_threads; ++i){
        threads_.emplace_back([this](){ io_.run(); });
    }
    io_.run();
}

void RegistryServer::start_background(){
    if(!started_) start();
    if(!threads_.empty()) return;
    for(std::size_t i = 0; i < options_.io_threads; ++i){
        threads_.emplace_back([this](){ io_.run(); });
    }
}

void RegistryServer::stop(){
    if(!started_.exchange(false)) return;

    io_.stop();
    for(auto& t : threads_){
        if(t.joinable()) t.join();
    }
    threads_.clear();

    std::error_code ignored;
    if(signals_) signals_->cancel(ignored);
    if(sweep_timer_) sweep_timer_->cancel();
    if(acceptor_) acceptor_->close(ignored);
    signals_.reset();
    sweep_timer_.reset();
    acceptor_.reset();
    io_.restart();
}
