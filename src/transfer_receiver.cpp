#include "transfer_receiver.hpp"

#include <csignal>

#include "connection.hpp"
#include "registry_client.hpp"

std::optional<std::filesystem::path> resolve_output_path(const std::filesystem::path& out_path,
                                                         const std::string& file_id,
                                                         const std::string& expected_file_id) {
  if(!expected_file_id.empty() && file_id != expected_file_id) return std::nullopt;

  std::error_code ec;
  if(!std::filesystem::is_directory(out_path, ec)) {
    return out_path;
  }
  if(file_id == "." || file_id.find("..") != std::string::npos) return std::nullopt;
  if(file_id.find_first_of("/\\") != std::string::npos) return std::nullopt;
  return out_path / file_id;
}

TransferReceiver::TransferReceiver(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("netcopy-receiver")) {
  if(options_.verify_threads == 0) options_.verify_threads = 1;
}

TransferReceiver::~TransferReceiver() {
  stop();
}

void TransferReceiver::set_verdict_callback(VerdictCallback callback) {
  std::lock_guard<std::mutex> lock(report_mutex_);
  callback_ = std::move(callback);
}

void TransferReceiver::start() {
  if(started_) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();

  verify_pool_ = std::make_unique<asio::thread_pool>(options_.verify_threads);
  started_ = true;

  logger_->info("Receiver listening on {}:{}, verifying against {}:{}",
                options_.listen_ip, listen_port_,
                options_.registry_host, options_.registry_port);

  do_accept();

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      logger_->info("Signal {} received, shutting down", signo);
      io_.stop();
    });
  }
}

void TransferReceiver::do_accept() {
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(!started_) return;
      if(ec) {
        logger_->error("Accept error: {}", ec.message());
      } else {
        TransferConnection::Hooks hooks;
        hooks.resolve_output = [this](const std::string& file_id){
          return resolve_output_path(options_.out_path, file_id, options_.expected_file_id);
        };
        hooks.verify = [this](std::shared_ptr<TransferConnection> conn){
          verify(std::move(conn));
        };
        hooks.abandoned = [this](const TransferConnection&, const std::string&){
          abandoned_++;
        };
        hooks.finished = [this](const TransferConnection&){
          // Once mode ends after the first verdicted connection has closed.
          if(options_.once) io_.stop();
        };
        TransferConnection::create_incoming(std::move(socket), options_.io_timeout,
                                            std::move(hooks), logger_)->start();
      }
      do_accept();
    });
}

void TransferReceiver::verify(std::shared_ptr<TransferConnection> conn) {
  asio::post(*verify_pool_, [this, conn](){
    TransferReport rep;
    rep.file_id = conn->file_id();
    rep.output_path = conn->output_path();
    rep.bytes_received = conn->bytes_received();
    rep.local_md5 = conn->local_md5();

    RegistryClient registry(options_.registry_host, options_.registry_port,
                            options_.registry_timeout, logger_.get());
    classify_transfer(rep, registry.query(rep.file_id));

    report(rep);
    conn->finish(rep.verdict);
  });
}

void TransferReceiver::report(const TransferReport& rep) {
  logger_->print("{}", verdict_label(rep.verdict));
  if(rep.verdict == Verdict::Ok) {
    logger_->info("'{}': {} bytes -> {} ({})", rep.file_id, rep.bytes_received,
                  rep.output_path.string(), rep.detail);
  } else {
    logger_->warn("'{}': {} bytes -> {} ({})", rep.file_id, rep.bytes_received,
                  rep.output_path.string(), rep.detail);
  }

  VerdictCallback callback;
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(report_mutex_);
    if(!first_report_) {
      first_report_ = rep;
      first = true;
    }
    callback = callback_;
  }
  verdicts_++;
  if(callback) callback(rep);
  if(first && options_.once) {
    logger_->debug("Once mode: stopping after '{}' closes", rep.file_id);
  }
}

void TransferReceiver::run() {
  if(!started_) start();
  io_.run();
}

void TransferReceiver::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void TransferReceiver::stop() {
  if(!started_.exchange(false)) return;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(verify_pool_) {
    verify_pool_->join();
    verify_pool_.reset();
  }

  std::error_code ignored;
  if(signals_) signals_->cancel(ignored);
  if(acceptor_) acceptor_->close(ignored);
  signals_.reset();
  acceptor_.reset();
  io_.restart();
}

TransferReceiver::Stats TransferReceiver::stats() const {
  Stats s;
  s.verdicts = verdicts_.load();
  s.abandoned = abandoned_.load();
  return s;
}

std::optional<TransferReport> TransferReceiver::first_report() const {
  std::lock_guard<std::mutex> lock(report_mutex_);
  return first_report_;
}
