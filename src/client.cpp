#include "client.hpp"

#include <system_error>

Client::Client(std::chrono::milliseconds timeout)
: socket_(io_), timeout_(timeout)
{
}

Client::~Client(){
    close();
}

void Client::run_until_done(){
    io_.restart();
    io_.run_for(timeout_);
    if(!io_.stopped()){
        // Abort the pending operation and let its handler drain.
        close();
        io_.run();
        throw std::system_error(asio::error::make_error_code(asio::error::timed_out));
    }
}

void Client::connect(const std::string& host, unsigned short port){
    asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host, std::to_string(port));

    std::error_code result = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&result](const std::error_code& ec, const asio::ip::tcp::endpoint&){
            result = ec;
        });
    run_until_done();
    if(result) throw std::system_error(result, "connect " + host + ":" + std::to_string(port));
}

void Client::write_all(const void* data, std::size_t size){
    std::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data, size),
        [&result](const std::error_code& ec, std::size_t){
            result = ec;
        });
    run_until_done();
    if(result) throw std::system_error(result, "write");
}

std::size_t Client::read_some(void* data, std::size_t size){
    std::error_code result = asio::error::would_block;
    std::size_t transferred = 0;
    socket_.async_read_some(asio::buffer(data, size),
        [&result, &transferred](const std::error_code& ec, std::size_t n){
            result = ec;
            transferred = n;
        });
    run_until_done();
    if(result == asio::error::eof) return 0;
    if(result) throw std::system_error(result, "read");
    return transferred;
}

std::string Client::read_to_eof(std::size_t limit){
    std::string out;
    char buf[512];
    for(;;){
        std::size_t n = read_some(buf, sizeof(buf));
        if(n == 0) break;
        out.append(buf, n);
        if(out.size() > limit){
            throw std::system_error(asio::error::make_error_code(asio::error::message_size),
                                    "reply exceeds " + std::to_string(limit) + " bytes");
        }
    }
    return out;
}

void Client::shutdown_send(){
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if(ec) throw std::system_error(ec, "shutdown");
}

void Client::close(){
    std::error_code ignored;
    socket_.close(ignored);
}
