#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include "StatsDClient.hpp"

using boost::asio::ip::udp;

StatsDClient::StatsDClient(
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address,
    std::size_t batch_size,
    std::chrono::milliseconds send_interval)
    : logger_(logger),
    batch_size_(batch_size),
    send_interval_(send_interval.count() > 0 ? send_interval : std::chrono::milliseconds(1)),
    socket_(io_context_),
    flush_timer_(io_context_),
    work_(boost::asio::make_work_guard(io_context_)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }
    std::string port = statsd_address.substr(colon_pos + 1);

    boost::system::error_code ec;
    udp::resolver resolver(io_context_);
    auto results = resolver.resolve(udp::v4(), host, port, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Failed to resolve STATSD_SERVER " + statsd_address + ": " + ec.message());
    }
    endpoint_ = results.begin()->endpoint();

    socket_.open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD UDP socket: " + ec.message());
    }

    if (batch_size_ > 0) {
        scheduleFlush();
        flush_thread_ = std::thread([this]() { io_context_.run(); });
    }
    logger_->setup("StatsDClient sending to " + endpoint_.address().to_string() + ":" +
                   std::to_string(endpoint_.port()) + " (batch size " + std::to_string(batch_size_) + ")");
}

StatsDClient::~StatsDClient() {
    io_context_.stop();
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }
    flush();
    boost::system::error_code ec;
    socket_.close(ec);
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::send(const std::string& message) {
    if (batch_size_ == 0) {
        sendDatagram(message);
        return;
    }
    std::lock_guard<std::mutex> lock(batch_mutex_);
    if (batches_.empty() || batches_.back().size() + 1 + message.size() > batch_size_) {
        batches_.push_back(message);
    } else {
        batches_.back().append("\n").append(message);
    }
}

void StatsDClient::sendDatagram(const std::string& datagram) {
    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        socket_.send_to(boost::asio::buffer(datagram), endpoint_, 0, ec);
    }
    if (ec) {
        logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
    }
}

void StatsDClient::scheduleFlush() {
    flush_timer_.expires_after(send_interval_);
    flush_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        flush();
        scheduleFlush();
    });
}

void StatsDClient::flush() {
    std::deque<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        pending.swap(batches_);
    }
    for (const auto& datagram : pending) {
        sendDatagram(datagram);
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}
