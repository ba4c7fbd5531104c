#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Sends StatsD lines over UDP.
// With batch_size 0 every metric is its own datagram, sent immediately. Otherwise
// lines are joined with '\n' into datagrams of at most batch_size bytes and
// flushed every send_interval by a background thread, and once more on destruction.
class StatsDClient : public IStatsDClient {
public:
    // stats_server_endpoint is "<host>:<port>". Throws std::runtime_error if it cannot be parsed or resolved.
    StatsDClient(std::shared_ptr<ILogger> logger,
                 const std::string& stats_server_endpoint,
                 std::size_t batch_size = 0,
                 std::chrono::milliseconds send_interval = std::chrono::milliseconds(1000));
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    void send(const std::string& message);
    void sendDatagram(const std::string& datagram);
    void scheduleFlush();
    void flush();

    std::shared_ptr<ILogger> logger_;
    const std::size_t batch_size_;
    const std::chrono::milliseconds send_interval_;

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint endpoint_;
    std::mutex socket_mutex_;

    std::deque<std::string> batches_;
    std::mutex batch_mutex_;

    boost::asio::steady_timer flush_timer_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread flush_thread_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
