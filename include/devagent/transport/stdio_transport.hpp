#pragma once
#include "transport.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace devagent {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Uses a background reader thread and a write queue drained by a writer thread.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport over the given descriptors (for testing). Takes
    /// ownership of both and closes them on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void on_message(MessageCallback cb) override;
    void on_error(ErrorCallback cb) override;
    void on_close(CloseCallback cb) override;

    void start() override;
    void send(const JsonRpcResponse& msg) override;
    void stop() override;
    bool is_ready() const override;

private:
    void read_loop();
    void write_loop();
    void process_line(std::string line);
    void report_error(std::exception_ptr ep);
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::mutex callback_mutex_;
    MessageCallback on_message_;
    ErrorCallback on_error_;
    CloseCallback on_close_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::mutex lifecycle_mutex_;
    std::thread reader_thread_;
    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writer_done_{false};

    int wakeup_pipe_[2]{-1, -1};  // self-pipe for interrupting poll() in the reader
};

} // namespace devagent
