#include "devagent/transport/stdio_transport.hpp"
#include "devagent/codec.hpp"
#include "devagent/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace devagent {

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    stop();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::on_message(MessageCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_message_ = std::move(cb);
}

void StdioTransport::on_error(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_error_ = std::move(cb);
}

void StdioTransport::on_close(CloseCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_close_ = std::move(cb);
}

void StdioTransport::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    // start() after stop() is a no-op, as is a second start().
    if (stop_requested_.load() || started_.load()) return;

    if (::pipe(wakeup_pipe_) < 0) {
        wakeup_pipe_[0] = wakeup_pipe_[1] = -1;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    started_ = true;
    running_ = true;
    writer_thread_ = std::thread([this]() { write_loop(); });
    reader_thread_ = std::thread([this]() { read_loop(); });
}

void StdioTransport::read_loop() {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // poll() on the input and the self-pipe so that stop() can interrupt
        // a blocking read.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report_error(std::make_exception_ptr(
                TransportError(std::string("poll failed: ") + std::strerror(errno))));
            break;
        }

        if (fds[1].revents & POLLIN) return;  // stop() was called

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) return;
            report_error(std::make_exception_ptr(
                TransportError(std::string("Read error: ") + std::strerror(errno))));
            break;
        }
        if (n == 0) {
            // EOF. A final line without a trailing newline still counts.
            if (!buffer.empty()) {
                process_line(std::move(buffer));
                buffer.clear();
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            process_line(buffer.substr(pos, nl - pos));
            pos = nl + 1;
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }

    // Input closed. The writer keeps draining until stop().
    running_ = false;
    CloseCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_close_;
    }
    if (cb) cb();
}

void StdioTransport::process_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) return;

    MessageCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_message_;
    }

    try {
        auto msg = Codec::parse(line);
        if (cb) cb(std::move(msg));
    } catch (const std::exception&) {
        report_error(std::current_exception());
    }
}

void StdioTransport::report_error(std::exception_ptr ep) {
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_error_;
    }
    if (cb) cb(ep);
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || writer_done_;
            });

            if (write_queue_.empty()) break;  // writer_done_ and drained
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                report_error(std::make_exception_ptr(
                    TransportError(std::string("Write error: ") + std::strerror(errno))));
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcResponse& msg) {
    if (stop_requested_.load()) {
        report_error(std::make_exception_ptr(TransportError("Transport stopped")));
        return;
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        [[maybe_unused]] ssize_t r = ::write(wakeup_pipe_[1], &b, 1);
    }
}

void StdioTransport::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_requested_ = true;
    running_ = false;
    wake_reader();
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        writer_done_ = true;
    }
    write_cv_.notify_all();

    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    if (writer_thread_.joinable()) writer_thread_.join();
}

bool StdioTransport::is_ready() const {
    return running_;
}

} // namespace devagent
