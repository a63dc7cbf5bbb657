#pragma once

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>

namespace platform {

/**
 * @brief Non-blocking line reader for a file descriptor (stdin by default)
 *
 * Meant to be polled from the audio loop: pollAndRead() never waits, and
 * hands every complete line to the callback.
 */
class ConsoleLineIn {
public:
    explicit ConsoleLineIn(int fd = STDIN_FILENO)
        : fd_(fd) {}

    /**
     * @brief Drain pending input without blocking
     * @return Number of complete lines delivered
     */
    template<typename Callback>
    size_t pollAndRead(Callback callback) {
        size_t lines = 0;
        while (!closed_) {
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = poll(&pfd, 1, 0);
            if (ready < 0) {
                if (errno == EINTR) {
                    break;
                }
                throw std::runtime_error(std::string("Console poll failed: ") + strerror(errno));
            }
            if (ready == 0) {
                break;
            }

            char buffer[256];
            ssize_t bytesRead = read(fd_, buffer, sizeof(buffer));
            if (bytesRead <= 0) {
                // End of input
                closed_ = true;
                break;
            }

            for (ssize_t i = 0; i < bytesRead; ++i) {
                if (buffer[i] == '\n') {
                    callback(pending_);
                    pending_.clear();
                    ++lines;
                } else if (buffer[i] != '\r') {
                    pending_ += buffer[i];
                }
            }
        }
        return lines;
    }

    bool isClosed() const { return closed_; }

private:
    int fd_;
    bool closed_ = false;
    std::string pending_;
};

} // namespace platform
