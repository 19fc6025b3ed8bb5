#pragma once

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <utility>

namespace wasmtask::internal {

    // owning file descriptor, closed on destruction
    class unique_fd {
      public:
        unique_fd() = default;
        explicit unique_fd(int fd) : fd_{fd} {}
        ~unique_fd() { reset(); }

        unique_fd(const unique_fd&) = delete;
        unique_fd& operator=(const unique_fd&) = delete;

        unique_fd(unique_fd&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
        unique_fd& operator=(unique_fd&& other) noexcept {
            if (this != &other) {
                reset(std::exchange(other.fd_, -1));
            }
            return *this;
        }

        int get() const { return fd_; }
        explicit operator bool() const { return fd_ >= 0; }

        int release() { return std::exchange(fd_, -1); }

        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

      private:
        int fd_{-1};
    };

    struct pipe_fds {
        unique_fd read{};
        unique_fd write{};
    };

    // both ends close-on-exec; returns false and sets errno on failure
    inline bool make_pipe(pipe_fds& out) {
        int fds[2]{};
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        out.read.reset(fds[0]);
        out.write.reset(fds[1]);
        return true;
    }

}  // namespace wasmtask::internal
