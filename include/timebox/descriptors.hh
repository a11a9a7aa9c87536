#ifndef LIBTIMEBOX_DESCRIPTORS_HH
#define LIBTIMEBOX_DESCRIPTORS_HH

#include "timebox/error.hh"
#include "timebox/logging.hh"

#include <errno.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <chrono>
#include <limits>
#include <algorithm>
#include <utility>

namespace timebox {

//! \file
//! minimal fd wrappers used for the worker reply channel

//! base class for other file descriptors
//
//! movable, but not copyable
//! close is called in destructor
struct fd_base {
    //! the file descriptor
    int fd;

    //! \param fd_ the file descriptor
    fd_base(int fd_=-1) : fd(fd_) {}

    fd_base(const fd_base &) = delete;
    fd_base &operator =(const fd_base &) = delete;

    fd_base(fd_base &&other) {
        fd = other.fd;
        other.fd = -1;
    }
    fd_base &operator = (fd_base &&other) {
        if (this != &other) {
            if (valid()) close();
            std::swap(fd, other.fd);
        }
        return *this;
    }

    //! true if fd != -1
    bool valid() const { return fd != -1; }

    //! read from fd
    ssize_t read(void *buf, size_t count) noexcept __attribute__((warn_unused_result)) {
        return ::read(fd, buf, count);
    }

    //! write the whole buffer, retrying on EINTR and short writes
    //! \return false if the write failed, errno is left set
    bool write_all(const void *buf, size_t count) noexcept __attribute__((warn_unused_result)) {
        const char *p = static_cast<const char *>(buf);
        while (count > 0) {
            ssize_t nw = ::write(fd, p, count);
            if (nw == -1) {
                if (errno == EINTR) continue;
                return false;
            }
            p += nw;
            count -= nw;
        }
        return true;
    }

    //! wait for fd to become readable (or hang up)
    //! \param timeout_ms -1 waits forever
    //! \return true if readable, false on timeout or EINTR
    bool wait_readable(int timeout_ms) {
        pollfd pfd{fd, POLLIN, 0};
        int s = ::poll(&pfd, 1, timeout_ms);
        if (s == -1 && errno == EINTR) return false;
        throw_if(s == -1, "poll");
        return s > 0;
    }

    //! attempts to close fd
    void close() noexcept {
        // man 2 close says close can result in EBADF, EIO, and EINTR
        // Linux and any thread-safe OS will not return EINTR, but we check just in case
        if (::close(fd) == -1) {
            if (errno == EINTR) {
                saved_backtrace bt;
                LOG(DFATAL) << "close() failed with EINTR; This Should Never Happen\n" << bt.str();
            }
        }
        fd = -1;
    }

    //! attempts to close fd if it is valid
    ~fd_base() {
        if (valid()) close();
    }
};

//! pipe_fd is a pair of unidirectional file descriptors
struct pipe_fd {
    //! read end of the pipe
    fd_base r;
    //! write end of the pipe
    fd_base w;

    //! create a pair of unidirectional file descriptors with
    //! pipe2() that can be used for interprocess communication
    //! \param flags can be 0, or ORed O_NONBLOCK, O_CLOEXEC
    pipe_fd(int flags=0) {
        int fds[2];
        throw_if(pipe2(fds, flags | O_CLOEXEC) == -1, "pipe2");
        r.fd = fds[0];
        w.fd = fds[1];
    }
};

//! poll timeout in milliseconds for a remaining duration, rounded up
//! so a wait never returns before the deadline
template <class Rep, class Period>
inline int poll_timeout(std::chrono::duration<Rep, Period> d) {
    using namespace std::chrono;
    if (d <= d.zero()) return 0;
    auto ms = duration_cast<milliseconds>(d);
    if (ms < d) ++ms;
    const auto cap = milliseconds(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(ms, cap).count());
}

} // end namespace timebox

#endif // LIBTIMEBOX_DESCRIPTORS_HH
