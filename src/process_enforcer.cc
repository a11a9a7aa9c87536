#include "timebox/process_enforcer.hh"
#include "timebox/descriptors.hh"
#include "interrupt_private.hh"

#include <cstdio>
#include <iostream>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace timebox {

namespace {

// worker exit codes, reported through worker_error
constexpr int worker_exit_ok = 0;
constexpr int worker_exit_orphaned = 120;
constexpr int worker_exit_body_failed = 121;
constexpr int worker_exit_write_failed = 122;

std::string describe_status(int status) {
    std::ostringstream os;
    if (status == -1) {
        os << "could not be waited for";
    } else if (WIFEXITED(status)) {
        os << "exited with status " << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        os << "was killed by signal " << WTERMSIG(status)
            << " (" << strsignal(WTERMSIG(status)) << ")";
    } else {
        os << "stopped with wait status " << status;
    }
    return os.str();
}

//! a forked worker; killed and reaped in the destructor unless reaped already
class worker {
public:
    explicit worker(pid_t pid_) : _pid(pid_) {}

    worker(const worker &) = delete;
    worker &operator =(const worker &) = delete;

    ~worker() {
        if (_pid > 0) {
            kill_and_reap();
        }
    }

    pid_t pid() const { return _pid; }

    //! wait for the worker to exit
    //! \return wait status, or -1 if waitpid failed
    int reap() noexcept {
        int status = 0;
        while (waitpid(_pid, &status, 0) == -1) {
            if (errno != EINTR) {
                PLOG(ERROR) << "waitpid(" << _pid << ") failed";
                status = -1;
                break;
            }
        }
        _pid = -1;
        return status;
    }

    //! SIGKILL the worker, it may be blocked forever, then reap it
    int kill_and_reap() noexcept {
        if (::kill(_pid, SIGKILL) == -1) {
            PLOG(ERROR) << "kill(" << _pid << ", SIGKILL) failed";
        }
        return reap();
    }

private:
    pid_t _pid;
};

void flush_output() {
    std::cout.flush();
    std::cerr.flush();
    fflush(nullptr);
}

//! runs in the child, never returns
void worker_main(const process_enforcer::worker_body &body, fd_base &reply, pid_t parent)
    __attribute__((noreturn));

void worker_main(const process_enforcer::worker_body &body, fd_base &reply, pid_t parent) {
    // go down with the caller; covers a parent that died before prctl
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (getppid() != parent) {
        _exit(worker_exit_orphaned);
    }
    // the caller's interrupt state doesn't apply here
    interrupt_impl::reset();

    std::string bytes;
    try {
        bytes = body();
    } catch (std::exception &) {
        // body encodes the call's exceptions, this is an encoder failure
        _exit(worker_exit_body_failed);
    }
    flush_output();
    const bool written = reply.write_all(bytes.data(), bytes.size());
    _exit(written ? worker_exit_ok : worker_exit_write_failed);
}

} // anon

enforcement_result process_enforcer::run_worker(const worker_body &body, const value_decoder &decode) {
    pipe_fd reply;
    // buffered output would otherwise be written by both processes
    flush_output();

    const pid_t parent = getpid();
    const pid_t pid = fork();
    throw_if(pid == -1, "fork");
    if (pid == 0) {
        reply.r.close();
        worker_main(body, reply.w, parent);
    }

    worker w(pid);
    reply.w.close();
    DVLOG(3) << "worker " << pid << " started, " << _deadline;

    std::string bytes;
    char buf[4096];
    for (;;) {
        const int timeout_ms = _deadline.unlimited() ? -1 : poll_timeout(_deadline.remaining());
        if (!reply.r.wait_readable(timeout_ms)) {
            if (_deadline.expired()) {
                const int status = w.kill_and_reap();
                DVLOG(3) << "worker " << pid << " timed out and " << describe_status(status);
                return enforcement_result::timed_out();
            }
            // interrupted by a signal, wait again for what is left
            continue;
        }
        const ssize_t nr = reply.r.read(buf, sizeof(buf));
        if (nr == -1) {
            if (errno == EINTR) continue;
            throw errno_error("read worker reply");
        }
        if (nr == 0) break;
        bytes.append(buf, nr);
    }

    const int status = w.reap();
    DVLOG(3) << "worker " << pid << " " << describe_status(status)
        << " after a " << bytes.size() << " byte reply";
    if (bytes.empty()) {
        throw_stream<worker_error>() << "worker " << pid << " " << describe_status(status)
            << " without a reply" << endx;
    }
    if (status != -1 && !(WIFEXITED(status) && WEXITSTATUS(status) == worker_exit_ok)) {
        throw_stream<worker_error>() << "worker " << pid << " " << describe_status(status)
            << " after a partial reply" << endx;
    }
    return wire::decode_reply(bytes, decode);
}

} // end namespace timebox
