#include "timebox/interrupt.hh"
#include "timebox/error.hh"
#include "timebox/timespec.hh"
#include "interrupt_private.hh"

#include <errno.h>
#include <poll.h>
#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace timebox {

namespace interrupt_impl {

volatile sig_atomic_t alarm_fired = 0;
volatile sig_atomic_t level_fired[max_depth];
volatile sig_atomic_t foreign_alarms = 0;
volatile sig_atomic_t depth = 0;

void note_alarm(const siginfo_t &info) noexcept {
    // enforcer timers carry their nesting level
    if (info.si_code == SI_TIMER) {
        const int level = info.si_value.sival_int;
        if (level >= 0 && level < depth) {
            level_fired[level] = 1;
            alarm_fired = 1;
            return;
        }
    }
    ++foreign_alarms;
}

void on_alarm(int, siginfo_t *info, void *) {
    const int saved_errno = errno;
    note_alarm(*info);
    errno = saved_errno;
}

void reset() noexcept {
    for (int i = 0; i < max_depth; ++i) {
        level_fired[i] = 0;
    }
    alarm_fired = 0;
    foreign_alarms = 0;
    depth = 0;
}

bool primary_thread() noexcept {
    return syscall(SYS_gettid) == getpid();
}

sigset_t alarm_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, alarm_signal);
    return set;
}

} // end namespace interrupt_impl

using namespace interrupt_impl;

namespace this_call {

// only the primary thread is ever interrupted
bool interrupted() noexcept {
    return alarm_fired != 0 && primary_thread();
}

void interruption_point() {
    if (interrupted()) {
        throw call_interrupted();
    }
}

void sleep_until(const deadline_clock::time_point &sleep_time) {
    if (!primary_thread()) {
        for (auto now = deadline_clock::now(); now < sleep_time; now = deadline_clock::now()) {
            const timespec ts = to_timespec(sleep_time - now);
            nanosleep(&ts, nullptr);
        }
        return;
    }

    // block the alarm so checking the flag and sleeping can't race it;
    // ppoll unblocks it atomically for the duration of the sleep
    const sigset_t block = alarm_set();
    sigset_t old_mask;
    const int e = pthread_sigmask(SIG_BLOCK, &block, &old_mask);
    if (e != 0) throw errno_error(e, "pthread_sigmask");
    sigset_t sleep_mask = old_mask;
    sigdelset(&sleep_mask, alarm_signal);

    for (;;) {
        if (alarm_fired) {
            pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
            throw call_interrupted();
        }
        const auto now = deadline_clock::now();
        if (now >= sleep_time) break;
        const timespec ts = to_timespec(sleep_time - now);
        if (ppoll(nullptr, 0, &ts, &sleep_mask) == -1 && errno != EINTR) {
            const int err = errno;
            pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
            throw errno_error(err, "ppoll");
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
}

} // end namespace this_call

} // end namespace timebox
