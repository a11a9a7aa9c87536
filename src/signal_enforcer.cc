#include "timebox/signal_enforcer.hh"
#include "timebox/error.hh"
#include "timebox/timespec.hh"
#include "interrupt_private.hh"

#include <errno.h>
#include <pthread.h>
#include <string.h>
#include <sys/syscall.h>
#include <time.h>
#include <typeinfo>
#include <unistd.h>

// older glibc only has the union member
#ifndef sigev_notify_thread_id
#define sigev_notify_thread_id _sigev_un._tid
#endif

namespace timebox {

using namespace interrupt_impl;
using namespace std::chrono;

namespace {

//! arms a CLOCK_MONOTONIC timer aimed at the calling thread for one
//! call and puts the previous handler and mask back in the destructor
class alarm_guard {
public:
    explicit alarm_guard(const deadline &dl);
    ~alarm_guard();

    alarm_guard(const alarm_guard &) = delete;
    alarm_guard &operator =(const alarm_guard &) = delete;

    //! stop the timer and collect alarms still pending
    //! \return true if this guard's timer fired
    bool disarm() noexcept;

    //! true if the timer of an enclosing guard fired
    bool outer_fired() const noexcept;

private:
    sigset_t _saved_mask;
    struct sigaction _saved_action;
    timer_t _timer;
    int _level = -1;
    bool _action_saved = false;
    bool _timer_created = false;
    bool _disarmed = false;
    bool _fired = false;

    void restore() noexcept;
};

void block_alarm(sigset_t *old) {
    const sigset_t alarm = alarm_set();
    const int e = pthread_sigmask(SIG_BLOCK, &alarm, old);
    if (e != 0) throw errno_error(e, "pthread_sigmask");
}

//! take every pending SIGALRM off the calling thread, SIGALRM must be blocked
void drain_alarms() noexcept {
    const sigset_t alarm = alarm_set();
    const timespec no_wait{0, 0};
    siginfo_t info;
    for (;;) {
        const int sig = sigtimedwait(&alarm, &info, &no_wait);
        if (sig == alarm_signal) {
            note_alarm(info);
        } else if (sig == -1 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
}

alarm_guard::alarm_guard(const deadline &dl) {
    block_alarm(&_saved_mask);

    try {
        if (depth >= max_depth) {
            throw_stream() << "signal enforcers nested deeper than " << max_depth << endx;
        }
        _level = depth;
        level_fired[_level] = 0;
        depth = _level + 1;

        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_sigaction = on_alarm;
        sigemptyset(&sa.sa_mask);
        // no SA_RESTART, blocking system calls in the call must see EINTR
        sa.sa_flags = SA_SIGINFO;
        throw_if(sigaction(alarm_signal, &sa, &_saved_action) == -1, "sigaction");
        _action_saved = true;

        // only this thread may ever see the alarm
        sigevent sev;
        memset(&sev, 0, sizeof(sev));
        sev.sigev_notify = SIGEV_THREAD_ID;
        sev.sigev_signo = alarm_signal;
        sev.sigev_value.sival_int = _level;
        sev.sigev_notify_thread_id = syscall(SYS_gettid);
        throw_if(timer_create(CLOCK_MONOTONIC, &sev, &_timer) == -1, "timer_create");
        _timer_created = true;

        const auto remaining = dl.remaining();
        if (remaining > deadline::duration::zero()) {
            itimerspec its;
            memset(&its, 0, sizeof(its));
            its.it_value = to_timespec(remaining);
            throw_if(timer_settime(_timer, 0, &its, nullptr) == -1, "timer_settime");
        } else {
            // expire immediately; the call still starts
            level_fired[_level] = 1;
            alarm_fired = 1;
        }

        sigset_t run_mask = _saved_mask;
        sigdelset(&run_mask, alarm_signal);
        const int e = pthread_sigmask(SIG_SETMASK, &run_mask, nullptr);
        if (e != 0) throw errno_error(e, "pthread_sigmask");
        DVLOG(4) << "alarm level " << _level << " armed, "
            << duration_cast<microseconds>(remaining).count() << "us";
    } catch (...) {
        restore();
        throw;
    }
}

bool alarm_guard::disarm() noexcept {
    if (_disarmed) return _fired;
    const sigset_t alarm = alarm_set();
    pthread_sigmask(SIG_BLOCK, &alarm, nullptr);

    if (_timer_created) {
        itimerspec zero;
        memset(&zero, 0, sizeof(zero));
        if (timer_settime(_timer, 0, &zero, nullptr) == -1) {
            PLOG(ERROR) << "timer_settime disarm failed";
        }
        // the timer can't fire any more and its signal only targets
        // this thread, so whatever it sent is pending here now
        drain_alarms();
        if (timer_delete(_timer) == -1) {
            PLOG(ERROR) << "timer_delete failed";
        }
        _timer_created = false;
    }
    _fired = _level >= 0 && level_fired[_level] != 0;
    _disarmed = true;
    DVLOG(4) << "alarm level " << _level << " disarmed, fired: " << _fired;
    return _fired;
}

bool alarm_guard::outer_fired() const noexcept {
    for (int i = 0; i < _level; ++i) {
        if (level_fired[i]) return true;
    }
    return false;
}

void alarm_guard::restore() noexcept {
    disarm();
    if (_action_saved && sigaction(alarm_signal, &_saved_action, nullptr) == -1) {
        PLOG(ERROR) << "restoring SIGALRM handler failed";
    }
    if (_level >= 0) {
        depth = _level;
        // alarms of enclosing guards stay visible to them
        alarm_fired = outer_fired();
    }
    // an alarm that wasn't ours goes to the handler it was meant for
    if (foreign_alarms) {
        foreign_alarms = 0;
        DVLOG(4) << "passing a foreign SIGALRM on to the previous handler";
        pthread_kill(pthread_self(), alarm_signal);
    }
    pthread_sigmask(SIG_SETMASK, &_saved_mask, nullptr);
}

alarm_guard::~alarm_guard() {
    restore();
}

} // anon

bool signal_enforcer::supported() noexcept {
    return primary_thread();
}

enforcement_result signal_enforcer::run(const anyfunc &f) {
    if (!supported()) {
        throw unsupported_context("signal based timeouts only work on the main thread"
                "; use process based enforcement from other threads");
    }

    alarm_guard guard(_deadline);
    boost::any value;
    try {
        value = f();
    } catch (call_interrupted &) {
        if (guard.disarm()) {
            DVLOG(3) << "call interrupted at " << _deadline;
            return enforcement_result::timed_out();
        }
        // an enclosing enforcer's deadline passed, let it unwind to there
        if (guard.outer_fired()) throw;
        return enforcement_result::completed_with_error(std::current_exception());
    } catch (std::exception &e) {
        const auto failed_at = deadline_clock::now();
        if (guard.disarm() && _deadline.expired(failed_at)) {
            // most likely the interrupt itself, EINTR turned into an exception
            DVLOG(3) << "call failed after its deadline, dropping " << demangle(typeid(e).name())
                << ": " << e.what();
            return enforcement_result::timed_out();
        }
        return enforcement_result::completed_with_error(std::current_exception());
    } catch (...) {
        const auto failed_at = deadline_clock::now();
        if (guard.disarm() && _deadline.expired(failed_at)) {
            DVLOG(3) << "call failed after its deadline, dropping a non-std exception";
            return enforcement_result::timed_out();
        }
        return enforcement_result::completed_with_error(std::current_exception());
    }
    const auto returned_at = deadline_clock::now();
    // a value returned in time stands even if the alarm beat disarm()
    if (guard.disarm() && _deadline.expired(returned_at)) {
        DVLOG(3) << "call returned after its deadline, discarding value";
        return enforcement_result::timed_out();
    }
    return enforcement_result::completed(std::move(value));
}

} // end namespace timebox
