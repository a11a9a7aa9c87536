#ifndef LIBTIMEBOX_SIGNAL_ENFORCER_HH
#define LIBTIMEBOX_SIGNAL_ENFORCER_HH

#include "timebox/deadline.hh"
#include "timebox/enforcer.hh"
#include "timebox/interrupt.hh"

namespace timebox {

//! run a call on the primary thread and interrupt it with SIGALRM
//
//! the call stops at its next interruption point (see this_call)
//! or sees EINTR from a blocking system call. a call that returns
//! after the timer fired has its value discarded and counts as timed out.
//! the timer is a per-call CLOCK_MONOTONIC timer aimed at the calling
//! thread; an ITIMER_REAL or other timer the program owns is left alone.
//! the previous SIGALRM handler and signal mask are restored on every path,
//! and a SIGALRM that arrived from elsewhere during the call is passed on
//! to that handler afterwards.
class signal_enforcer {
public:
    explicit signal_enforcer(const deadline &dl) : _deadline(dl) {}

    signal_enforcer(const signal_enforcer &) = delete;
    signal_enforcer &operator =(const signal_enforcer &) = delete;

    //! \throw unsupported_context when not on the primary thread
    enforcement_result run(const anyfunc &f);

    //! true if the calling thread can receive the enforcing signal
    static bool supported() noexcept;

private:
    deadline _deadline;
};

} // end namespace timebox

#endif // LIBTIMEBOX_SIGNAL_ENFORCER_HH
