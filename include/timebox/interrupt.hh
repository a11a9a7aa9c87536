#ifndef LIBTIMEBOX_INTERRUPT_HH
#define LIBTIMEBOX_INTERRUPT_HH

#include "timebox/deadline.hh"
#include <chrono>

namespace timebox {

//! thrown at an interruption point once the enforcing timer fired
//
//! not derived from std::exception so catch (std::exception &)
//! in the wrapped call does not stop the unwind
struct call_interrupted {};

//! interruption points for code running under a signal_enforcer
//
//! outside an enforced call (or in a worker process) these never throw
//! and the sleeps simply sleep
namespace this_call {

//! true once the timer of the enclosing enforced call fired
bool interrupted() noexcept;

//! throw call_interrupted if the timer fired
void interruption_point();

//! sleep until time is reached, or throw call_interrupted
void sleep_until(const deadline_clock::time_point &sleep_time);

//! sleep for the given duration, or throw call_interrupted
template <class Rep, class Period>
    void sleep_for(std::chrono::duration<Rep, Period> sleep_duration) {
        sleep_until(deadline_clock::now() +
            std::chrono::duration_cast<deadline_clock::duration>(sleep_duration));
    }

} // end namespace this_call

} // end namespace timebox

#endif // LIBTIMEBOX_INTERRUPT_HH
