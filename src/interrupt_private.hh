#ifndef LIBTIMEBOX_INTERRUPT_PRIVATE_HH
#define LIBTIMEBOX_INTERRUPT_PRIVATE_HH

#include <signal.h>

namespace timebox {
namespace interrupt_impl {

//! signal used to interrupt the primary thread
constexpr int alarm_signal = SIGALRM;

//! deepest nesting of signal enforcers
constexpr int max_depth = 16;

//! set once the timer of any active signal enforcer fired
extern volatile sig_atomic_t alarm_fired;

//! per nesting level, set when that level's timer fired
extern volatile sig_atomic_t level_fired[max_depth];

//! SIGALRMs that didn't come from an enforcer timer, delivered again
//! to the previous handler once the enforced call is over
extern volatile sig_atomic_t foreign_alarms;

//! number of signal enforcers active on the primary thread
extern volatile sig_atomic_t depth;

//! the SIGALRM handler installed by signal_enforcer
void on_alarm(int signo, siginfo_t *info, void *ctx);

//! record one SIGALRM, from the handler or from sigtimedwait
void note_alarm(const siginfo_t &info) noexcept;

//! forget all enforcer state, used in a freshly forked worker
void reset() noexcept;

//! true on the thread whose id equals the process id
bool primary_thread() noexcept;

//! sigset containing only alarm_signal
sigset_t alarm_set();

} // end namespace interrupt_impl
} // end namespace timebox

#endif // LIBTIMEBOX_INTERRUPT_PRIVATE_HH
