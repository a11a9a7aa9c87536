#ifndef LIBTIMEBOX_TIMESPEC_HH
#define LIBTIMEBOX_TIMESPEC_HH

#include <time.h>
#include <chrono>

namespace timebox {

//! convert a non-negative duration to a timespec for timer_settime/ppoll/sigtimedwait
template <class Rep, class Period>
inline timespec to_timespec(std::chrono::duration<Rep, Period> d) {
    using namespace std::chrono;
    const auto sec = duration_cast<seconds>(d);
    timespec ts;
    ts.tv_sec = sec.count();
    ts.tv_nsec = duration_cast<nanoseconds>(d - sec).count();
    return ts;
}

} // end namespace timebox

#endif // LIBTIMEBOX_TIMESPEC_HH
