#include "timebox/deadline.hh"
#include "timebox/error.hh"
#include <algorithm>
#include <cmath>

namespace timebox {

using namespace std::chrono;

namespace {

void check_seconds(double s, const char *what) {
    if (!std::isfinite(s))
        throw_stream<invalid_timeout_spec>() << what << " is not finite: " << s << endx;
    if (s < 0)
        throw_stream<invalid_timeout_spec>() << "negative " << what << ": " << s << endx;
    if (s > max_timeout_seconds)
        throw_stream<invalid_timeout_spec>() << what << " too large: " << s << endx;
}

deadline::duration offset(double s) {
    return duration_cast<deadline::duration>(duration<double>(s));
}

} // anon

std::ostream &operator << (std::ostream &o, const timeout_spec &s) {
    switch (s._form) {
    case timeout_spec::form::unlimited:
        o << "unlimited";
        break;
    case timeout_spec::form::seconds:
        o << s._seconds << "s";
        break;
    case timeout_spec::form::instant:
        o << "at " << system_clock::to_time_t(s._instant);
        break;
    case timeout_spec::form::duration:
        o << s._duration.count() << "s duration";
        break;
    case timeout_spec::form::components:
        o << s._components.hours << "h" << s._components.minutes << "m"
            << s._components.seconds << "s";
        break;
    }
    return o;
}

deadline::duration deadline::remaining(time_point now) const {
    if (!_expiry) return duration::max();
    if (*_expiry <= now) return duration::zero();
    return *_expiry - now;
}

std::ostream &operator << (std::ostream &o, const deadline &d) {
    if (d.unlimited()) {
        o << "deadline(never)";
    } else {
        o << "deadline(" << duration_cast<microseconds>(d.remaining()).count() << "us)";
    }
    return o;
}

deadline resolve(const timeout_spec &spec) {
    return resolve(spec, deadline_clock::now(), system_clock::now());
}

deadline resolve(const timeout_spec &spec,
        deadline_clock::time_point now,
        system_clock::time_point wall_now)
{
    double secs = 0;
    switch (spec.which()) {
    case timeout_spec::form::unlimited:
        return deadline::never();
    case timeout_spec::form::seconds:
        secs = spec.seconds();
        check_seconds(secs, "timeout");
        break;
    case timeout_spec::form::duration:
        secs = spec.duration().count();
        check_seconds(secs, "timeout duration");
        break;
    case timeout_spec::form::components:
        {
            const hms &c = spec.hms_components();
            check_seconds(c.hours, "hours");
            check_seconds(c.minutes, "minutes");
            check_seconds(c.seconds, "seconds");
            secs = c.hours * 3600 + c.minutes * 60 + c.seconds;
            check_seconds(secs, "timeout");
        }
        break;
    case timeout_spec::form::instant:
        // an instant already in the past leaves zero time, not an error
        secs = std::max(0.0, duration<double>(spec.instant() - wall_now).count());
        check_seconds(secs, "timeout instant");
        break;
    default:
        throw_stream<invalid_timeout_spec>() << "unrecognized timeout form "
            << static_cast<int>(spec.which()) << endx;
    }
    deadline d(now + offset(secs));
    DVLOG(5) << "resolved " << spec << " to " << d;
    return d;
}

} // end namespace timebox
