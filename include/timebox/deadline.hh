#ifndef LIBTIMEBOX_DEADLINE_HH
#define LIBTIMEBOX_DEADLINE_HH

#include <chrono>
#include <ostream>
#include <boost/optional.hpp>

namespace timebox {

//! monotonic clock every deadline is expressed in
typedef std::chrono::steady_clock deadline_clock;

//! hours, minutes and seconds summed into one offset from now
struct hms {
    double hours;
    double minutes;
    double seconds;

    explicit hms(double hours_=0, double minutes_=0, double seconds_=0)
        : hours(hours_), minutes(minutes_), seconds(seconds_) {}
};

//! any of the accepted ways to say when a call should time out
class timeout_spec {
public:
    enum class form {
        unlimited,
        seconds,
        instant,
        duration,
        components
    };

    //! no limit at all
    timeout_spec() : _form(form::unlimited) {}

    //! seconds from now
    timeout_spec(double seconds_) : _form(form::seconds), _seconds(seconds_) {}

    //! absolute wall clock instant
    timeout_spec(std::chrono::system_clock::time_point instant_)
        : _form(form::instant), _instant(instant_) {}

    //! offset from now
    template <class Rep, class Period>
    timeout_spec(std::chrono::duration<Rep, Period> d)
        : _form(form::duration), _duration(std::chrono::duration<double>(d)) {}

    timeout_spec(const hms &c) : _form(form::components), _components(c) {}

    static timeout_spec components(double hours, double minutes, double seconds) {
        return timeout_spec(hms(hours, minutes, seconds));
    }

    form which() const { return _form; }
    bool unlimited() const { return _form == form::unlimited; }

    double seconds() const { return _seconds; }
    std::chrono::system_clock::time_point instant() const { return _instant; }
    std::chrono::duration<double> duration() const { return _duration; }
    const hms &hms_components() const { return _components; }

    friend std::ostream &operator << (std::ostream &o, const timeout_spec &s);

private:
    form _form;
    double _seconds = 0;
    std::chrono::system_clock::time_point _instant;
    std::chrono::duration<double> _duration{0};
    hms _components;
};

//! an absolute point on deadline_clock after which a call must stop
//
//! computed once, before the call starts; remaining() is never negative
class deadline {
public:
    typedef deadline_clock::time_point time_point;
    typedef deadline_clock::duration duration;

    //! a deadline that never expires
    static deadline never() { return deadline(); }

    explicit deadline(time_point expiry_) : _expiry(expiry_) {}

    bool unlimited() const { return !_expiry; }

    //! \pre !unlimited()
    time_point expiry() const { return *_expiry; }

    //! time left, zero once expired, duration::max() if unlimited
    duration remaining(time_point now = deadline_clock::now()) const;

    bool expired(time_point now = deadline_clock::now()) const {
        return _expiry && *_expiry <= now;
    }

    friend std::ostream &operator << (std::ostream &o, const deadline &d);

private:
    deadline() {}

    boost::optional<time_point> _expiry;
};

//! largest accepted offset from now, in seconds
constexpr double max_timeout_seconds = 1e9;

//! turn any timeout_spec into a deadline
//! \throw invalid_timeout_spec for negative, non-finite or oversized values
deadline resolve(const timeout_spec &spec);

//! resolve against explicit clock readings
deadline resolve(const timeout_spec &spec,
        deadline_clock::time_point now,
        std::chrono::system_clock::time_point wall_now);

} // end namespace timebox

#endif // LIBTIMEBOX_DEADLINE_HH
