#ifndef LIBTIMEBOX_TIMEOUT_HH
#define LIBTIMEBOX_TIMEOUT_HH

#include "timebox/deadline.hh"
#include "timebox/policy.hh"
#include "timebox/signal_enforcer.hh"
#include "timebox/process_enforcer.hh"
#include <boost/optional.hpp>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace timebox {

template <class Func> class timed;

//! wrap callables with a deadline
//
//! \code
//! auto f = timeout(1.5).on_timeout(fallback, 1, 2)(work);
//! auto r = f(args...); // work's result, or fallback(1, 2) on expiry
//! \endcode
class timeout {
public:
    //! \param spec seconds, a duration, an instant, hms, or nothing for no limit
    timeout(timeout_spec spec = timeout_spec())
        : _spec(std::move(spec)),
          _raise(&expiry_policy::raise<timeout_expired>) {}

    //! true (the default) interrupts in place with SIGALRM,
    //! false runs the call in a worker process
    timeout &use_signals(bool on) {
        _use_signals = on;
        return *this;
    }

    //! raise Exception instead of timeout_expired
    template <class Exception>
    timeout &exception_type() {
        _raise = &expiry_policy::raise<Exception>;
        return *this;
    }

    //! message given to the raised exception
    timeout &exception_message(std::string msg) {
        _message = std::move(msg);
        return *this;
    }

    //! return f(args...) instead of raising; wins over exception_type
    template <class Func, class... Args>
    timeout &on_timeout(Func f, Args... args) {
        _fallback = make_anyfunc(std::bind(f, args...));
        return *this;
    }

    const timeout_spec &spec() const { return _spec; }
    bool signals() const { return _use_signals; }

    //! the normalized policy applied when a call wrapped by this times out
    expiry_policy policy() const {
        return normalize_policy(_raise(_message), _fallback);
    }

    template <class Func>
    timed<typename std::decay<Func>::type> operator()(Func &&f) const {
        return timed<typename std::decay<Func>::type>(std::forward<Func>(f), *this);
    }

private:
    timeout_spec _spec;
    bool _use_signals = true;
    std::function<expiry_policy (boost::optional<std::string>)> _raise;
    boost::optional<std::string> _message;
    anyfunc _fallback;
};

namespace timeout_impl {

template <class Result>
Result finish(enforcement_result r, const expiry_policy &policy) {
    switch (r.status) {
    case enforcement_result::outcome::completed:
        return any_value<Result>(std::move(r.value));
    case enforcement_result::outcome::completed_with_error:
        std::rethrow_exception(r.error);
    case enforcement_result::outcome::timed_out:
        break;
    }
    return policy.apply_as<Result>();
}

} // end namespace timeout_impl

//! a callable wrapped by timeout, called with the same arguments as the wrapped one
template <class Func>
class timed {
public:
    template <class... Args>
    using result_of_call = typename std::decay<
        typename std::result_of<Func &(Args &&...)>::type>::type;

    timed(Func f, timeout settings)
        : _f(std::move(f)), _settings(std::move(settings)) {}

    template <class... Args>
    result_of_call<Args...> operator()(Args &&... args) {
        return with_limit(_settings.spec(), std::forward<Args>(args)...);
    }

    //! call once with a different limit than the wrapper was built with
    template <class... Args>
    result_of_call<Args...> with_limit(const timeout_spec &spec, Args &&... args) {
        typedef result_of_call<Args...> result_type;

        // resolved before anything runs
        const deadline dl = resolve(spec);
        if (dl.unlimited()) {
            return _f(std::forward<Args>(args)...);
        }

        const expiry_policy policy = _settings.policy();
        enforcement_result r = _settings.signals()
            ? run_signal(dl, std::forward<Args>(args)...)
            : run_process(dl, std::forward<Args>(args)...);
        if (r.expired()) {
            VLOG(1) << "call timed out after " << spec << ", applying " << policy;
        }
        return timeout_impl::finish<result_type>(std::move(r), policy);
    }

    const timeout &settings() const { return _settings; }

private:
    Func _f;
    timeout _settings;

    template <class... Args>
    enforcement_result run_signal(const deadline &dl, Args &&... args) {
        signal_enforcer enforcer(dl);
        return enforcer.run(make_anyfunc([&]() {
            return _f(std::forward<Args>(args)...);
        }));
    }

    template <class... Args>
    enforcement_result run_process(const deadline &dl, Args &&... args) {
        process_enforcer enforcer(dl);
        return enforcer.run(_f, std::forward<Args>(args)...);
    }
};

} // end namespace timebox

#endif // LIBTIMEBOX_TIMEOUT_HH
