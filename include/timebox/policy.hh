#ifndef LIBTIMEBOX_POLICY_HH
#define LIBTIMEBOX_POLICY_HH

#include "timebox/anyfunc.hh"
#include "timebox/error.hh"
#include <boost/optional.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>

namespace timebox {

namespace policy_impl {

template <class E>
void raise(const boost::optional<std::string> &msg, std::true_type, std::true_type) {
    if (msg) throw E(*msg);
    throw E();
}

// no default constructor, always pass a message
template <class E>
void raise(const boost::optional<std::string> &msg, std::true_type, std::false_type) {
    throw E(msg ? *msg : std::string("timed out"));
}

// can't take a message, any configured one is dropped
template <class E>
void raise(const boost::optional<std::string> &, std::false_type, std::true_type) {
    throw E();
}

} // end namespace policy_impl

//! what happens when a deadline passes
//
//! either raise an exception of a configured type or call a fallback
//! whose return value stands in for the timed out call
class expiry_policy {
public:
    enum class kind {
        raise_exception,
        invoke_fallback
    };

    //! raise timeout_expired
    expiry_policy() : expiry_policy(raise<timeout_expired>()) {}

    //! \tparam Exception raised on expiry, constructed from message when one is given
    template <class Exception>
    static expiry_policy raise(boost::optional<std::string> message = boost::none) {
        static_assert(std::is_base_of<std::exception, Exception>::value,
                "exception type must derive from std::exception");
        typedef typename std::is_constructible<Exception, std::string>::type takes_message;
        typedef typename std::is_default_constructible<Exception>::type takes_nothing;
        static_assert(takes_message::value || takes_nothing::value,
                "exception type must be constructible from a string or default constructible");
        if (message && !takes_message::value) {
            LOG(WARNING) << type_name<Exception>() << " can't carry a message, dropping: " << *message;
        }
        return expiry_policy(kind::raise_exception, [message] {
            policy_impl::raise<Exception>(message, takes_message(), takes_nothing());
        }, anyfunc(), type_name<Exception>());
    }

    //! call f on expiry and use its result
    static expiry_policy fallback(anyfunc f);

    //! call f(args...) on expiry and use its result
    template <class Func, class... Args>
    static expiry_policy fallback(Func f, Args... args) {
        return fallback(make_anyfunc(std::bind(f, args...)));
    }

    kind which() const { return _kind; }

    //! raise the configured exception, or call the fallback and return its value
    //
    //! anything the fallback throws propagates unmodified
    boost::any apply() const;

    //! apply() and unwrap the fallback value as the wrapped call's result type
    template <class Result>
    Result apply_as() const {
        boost::any v = apply();
        if (!std::is_void<Result>::value && v.type() != typeid(Result)) {
            throw_stream() << "on_timeout handler returned " << demangle(v.type().name())
                << ", expected " << type_name<Result>() << endx;
        }
        return any_value<Result>(std::move(v));
    }

    friend std::ostream &operator << (std::ostream &o, const expiry_policy &p);

private:
    kind _kind;
    std::function<void ()> _thrower;
    anyfunc _fallback;
    std::string _name;

    expiry_policy(kind k, std::function<void ()> thrower, anyfunc f, std::string name)
        : _kind(k), _thrower(std::move(thrower)), _fallback(std::move(f)), _name(std::move(name)) {}
};

//! pick the active policy: a fallback, when one is configured, wins over raising
expiry_policy normalize_policy(const expiry_policy &raise, const anyfunc &fallback);

} // end namespace timebox

#endif // LIBTIMEBOX_POLICY_HH
