#include "timebox/policy.hh"

namespace timebox {

expiry_policy expiry_policy::fallback(anyfunc f) {
    if (!f) {
        throw errorx("empty on_timeout handler");
    }
    return expiry_policy(kind::invoke_fallback, std::function<void ()>(), std::move(f), "on_timeout");
}

boost::any expiry_policy::apply() const {
    DVLOG(3) << "applying expiry policy " << *this;
    if (_kind == kind::invoke_fallback) {
        return _fallback();
    }
    _thrower();
    // a thrower always throws
    throw_stream() << "expiry policy " << _name << " did not raise" << endx;
    return boost::any();
}

std::ostream &operator << (std::ostream &o, const expiry_policy &p) {
    switch (p._kind) {
    case expiry_policy::kind::raise_exception:
        o << "raise(" << p._name << ")";
        break;
    case expiry_policy::kind::invoke_fallback:
        o << "fallback(" << p._name << ")";
        break;
    }
    return o;
}

expiry_policy normalize_policy(const expiry_policy &raise, const anyfunc &fallback) {
    if (fallback) {
        return expiry_policy::fallback(fallback);
    }
    return raise;
}

} // end namespace timebox
