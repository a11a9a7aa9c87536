#ifndef LIBTIMEBOX_ENFORCER_HH
#define LIBTIMEBOX_ENFORCER_HH

#include "timebox/anyfunc.hh"
#include <exception>
#include <ostream>

namespace timebox {

//! outcome of one enforced call, consumed right away by the caller
struct enforcement_result {
    enum class outcome {
        completed,
        completed_with_error,
        timed_out
    };

    outcome status;
    //! return value when completed, empty for void
    boost::any value;
    //! the call's own exception when completed_with_error
    std::exception_ptr error;

    static enforcement_result completed(boost::any v) {
        return enforcement_result{outcome::completed, std::move(v), nullptr};
    }

    static enforcement_result completed_with_error(std::exception_ptr e) {
        return enforcement_result{outcome::completed_with_error, boost::any(), e};
    }

    static enforcement_result timed_out() {
        return enforcement_result{outcome::timed_out, boost::any(), nullptr};
    }

    bool expired() const { return status == outcome::timed_out; }
};

inline std::ostream &operator << (std::ostream &o, enforcement_result::outcome s) {
    switch (s) {
    case enforcement_result::outcome::completed: o << "completed"; break;
    case enforcement_result::outcome::completed_with_error: o << "completed_with_error"; break;
    case enforcement_result::outcome::timed_out: o << "timed_out"; break;
    }
    return o;
}

} // end namespace timebox

#endif // LIBTIMEBOX_ENFORCER_HH
