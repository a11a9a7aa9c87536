#ifndef LIBTIMEBOX_PROCESS_ENFORCER_HH
#define LIBTIMEBOX_PROCESS_ENFORCER_HH

#include "timebox/deadline.hh"
#include "timebox/enforcer.hh"
#include "timebox/serialization.hh"
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>

namespace timebox {

//! run a call in a forked worker process and SIGKILL it at the deadline
//
//! usable from any thread. arguments and the result cross the process
//! boundary through msgpack, so they must satisfy is_serializable.
//! the worker is killed and reaped before run() returns, on every path.
class process_enforcer {
public:
    //! produces the encoded reply inside the worker
    typedef std::function<std::string ()> worker_body;
    //! turns the value of a reply back into the call's result
    typedef std::function<boost::any (const msgpack::object &)> value_decoder;

    explicit process_enforcer(const deadline &dl) : _deadline(dl) {}

    process_enforcer(const process_enforcer &) = delete;
    process_enforcer &operator =(const process_enforcer &) = delete;

    //! run f(args...) in a worker
    //! \throw non_serializable_callable before forking if an argument
    //!        or the result type can't cross the boundary
    template <class Func, class... Args>
    enforcement_result run(Func &f, Args&&... args) {
        typedef typename std::result_of<
            Func &(typename std::decay<Args>::type &...)>::type result_type;
        typedef typename std::decay<result_type>::type value_type;
        typedef all_serializable<value_type, typename std::decay<Args>::type...> crossable;
        return run_impl<value_type>(typename crossable::type(), f, std::forward<Args>(args)...);
    }

    //! fork, run body in the worker and wait for its reply or the deadline
    enforcement_result run_worker(const worker_body &body, const value_decoder &decode);

private:
    deadline _deadline;

    template <class Result, class Func, class... Args>
    enforcement_result run_impl(std::false_type, Func &, Args&&...) {
        throw non_serializable_callable(
            describe_unserializable<Result, typename std::decay<Args>::type...>());
    }

    template <class Result, class Func, class... Args>
    enforcement_result run_impl(std::true_type, Func &f, Args&&... args) {
        typedef std::tuple<typename std::decay<Args>::type...> args_type;

        // pack in the caller so the worker only ever sees transferred copies
        const std::string arg_bytes = wire::pack_args(args_type(std::forward<Args>(args)...));

        worker_body body = [&f, &arg_bytes]() -> std::string {
            args_type call_args;
            try {
                wire::unpack_args(arg_bytes, call_args);
            } catch (std::exception &e) {
                return wire::pack_exception(typeid(non_serializable_callable).name(),
                        std::string("arguments did not survive the transfer: ") + e.what());
            }
            return wire::call_and_pack<Result>(f, call_args);
        };
        return run_worker(body, wire::value_decoder<Result>());
    }
};

} // end namespace timebox

#endif // LIBTIMEBOX_PROCESS_ENFORCER_HH
