#ifndef LIBTIMEBOX_SERIALIZATION_HH
#define LIBTIMEBOX_SERIALIZATION_HH

#include <msgpack.hpp>
#include "timebox/apply.hh"
#include "timebox/enforcer.hh"
#include "timebox/error.hh"

#include <deque>
#include <exception>
#include <functional>
#include <list>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace timebox {

////// what may cross the worker boundary //////

namespace serialization_impl {

template <class T>
struct has_msgpack_define {
private:
    template <class U>
    static auto test(int) -> decltype(
        std::declval<const U &>().msgpack_pack(std::declval<msgpack::packer<msgpack::sbuffer> &>()),
        std::declval<U &>().msgpack_unpack(std::declval<msgpack::object>()),
        std::true_type());
    template <class U>
    static std::false_type test(...);
public:
    typedef decltype(test<T>(0)) type;
    static constexpr bool value = type::value;
};

} // end namespace serialization_impl

//! true if values of T can be packed into, and unpacked out of, msgpack
//
//! specialize for types with a custom msgpack adaptor
template <class T, class Enable = void>
struct is_serializable : std::false_type {};

template <class T>
struct is_serializable<T, typename std::enable_if<
    std::is_arithmetic<T>::value && !std::is_same<T, long double>::value>::type>
    : std::true_type {};

template <class T>
struct is_serializable<T, typename std::enable_if<
    serialization_impl::has_msgpack_define<T>::value &&
    std::is_default_constructible<T>::value>::type>
    : std::true_type {};

template <> struct is_serializable<void> : std::true_type {};
template <> struct is_serializable<std::string> : std::true_type {};

template <class T, class A>
struct is_serializable<std::vector<T, A>> : is_serializable<T> {};
template <class T, class A>
struct is_serializable<std::list<T, A>> : is_serializable<T> {};
template <class T, class A>
struct is_serializable<std::deque<T, A>> : is_serializable<T> {};
template <class T, class C, class A>
struct is_serializable<std::set<T, C, A>> : is_serializable<T> {};

template <class... T>
struct all_serializable;

template <>
struct all_serializable<> : std::true_type {};

template <class T, class... Rest>
struct all_serializable<T, Rest...>
    : std::integral_constant<bool, is_serializable<T>::value && all_serializable<Rest...>::value> {};

template <class K, class V, class C, class A>
struct is_serializable<std::map<K, V, C, A>> : all_serializable<K, V> {};
template <class A, class B>
struct is_serializable<std::pair<A, B>> : all_serializable<A, B> {};
template <class... T>
struct is_serializable<std::tuple<T...>> : all_serializable<T...> {};

//! describe the arguments of a call that can't cross the worker boundary
template <class Result, class... Args>
std::string describe_unserializable() {
    std::ostringstream os;
    os << "can't run in a worker process:";
    if (!is_serializable<Result>::value) {
        os << " return value (" << type_name<Result>() << ")";
    }
    // leading entry keeps the arrays non-empty for calls without arguments
    const bool ok[] = {true, is_serializable<Args>::value...};
    const std::string names[] = {std::string(), type_name<Args>()...};
    for (size_t i = 1; i < sizeof(ok) / sizeof(ok[0]); ++i) {
        if (!ok[i]) {
            os << " argument " << i << " (" << names[i] << ")";
        }
    }
    return os.str();
}

////// exceptions crossing back from the worker //////

typedef std::function<std::exception_ptr (const std::string &what)> exception_factory;

//! re-create exceptions with typeid name as E, given the worker's what()
void register_exception(const std::type_info &type, exception_factory factory);

//! re-raise worker exceptions of type E as E instead of remote_error
template <class E>
void register_exception() {
    static_assert(std::is_base_of<std::exception, E>::value,
            "exception type must derive from std::exception");
    static_assert(std::is_constructible<E, std::string>::value,
            "exception type must be constructible from its message");
    register_exception(typeid(E), [](const std::string &what) {
        return std::make_exception_ptr(E(what));
    });
}

//! exception_ptr for an exception the worker reported by mangled type name
//
//! unregistered types come back as remote_error
std::exception_ptr remote_exception(const std::string &mangled_type, const std::string &what);

////// reply frames written by the worker //////

namespace wire {

//! first element of every reply frame
enum class reply_kind : int {
    value = 0,
    exception = 1,
    result_not_serializable = 2
};

std::string pack_void();
std::string pack_exception(const std::string &mangled_type, const std::string &what);
std::string pack_not_serializable(const std::string &what);

//! arguments of a call, packed in the caller before the worker starts
template <class... T>
std::string pack_args(const std::tuple<T...> &args) {
    msgpack::sbuffer buf;
    msgpack::pack(buf, args);
    return std::string(buf.data(), buf.size());
}

inline std::string pack_args(const std::tuple<> &) {
    return std::string();
}

//! \throw std::exception if bytes don't hold a matching tuple
template <class... T>
void unpack_args(const std::string &bytes, std::tuple<T...> &args) {
    msgpack::unpacked msg;
    msgpack::unpack(msg, bytes.data(), bytes.size());
    msg.get().convert(args);
}

inline void unpack_args(const std::string &, std::tuple<> &) {}

//! [value, v], or a result_not_serializable frame if packing v fails
template <class T>
std::string pack_value(const T &v) {
    try {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);
        pk.pack_array(2);
        pk.pack(static_cast<int>(reply_kind::value));
        pk.pack(v);
        return std::string(buf.data(), buf.size());
    } catch (std::exception &e) {
        return pack_not_serializable(e.what());
    }
}

namespace wire_impl {

template <class Result, class Func, class Tuple>
std::string call(Func &f, Tuple &args, std::false_type) {
    const Result v = apply_tuple(f, args);
    return pack_value(v);
}

template <class Result, class Func, class Tuple>
std::string call(Func &f, Tuple &args, std::true_type) {
    apply_tuple(f, args);
    return pack_void();
}

} // end namespace wire_impl

//! run f with the unpacked arguments inside the worker and encode
//! whatever comes out of it, value or exception
template <class Result, class Func, class Tuple>
std::string call_and_pack(Func &f, Tuple &args) {
    try {
        return wire_impl::call<Result>(f, args, typename std::is_void<Result>::type());
    } catch (std::exception &e) {
        return pack_exception(typeid(e).name(), e.what());
    } catch (...) {
        return pack_exception(std::string(), "exception not derived from std::exception");
    }
}

//! turns the value element of a reply back into the call's result
template <class T>
struct value_decoder {
    boost::any operator()(const msgpack::object &o) const {
        T v;
        o.convert(v);
        return v;
    }
};

template <>
struct value_decoder<void> {
    boost::any operator()(const msgpack::object &) const {
        return boost::any();
    }
};

//! decode a complete reply frame
//! \throw result_not_serializable, worker_error
enforcement_result decode_reply(const std::string &bytes,
        const std::function<boost::any (const msgpack::object &)> &decode);

} // end namespace wire

} // end namespace timebox

#endif // LIBTIMEBOX_SERIALIZATION_HH
