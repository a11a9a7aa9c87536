#ifndef LIBTIMEBOX_ANYFUNC_HH
#define LIBTIMEBOX_ANYFUNC_HH

#include <boost/any.hpp>
#include <functional>
#include <type_traits>
#include <utility>

namespace timebox {

// anyfunc - hold and call a function that may return void or non-void

using anyfunc = std::function<boost::any ()>;

namespace anyfunc_impl {
template <typename F> anyfunc make(F f,   std::true_type)   { return [f]() mutable -> boost::any { f(); return {}; }; }
template <typename F> anyfunc make(F &&f, std::false_type)  { return anyfunc(std::forward<F>(f)); }
}

template <typename F, typename R = typename std::result_of<F()>::type>
inline anyfunc make_anyfunc(F f) {
    return anyfunc_impl::make(std::move(f), typename std::is_void<R>::type());
}

inline anyfunc make_anyfunc(const anyfunc  &f) { return f; }
inline anyfunc make_anyfunc(      anyfunc &&f) { return std::move(f); }

// return a boost::any even if it's empty

template <class T> inline T    any_value(      const boost::any  &a) { return boost::any_cast<T>(a); }
template <class T> inline T    any_value(            boost::any &&a) { return std::move(boost::any_cast<T &>(a)); }
template <>        inline void any_value<void>(const boost::any  &)  {}
template <>        inline void any_value<void>(      boost::any &&)  {}

} // end namespace timebox

#endif // LIBTIMEBOX_ANYFUNC_HH
