#ifndef LIBTIMEBOX_APPLY_HH
#define LIBTIMEBOX_APPLY_HH

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace timebox {

//! compile time list of tuple indices
template <std::size_t... I>
struct index_list {};

template <std::size_t N, std::size_t... I>
struct make_index_list : make_index_list<N - 1, N - 1, I...> {};

template <std::size_t... I>
struct make_index_list<0, I...> {
    typedef index_list<I...> type;
};

template <class Op, class Tuple>
struct tuple_result;

template <class Op, class... Types>
struct tuple_result<Op, std::tuple<Types...>> {
    typedef typename std::result_of<Op &(Types &...)>::type type;
};

template <class Op, class Tuple, std::size_t... I>
inline typename tuple_result<Op, Tuple>::type
apply_tuple_impl(Op &op, Tuple &t, index_list<I...>) {
    return op(std::get<I>(t)...);
}

//! call op with the elements of t as arguments (lvalues, t owns them)
template <class Op, class Tuple>
inline typename tuple_result<Op, Tuple>::type
apply_tuple(Op &op, Tuple &t) {
    return apply_tuple_impl(op, t,
        typename make_index_list<std::tuple_size<Tuple>::value>::type());
}

} // end namespace timebox

#endif // LIBTIMEBOX_APPLY_HH
