#include "gtest/gtest.h"
#include "timebox/serialization.hh"

#include <functional>
#include <map>
#include <stdexcept>

using namespace timebox;

namespace {

struct point {
    int x;
    int y;
    MSGPACK_DEFINE(x, y);
};

struct raw {
    int a;
};

std::function<boost::any (const msgpack::object &)> as_int = wire::value_decoder<int>();

} // anon

TEST(Serializable, Accepted) {
    EXPECT_TRUE(is_serializable<int>::value);
    EXPECT_TRUE(is_serializable<bool>::value);
    EXPECT_TRUE(is_serializable<double>::value);
    EXPECT_TRUE(is_serializable<std::string>::value);
    EXPECT_TRUE(is_serializable<std::vector<int>>::value);
    EXPECT_TRUE((is_serializable<std::map<std::string, std::vector<double>>>::value));
    EXPECT_TRUE((is_serializable<std::pair<int, std::string>>::value));
    EXPECT_TRUE((is_serializable<std::tuple<int, std::string, point>>::value));
    EXPECT_TRUE(is_serializable<point>::value);
    EXPECT_TRUE(is_serializable<void>::value);
}

TEST(Serializable, Rejected) {
    EXPECT_FALSE(is_serializable<int *>::value);
    EXPECT_FALSE(is_serializable<const char *>::value);
    EXPECT_FALSE(is_serializable<long double>::value);
    EXPECT_FALSE(is_serializable<raw>::value);
    EXPECT_FALSE(is_serializable<std::vector<int *>>::value);
    EXPECT_FALSE((is_serializable<std::map<std::string, raw>>::value));
    EXPECT_FALSE(is_serializable<std::function<void ()>>::value);
    EXPECT_FALSE((all_serializable<int, std::string, raw>::value));
    EXPECT_TRUE((all_serializable<>::value));
}

TEST(Serializable, Describe) {
    const std::string args = describe_unserializable<int, int, int *>();
    EXPECT_NE(std::string::npos, args.find("argument 2 (int*)"));
    EXPECT_EQ(std::string::npos, args.find("argument 1"));
    EXPECT_EQ(std::string::npos, args.find("return value"));
    EXPECT_NE(std::string::npos, describe_unserializable<raw>().find("return value"));
}

TEST(Reply, Value) {
    enforcement_result r = wire::decode_reply(wire::pack_value(42), as_int);
    ASSERT_EQ(enforcement_result::outcome::completed, r.status);
    EXPECT_EQ(42, boost::any_cast<int>(r.value));
}

TEST(Reply, Void) {
    enforcement_result r = wire::decode_reply(wire::pack_void(), wire::value_decoder<void>());
    EXPECT_EQ(enforcement_result::outcome::completed, r.status);
    EXPECT_TRUE(r.value.empty());
}

TEST(Reply, RegisteredException) {
    enforcement_result r = wire::decode_reply(
        wire::pack_exception(typeid(std::out_of_range).name(), "oops"), as_int);
    ASSERT_EQ(enforcement_result::outcome::completed_with_error, r.status);
    EXPECT_THROW(std::rethrow_exception(r.error), std::out_of_range);
}

TEST(Reply, UnknownException) {
    enforcement_result r = wire::decode_reply(wire::pack_exception("N3foo3barE", "oops"), as_int);
    try {
        std::rethrow_exception(r.error);
    } catch (remote_error &e) {
        EXPECT_EQ("foo::bar", e.type_name());
        EXPECT_STREQ("foo::bar: oops", e.what());
    }
}

TEST(Reply, ManualRegistration) {
    register_exception(typeid(raw), [](const std::string &what) {
        return std::make_exception_ptr(std::domain_error("raw: " + what));
    });
    enforcement_result r = wire::decode_reply(wire::pack_exception(typeid(raw).name(), "x"), as_int);
    EXPECT_THROW(std::rethrow_exception(r.error), std::domain_error);
}

TEST(Reply, NotSerializable) {
    EXPECT_THROW(wire::decode_reply(wire::pack_not_serializable("too big"), as_int),
        result_not_serializable);
}

TEST(Reply, TypeMismatch) {
    EXPECT_THROW(wire::decode_reply(wire::pack_value(std::string("abc")), as_int),
        result_not_serializable);
}

TEST(Reply, Corrupt) {
    EXPECT_THROW(wire::decode_reply(std::string("\xc1", 1), as_int), worker_error);
    const std::string whole = wire::pack_value(std::string(100, 'x'));
    EXPECT_THROW(wire::decode_reply(whole.substr(0, 10), as_int), worker_error);
}

TEST(Reply, Malformed) {
    msgpack::sbuffer scalar;
    msgpack::pack(scalar, 5);
    EXPECT_THROW(wire::decode_reply(std::string(scalar.data(), scalar.size()), as_int), worker_error);

    msgpack::sbuffer unknown;
    msgpack::packer<msgpack::sbuffer> pk(&unknown);
    pk.pack_array(2);
    pk.pack(9);
    pk.pack_nil();
    EXPECT_THROW(wire::decode_reply(std::string(unknown.data(), unknown.size()), as_int), worker_error);
}
