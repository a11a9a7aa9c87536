#include "timebox/serialization.hh"

#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace timebox {

namespace {

template <class E>
std::exception_ptr make_exception(const std::string &what) {
    return std::make_exception_ptr(E(what));
}

struct exception_registry {
    std::mutex mtx;
    std::unordered_map<std::string, exception_factory> factories;

    exception_registry() {
        add<std::exception>([](const std::string &what) {
            return std::make_exception_ptr(std::runtime_error(what));
        });
        add<std::runtime_error>(make_exception<std::runtime_error>);
        add<std::logic_error>(make_exception<std::logic_error>);
        add<std::invalid_argument>(make_exception<std::invalid_argument>);
        add<std::domain_error>(make_exception<std::domain_error>);
        add<std::length_error>(make_exception<std::length_error>);
        add<std::out_of_range>(make_exception<std::out_of_range>);
        add<std::range_error>(make_exception<std::range_error>);
        add<std::overflow_error>(make_exception<std::overflow_error>);
        add<std::underflow_error>(make_exception<std::underflow_error>);
        add<errorx>(make_exception<errorx>);
        add<errno_error>([](const std::string &what) {
            // what() already carries the strerror text
            return std::make_exception_ptr(errno_error(0, what));
        });
        add<invalid_timeout_spec>(make_exception<invalid_timeout_spec>);
        add<unsupported_context>(make_exception<unsupported_context>);
        add<timeout_expired>(make_exception<timeout_expired>);
        add<non_serializable_callable>(make_exception<non_serializable_callable>);
        add<result_not_serializable>(make_exception<result_not_serializable>);
        add<worker_error>(make_exception<worker_error>);
    }

    template <class E>
    void add(exception_factory f) {
        factories[typeid(E).name()] = std::move(f);
    }
};

exception_registry &registry() {
    static exception_registry r;
    return r;
}

} // anon

void register_exception(const std::type_info &type, exception_factory factory) {
    auto &r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    r.factories[type.name()] = std::move(factory);
}

std::exception_ptr remote_exception(const std::string &mangled_type, const std::string &what) {
    exception_factory factory;
    {
        auto &r = registry();
        std::lock_guard<std::mutex> lock(r.mtx);
        auto i = r.factories.find(mangled_type);
        if (i != r.factories.end()) {
            factory = i->second;
        }
    }
    if (factory) {
        return factory(what);
    }
    const std::string name = mangled_type.empty() ? "unknown exception" : demangle(mangled_type.c_str());
    return std::make_exception_ptr(remote_error(name, what));
}

namespace wire {

std::string pack_void() {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(2);
    pk.pack(static_cast<int>(reply_kind::value));
    pk.pack_nil();
    return std::string(buf.data(), buf.size());
}

std::string pack_exception(const std::string &mangled_type, const std::string &what) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(3);
    pk.pack(static_cast<int>(reply_kind::exception));
    pk.pack(mangled_type);
    pk.pack(what);
    return std::string(buf.data(), buf.size());
}

std::string pack_not_serializable(const std::string &what) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(2);
    pk.pack(static_cast<int>(reply_kind::result_not_serializable));
    pk.pack(what);
    return std::string(buf.data(), buf.size());
}

enforcement_result decode_reply(const std::string &bytes,
        const std::function<boost::any (const msgpack::object &)> &decode)
{
    msgpack::unpacked msg;
    try {
        msgpack::unpack(msg, bytes.data(), bytes.size());
    } catch (std::exception &e) {
        throw_stream<worker_error>() << "corrupt worker reply (" << bytes.size()
            << " bytes): " << e.what() << endx;
    }

    const msgpack::object &o = msg.get();
    if (o.type != msgpack::type::ARRAY || o.via.array.size < 2) {
        throw worker_error("malformed worker reply");
    }
    const msgpack::object *items = o.via.array.ptr;

    int kind = -1;
    std::string text;
    try {
        kind = items[0].as<int>();
        switch (static_cast<reply_kind>(kind)) {
        case reply_kind::value:
            break;
        case reply_kind::exception:
            if (o.via.array.size < 3) {
                throw worker_error("malformed exception reply");
            }
            return enforcement_result::completed_with_error(
                remote_exception(items[1].as<std::string>(), items[2].as<std::string>()));
        case reply_kind::result_not_serializable:
            text = items[1].as<std::string>();
            break;
        default:
            throw_stream<worker_error>() << "unknown worker reply kind " << kind << endx;
        }
    } catch (msgpack::type_error &e) {
        throw_stream<worker_error>() << "malformed worker reply: " << e.what() << endx;
    }

    if (static_cast<reply_kind>(kind) == reply_kind::result_not_serializable) {
        throw result_not_serializable(text);
    }

    try {
        return enforcement_result::completed(decode(items[1]));
    } catch (msgpack::type_error &e) {
        throw_stream<result_not_serializable>() << "worker result doesn't match the return type: "
            << e.what() << endx;
    }
}

} // end namespace wire

} // end namespace timebox
