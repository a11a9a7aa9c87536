#ifndef LIBTIMEBOX_ERROR_HH
#define LIBTIMEBOX_ERROR_HH

#include <exception>
#include <algorithm>
#include <memory>
#include <sstream>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <typeinfo>
#include <type_traits>
#include <string.h>
#include <errno.h>
#include "timebox/logging.hh"

namespace timebox {

//! capture the current stack trace
struct saved_backtrace {
    static constexpr size_t max_frames = 50;
    void *array[max_frames];
    int size;

    saved_backtrace() { capture(); }

    void capture();
    std::string str();
};

//! demangled name of a type_info, or the raw name if demangling fails
std::string demangle(const char *name);

template <class T>
inline std::string type_name() { return demangle(typeid(T).name()); }

//! captures the backtrace in the constructor
class backtrace_exception : public std::exception {
public:
    std::string backtrace_str() { return bt.str(); }
private:
    saved_backtrace bt;
};

//! construct a what() string in printf() format
class errorx : public backtrace_exception {
protected:
    static constexpr size_t _bufsize = 256;
    char _buf[_bufsize];

    void init(const char *msg, size_t len);
    void initf(const char *fmt, ...) __attribute__((format (printf, 2, 3)));

    errorx() { _buf[0] = '\0'; }

public:
    errorx(const std::string &msg) { init(msg.data(), msg.size()); }
    errorx(const char *msg)        { init(msg, strlen(msg)); }

    //! \param fmt printf-style format string
    template <typename A, typename... Args>
    errorx(const char *fmt, A &&a, Args&&... args) { initf(fmt, std::forward<A>(a), std::forward<Args>(args)...); }

    //! \return a string describing the error
    const char *what() const noexcept override { return _buf; }
};

// helper to make sure errno is saved first, below
class errno_saver {
    friend class errno_error;
    const int _error;
    errno_saver(const int e = errno) : _error(e) {}
};

//! exception that sets what() based on current errno value
class errno_error : private errno_saver, public errorx {
public:
    errno_error() { _add_strerror(); }

    errno_error(const errno_error &) = default;
    errno_error(errno_error &&e) = default;
    errno_error(errno_error &e) : errno_saver(e), errorx(e) {}

    template <typename... Args>
    errno_error(Args&&... args)
        : errorx(std::forward<Args>(args)...) { _add_strerror(); }

    template <typename... Args>
    errno_error(const int err, Args&&... args)
        : errno_saver(err), errorx(std::forward<Args>(args)...) { _add_strerror(); }

    int error() const { return _error; }

private:
    void _add_strerror();
};

//! convenience wrapper for throwing errno_error
template <class ...Args>
void throw_if(bool condition, Args ...args) {
    if (condition) {
        throw errno_error(std::forward<Args>(args)...);
    }
}

//! prevent conversion to bool
template <class NotBool, class ...Args>
void throw_if(NotBool, Args ...args) {
    static_assert(std::is_same<NotBool, bool>::value, "using throw_if without a boolean");
}

//! conveniently create an errorx with stream output

enum endx_t { endx };

template <class Exception>
class error_stream {
    std::unique_ptr<std::ostringstream> _os;

public:
    error_stream()                     : _os(new std::ostringstream) {}
    error_stream(error_stream &&other) : _os(std::move(other._os))   {}
    ~error_stream()                    { if (_os) LOG(FATAL) << "error_stream<" << typeid(Exception).name() << "> missing endx"; }

    error_stream(const error_stream &) = delete;
    error_stream & operator = (const error_stream &) = delete;
    error_stream & operator = (error_stream &&) = delete;

    template <class T>
    error_stream & operator << (const T &t) {
        if (_os) *_os << t;
        return *this;
    }
    void operator << (endx_t) {
        if (_os) {
            auto os = std::move(_os);
            throw Exception(os->str());
        }
    }
};

template <class Exception = errorx>
inline error_stream<Exception> throw_stream() { return error_stream<Exception>(); }

////// deadline enforcement errors //////

//! malformed or negative timeout specification; nothing was executed
struct invalid_timeout_spec : errorx {
    using errorx::errorx;
};

//! signal enforcement requested from a thread that can't receive SIGALRM
struct unsupported_context : errorx {
    using errorx::errorx;
};

//! default exception raised when a deadline passes
struct timeout_expired : errorx {
    timeout_expired() : errorx("timed out") {}
    timeout_expired(const std::string &msg) : errorx(msg) {}
    timeout_expired(const char *msg) : errorx(msg) {}
};

//! an argument or return type can't cross into the worker process
struct non_serializable_callable : errorx {
    using errorx::errorx;
};

//! the worker computed a value but failed to encode it for the return trip
struct result_not_serializable : errorx {
    using errorx::errorx;
};

//! the worker process went away without sending a reply
struct worker_error : errorx {
    using errorx::errorx;
};

//! exception raised in the worker whose type isn't registered
//! with register_exception(), carried back by name and message
class remote_error : public errorx {
    std::string _type_name;
public:
    remote_error(std::string type_name_, const std::string &msg)
        : errorx("%s: %s", type_name_.c_str(), msg.c_str()),
          _type_name(std::move(type_name_)) {}

    //! demangled type name of the exception thrown in the worker
    const std::string &type_name() const { return _type_name; }
};

} // end namespace timebox

#endif // LIBTIMEBOX_ERROR_HH
