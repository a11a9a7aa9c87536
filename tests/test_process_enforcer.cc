#include "gtest/gtest.h"
#include "timebox/process_enforcer.hh"

#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <dirent.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace timebox;
using namespace std::chrono;

namespace {

struct point {
    int x;
    int y;
    MSGPACK_DEFINE(x, y);
};

struct raw {
    int a;
};

struct custom_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct registered_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

//! processes in /proc whose parent is this process
int child_count() {
    const pid_t self = getpid();
    DIR *d = opendir("/proc");
    if (d == nullptr) return -1;
    int n = 0;
    while (dirent *ent = readdir(d)) {
        if (!isdigit(static_cast<unsigned char>(ent->d_name[0]))) continue;
        std::ifstream stat(std::string("/proc/") + ent->d_name + "/stat");
        std::string line;
        if (!std::getline(stat, line)) continue;
        // pid (comm) state ppid ...
        const size_t comm_end = line.rfind(')');
        if (comm_end == std::string::npos) continue;
        std::istringstream fields(line.substr(comm_end + 1));
        char state;
        pid_t ppid;
        if (fields >> state >> ppid && ppid == self) ++n;
    }
    closedir(d);
    return n;
}

::testing::AssertionResult no_children() {
    errno = 0;
    const pid_t p = waitpid(-1, nullptr, WNOHANG);
    if (p != -1 || errno != ECHILD) {
        return ::testing::AssertionFailure() << "waitpid found child " << p;
    }
    const int n = child_count();
    if (n != 0) {
        return ::testing::AssertionFailure() << n << " children in /proc";
    }
    return ::testing::AssertionSuccess();
}

milliseconds since(deadline_clock::time_point start) {
    return duration_cast<milliseconds>(deadline_clock::now() - start);
}

template <class E>
std::string rethrown_what(const enforcement_result &r) {
    try {
        std::rethrow_exception(r.error);
    } catch (E &e) {
        return e.what();
    }
    return std::string();
}

} // anon

TEST(ProcessEnforcer, Completes) {
    auto add = [](int a, int b) { return a + b; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(add, 1, 2);
    ASSERT_EQ(enforcement_result::outcome::completed, r.status);
    EXPECT_EQ(3, boost::any_cast<int>(r.value));
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, ContainersCrossBoundary) {
    auto join = [](const std::vector<std::string> &parts, const std::string &sep)
            -> std::map<std::string, size_t> {
        std::map<std::string, size_t> m;
        std::string out;
        for (const auto &p : parts) {
            if (!out.empty()) out += sep;
            out += p;
        }
        m[out] = parts.size();
        return m;
    };
    std::vector<std::string> parts{"a", "b", "c"};
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(join, parts, std::string("-"));
    ASSERT_EQ(enforcement_result::outcome::completed, r.status);
    auto m = boost::any_cast<std::map<std::string, size_t>>(r.value);
    ASSERT_EQ(1u, m.size());
    EXPECT_EQ(3u, m["a-b-c"]);
}

TEST(ProcessEnforcer, UserTypes) {
    auto swap_xy = [](point p) { return point{p.y, p.x}; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(swap_xy, point{1, 2});
    ASSERT_EQ(enforcement_result::outcome::completed, r.status);
    point p = boost::any_cast<point>(r.value);
    EXPECT_EQ(2, p.x);
    EXPECT_EQ(1, p.y);
}

TEST(ProcessEnforcer, VoidCall) {
    auto nothing = [] {};
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(nothing);
    EXPECT_EQ(enforcement_result::outcome::completed, r.status);
    EXPECT_TRUE(r.value.empty());
}

TEST(ProcessEnforcer, WorkerStateIsIsolated) {
    int counter = 0;
    auto bump = [&counter] { return ++counter; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(bump);
    EXPECT_EQ(1, boost::any_cast<int>(r.value));
    EXPECT_EQ(0, counter);
}

TEST(ProcessEnforcer, TimeoutKillsWorker) {
    auto stuck = []() -> int {
        ::sleep(30);
        return 1;
    };
    const auto start = deadline_clock::now();
    process_enforcer e(resolve(timeout_spec(0.3)));
    enforcement_result r = e.run(stuck);
    EXPECT_TRUE(r.expired());
    EXPECT_GE(since(start), milliseconds(290));
    EXPECT_LT(since(start), milliseconds(5000));
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, TimeoutKillsBusyWorker) {
    auto spin = []() -> int {
        volatile bool forever = true;
        while (forever) {}
        return 1;
    };
    process_enforcer e(resolve(timeout_spec(0.2)));
    EXPECT_TRUE(e.run(spin).expired());
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, TimeoutKillsWorkerIgnoringSignals) {
    auto stubborn = []() -> int {
        sigset_t all;
        sigfillset(&all);
        sigprocmask(SIG_BLOCK, &all, nullptr);
        signal(SIGTERM, SIG_IGN);
        ::sleep(30);
        return 1;
    };
    process_enforcer e(resolve(timeout_spec(0.2)));
    EXPECT_TRUE(e.run(stubborn).expired());
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, ExceptionKeepsType) {
    auto reject = [](int n) -> int {
        throw std::invalid_argument("bad input " + std::to_string(n));
    };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(reject, 7);
    ASSERT_EQ(enforcement_result::outcome::completed_with_error, r.status);
    EXPECT_EQ("bad input 7", rethrown_what<std::invalid_argument>(r));
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, WorkerTimeoutExpiredKeepsType) {
    auto give_up = []() -> int { throw timeout_expired("inner limit"); };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(give_up);
    ASSERT_EQ(enforcement_result::outcome::completed_with_error, r.status);
    EXPECT_EQ("inner limit", rethrown_what<timeout_expired>(r));
}

TEST(ProcessEnforcer, UnregisteredExceptionIsRemoteError) {
    auto fail = []() -> int { throw custom_error("went wrong"); };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(fail);
    ASSERT_EQ(enforcement_result::outcome::completed_with_error, r.status);
    try {
        std::rethrow_exception(r.error);
    } catch (remote_error &err) {
        EXPECT_NE(std::string::npos, err.type_name().find("custom_error"));
        EXPECT_NE(std::string::npos, std::string(err.what()).find("went wrong"));
    }
}

TEST(ProcessEnforcer, RegisteredException) {
    register_exception<registered_error>();
    auto fail = []() -> int { throw registered_error("known failure"); };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(fail);
    EXPECT_EQ("known failure", rethrown_what<registered_error>(r));
}

TEST(ProcessEnforcer, NonStandardException) {
    auto fail = []() -> int { throw 42; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    enforcement_result r = e.run(fail);
    try {
        std::rethrow_exception(r.error);
    } catch (remote_error &err) {
        EXPECT_EQ("unknown exception", err.type_name());
    }
}

TEST(ProcessEnforcer, NonSerializableArgument) {
    int x = 1;
    auto deref = [](int *p) { return *p; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    try {
        e.run(deref, &x);
        FAIL() << "pointer argument crossed into the worker";
    } catch (non_serializable_callable &err) {
        EXPECT_NE(std::string::npos, std::string(err.what()).find("argument 1"));
    }
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, NonSerializableResult) {
    auto make_raw = [] { return raw{1}; };
    process_enforcer e(resolve(timeout_spec(5.0)));
    EXPECT_THROW(e.run(make_raw), non_serializable_callable);
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, WorkerExitWithoutReply) {
    auto quit = []() -> int {
        _exit(3);
        return 1;
    };
    process_enforcer e(resolve(timeout_spec(5.0)));
    try {
        e.run(quit);
        FAIL() << "worker exit went unnoticed";
    } catch (worker_error &err) {
        EXPECT_NE(std::string::npos, std::string(err.what()).find("exited with status 3"));
    }
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, WorkerKilled) {
    auto die = []() -> int {
        kill(getpid(), SIGKILL);
        return 1;
    };
    process_enforcer e(resolve(timeout_spec(5.0)));
    EXPECT_THROW(e.run(die), worker_error);
    EXPECT_TRUE(no_children());
}

TEST(ProcessEnforcer, AnyThread) {
    auto add = [](int a, int b) { return a + b; };
    int result = 0;
    std::thread t([&] {
        process_enforcer e(resolve(timeout_spec(5.0)));
        result = boost::any_cast<int>(e.run(add, 20, 22).value);
    });
    t.join();
    EXPECT_EQ(42, result);
    EXPECT_TRUE(no_children());
}
