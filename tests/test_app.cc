#include "gtest/gtest.h"
#include "timebox/app.hh"

#include <string>
#include <vector>

using namespace timebox;

namespace {

//! argv for application::parse, owns the strings
struct args {
    std::vector<std::string> strings;
    std::vector<char *> ptrs;

    args(std::initializer_list<std::string> a) : strings(a) {
        for (auto &s : strings) {
            ptrs.push_back(&s[0]);
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }
    char **argv() { return ptrs.data(); }
};

const char *app_name = "timebox-test-app";

} // anon

TEST(App, Defaults) {
    app_config conf;
    application app("1.0", conf, app_name);
    args a{app_name};
    app.parse(a.argc(), a.argv());

    EXPECT_EQ(-1, conf.timeout_seconds);
    EXPECT_TRUE(conf.use_signals);
    EXPECT_EQ("timebox-test-app.conf", conf.config_path);

    timeout t = conf.make_timeout();
    EXPECT_TRUE(t.spec().unlimited());
    EXPECT_TRUE(t.signals());
}

TEST(App, TimeoutOptions) {
    app_config conf;
    application app("1.0", conf, app_name);
    args a{app_name, "--timeout", "2.5", "--use-signals", "false", "--timeout-message", "late"};
    app.parse(a.argc(), a.argv());

    EXPECT_EQ(2.5, conf.timeout_seconds);
    EXPECT_FALSE(conf.use_signals);
    EXPECT_EQ("late", conf.timeout_message);

    timeout t = conf.make_timeout();
    EXPECT_EQ(timeout_spec::form::seconds, t.spec().which());
    EXPECT_EQ(2.5, t.spec().seconds());
    EXPECT_FALSE(t.signals());
    try {
        t.policy().apply();
        FAIL() << "policy returned";
    } catch (timeout_expired &e) {
        EXPECT_STREQ("late", e.what());
    }
}

TEST(App, ConfiguredTimeoutApplies) {
    app_config conf;
    application app("1.0", conf, app_name);
    args a{app_name, "--timeout", "0.1"};
    app.parse(a.argc(), a.argv());

    auto f = conf.make_timeout()([] {
        this_call::sleep_for(std::chrono::seconds(2));
    });
    EXPECT_THROW(f(), timeout_expired);
}

TEST(App, RejectsBadTimeout) {
    app_config conf;
    application app("1.0", conf, app_name);
    args a{app_name, "--timeout", "1e12"};
    EXPECT_THROW(app.parse(a.argc(), a.argv()), invalid_timeout_spec);
}

TEST(App, RejectsUnknownOption) {
    app_config conf;
    application app("1.0", conf, app_name);
    args a{app_name, "--no-such-option"};
    EXPECT_THROW(app.parse(a.argc(), a.argv()), boost::program_options::error);
}

TEST(App, Help) {
    app_config conf;
    application app("1.0", conf, app_name);
    app.usage = "usage: test";
    args a{app_name};
    app.parse(a.argc(), a.argv());
    std::ostringstream os;
    app.showhelp(os);
    EXPECT_NE(std::string::npos, os.str().find("usage: test"));
    EXPECT_NE(std::string::npos, os.str().find("--timeout"));
    EXPECT_NE(std::string::npos, os.str().find("--glog-v"));
}
