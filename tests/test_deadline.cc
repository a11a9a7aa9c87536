#include "gtest/gtest.h"
#include "timebox/deadline.hh"
#include "timebox/error.hh"
#include <cmath>
#include <limits>
#include <sstream>

using namespace timebox;
using namespace std::chrono;

namespace {

const deadline_clock::time_point now = deadline_clock::now();
const system_clock::time_point wall_now = system_clock::now();

deadline at(const timeout_spec &spec) {
    return resolve(spec, now, wall_now);
}

// offset of the resolved expiry from now, in microseconds
long long offset_us(const timeout_spec &spec) {
    return duration_cast<microseconds>(at(spec).expiry() - now).count();
}

} // anon

TEST(Deadline, FormsAgree) {
    EXPECT_NEAR(5000000, offset_us(timeout_spec(5.0)), 1);
    EXPECT_NEAR(5000000, offset_us(seconds(5)), 1);
    EXPECT_NEAR(5000000, offset_us(milliseconds(5000)), 1);
    EXPECT_NEAR(5000000, offset_us(hms(0, 0, 5)), 1);
    EXPECT_NEAR(5000000, offset_us(wall_now + seconds(5)), 1);
}

TEST(Deadline, ComponentsSum) {
    EXPECT_NEAR(3661500000LL, offset_us(timeout_spec::components(1, 1, 1.5)), 1);
    EXPECT_NEAR(90000000, offset_us(hms(0, 1.5)), 1);
    EXPECT_EQ(timeout_spec::form::components, timeout_spec(hms()).which());
}

TEST(Deadline, Unlimited) {
    deadline d = at(timeout_spec());
    EXPECT_TRUE(d.unlimited());
    EXPECT_FALSE(d.expired(now + hours(24 * 365)));
    EXPECT_EQ(deadline::duration::max(), d.remaining(now));
    EXPECT_TRUE(deadline::never().unlimited());
}

TEST(Deadline, ZeroExpiresImmediately) {
    for (const timeout_spec &spec : {timeout_spec(0.0),
            timeout_spec(seconds(0)), timeout_spec(hms())})
    {
        deadline d = at(spec);
        EXPECT_FALSE(d.unlimited()) << spec;
        EXPECT_TRUE(d.expired(now)) << spec;
        EXPECT_EQ(deadline::duration::zero(), d.remaining(now)) << spec;
    }
}

TEST(Deadline, PastInstantIsZero) {
    deadline d = at(wall_now - seconds(10));
    EXPECT_TRUE(d.expired(now));
    EXPECT_EQ(deadline::duration::zero(), d.remaining(now));
    EXPECT_EQ(now, d.expiry());
}

TEST(Deadline, RemainingNeverNegative) {
    deadline d = at(timeout_spec(1.0));
    EXPECT_EQ(deadline::duration::zero(), d.remaining(now + seconds(2)));
    EXPECT_FALSE(d.expired(now + milliseconds(999)));
    EXPECT_TRUE(d.expired(now + seconds(1)));
    EXPECT_EQ(seconds(1), d.remaining(now));
}

TEST(Deadline, InvalidSpecs) {
    EXPECT_THROW(at(timeout_spec(-1.0)), invalid_timeout_spec);
    EXPECT_THROW(at(timeout_spec(-0.001)), invalid_timeout_spec);
    EXPECT_THROW(at(timeout_spec(std::nan(""))), invalid_timeout_spec);
    EXPECT_THROW(at(timeout_spec(std::numeric_limits<double>::infinity())), invalid_timeout_spec);
    EXPECT_THROW(at(timeout_spec(max_timeout_seconds * 2)), invalid_timeout_spec);
    EXPECT_THROW(at(seconds(-3)), invalid_timeout_spec);
    EXPECT_THROW(at(hms(0, -1, 0)), invalid_timeout_spec);
    EXPECT_THROW(at(timeout_spec::components(1, 0, -0.5)), invalid_timeout_spec);
    EXPECT_THROW(at(hms(std::nan(""))), invalid_timeout_spec);
    EXPECT_THROW(at(wall_now + hours(24 * 365 * 100)), invalid_timeout_spec);
}

TEST(Deadline, InvalidSpecMessage) {
    try {
        resolve(timeout_spec(-2.0));
        FAIL() << "negative timeout resolved";
    } catch (invalid_timeout_spec &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("negative"));
    }
}

TEST(Deadline, ResolveUsesCurrentTime) {
    const auto before = deadline_clock::now();
    deadline d = resolve(timeout_spec(2.0));
    const auto after = deadline_clock::now();
    EXPECT_GE(d.expiry(), before + seconds(2));
    EXPECT_LE(d.expiry(), after + seconds(2));
    EXPECT_FALSE(d.expired());
}

TEST(Deadline, Output) {
    std::ostringstream os;
    os << timeout_spec(1.5) << " " << timeout_spec() << " " << timeout_spec(hms(1, 2, 3));
    EXPECT_EQ("1.5s unlimited 1h2m3s", os.str());
}
