#include "timebox/app.hh"
#include "timebox/interrupt.hh"
#include "timebox/timeout.hh"
#include <iostream>

using namespace timebox;
using namespace std;

struct demo_config : app_config {
    double work_seconds;
    bool fallback;
};

static demo_config conf;

static int slow_answer(double seconds) {
    this_call::sleep_for(chrono::duration<double>(seconds));
    return 42;
}

static int gave_up(int a, int b) {
    return a + b;
}

int main(int argc, char *argv[]) {
    application app("0.1", conf);
    namespace po = boost::program_options;
    app.opts.configuration.add_options()
        ("work", po::value<double>(&conf.work_seconds)->default_value(3),
         "seconds the simulated work takes")
        ("fallback", po::value<bool>(&conf.fallback)->default_value(false),
         "return a fallback value instead of raising on timeout")
        ;
    app.usage = "Run a slow call under a deadline";
    app.usage_example = string(argv[0]) + " --timeout 1 --work 3 --use-signals false";
    app.parse_args(argc, argv);

    timeout t = conf.make_timeout();
    if (conf.fallback) {
        t.on_timeout(gave_up, -1, 0);
    }
    auto answer = t(slow_answer);

    const auto start = deadline_clock::now();
    try {
        const int r = answer(conf.work_seconds);
        LOG(INFO) << "answer: " << r;
        cout << r << endl;
    } catch (timeout_expired &e) {
        LOG(ERROR) << "gave up: " << e.what();
        return 2;
    }
    LOG(INFO) << "took " << chrono::duration_cast<chrono::milliseconds>(
        deadline_clock::now() - start).count() << "ms";
    return 0;
}
