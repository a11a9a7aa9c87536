#include "timebox/app.hh"
#include <fstream>
#include <sys/stat.h>

namespace timebox {

void app_config::configure_glog(const char *name) const {
    FLAGS_logtostderr = false; // turn master switch back off

    FLAGS_minloglevel = glog_min_level;
    FLAGS_stderrthreshold = glog_stderr_level;
    FLAGS_log_dir = glog_dir;
    FLAGS_max_log_size = glog_maxsize;
    FLAGS_v = glog_v;
    FLAGS_vmodule = glog_vmodule;

    if (glog_syslog_level >= 0 && glog_syslog_facility >= 0)
        google::SetSyslogLogging(glog_syslog_level, glog_syslog_facility);

    // Log only at the requested level (if any).
    // Other levels disabled by setting filename to "" (not null).
    for (int i = 0; i < google::NUM_SEVERITIES; ++i)
        google::SetLogDestination(i, (i == glog_file_level) ? name : "");
    // Ensure sane umask if we know we're writing log files.
    if (glog_file_level >= 0 && glog_file_level < google::NUM_SEVERITIES) {
        const int oldmask = umask(0777);
        const int newmask = oldmask & ~0555;
        umask(newmask);
        if (newmask != oldmask) {
            LOG(WARNING) << "umask changed to " << std::oct << std::showbase << newmask
                << " (was " << oldmask << ") to ensure readable logfiles";
        }
    }
}

timeout app_config::make_timeout() const {
    timeout t = timeout_seconds < 0 ? timeout() : timeout(timeout_seconds);
    t.use_signals(use_signals);
    if (!timeout_message.empty()) {
        t.exception_message(timeout_message);
    }
    return t;
}

options::options(const char *appname, app_config &c) :
    line_length(po::options_description::m_default_line_length),
    generic("Generic options",     line_length, line_length / 2),
    configuration("Configuration", line_length, line_length / 2),
    hidden("Hidden options",       line_length, line_length / 2),
    visible("Allowed options",     line_length, line_length / 2),
    cmdline_options(    line_length, line_length / 2),
    config_file_options(line_length, line_length / 2),
    pdesc()
{
    generic.add_options()
        ("version,v", "Show version")
        ("help", "Show help message")
        ;

    std::string conffile(appname);
    conffile += ".conf";
    configuration.add_options()
        ("config", po::value(&c.config_path)->default_value(conffile), "config file path")
        ("timeout", po::value(&c.timeout_seconds)->default_value(-1), "default call timeout in seconds (negative for no limit)")
        ("use-signals", po::value(&c.use_signals)->default_value(true), "interrupt calls with SIGALRM instead of running them in a worker process")
        ("timeout-message", po::value(&c.timeout_message)->default_value(""), "message carried by the timeout exception")
        ("glog-min", po::value(&c.glog_min_level)->default_value(0), "ignore log messages below this level")
        ("glog-stderr", po::value(&c.glog_stderr_level)->default_value(0), "log to stderr at or above this level")
        ("glog-syslog", po::value(&c.glog_syslog_level)->default_value(-1), "log to syslog at or above this level (if nonnegative)")
        ("glog-file", po::value(&c.glog_file_level)->default_value(-1), "log to file at or above this level (if nonnegative)")
        ("glog-dir", po::value(&c.glog_dir)->default_value(""), "write log files to this directory")
        ("glog-maxsize", po::value(&c.glog_maxsize)->default_value(1800), "max log size (in MB)")
        ("glog-v", po::value(&c.glog_v)->default_value(0), "log vlog messages at or below this value")
        ("glog-vmodule", po::value(&c.glog_vmodule), "comma separated <module>=<level>. overides glog-v")
        ;

    // TODO: make this cmdline-configurable
    c.glog_syslog_facility = LOG_USER;
}

application::application(const char *version_, app_config &c,
        const char *name_)
    : opts(name_, c), name(name_), version(version_), _conf(c)
{
}

void application::showhelp(std::ostream &os) {
    if (!usage.empty())
        os << usage << std::endl;
    os << opts.visible << std::endl;
    if (!usage_example.empty())
        os << usage_example << std::endl;
}

void application::parse(int argc, char *argv[]) {
    opts.setup();
    po::store(po::command_line_parser(argc, argv)
        .options(opts.cmdline_options).positional(opts.pdesc).run(), vm);
    po::notify(vm);

    std::ifstream config_stream(_conf.config_path.c_str());
    if (config_stream) {
        po::store(po::parse_config_file(config_stream, opts.config_file_options), vm);
        po::notify(vm);
    }

    // reject a bad default timeout now rather than on the first call
    if (_conf.timeout_seconds >= 0) {
        resolve(timeout_spec(_conf.timeout_seconds));
    }
}

void application::parse_args(int argc, char *argv[]) {
    try {
        parse(argc, argv);

        if (vm.count("help")) {
            showhelp();
            exit(1);
        }

        if (vm.count("version")) {
            std::cerr << version << std::endl;
            exit(1);
        }

        // apply glog options
        _conf.configure_glog(name.c_str());
    } catch (std::exception &e) {
        std::cerr << "argv[";
        for (int i=0; i<argc; ++i) {
            std::cerr << argv[i] << " ";
        }
        std::cerr << "]\n";
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        showhelp();
        exit(1);
    }
}

} // end namespace timebox
