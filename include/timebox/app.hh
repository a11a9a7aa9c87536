#ifndef LIBTIMEBOX_APP_HH
#define LIBTIMEBOX_APP_HH

#include <syslog.h>
#include <iostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "timebox/logging.hh"
#include "timebox/timeout.hh"

namespace timebox {

//! inherit application config from this
struct app_config {
    std::string config_path;

    // google glog options
    int glog_min_level;
    int glog_stderr_level;
    int glog_syslog_level;
    int glog_syslog_facility;
    int glog_file_level;
    std::string glog_dir;
    int glog_maxsize;
    int glog_v;
    std::string glog_vmodule;

    // default timeout for calls made by the application
    double timeout_seconds = -1;
    bool use_signals = true;
    std::string timeout_message;

    void configure_glog(const char *name) const;

    //! decorator built from the timeout options, unlimited if timeout_seconds < 0
    timeout make_timeout() const;
};

namespace po = boost::program_options;

//! setup basic options for all applications
struct options {
    const unsigned line_length;

    po::options_description generic;
    po::options_description configuration;
    po::options_description hidden;
    po::options_description visible;
    po::options_description cmdline_options;
    po::options_description config_file_options;
    po::positional_options_description pdesc;

    options(const char *appname, app_config &c);

    void setup() {
        cmdline_options.add(generic).add(configuration).add(hidden);
        config_file_options.add(configuration).add(hidden);
        visible.add(generic).add(configuration);
    }
};

//! helper for an application with logging, config, and versioning
class application {
public:
    options opts;
    po::variables_map vm;
    std::string name;
    std::string version;
    std::string usage;
    std::string usage_example;

    application(const char *version_, app_config &c,
            const char *name_= program_invocation_short_name);

    application(const application &) = delete;
    application &operator = (const application &) = delete;

    void showhelp(std::ostream &os = std::cerr);

    //! parse command line and config file, exits on --help, --version or errors
    void parse_args(int argc, char *argv[]);

    //! like parse_args but throws instead of exiting, call only once
    void parse(int argc, char *argv[]);

    template <typename ConfigT>
    const ConfigT &conf() const {
        return static_cast<ConfigT &>(_conf);
    }

private:
    app_config &_conf;
};

} // end namespace timebox

#endif // LIBTIMEBOX_APP_HH
