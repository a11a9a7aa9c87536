#ifndef LIBTIMEBOX_LOGGING_HH
#define LIBTIMEBOX_LOGGING_HH

#include <glog/logging.h>
#include <glog/stl_logging.h>

#endif // LIBTIMEBOX_LOGGING_HH
