#ifndef STENCIL_LOGGING_HPP
#define STENCIL_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace stencil {

// name under which the library logger is registered with spdlog
extern const char *g_logger_name ;

// shared logger used by loaders that were not given one explicitly. Created on first use with a
// colored stderr sink, unless a logger with the same name was registered by the application.
std::shared_ptr<spdlog::logger> defaultLogger() ;

}

#endif
