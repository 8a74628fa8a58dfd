#include <stencil/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

using namespace std ;

namespace stencil {

const char *g_logger_name = "stencil" ;

static shared_ptr<spdlog::logger> createLogger() {
    auto logger = spdlog::get(g_logger_name) ;
    if ( logger ) return logger ;

    try {
        return spdlog::stderr_color_mt(g_logger_name) ;
    }
    catch ( spdlog::spdlog_ex & ) {
        // registered concurrently by someone else
        return spdlog::get(g_logger_name) ;
    }
}

shared_ptr<spdlog::logger> defaultLogger() {
    static shared_ptr<spdlog::logger> s_logger = createLogger() ;
    return s_logger ;
}

}
