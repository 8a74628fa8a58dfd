#include <stencil/path_sanitizer.hpp>

#include <vector>

using namespace std ;

namespace stencil {

PathStatus sanitizePath(const string &name, string &sanitized) {

    if ( name.empty() ) return PathStatus::Empty ;

    if ( name.find('\0') != string::npos ) return PathStatus::Rejected ;

    vector<string> segments ;

    size_t pos = 0 ;
    while ( pos <= name.size() ) {
        size_t next = name.find_first_of("/\\", pos) ;
        if ( next == string::npos ) next = name.size() ;

        string segment = name.substr(pos, next - pos) ;
        pos = next + 1 ;

        if ( segment.empty() || segment == "." ) continue ;
        else if ( segment == ".." ) {
            // nothing left to climb out of
            if ( segments.empty() ) return PathStatus::Rejected ;
            segments.pop_back() ;
        }
        else
            segments.emplace_back(std::move(segment)) ;
    }

    sanitized.clear() ;

    if ( segments.empty() ) sanitized = "/" ;

    for( const string &s: segments ) {
        sanitized += '/' ;
        sanitized += s ;
    }

    return PathStatus::Valid ;
}

}
