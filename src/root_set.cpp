#include <stencil/root_set.hpp>
#include <stencil/configuration.hpp>

using namespace std ;

namespace stencil {

RootSet::RootSet(const vector<string> &roots): roots_(roots) {
    if ( roots_.empty() ) roots_.emplace_back() ;
}

RootSet RootSet::fromConfiguration(const Configuration &config) {
    if ( !config.has("path") ) return RootSet() ;
    return RootSet(config.getList("path")) ;
}

string RootSet::fileFor(const string &root, const string &path) {

    if ( root.empty() ) return path ;

    // a leading separator must not turn the name into an absolute path
    size_t start = ( !path.empty() && path[0] == '/' ) ? 1 : 0 ;

    string file(root) ;
    if ( file.back() != '/' ) file += '/' ;
    file.append(path, start, string::npos) ;

    return file ;
}

}
