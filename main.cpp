#include <stencil/loader.hpp>
#include <stencil/exceptions.hpp>
#include <iostream>

#include <spdlog/spdlog.h>

using namespace std ;
using namespace stencil ;

// usage: stencil_probe <name> [root ...]
// with no roots the name is taken as an absolute path

int main(int argc, char *argv[]) {

    if ( argc < 2 ) {
        cerr << "usage: " << argv[0] << " <name> [root ...]" << endl ;
        return 1 ;
    }

    spdlog::set_level(spdlog::level::debug) ;

    Configuration config ;
    for( int i=2 ; i<argc ; i++ )
        config.add("path", argv[i]) ;

    FileResourceLoader loader(config) ;

    try {
        ResolvedResource res = loader.resolve(argv[1]) ;

        cout << "root: '" << res.root_ << "'" << endl ;
        cout << "file: " << res.path_ << endl ;
        cout << "modified: " << res.last_modified_ << endl ;
        cout << "stale: " << boolalpha << loader.isStale(argv[1], loader.lastModified(argv[1])) << endl ;
        cout << endl << res.stream_->rdbuf() ;
    }
    catch ( ResourceNotFoundException &e ) {
        cerr << e.what() << endl ;
        return 1 ;
    }
    catch ( InvalidResourceNameException &e ) {
        cerr << e.what() << endl ;
        return 1 ;
    }
}
