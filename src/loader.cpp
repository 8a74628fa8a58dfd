#include <stencil/loader.hpp>
#include <stencil/exceptions.hpp>
#include <stencil/logging.hpp>
#include <stencil/path_sanitizer.hpp>

#include "file_utils.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

using namespace std ;

namespace stencil {

ResourceLoader::ResourceLoader(const Configuration &config):
    caching_(config.getBoolean("cache", false)),
    check_interval_(config.getLong("modificationCheckInterval", 2)) {
}

string ResourceLoader::load(const string &name) {
    ResolvedResource res = resolve(name) ;
    return static_cast<stringstream const&>(stringstream() << res.stream_->rdbuf()).str() ;
}

static Configuration configFromRoots(const initializer_list<string> &root_folders) {
    Configuration config ;
    for( const string &r: root_folders )
        config.add("path", r) ;
    return config ;
}

FileResourceLoader::FileResourceLoader(const Configuration &config, shared_ptr<spdlog::logger> logger):
    ResourceLoader(config), roots_(RootSet::fromConfiguration(config)),
    logger_(logger ? logger : defaultLogger()) {
    init() ;
}

FileResourceLoader::FileResourceLoader(const initializer_list<string> &root_folders, shared_ptr<spdlog::logger> logger):
    FileResourceLoader(configFromRoots(root_folders), logger) {
}

void FileResourceLoader::init() {
    logger_->trace("FileResourceLoader: initialization starting.") ;

    for( const string &r: roots_ )
        logger_->info("FileResourceLoader: adding path '{}'", r) ;

    logger_->trace("FileResourceLoader: initialization complete.") ;
}

string FileResourceLoader::sanitize(const string &name) {
    string path ;

    switch ( sanitizePath(name, path) ) {
    case PathStatus::Valid:
        return path ;
    case PathStatus::Empty:
        throw InvalidResourceNameException("Need to specify a file name or file path!") ;
    case PathStatus::Rejected:
    default:
        logger_->error("FileResourceLoader: File resource error: argument '{}' contains .. and may be trying "
                       "to access content outside of template root. Rejected.", name) ;
        throw ResourceRejectedException("FileResourceLoader: cannot find " + name, name) ;
    }
}

ResolvedResource FileResourceLoader::resolve(const string &name) {

    string path = sanitize(name) ;

    for ( const string &r: roots_ ) {

        ResolvedResource res ;

        if ( findTemplate(r, path, res) ) {
            res.name_ = name ;
            provenance_.put(name, r) ;
            logger_->debug("FileResourceLoader: found '{}' in '{}'", name, r) ;
            return res ;
        }
    }

    throw ResourceNotFoundException("FileResourceLoader: cannot find " + path, path) ;
}

bool FileResourceLoader::findTemplate(const string &root, const string &path, ResolvedResource &res) {

    string file = RootSet::fileFor(root, path) ;

    // the file may be replaced while it is opened; the status seen before and after opening must
    // agree so that the stream and the reported modification time describe the same file
    for( int attempt = 0 ; attempt < 3 ; attempt++ ) {

        if ( !detail::isReadableFile(file) ) return false ;

        detail::FileStatus before, after ;
        if ( !detail::fileStatus(file, before) ) return false ;

        unique_ptr<ifstream> in(new ifstream(file, ios::in | ios::binary)) ;
        if ( !*in ) return false ;

        if ( !detail::fileStatus(file, after) ) return false ;
        if ( before != after ) continue ;

        res.root_ = root ;
        res.path_ = file ;
        res.last_modified_ = after.modified_ ;
        res.stream_ = std::move(in) ;

        return true ;
    }

    logger_->debug("FileResourceLoader: '{}' kept changing while being opened", file) ;
    return false ;
}

bool FileResourceLoader::findCurrent(const string &path, string &file) const {
    for ( const string &r: roots_ ) {
        string candidate = RootSet::fileFor(r, path) ;
        if ( detail::isReadableFile(candidate) ) {
            file = candidate ;
            return true ;
        }
    }
    return false ;
}

bool FileResourceLoader::isStale(const string &name, Timestamp known_modified) {

    string path ;
    if ( sanitizePath(name, path) != PathStatus::Valid ) return true ;

    // a file may have appeared in a root that is searched earlier than the one the template
    // was loaded from, so find what would be loaded now and compare it to the original

    string current ;
    bool found = findCurrent(path, current) ;

    string root, file ;
    if ( provenance_.fetch(name, root) )
        file = RootSet::fileFor(root, path) ;
    else
        file = current ;

    bool stale = true ;

    if ( !found || !detail::fileExists(file) ) {
        // missing now: leave it stale and let the reload succeed with a new source or fail
    }
    else if ( current == file && detail::isReadableFile(file) ) {
        Timestamp ts ;
        if ( detail::modificationTime(file, ts) )
            stale = ( ts != known_modified ) ;
    }

    logger_->debug("FileResourceLoader: isStale for '{}': {}", name, stale) ;

    return stale ;
}

Timestamp FileResourceLoader::lastModified(const string &name) {
    string path, root ;

    if ( sanitizePath(name, path) != PathStatus::Valid ) return 0 ;
    if ( !provenance_.fetch(name, root) ) return 0 ;

    string file = RootSet::fileFor(root, path) ;

    Timestamp ts ;
    if ( detail::isReadableFile(file) && detail::modificationTime(file, ts) ) return ts ;

    return 0 ;
}

}
