#ifndef STENCIL_RESOURCE_LOADER_HPP
#define STENCIL_RESOURCE_LOADER_HPP

#include <cstdint>
#include <initializer_list>
#include <istream>
#include <memory>
#include <string>

#include <stencil/configuration.hpp>
#include <stencil/provenance_table.hpp>
#include <stencil/root_set.hpp>

namespace spdlog {
class logger ;
}

namespace stencil {

// milliseconds since the epoch, 0 when unknown
using Timestamp = int64_t ;

// result of a successful lookup. The stream belongs to the caller.

struct ResolvedResource {
    std::string name_ ;             // name as requested
    std::string root_ ;             // root that satisfied the request
    std::string path_ ;             // file that was opened
    Timestamp last_modified_ = 0 ;
    std::unique_ptr<std::istream> stream_ ;
};

// abstract template loader

class ResourceLoader {
public:
    ResourceLoader(const Configuration &config) ;
    virtual ~ResourceLoader() = default ;

    // locate the template and open it for reading.
    // Throws InvalidResourceNameException, ResourceNotFoundException or ResourceRejectedException
    virtual ResolvedResource resolve(const std::string &name) = 0 ;

    // whether a template loaded with the given modification time must be loaded again
    virtual bool isStale(const std::string &name, Timestamp known_modified) = 0 ;

    // modification time of the template that was last loaded under this name, or 0
    virtual Timestamp lastModified(const std::string &name) = 0 ;

    // resolve and return the whole template source
    std::string load(const std::string &name) ;

    // hints for the compiled template cache sitting above the loader
    bool isCachingOn() const { return caching_ ; }
    int64_t modificationCheckInterval() const { return check_interval_ ; }

protected:

    bool caching_ = false ;
    int64_t check_interval_ = 2 ;
};

// loads templates from file system relative to root folders.

class FileResourceLoader: public ResourceLoader {

public:
    FileResourceLoader(const Configuration &config, std::shared_ptr<spdlog::logger> logger = nullptr) ;
    FileResourceLoader(const std::initializer_list<std::string> &root_folders, std::shared_ptr<spdlog::logger> logger = nullptr) ;

    virtual ResolvedResource resolve(const std::string &name) override ;
    virtual bool isStale(const std::string &name, Timestamp known_modified) override ;
    virtual Timestamp lastModified(const std::string &name) override ;

    const RootSet &roots() const { return roots_ ; }

    // root that last supplied the template, false if it was never loaded
    bool sourceRoot(const std::string &name, std::string &root) const {
        return provenance_.fetch(name, root) ;
    }

private:

    void init() ;
    std::string sanitize(const std::string &name) ;
    bool findTemplate(const std::string &root, const std::string &path, ResolvedResource &res) ;
    bool findCurrent(const std::string &path, std::string &file) const ;

    RootSet roots_ ;
    ProvenanceTable provenance_ ;
    std::shared_ptr<spdlog::logger> logger_ ;
};

}

#endif
