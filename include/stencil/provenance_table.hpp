#ifndef STENCIL_PROVENANCE_TABLE_HPP
#define STENCIL_PROVENANCE_TABLE_HPP

#include <map>
#include <mutex>
#include <string>

namespace stencil {

// maps template names to the root that last supplied them. Entries are only ever overwritten.

class ProvenanceTable {
public:

    void put(const std::string &name, const std::string &root) {
        std::lock_guard<std::mutex> lock(guard_);
        roots_[name] = root ;
    }

    bool fetch(const std::string &name, std::string &root) const {
        std::lock_guard<std::mutex> lock(guard_);
        auto it = roots_.find(name) ;
        if ( it == roots_.end() ) return false ;
        root = it->second ;
        return true ;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(guard_);
        return roots_.size() ;
    }

private:
    std::map<std::string, std::string> roots_ ;
    mutable std::mutex guard_ ;
};

}

#endif
