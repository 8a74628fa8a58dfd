#ifndef STENCIL_ROOT_SET_HPP
#define STENCIL_ROOT_SET_HPP

#include <string>
#include <vector>

namespace stencil {

class Configuration ;

// Ordered list of search roots. The empty string stands for "no root": names are then taken as
// absolute paths.

class RootSet {
public:
    using const_iterator = std::vector<std::string>::const_iterator ;

    RootSet(): roots_{std::string()} {}
    RootSet(const std::vector<std::string> &roots) ;

    // roots from the "path" option, or a single root-less entry when the option is missing
    static RootSet fromConfiguration(const Configuration &config) ;

    const_iterator begin() const { return roots_.begin() ; }
    const_iterator end() const { return roots_.end() ; }
    size_t size() const { return roots_.size() ; }
    const std::string &operator[](size_t idx) const { return roots_[idx] ; }

    // file that holds the sanitized path under the given root
    static std::string fileFor(const std::string &root, const std::string &path) ;

private:
    std::vector<std::string> roots_ ;
};

}

#endif
