#ifndef STENCIL_CONFIGURATION_HPP
#define STENCIL_CONFIGURATION_HPP

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace stencil {

// Multi-valued set of loader options.
//
// e.g.  Configuration cfg{ {"path", "/srv/templates, /usr/share/templates"}, {"cache", "true"} } ;
//       cfg.getList("path") ; // -> { "/srv/templates", "/usr/share/templates" }

class Configuration {
public:

    Configuration() = default ;
    Configuration(std::initializer_list<std::pair<std::string, std::string>> options) ;

    // append a value to the key
    void add(const std::string &key, const std::string &value) ;

    // replace all values of the key
    void set(const std::string &key, const std::string &value) ;

    bool has(const std::string &key) const ;

    // all values of the key in insertion order. Each value is split on commas and trimmed.
    std::vector<std::string> getList(const std::string &key) const ;

    // first value of the key (trimmed) or the default if missing
    std::string getString(const std::string &key, const std::string &def = std::string()) const ;

    // Throws ConfigurationException if the value is not a boolean or integer respectively
    bool getBoolean(const std::string &key, bool def) const ;
    int64_t getLong(const std::string &key, int64_t def) const ;

private:

    std::map<std::string, std::vector<std::string>> options_ ;
};

}

#endif
