#include <stencil/configuration.hpp>
#include <stencil/exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cerrno>

using namespace std ;

namespace stencil {

static string trim(const string &s) {
    size_t first = s.find_first_not_of(" \t\r\n") ;
    if ( first == string::npos ) return string() ;
    size_t last = s.find_last_not_of(" \t\r\n") ;
    return s.substr(first, last - first + 1) ;
}

Configuration::Configuration(initializer_list<pair<string, string>> options) {
    for( const auto &p: options )
        add(p.first, p.second) ;
}

void Configuration::add(const string &key, const string &value) {
    options_[key].push_back(value) ;
}

void Configuration::set(const string &key, const string &value) {
    options_[key] = vector<string>{value} ;
}

bool Configuration::has(const string &key) const {
    return options_.count(key) != 0 ;
}

vector<string> Configuration::getList(const string &key) const {
    vector<string> res ;

    auto it = options_.find(key) ;
    if ( it == options_.end() ) return res ;

    for( const string &value: it->second ) {
        size_t pos = 0 ;
        while ( true ) {
            size_t comma = value.find(',', pos) ;
            if ( comma == string::npos ) {
                res.emplace_back(trim(value.substr(pos))) ;
                break ;
            }
            res.emplace_back(trim(value.substr(pos, comma - pos))) ;
            pos = comma + 1 ;
        }
    }

    return res ;
}

string Configuration::getString(const string &key, const string &def) const {
    auto it = options_.find(key) ;
    if ( it == options_.end() || it->second.empty() ) return def ;
    return trim(it->second.front()) ;
}

bool Configuration::getBoolean(const string &key, bool def) const {
    if ( !has(key) ) return def ;

    string val = getString(key) ;
    transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return std::tolower(c) ; }) ;

    if ( val == "true" || val == "yes" || val == "on" ) return true ;
    else if ( val == "false" || val == "no" || val == "off" ) return false ;

    throw ConfigurationException("option '" + key + "' is not a boolean: " + val) ;
}

int64_t Configuration::getLong(const string &key, int64_t def) const {
    if ( !has(key) ) return def ;

    string val = getString(key) ;
    if ( val.empty() )
        throw ConfigurationException("option '" + key + "' is empty") ;

    char *end = nullptr ;
    errno = 0 ;
    long long res = strtoll(val.c_str(), &end, 10) ;
    if ( errno != 0 || *end != 0 )
        throw ConfigurationException("option '" + key + "' is not an integer: " + val) ;

    return static_cast<int64_t>(res) ;
}

}
