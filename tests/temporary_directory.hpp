#ifndef STENCIL_TESTS_TEMPORARY_DIRECTORY_HPP
#define STENCIL_TESTS_TEMPORARY_DIRECTORY_HPP

#include <cstdint>
#include <string>

namespace stencil {
namespace test {

// a uniquely named directory under /tmp that is removed, with its content, on destruction

class TemporaryDirectory {
public:
    TemporaryDirectory() ;
    TemporaryDirectory(const TemporaryDirectory &) = delete ;
    TemporaryDirectory &operator=(const TemporaryDirectory &) = delete ;
    ~TemporaryDirectory() ;

    const std::string &path() const { return path_ ; }

    // absolute path of an entry relative to the directory
    std::string operator / (const std::string &rel) const { return path_ + '/' + rel ; }

    // creates missing parent directories
    std::string write(const std::string &rel, const std::string &content) const ;
    std::string mkdir(const std::string &rel) const ;

    // symbolic link at rel pointing to target, which is stored as given
    std::string symlink(const std::string &rel, const std::string &target) const ;

private:
    std::string path_ ;
};

// set both access and modification time, in seconds since the epoch
void setModificationTime(const std::string &path, int64_t seconds) ;

}}

#endif
