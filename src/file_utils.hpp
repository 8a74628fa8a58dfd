// thin wrappers over stat/access used while probing roots
#ifndef STENCIL_FILE_UTILS_HPP
#define STENCIL_FILE_UTILS_HPP

#include <cstdint>
#include <string>

namespace stencil {
namespace detail {

bool fileExists(const std::string &path) ;

// regular file that the process may open for reading
bool isReadableFile(const std::string &path) ;

// modification time in milliseconds since the epoch
bool modificationTime(const std::string &path, int64_t &ms) ;

// identity and modification time of a file, used to tell whether it was replaced
struct FileStatus {
    uint64_t device_ = 0 ;
    uint64_t inode_ = 0 ;
    int64_t modified_ = 0 ;

    bool operator == (const FileStatus &other) const {
        return device_ == other.device_ && inode_ == other.inode_ && modified_ == other.modified_ ;
    }
    bool operator != (const FileStatus &other) const { return !(*this == other) ; }
};

bool fileStatus(const std::string &path, FileStatus &status) ;

}}

#endif
