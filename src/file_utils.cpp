#include "file_utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

using namespace std ;

namespace stencil {
namespace detail {

bool fileExists(const string &path) {
    struct stat st ;
    return ::stat(path.c_str(), &st) == 0 ;
}

bool isReadableFile(const string &path) {
    struct stat st ;
    if ( ::stat(path.c_str(), &st) != 0 ) return false ;
    if ( !S_ISREG(st.st_mode) ) return false ;
    return ::access(path.c_str(), R_OK) == 0 ;
}

static int64_t toMilliseconds(const struct stat &st) {
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000 ;
}

bool modificationTime(const string &path, int64_t &ms) {
    struct stat st ;
    if ( ::stat(path.c_str(), &st) != 0 ) return false ;

    ms = toMilliseconds(st) ;
    return true ;
}

bool fileStatus(const string &path, FileStatus &status) {
    struct stat st ;
    if ( ::stat(path.c_str(), &st) != 0 ) return false ;

    status.device_ = static_cast<uint64_t>(st.st_dev) ;
    status.inode_ = static_cast<uint64_t>(st.st_ino) ;
    status.modified_ = toMilliseconds(st) ;
    return true ;
}

}}
