#ifndef STENCIL_PATH_SANITIZER_HPP
#define STENCIL_PATH_SANITIZER_HPP

#include <string>

namespace stencil {

enum class PathStatus { Valid, Empty, Rejected } ;

// Normalizes a template name into a path inside the template namespace. Pure string transform,
// the filesystem is never consulted.
//
// - backslashes are treated as separators, "//" is collapsed and "." segments are dropped
// - ".." removes the previous segment; a ".." with nothing left to remove makes the name Rejected
// - names with embedded NUL characters are Rejected
// - an empty name gives Empty
//
// On success the normalized path is stored in sanitized and always starts with a single '/'
// e.g. "a/./b//../c.vm" -> "/a/c.vm"

PathStatus sanitizePath(const std::string &name, std::string &sanitized) ;

}

#endif
