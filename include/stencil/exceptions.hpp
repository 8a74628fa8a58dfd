#ifndef STENCIL_EXCEPTIONS_HPP__
#define STENCIL_EXCEPTIONS_HPP__

#include <stdexcept>
#include <string>

namespace stencil {


class ResourceException: public std::runtime_error {
public:

    ResourceException(const std::string &msg): std::runtime_error(msg) {}
};

// the caller did not supply a template name at all

class InvalidResourceNameException: public ResourceException {
public:
    InvalidResourceNameException(const std::string &msg): ResourceException(msg) {}
};

class ResourceNotFoundException: public ResourceException {
public:
    ResourceNotFoundException(const std::string &msg, const std::string &resource):
        ResourceException(msg), resource_(resource) {}

    // name of the resource that could not be found: the sanitized path for a missing template,
    // the name as requested for a rejected one
    const std::string &resourceName() const { return resource_ ; }

private:
    std::string resource_ ;
};

// thrown when a name tries to climb out of the template namespace. Its message is the same as for a
// missing template; the subclass exists for the loader's own audit logging and for tests only, callers
// must handle it as ResourceNotFoundException and not rely on telling the two apart.

class ResourceRejectedException: public ResourceNotFoundException {
public:
    ResourceRejectedException(const std::string &msg, const std::string &resource):
        ResourceNotFoundException(msg, resource) {}
};

class ConfigurationException: public ResourceException {
public:
    ConfigurationException(const std::string &msg): ResourceException(msg) {}
};

}
#endif
