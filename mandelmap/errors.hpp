#ifndef MANDELMAP_ERRORS_HPP
#define MANDELMAP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mandelmap {

// Base of everything the harness throws. None of these are retryable: the
// computation is deterministic, a second attempt fails the same way.
class error : public std::runtime_error
{
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

// Bad width/height/iteration bound/window, detected before any dispatch.
class configuration_error : public error
{
public:
    explicit configuration_error(const std::string& what) : error(what) {}
};

// No usable execution context, or the launch/completion wait failed.
class environment_error : public error
{
public:
    explicit environment_error(const std::string& what) : error(what) {}
};

// Output region could not be allocated or transferred to the host.
class allocation_error : public error
{
public:
    explicit allocation_error(const std::string& what) : error(what) {}
};

} // namespace mandelmap

#endif //MANDELMAP_ERRORS_HPP
