#pragma once

#include <stdexcept>
#include <string>

namespace lw::lock {

// The backing store could not answer. Never to be read as locked or unlocked.
class Unavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResourceNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
