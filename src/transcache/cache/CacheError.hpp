#pragma once

#include <stdexcept>
#include <string>

namespace transcache
{

// Storage-layer failure (disk I/O, unwritable cache file).
class CacheError : public std::runtime_error
{
public:
    explicit CacheError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

} // namespace transcache
