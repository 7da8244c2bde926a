#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace transcache
{

// String-keyed string storage backing the persistent cache tier.
// Durability is best effort across restarts, not transactional.
// Implementations throw CacheError on storage failures.
class IKeyValueStore
{
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> read(const std::string& key) = 0;
    virtual std::map<std::string, std::string> readAll() = 0;
    virtual void write(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual std::size_t count() = 0;
};

} // namespace transcache
