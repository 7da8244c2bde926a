#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transcache
{

// Where the active target language comes from. Listeners fire after the
// current tag has changed and receive the new tag.
class ILocaleSource
{
public:
    using Listener = std::function<void(const std::string& tag)>;

    virtual ~ILocaleSource() = default;

    virtual std::string currentLocale() const = 0;
    virtual std::vector<std::string> supportedLocales() const = 0;

    virtual std::uint64_t subscribe(Listener listener) = 0;
    virtual void unsubscribe(std::uint64_t id) = 0;
};

} // namespace transcache
