#pragma once

#include "ILocaleSource.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace transcache
{

/**
 * @brief In-process locale source
 *
 * Holds the selected tag and the list of locales the application ships.
 * A requested tag is resolved against that list (exact match first, then
 * primary subtag) so "es-MX" selects "es" when only "es" is supported.
 * An empty supported list accepts any non-empty tag as-is.
 */
class LocaleState : public ILocaleSource
{
public:
    LocaleState(std::string initial, std::vector<std::string> supported);

    std::string currentLocale() const override;
    std::vector<std::string> supportedLocales() const override;

    std::uint64_t subscribe(Listener listener) override;
    void unsubscribe(std::uint64_t id) override;

    // Returns the tag actually selected, or nullopt when the request
    // resolves to nothing supported (the current tag is kept).
    std::optional<std::string> setLocale(const std::string& requested);

    std::optional<std::string> resolve(const std::string& requested) const;

private:
    std::optional<std::string> resolveLocked(const std::string& requested) const;

    mutable std::mutex mtx_;
    std::string current_;
    std::vector<std::string> supported_;
    std::map<std::uint64_t, Listener> listeners_;
    std::uint64_t next_id_ = 1;
};

} // namespace transcache
