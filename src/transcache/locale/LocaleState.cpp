#include "LocaleState.hpp"
#include "LanguageTag.hpp"

#include <plog/Log.h>

namespace transcache
{

LocaleState::LocaleState(std::string initial, std::vector<std::string> supported)
    : supported_(std::move(supported))
{
    auto resolved = resolveLocked(initial);
    if (resolved)
    {
        current_ = *resolved;
    }
    else
    {
        current_ = supported_.empty() ? initial : supported_.front();
        PLOG_WARNING << "Locale '" << initial << "' is not supported, using '" << current_ << "'";
    }
}

std::string LocaleState::currentLocale() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

std::vector<std::string> LocaleState::supportedLocales() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return supported_;
}

std::uint64_t LocaleState::subscribe(Listener listener)
{
    if (!listener)
        return 0;
    std::lock_guard<std::mutex> lock(mtx_);
    const std::uint64_t id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void LocaleState::unsubscribe(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mtx_);
    listeners_.erase(id);
}

std::optional<std::string> LocaleState::setLocale(const std::string& requested)
{
    std::vector<Listener> to_notify;
    std::string selected;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto resolved = resolveLocked(requested);
        if (!resolved)
        {
            PLOG_WARNING << "Ignoring unsupported locale '" << requested << "'";
            return std::nullopt;
        }
        selected = *resolved;
        if (selected == current_)
            return selected;

        PLOG_INFO << "Locale changed: " << current_ << " -> " << selected;
        current_ = selected;
        to_notify.reserve(listeners_.size());
        for (const auto& entry : listeners_)
            to_notify.push_back(entry.second);
    }

    for (const auto& listener : to_notify)
        listener(selected);
    return selected;
}

std::optional<std::string> LocaleState::resolve(const std::string& requested) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return resolveLocked(requested);
}

std::optional<std::string> LocaleState::resolveLocked(const std::string& requested) const
{
    if (requested.empty())
        return std::nullopt;
    if (supported_.empty())
        return requested;
    return resolveSupported(requested, supported_);
}

} // namespace transcache
