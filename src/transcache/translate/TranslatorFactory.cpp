#include "ITranslator.hpp"
#include "GoogleTranslator.hpp"
#include "../processing/TextUtils.hpp"

#include <memory>

namespace transcache
{

const char* backendName(Backend backend)
{
    switch (backend)
    {
    case Backend::None:
        return "none";
    case Backend::Google:
        return "google";
    }
    return "none";
}

std::optional<Backend> parseBackend(const std::string& name)
{
    const std::string n = toLowerAscii(name);
    if (n == "none" || n.empty())
        return Backend::None;
    if (n == "google")
        return Backend::Google;
    return std::nullopt;
}

std::shared_ptr<ITranslator> createTranslator(const BackendConfig& cfg)
{
    switch (cfg.backend)
    {
    case Backend::Google:
        return std::make_shared<GoogleTranslator>(cfg);
    case Backend::None:
    default:
        return nullptr;
    }
}

} // namespace transcache
