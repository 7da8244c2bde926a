#include "transcache/app/Localizer.hpp"
#include "transcache/config/ConfigManager.hpp"
#include "transcache/utils/ErrorReporter.hpp"
#include "transcache/utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace transcache;

namespace
{

void printUsage(const char* argv0)
{
    std::cerr << "usage: " << argv0
              << " [--config path] [--context ui|backend|user|system] [--prepare] [--clear-cache] [text...]\n"
              << "Translates each argument, or each line of stdin when none is given.\n";
}

void printPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] "
                  << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << '\n';
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::string config_path = "config.toml";
    TranslationContext context = TranslationContext::UI;
    bool do_prepare = false;
    bool do_clear = false;
    std::vector<std::string> texts;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (std::strcmp(arg, "--context") == 0 && i + 1 < argc)
        {
            auto parsed = parseContext(argv[++i]);
            if (!parsed)
            {
                std::cerr << "unknown context: " << argv[i] << '\n';
                return 2;
            }
            context = *parsed;
        }
        else if (std::strcmp(arg, "--prepare") == 0)
        {
            do_prepare = true;
        }
        else if (std::strcmp(arg, "--clear-cache") == 0)
        {
            do_clear = true;
        }
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (std::strcmp(arg, "--") == 0)
        {
            for (++i; i < argc; ++i)
                texts.emplace_back(argv[i]);
        }
        else if (arg[0] == '-' && arg[1] == '-')
        {
            printUsage(argv[0]);
            return 2;
        }
        else
        {
            texts.emplace_back(arg);
        }
    }

    ConfigManager config_manager(config_path);
    config_manager.load();
    const LocalizerConfig& config = config_manager.config();

    utils::LogManager::Initialize(utils::LogManager::SeverityFromInt(config.logging.level), config.logging.append);
    utils::LogManager::LoggerConfig log_cfg;
    log_cfg.filepath = config.logging.file;
    log_cfg.append = config.logging.append;
    log_cfg.add_console_appender = config.logging.console;
    utils::LogManager::RegisterLogger(log_cfg);

    if (!config_manager.lastError().empty())
        PLOG_WARNING << config_manager.lastError();
    PLOG_INFO << "transcache-cli starting, config " << config_manager.path();

    int rc = 0;
    {
        auto localizer = Localizer::create(config);

        if (do_clear && !localizer->clearCache())
            rc = 1;

        if (do_prepare)
        {
            PrepareResult result = localizer->prepare();
            if (result.state == PrepareResult::State::Failed)
            {
                std::cerr << "prepare failed: " << (result.error ? result.error->what() : "unknown error") << '\n';
                rc = 1;
            }
            else if (result.state == PrepareResult::State::Downloading)
            {
                std::cerr << "model download in progress (" << static_cast<int>(result.progress * 100.0f)
                          << "%)\n";
            }
        }

        if (texts.empty() && !do_prepare && !do_clear)
        {
            std::string line;
            while (std::getline(std::cin, line))
                std::cout << localizer->translate(line, context) << '\n';
        }
        else
        {
            for (const auto& text : texts)
                std::cout << localizer->translate(text, context) << '\n';
        }

        localizer->shutdown();
    }

    printPendingErrors();
    utils::LogManager::Shutdown();
    return rc;
}
