#include "JsonFileStore.hpp"
#include "CacheError.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace transcache
{

JsonFileStore::JsonFileStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

std::optional<std::string> JsonFileStore::read(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensureLoadedLocked();
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> JsonFileStore::readAll()
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensureLoadedLocked();
    return data_;
}

void JsonFileStore::write(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensureLoadedLocked();
    auto next = data_;
    next[key] = value;
    flushLocked(next);
    data_.swap(next);
}

void JsonFileStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensureLoadedLocked();
    if (data_.find(key) == data_.end())
        return;
    auto next = data_;
    next.erase(key);
    flushLocked(next);
    data_.swap(next);
}

void JsonFileStore::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    flushLocked({});
    data_.clear();
    loaded_ = true;
}

std::size_t JsonFileStore::count()
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensureLoadedLocked();
    return data_.size();
}

void JsonFileStore::ensureLoadedLocked()
{
    if (loaded_)
        return;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        if (ec)
            throw CacheError("cannot stat cache file " + path_.string() + ": " + ec.message());
        loaded_ = true;
        return;
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
        throw CacheError("cannot open cache file " + path_.string());

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    ifs.close();

    if (buffer.str().empty())
    {
        loaded_ = true;
        return;
    }

    std::string parse_error;
    try
    {
        json doc = json::parse(buffer.str());
        if (doc.is_object())
        {
            std::map<std::string, std::string> loaded;
            for (auto it = doc.begin(); it != doc.end(); ++it)
            {
                if (it.value().is_string())
                    loaded.emplace(it.key(), it.value().get<std::string>());
            }
            data_.swap(loaded);
            PLOG_DEBUG << "Loaded " << data_.size() << " cached translation(s) from " << path_.string();
        }
        else
        {
            parse_error = "root is not a JSON object";
        }
    }
    catch (const json::exception& e)
    {
        parse_error = e.what();
    }

    if (!parse_error.empty())
    {
        std::filesystem::path aside = path_;
        aside += ".corrupt";
        std::filesystem::rename(path_, aside, ec);
        if (ec)
            PLOG_WARNING << "Could not move unreadable cache file aside: " << ec.message();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Cache,
                                            "Translation cache file was unreadable and has been reset",
                                            path_.string() + ": " + parse_error);
        data_.clear();
    }
    loaded_ = true;
}

void JsonFileStore::flushLocked(const std::map<std::string, std::string>& data)
{
    std::error_code ec;
    const auto dir = path_.parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw CacheError("cannot create cache directory " + dir.string() + ": " + ec.message());
    }

    json doc = json::object();
    for (const auto& [key, value] : data)
    {
        doc[key] = value;
    }

    std::string serialized;
    try
    {
        serialized = doc.dump();
    }
    catch (const json::type_error& e)
    {
        throw CacheError(std::string("cannot serialize cache file: ") + e.what());
    }

    std::filesystem::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw CacheError("cannot write cache file " + tmp.string());
        ofs << serialized;
        if (!ofs)
            throw CacheError("short write to cache file " + tmp.string());
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec)
        throw CacheError("cannot replace cache file " + path_.string() + ": " + ec.message());
}

} // namespace transcache
