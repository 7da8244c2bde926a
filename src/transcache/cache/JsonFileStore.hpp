#pragma once

#include "IKeyValueStore.hpp"

#include <filesystem>
#include <mutex>

namespace transcache
{

// IKeyValueStore kept as one JSON object on disk. The file is read lazily on
// first access and rewritten (temp file + rename) after every mutation.
// A mutation whose rewrite fails leaves the in-memory view unchanged.
// A file that fails to parse is moved aside to "<name>.corrupt" and the
// store starts empty.
class JsonFileStore : public IKeyValueStore
{
public:
    explicit JsonFileStore(std::filesystem::path path);

    std::optional<std::string> read(const std::string& key) override;
    std::map<std::string, std::string> readAll() override;
    void write(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    void clear() override;
    std::size_t count() override;

    const std::filesystem::path& path() const { return path_; }

private:
    void ensureLoadedLocked();
    void flushLocked(const std::map<std::string, std::string>& data);

    std::filesystem::path path_;
    std::mutex mtx_;
    bool loaded_ = false;
    std::map<std::string, std::string> data_;
};

} // namespace transcache
