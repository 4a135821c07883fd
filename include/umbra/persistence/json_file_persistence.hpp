#pragma once

#include <umbra/scene/providers.hpp>

#include <map>
#include <string>

namespace umbra::persistence {

/**
 * @brief Override storage backed by a single JSON document on disk.
 *
 * The file is read lazily on first access. Every mutation rewrites the whole
 * document through a temporary file that is renamed over the original, so a
 * crash mid-write leaves the previous version intact. A failed write leaves
 * the in-memory view unchanged as well. Values are stored verbatim as JSON
 * strings.
 */
class JsonFilePersistence : public scene::IPersistenceProvider {
public:
    explicit JsonFilePersistence(std::string path);

    Result<Option<std::string>, Error> load(const std::string& key) override;
    Result<void, Error> store(const std::string& key, const std::string& value) override;
    Result<void, Error> erase(const std::string& key) override;
    Result<std::vector<std::string>, Error> keys(const std::string& prefix) override;

    const std::string& path() const noexcept { return path_; }

private:
    Result<void, Error> ensure_loaded();
    Result<void, Error> write_back(const std::map<std::string, std::string>& values);

    std::string path_;
    bool loaded_ = false;
    std::map<std::string, std::string> values_;
};

} // namespace umbra::persistence
