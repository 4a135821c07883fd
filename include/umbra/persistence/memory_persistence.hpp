#pragma once

#include <umbra/scene/providers.hpp>

#include <map>
#include <string>

namespace umbra::persistence {

// Process-lifetime key-value store
class MemoryPersistence : public scene::IPersistenceProvider {
public:
    Result<Option<std::string>, Error> load(const std::string& key) override;
    Result<void, Error> store(const std::string& key, const std::string& value) override;
    Result<void, Error> erase(const std::string& key) override;
    Result<std::vector<std::string>, Error> keys(const std::string& prefix) override;

    size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace umbra::persistence
