#include <umbra/persistence/memory_persistence.hpp>

namespace umbra::persistence {

Result<Option<std::string>, Error> MemoryPersistence::load(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return Option<std::string>{};
    }
    return Option<std::string>{it->second};
}

Result<void, Error> MemoryPersistence::store(const std::string& key, const std::string& value) {
    values_[key] = value;
    return {};
}

Result<void, Error> MemoryPersistence::erase(const std::string& key) {
    values_.erase(key);
    return {};
}

Result<std::vector<std::string>, Error> MemoryPersistence::keys(const std::string& prefix) {
    std::vector<std::string> result;
    for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        result.push_back(it->first);
    }
    return result;
}

} // namespace umbra::persistence
