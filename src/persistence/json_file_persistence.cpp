#include <umbra/persistence/json_file_persistence.hpp>
#include <umbra/core/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace umbra::persistence {

JsonFilePersistence::JsonFilePersistence(std::string path)
    : path_(std::move(path)) {
}

Result<void, Error> JsonFilePersistence::ensure_loaded() {
    if (loaded_) {
        return {};
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(path_, ec);
    if (ec) {
        return std::unexpected(core::make_error(ErrorCode::FileReadError,
                                                "cannot access override store " + path_ + ": " + ec.message()));
    }
    if (!exists) {
        // A missing file is an empty store
        loaded_ = true;
        return {};
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::unexpected(core::make_error(ErrorCode::FileReadError,
                                                "cannot open override store " + path_));
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(core::make_error(ErrorCode::ParseError,
                                                "override store " + path_ + " is corrupt: " + e.what()));
    }

    if (!document.is_object()) {
        return std::unexpected(core::make_error(ErrorCode::ParseError,
                                                "override store " + path_ + " must contain an object"));
    }

    for (const auto& [key, value] : document.items()) {
        // Older files embedded JSON values directly
        values_[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }

    loaded_ = true;
    LOG_DEBUG(Persistence, "Loaded {} entries from {}", values_.size(), path_);
    return {};
}

Result<void, Error> JsonFilePersistence::write_back(const std::map<std::string, std::string>& values) {
    std::string text;
    try {
        json document = json::object();
        for (const auto& [key, value] : values) {
            document[key] = value;
        }
        text = document.dump(2);
    } catch (const json::exception& e) {
        return std::unexpected(core::make_error(ErrorCode::FileWriteError,
                                                "cannot encode override store " + path_ + ": " + e.what()));
    }

    const std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    const std::string temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(core::make_error(ErrorCode::FileWriteError,
                                                    "cannot write override store " + temp_path));
        }
        out << text;
        if (!out.good()) {
            return std::unexpected(core::make_error(ErrorCode::FileWriteError,
                                                    "short write to " + temp_path));
        }
    }

    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        return std::unexpected(core::make_error(ErrorCode::FileWriteError,
                                                "cannot replace " + path_ + ": " + ec.message()));
    }
    return {};
}

Result<Option<std::string>, Error> JsonFilePersistence::load(const std::string& key) {
    if (auto ready = ensure_loaded(); !ready) {
        return std::unexpected(ready.error());
    }
    auto it = values_.find(key);
    if (it == values_.end()) {
        return Option<std::string>{};
    }
    return Option<std::string>{it->second};
}

Result<void, Error> JsonFilePersistence::store(const std::string& key, const std::string& value) {
    if (auto ready = ensure_loaded(); !ready) {
        return ready;
    }
    auto updated = values_;
    updated[key] = value;
    if (auto written = write_back(updated); !written) {
        return written;
    }
    values_ = std::move(updated);
    return {};
}

Result<void, Error> JsonFilePersistence::erase(const std::string& key) {
    if (auto ready = ensure_loaded(); !ready) {
        return ready;
    }
    if (!values_.contains(key)) {
        return {};
    }
    auto updated = values_;
    updated.erase(key);
    if (auto written = write_back(updated); !written) {
        return written;
    }
    values_ = std::move(updated);
    return {};
}

Result<std::vector<std::string>, Error> JsonFilePersistence::keys(const std::string& prefix) {
    if (auto ready = ensure_loaded(); !ready) {
        return std::unexpected(ready.error());
    }
    std::vector<std::string> result;
    for (const auto& [key, value] : values_) {
        if (key.starts_with(prefix)) {
            result.push_back(key);
        }
    }
    return result;
}

} // namespace umbra::persistence
