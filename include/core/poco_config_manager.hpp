#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe JSON configuration store backed by Poco JSONConfiguration.
 *
 * Keys are dotted paths ("sampler.max_frames"). Getters never throw; they return
 * the supplied default when a key is absent or has the wrong type.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);
    bool loadFromString(const std::string &json_text);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    bool has(const std::string &key) const;
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
