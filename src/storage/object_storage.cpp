#include "storage/object_storage.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

LocalObjectStorage::LocalObjectStorage(const fs::path &publish_root, const std::string &public_base_url)
    : publish_root_(publish_root), public_base_url_(public_base_url)
{
    while (!public_base_url_.empty() && public_base_url_.back() == '/')
        public_base_url_.pop_back();
}

fs::path LocalObjectStorage::resolveKey(const std::string &object_key) const
{
    const fs::path key = fs::path(object_key).lexically_normal();
    if (key.empty() || key.is_absolute() || *key.begin() == "..")
    {
        throw std::invalid_argument("Invalid object key: " + object_key);
    }
    return publish_root_ / key;
}

std::string LocalObjectStorage::upload(const std::string &local_path, const std::string &object_key)
{
    const fs::path destination = resolveKey(object_key);

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create storage directory " + destination.parent_path().string() + ": " +
                                 ec.message());
    }
    fs::copy_file(local_path, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw std::runtime_error("Upload of " + local_path + " failed: " + ec.message());
    }

    const std::string url = public_base_url_ + "/" + fs::path(object_key).lexically_normal().generic_string();
    Logger::debug("Uploaded " + local_path + " -> " + url);
    return url;
}

size_t LocalObjectStorage::removePrefix(const std::string &prefix)
{
    const fs::path target = resolveKey(prefix);
    std::error_code ec;
    const auto removed = fs::remove_all(target, ec);
    if (ec)
    {
        Logger::warn("Failed to remove stored objects under " + prefix + ": " + ec.message());
        return 0;
    }
    return static_cast<size_t>(removed);
}
