#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Publishes files and returns the URL they can be fetched from
 */
class ObjectStorage
{
public:
    virtual ~ObjectStorage() = default;

    /**
     * @param local_path File to publish
     * @param object_key Destination key, e.g. "jobs/<id>/keyframes/keyframe_000.jpg"
     * @return Public URL of the stored object
     * @throws std::runtime_error if the upload fails
     */
    virtual std::string upload(const std::string &local_path, const std::string &object_key) = 0;

    /**
     * @brief Remove every object under a key prefix; returns the number removed
     */
    virtual size_t removePrefix(const std::string &prefix) = 0;
};

/**
 * @brief Object storage backed by a local directory served at public_base_url
 */
class LocalObjectStorage : public ObjectStorage
{
public:
    LocalObjectStorage(const std::filesystem::path &publish_root, const std::string &public_base_url);

    std::string upload(const std::string &local_path, const std::string &object_key) override;
    size_t removePrefix(const std::string &prefix) override;

    const std::filesystem::path &publishRoot() const { return publish_root_; }

private:
    std::filesystem::path resolveKey(const std::string &object_key) const;

    std::filesystem::path publish_root_;
    std::string public_base_url_;
};
