#pragma once

#include "core/media_types.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Owner of frame pixel data behind opaque ImageRef handles.
 *
 * The sampler writes each picked frame once; later stages load it on demand and
 * release it when the frame is no longer needed.
 */
class FrameStore
{
public:
    virtual ~FrameStore() = default;

    /**
     * @brief Store a frame image
     * @return Handle to the stored image
     */
    virtual ImageRef put(const cv::Mat &image) = 0;

    /**
     * @brief Load a stored image
     * @return The decoded image, or an empty Mat if the handle is unknown or undecodable
     */
    virtual cv::Mat load(const ImageRef &ref) const = 0;

    /**
     * @brief Location usable by external collaborators (a filesystem path for file stores)
     * @throws DecodeError if the handle was released or its image is gone
     */
    virtual std::string location(const ImageRef &ref) const = 0;

    /**
     * @brief Drop the backing pixel data. Releasing an unknown handle is a no-op.
     */
    virtual void release(const ImageRef &ref) = 0;

    virtual size_t size() const = 0;
};

/**
 * @brief JPEG files under a directory, named by the SHA-256 of their encoded bytes.
 *
 * Content addressing keeps names stable regardless of the order frames are picked in,
 * so nothing needs renaming after the sampler sorts its output.
 */
class FileFrameStore : public FrameStore
{
public:
    explicit FileFrameStore(const std::filesystem::path &directory, int jpeg_quality = 90);

    ImageRef put(const cv::Mat &image) override;
    cv::Mat load(const ImageRef &ref) const override;
    std::string location(const ImageRef &ref) const override;
    void release(const ImageRef &ref) override;
    size_t size() const override;

    const std::filesystem::path &directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    int jpeg_quality_;
    mutable std::mutex mutex_;
    std::map<ImageRef, int> ref_counts_;
};

/**
 * @brief In-memory frame store (no I/O), mainly for algorithm-level use and tests
 */
class MemoryFrameStore : public FrameStore
{
public:
    ImageRef put(const cv::Mat &image) override;
    cv::Mat load(const ImageRef &ref) const override;
    std::string location(const ImageRef &ref) const override;
    void release(const ImageRef &ref) override;
    size_t size() const override;

    /**
     * @brief Replace stored pixels with garbage that cannot be hashed (simulates a decode failure)
     */
    void corrupt(const ImageRef &ref);

private:
    mutable std::mutex mutex_;
    std::map<ImageRef, cv::Mat> images_;
    uint64_t next_id_ = 0;
};

/**
 * @brief Hex SHA-256 of a byte buffer
 */
std::string sha256Hex(const std::vector<uint8_t> &data);
