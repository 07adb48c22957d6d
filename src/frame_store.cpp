#include "core/frame_store.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string sha256Hex(const std::vector<uint8_t> &data)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

FileFrameStore::FileFrameStore(const std::filesystem::path &directory, int jpeg_quality)
    : directory_(directory), jpeg_quality_(jpeg_quality)
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create frame directory " + directory_.string() + ": " + ec.message());
    }
}

ImageRef FileFrameStore::put(const cv::Mat &image)
{
    if (image.empty())
    {
        throw DecodeError("Refusing to store an empty frame");
    }

    std::vector<uint8_t> encoded;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    if (!cv::imencode(".jpg", image, encoded, params))
    {
        throw DecodeError("JPEG encoding failed for frame");
    }

    ImageRef ref = sha256Hex(encoded) + ".jpg";

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ref_counts_.find(ref);
    if (it != ref_counts_.end())
    {
        // Identical pixels already stored; share the file
        ++it->second;
        return ref;
    }

    const auto path = directory_ / ref;
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open())
    {
        throw std::runtime_error("Cannot write frame file: " + path.string());
    }
    out.write(reinterpret_cast<const char *>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    out.close();
    if (!out)
    {
        throw std::runtime_error("Short write for frame file: " + path.string());
    }

    ref_counts_[ref] = 1;
    Logger::trace("Stored frame " + path.string());
    return ref;
}

cv::Mat FileFrameStore::load(const ImageRef &ref) const
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ref_counts_.find(ref) == ref_counts_.end())
            return cv::Mat();
    }
    return cv::imread((directory_ / ref).string(), cv::IMREAD_COLOR);
}

std::string FileFrameStore::location(const ImageRef &ref) const
{
    const auto path = directory_ / ref;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ref_counts_.find(ref) == ref_counts_.end())
            throw DecodeError("Unknown frame handle: " + ref);
    }
    if (!std::filesystem::exists(path))
    {
        throw DecodeError("Frame image is missing: " + path.string());
    }
    return path.string();
}

void FileFrameStore::release(const ImageRef &ref)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ref_counts_.find(ref);
    if (it == ref_counts_.end())
        return;
    if (--it->second > 0)
        return;

    ref_counts_.erase(it);
    std::error_code ec;
    std::filesystem::remove(directory_ / ref, ec);
    if (ec)
    {
        Logger::warn("Failed to remove frame file " + (directory_ / ref).string() + ": " + ec.message());
    }
}

size_t FileFrameStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ref_counts_.size();
}

ImageRef MemoryFrameStore::put(const cv::Mat &image)
{
    if (image.empty())
    {
        throw DecodeError("Refusing to store an empty frame");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ImageRef ref = "mem-" + std::to_string(next_id_++);
    images_[ref] = image.clone();
    return ref;
}

cv::Mat MemoryFrameStore::load(const ImageRef &ref) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = images_.find(ref);
    if (it == images_.end())
        return cv::Mat();
    return it->second;
}

std::string MemoryFrameStore::location(const ImageRef &ref) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (images_.find(ref) == images_.end())
        throw DecodeError("Unknown frame handle: " + ref);
    return "memory://" + ref;
}

void MemoryFrameStore::release(const ImageRef &ref)
{
    std::lock_guard<std::mutex> lock(mutex_);
    images_.erase(ref);
}

size_t MemoryFrameStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return images_.size();
}

void MemoryFrameStore::corrupt(const ImageRef &ref)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = images_.find(ref);
    if (it != images_.end())
    {
        // 32-bit float pixels are rejected by the hasher
        it->second = cv::Mat(it->second.rows, it->second.cols, CV_32FC1, cv::Scalar(0.5f));
    }
}
