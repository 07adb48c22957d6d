#pragma once

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Fixed-length perceptual fingerprint, one entry (0/1) per bit
 */
using FrameHash = std::vector<uint8_t>;

/**
 * @brief Difference-hash (dHash) generator for frame similarity.
 *
 * The image is reduced to luminance, area-downscaled to (hash_size + 1) x hash_size and
 * each bit records whether a cell is darker than its right-hand neighbour.
 */
class PerceptualHasher
{
public:
    explicit PerceptualHasher(int hash_size = 16);

    /**
     * @brief Compute the hash of an 8-bit gray, BGR or BGRA image
     * @throws DecodeError if the image is empty or has an unsupported layout
     */
    FrameHash hash(const cv::Mat &image) const;

    /**
     * @brief Number of differing bits
     * @throws ShapeMismatch if the hashes differ in length
     */
    static int distance(const FrameHash &a, const FrameHash &b);

    int hashSize() const { return hash_size_; }
    size_t bitCount() const { return static_cast<size_t>(hash_size_) * hash_size_; }

private:
    int hash_size_;
};
