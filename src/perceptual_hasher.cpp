#include "core/perceptual_hasher.hpp"
#include "core/pipeline_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <string>

PerceptualHasher::PerceptualHasher(int hash_size)
    : hash_size_(hash_size)
{
    if (hash_size_ < 2)
    {
        throw std::invalid_argument("hash_size must be at least 2, got " + std::to_string(hash_size));
    }
}

FrameHash PerceptualHasher::hash(const cv::Mat &image) const
{
    if (image.empty())
    {
        throw DecodeError("Cannot hash an empty image");
    }
    if (image.depth() != CV_8U)
    {
        throw DecodeError("Unsupported image depth for hashing: " + std::to_string(image.depth()));
    }

    cv::Mat gray_image;
    try
    {
        switch (image.channels())
        {
        case 1:
            gray_image = image;
            break;
        case 3:
            cv::cvtColor(image, gray_image, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray_image, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw DecodeError("Unsupported channel count for hashing: " + std::to_string(image.channels()));
        }

        // INTER_AREA averages the covered pixels; nearest-neighbour would amplify noise
        cv::Mat resized_image;
        cv::resize(gray_image, resized_image, cv::Size(hash_size_ + 1, hash_size_), 0, 0, cv::INTER_AREA);

        FrameHash bits;
        bits.reserve(bitCount());
        for (int y = 0; y < hash_size_; ++y)
        {
            const uint8_t *row = resized_image.ptr<uint8_t>(y);
            for (int x = 0; x < hash_size_; ++x)
            {
                bits.push_back(row[x + 1] > row[x] ? 1 : 0);
            }
        }
        return bits;
    }
    catch (const cv::Exception &e)
    {
        throw DecodeError(std::string("OpenCV error while hashing: ") + e.what());
    }
}

int PerceptualHasher::distance(const FrameHash &a, const FrameHash &b)
{
    if (a.size() != b.size())
    {
        throw ShapeMismatch("Hash length mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));
    }
    int differing = 0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (a[i] != b[i])
            ++differing;
    }
    return differing;
}
