#include "core/frame_deduplicator.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <optional>
#include <stdexcept>

FrameDeduplicator::FrameDeduplicator(FrameStore &store, const PerceptualHasher &hasher)
    : store_(store), hasher_(hasher)
{
}

DedupResult FrameDeduplicator::deduplicate(const std::vector<CandidateFrame> &candidates, int similarity_threshold,
                                           bool keep_first)
{
    if (!keep_first)
    {
        throw std::invalid_argument("Only keep-first deduplication is supported");
    }
    if (similarity_threshold < 0)
    {
        throw std::invalid_argument("Similarity threshold must be non-negative");
    }

    DedupResult result;
    if (candidates.empty())
        return result;

    Logger::info("Deduplicating " + std::to_string(candidates.size()) +
                 " keyframes (threshold=" + std::to_string(similarity_threshold) + ")...");

    std::vector<std::optional<FrameHash>> kept_hashes;
    for (size_t i = 0; i < candidates.size(); i++)
    {
        const CandidateFrame &candidate = candidates[i];

        std::optional<FrameHash> hash;
        try
        {
            hash = hasher_.hash(store_.load(candidate.image_ref));
        }
        catch (const DecodeError &e)
        {
            Logger::warn("Cannot hash frame at " + std::to_string(candidate.timestamp_seconds) +
                         "s, keeping it: " + e.what());
        }

        bool is_duplicate = false;
        if (hash)
        {
            for (size_t j = 0; j < kept_hashes.size(); j++)
            {
                if (!kept_hashes[j])
                    continue;
                const int distance = PerceptualHasher::distance(*hash, *kept_hashes[j]);
                if (distance <= similarity_threshold)
                {
                    Logger::debug("Frame " + std::to_string(i) + " (" + std::to_string(candidate.timestamp_seconds) +
                                  "s) is duplicate of " + std::to_string(result.unique[j].timestamp_seconds) +
                                  "s - distance=" + std::to_string(distance));
                    is_duplicate = true;
                    break;
                }
            }
        }

        if (is_duplicate)
        {
            result.removed_count++;
            if (release_duplicates_)
                store_.release(candidate.image_ref);
            continue;
        }

        result.unique.push_back(candidate);
        kept_hashes.push_back(hash);
    }

    Logger::info("Deduplication complete: " + std::to_string(result.unique.size()) + " unique frames, " +
                 std::to_string(result.removed_count) + " duplicates removed");
    return result;
}
