#pragma once

#include "core/frame_store.hpp"
#include "core/media_types.hpp"
#include "core/perceptual_hasher.hpp"
#include <vector>

struct DedupResult
{
    std::vector<CandidateFrame> unique;
    int removed_count = 0;
};

/**
 * @brief Greedy near-duplicate removal over perceptual hashes
 *
 * Candidates are visited in input order and compared against every frame kept so far;
 * a Hamming distance at or below the threshold marks a duplicate. Frames that cannot be
 * hashed are always kept.
 */
class FrameDeduplicator
{
public:
    FrameDeduplicator(FrameStore &store, const PerceptualHasher &hasher);

    /**
     * @brief Collapse near-identical candidates
     * @param candidates Frames in timestamp order
     * @param similarity_threshold Max Hamming distance still considered a duplicate
     * @param keep_first Only true is supported: the earliest occurrence wins
     * @return Surviving frames (input order) and the number removed
     * @throws std::invalid_argument if keep_first is false or the threshold is negative
     */
    DedupResult deduplicate(const std::vector<CandidateFrame> &candidates, int similarity_threshold = 20,
                            bool keep_first = true);

    /**
     * @brief Whether duplicate images are released from the store (default true)
     */
    void setReleaseDuplicates(bool release) { release_duplicates_ = release; }

private:
    FrameStore &store_;
    const PerceptualHasher &hasher_;
    bool release_duplicates_ = true;
};
