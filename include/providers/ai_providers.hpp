#pragma once

#include "core/media_types.hpp"
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Speech-to-text capability
 */
class TranscriptionProvider
{
public:
    virtual ~TranscriptionProvider() = default;

    /**
     * @brief Transcribe an audio file
     * @param audio_path Path to a WAV/MP3 file
     * @param language ISO 639-1 language hint
     * @return Full text plus timestamped segments
     * @throws TransportFailure on network, timeout or provider errors
     */
    virtual Transcript transcribe(const std::string &audio_path, const std::string &language) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Image description capability
 */
class VisionProvider
{
public:
    virtual ~VisionProvider() = default;

    /**
     * @brief Describe one frame image
     * @param image_path JPEG/PNG file on disk
     * @param prompt Instruction text
     * @param context Structured context the prompt was built from (providers may ignore it)
     * @return Raw model output (expected to be JSON, not guaranteed)
     * @throws TransportFailure on network, timeout or provider errors
     */
    virtual std::string describeFrame(const std::string &image_path, const std::string &prompt,
                                      const nlohmann::json &context) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Text analysis capability (enrichment, content type inference, synthesis)
 */
class AnalysisProvider
{
public:
    virtual ~AnalysisProvider() = default;

    /**
     * @param response_format Provider response format hint such as "json_object", empty for none
     * @throws TransportFailure on network, timeout or provider errors
     */
    virtual std::string analyze(const std::string &prompt, const std::string &system_message, int max_tokens = 4000,
                                const std::string &response_format = "") = 0;

    virtual std::string name() const = 0;
};
