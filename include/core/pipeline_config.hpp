#pragma once

#include "core/poco_config_manager.hpp"
#include <string>

/**
 * @brief Parameters of the two-phase frame sampler
 */
struct SamplerSettings
{
    double interval_seconds = 4.0;
    int min_frames = 10;
    int max_frames = 50;
    double scene_threshold = 20.0;
};

/**
 * @brief Connection settings for one AI capability
 */
struct ProviderSettings
{
    std::string provider = "openai";
    std::string model;
    std::string api_key;
    std::string base_url;
    int timeout_seconds = 120;
};

/**
 * @brief Typed view of the JSON configuration used by the worker
 */
struct PipelineConfig
{
    std::string log_level = "INFO";
    std::string database_path = "media_insight.db";
    std::string work_root;
    std::string publish_root = "published";
    std::string public_base_url = "http://localhost:9000/media-insight";
    int max_concurrent_jobs = 2;
    std::string language = "it";

    SamplerSettings sampler;
    int similarity_threshold = 20;
    int hash_size = 16;
    double transcript_window_seconds = 5.0;
    size_t max_transcript_chars = 8000;
    size_t max_keyframes_in_synthesis = 15;

    ProviderSettings transcription;
    ProviderSettings vision;
    ProviderSettings analysis;
    ProviderSettings enrichment;

    /**
     * @brief Build the typed configuration, falling back to defaults for missing keys
     * @param cfg Loaded JSON configuration
     */
    static PipelineConfig fromConfig(const PocoConfigManager &cfg);

    /**
     * @brief Default configuration as a JSON document (written when no file exists)
     */
    static std::string defaultJson();

    /**
     * @brief Check value ranges; logs every problem found
     * @return true when the configuration is usable
     */
    bool validate() const;
};
