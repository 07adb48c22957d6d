#include "core/pipeline_config.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace
{
    ProviderSettings readProvider(const PocoConfigManager &cfg, const std::string &role,
                                  const std::string &default_model)
    {
        const std::string prefix = "providers." + role + ".";
        ProviderSettings settings;
        settings.provider = cfg.getString(prefix + "provider", "openai");
        settings.model = cfg.getString(prefix + "model", default_model);
        settings.api_key = cfg.getString(prefix + "api_key", "");
        settings.base_url = cfg.getString(prefix + "base_url", "");
        settings.timeout_seconds = cfg.getInt(prefix + "timeout_seconds", 120);
        return settings;
    }
}

PipelineConfig PipelineConfig::fromConfig(const PocoConfigManager &cfg)
{
    PipelineConfig config;
    config.log_level = cfg.getString("log_level", config.log_level);
    config.database_path = cfg.getString("database.path", config.database_path);
    config.work_root = cfg.getString("work_root",
                                     (std::filesystem::temp_directory_path() / "media_insight").string());
    config.publish_root = cfg.getString("storage.publish_root", config.publish_root);
    config.public_base_url = cfg.getString("storage.public_base_url", config.public_base_url);
    config.max_concurrent_jobs = cfg.getInt("workers.max_concurrent_jobs", config.max_concurrent_jobs);
    config.language = cfg.getString("transcription.language", config.language);

    config.sampler.interval_seconds = cfg.getDouble("sampler.interval_seconds", config.sampler.interval_seconds);
    config.sampler.min_frames = cfg.getInt("sampler.min_frames", config.sampler.min_frames);
    config.sampler.max_frames = cfg.getInt("sampler.max_frames", config.sampler.max_frames);
    config.sampler.scene_threshold = cfg.getDouble("sampler.scene_threshold", config.sampler.scene_threshold);

    config.similarity_threshold = cfg.getInt("dedup.similarity_threshold", config.similarity_threshold);
    config.hash_size = cfg.getInt("hasher.hash_size", config.hash_size);
    config.transcript_window_seconds = cfg.getDouble("transcript.window_seconds", config.transcript_window_seconds);
    config.max_transcript_chars = static_cast<size_t>(
        cfg.getInt("synthesis.max_transcript_chars", static_cast<int>(config.max_transcript_chars)));
    config.max_keyframes_in_synthesis = static_cast<size_t>(
        cfg.getInt("synthesis.max_keyframes", static_cast<int>(config.max_keyframes_in_synthesis)));

    config.transcription = readProvider(cfg, "transcription", "whisper-1");
    config.vision = readProvider(cfg, "vision", "gpt-4o");
    config.analysis = readProvider(cfg, "analysis", "gpt-4o");
    config.enrichment = readProvider(cfg, "enrichment", "gpt-4o-mini");
    return config;
}

std::string PipelineConfig::defaultJson()
{
    nlohmann::json providers = nlohmann::json::object();
    const std::pair<const char *, const char *> roles[] = {
        {"transcription", "whisper-1"},
        {"vision", "gpt-4o"},
        {"analysis", "gpt-4o"},
        {"enrichment", "gpt-4o-mini"}};
    for (const auto &role : roles)
    {
        providers[role.first] = {
            {"provider", "openai"},
            {"model", role.second},
            {"api_key", ""},
            {"base_url", ""},
            {"timeout_seconds", 120}};
    }

    nlohmann::json doc = {
        {"log_level", "INFO"},
        {"database", {{"path", "media_insight.db"}}},
        {"work_root", (std::filesystem::temp_directory_path() / "media_insight").string()},
        {"storage", {{"publish_root", "published"}, {"public_base_url", "http://localhost:9000/media-insight"}}},
        {"workers", {{"max_concurrent_jobs", 2}}},
        {"transcription", {{"language", "it"}}},
        {"sampler", {{"interval_seconds", 4.0}, {"min_frames", 10}, {"max_frames", 50}, {"scene_threshold", 20.0}}},
        {"dedup", {{"similarity_threshold", 20}}},
        {"hasher", {{"hash_size", 16}}},
        {"transcript", {{"window_seconds", 5.0}}},
        {"synthesis", {{"max_transcript_chars", 8000}, {"max_keyframes", 15}}},
        {"providers", providers}};
    return doc.dump(2);
}

bool PipelineConfig::validate() const
{
    bool ok = true;
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log_level: " + log_level);
        ok = false;
    }
    if (sampler.interval_seconds <= 0.0)
    {
        Logger::error("sampler.interval_seconds must be positive");
        ok = false;
    }
    if (sampler.min_frames < 1 || sampler.max_frames < sampler.min_frames)
    {
        Logger::error("sampler frame bounds must satisfy 1 <= min_frames <= max_frames");
        ok = false;
    }
    if (sampler.scene_threshold < 0.0 || sampler.scene_threshold > 100.0)
    {
        Logger::error("sampler.scene_threshold must be within 0-100");
        ok = false;
    }
    if (hash_size < 2)
    {
        Logger::error("hasher.hash_size must be at least 2");
        ok = false;
    }
    if (similarity_threshold < 0 || similarity_threshold > hash_size * hash_size)
    {
        Logger::error("dedup.similarity_threshold out of range for hash size");
        ok = false;
    }
    if (max_concurrent_jobs < 1)
    {
        Logger::error("workers.max_concurrent_jobs must be at least 1");
        ok = false;
    }
    return ok;
}
