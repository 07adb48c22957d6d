#include "core/analysis_pipeline.hpp"
#include "core/frame_deduplicator.hpp"
#include "core/frame_sampler.hpp"
#include "core/perceptual_hasher.hpp"
#include "core/pipeline_errors.hpp"
#include "core/transcript_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    const size_t kMaxFrameKeywords = 15;

    AnalysisProvider &requireAnalysis(const PipelineServices &services)
    {
        if (!services.analysis)
            throw std::invalid_argument("Pipeline requires an analysis provider");
        return *services.analysis;
    }

    AnalysisProvider &requireEnrichment(const PipelineServices &services)
    {
        if (services.enrichment)
            return *services.enrichment;
        return requireAnalysis(services);
    }
}

ScopedTempDir::ScopedTempDir(const fs::path &root, const std::string &name)
    : path_(root / name)
{
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create working directory " + path_.string() + ": " + ec.message());
    }
}

ScopedTempDir::~ScopedTempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::error("Failed to remove working directory " + path_.string() + ": " + ec.message());
    }
}

AnalysisPipeline::AnalysisPipeline(PipelineServices services, const PipelineConfig &config)
    : services_(std::move(services)), config_(config),
      analyzer_(requireAnalysis(services_), requireEnrichment(services_), config.max_transcript_chars,
                config.max_keyframes_in_synthesis)
{
    if (!services_.media || !services_.vision || !services_.storage || !services_.store)
    {
        throw std::invalid_argument("Pipeline requires media backend, vision provider, storage and result store");
    }
    if (!services_.refusal_policy)
    {
        services_.refusal_policy = looksLikeRefusal;
    }
}

std::string AnalysisPipeline::keyframeObjectKey(const std::string &job_id, int sequence)
{
    char name[32];
    std::snprintf(name, sizeof(name), "keyframe_%03d.jpg", sequence);
    return "jobs/" + job_id + "/keyframes/" + name;
}

PipelineStage AnalysisPipeline::execute(PipelineJob &job, JobObserver *observer)
{
    Logger::info("Starting job " + job.job_id + " for " + job.media_path);
    job.error_message.clear();

    try
    {
        {
            ScopedTempDir work_dir(config_.work_root, job.job_id);
            JobContext ctx{job, observer, work_dir.path(), MediaInfo{}, false, EnrichedTranscript{}, nullptr, {}, {}, {}};
            runStages(ctx);
        }
        enterStage(job, PipelineStage::COMPLETED, observer);
        progress(job, LogLevel::INFO, "Job completed", observer);
        Logger::info("Job " + job.job_id + " completed");
    }
    catch (const std::exception &e)
    {
        // Working directory already removed by stack unwinding
        job.error_message = e.what();
        const std::string failed_stage = PipelineStages::stageName(job.stage);
        enterStage(job, PipelineStage::FAILED, observer);
        progress(job, LogLevel::ERROR, "Failed during " + failed_stage + ": " + job.error_message, observer);
        Logger::error("Job " + job.job_id + " failed during " + failed_stage + ": " + job.error_message);
    }
    return job.stage;
}

void AnalysisPipeline::runStages(JobContext &ctx)
{
    ctx.info = services_.media->probe(ctx.job.media_path);
    if (ctx.job.media_kind == MediaKind::VIDEO && !ctx.info.has_video)
    {
        progress(ctx.job, LogLevel::WARNING, "No video stream found, processing as audio", ctx.observer);
        ctx.job.media_kind = MediaKind::AUDIO;
    }

    extractAudio(ctx);
    transcribe(ctx);
    enrichTranscript(ctx);
    sampleFrames(ctx);
    deduplicateFrames(ctx);
    analyzeFrames(ctx);
    synthesize(ctx);
    persist(ctx);
}

void AnalysisPipeline::extractAudio(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::EXTRACTING_AUDIO, ctx.observer);

    if (!ctx.info.has_audio)
    {
        progress(ctx.job, LogLevel::WARNING, "Media has no audio track, transcript will be empty", ctx.observer);
        return;
    }
    const fs::path wav_path = ctx.work_dir / "audio.wav";
    ctx.has_audio = services_.media->extractAudio(ctx.job.media_path, wav_path.string());
    progress(ctx.job, ctx.has_audio ? LogLevel::INFO : LogLevel::WARNING,
             ctx.has_audio ? "Audio extracted" : "No audio extracted, transcript will be empty", ctx.observer);
}

void AnalysisPipeline::transcribe(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::TRANSCRIBING, ctx.observer);

    ctx.transcript.transcript.language = config_.language;
    if (!ctx.has_audio)
        return;

    if (!services_.transcription)
    {
        throw TransportFailure("No transcription provider configured");
    }
    ctx.transcript.transcript = services_.transcription->transcribe((ctx.work_dir / "audio.wav").string(),
                                                                    config_.language);
    progress(ctx.job, LogLevel::INFO,
             "Transcription complete: " + std::to_string(ctx.transcript.transcript.segments.size()) + " segments",
             ctx.observer);
}

void AnalysisPipeline::enrichTranscript(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::ENRICHING, ctx.observer);

    const std::string media_name = fs::path(ctx.job.media_path).filename().string();
    ctx.transcript = analyzer_.enrich(ctx.transcript.transcript, ctx.info.duration_seconds, media_name);

    if (ctx.transcript.enriched)
    {
        progress(ctx.job, LogLevel::INFO,
                 "Transcript enriched: " + std::to_string(ctx.transcript.topics.size()) + " topics, " +
                     std::to_string(ctx.transcript.keywords.size()) + " keywords",
                 ctx.observer);
    }
    else if (!ctx.transcript.enrichment_error.empty())
    {
        progress(ctx.job, LogLevel::WARNING, "Enrichment failed, continuing with raw transcript: " +
                                                 ctx.transcript.enrichment_error,
                 ctx.observer);
    }
}

void AnalysisPipeline::sampleFrames(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::SAMPLING_FRAMES, ctx.observer);

    if (ctx.job.media_kind == MediaKind::AUDIO)
    {
        progress(ctx.job, LogLevel::INFO, "Audio-only media, no frames to sample", ctx.observer);
        return;
    }

    ctx.frames_store = std::make_unique<FileFrameStore>(ctx.work_dir / "frames");
    auto source = services_.media->openVideo(ctx.job.media_path);
    FrameSampler sampler(*ctx.frames_store, config_.sampler);
    ctx.candidates = sampler.sample(*source);

    progress(ctx.job, LogLevel::INFO, "Extracted " + std::to_string(ctx.candidates.size()) + " candidate frames",
             ctx.observer);
}

void AnalysisPipeline::deduplicateFrames(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::DEDUPLICATING, ctx.observer);

    if (!ctx.frames_store)
    {
        progress(ctx.job, LogLevel::INFO, "Audio-only media, nothing to deduplicate", ctx.observer);
        return;
    }

    PerceptualHasher hasher(config_.hash_size);
    FrameDeduplicator deduplicator(*ctx.frames_store, hasher);
    DedupResult result = deduplicator.deduplicate(ctx.candidates, config_.similarity_threshold);
    ctx.candidates = std::move(result.unique);

    progress(ctx.job, LogLevel::INFO,
             std::to_string(ctx.candidates.size()) + " unique frames, " + std::to_string(result.removed_count) +
                 " duplicates removed",
             ctx.observer);
}

void AnalysisPipeline::analyzeFrames(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::ANALYZING_FRAMES, ctx.observer);

    if (!ctx.frames_store)
    {
        progress(ctx.job, LogLevel::INFO, "Audio-only media, no frames to analyze", ctx.observer);
        return;
    }

    VisionRetryMachine machine(*services_.vision, *ctx.frames_store, services_.refusal_policy);
    const auto &segments = ctx.transcript.transcript.segments;
    std::vector<std::string> keywords(ctx.transcript.keywords.begin(),
                                      ctx.transcript.keywords.begin() +
                                          std::min(ctx.transcript.keywords.size(), kMaxFrameKeywords));

    std::optional<std::string> previous_description;
    const size_t total = ctx.candidates.size();
    for (size_t i = 0; i < total; i++)
    {
        checkCancelled(ctx.job, ctx.observer);

        const CandidateFrame &candidate = ctx.candidates[i];
        SampledFrame sampled;
        sampled.frame = candidate;
        sampled.transcript_window = transcript_utils::transcriptWindow(segments, candidate.timestamp_seconds,
                                                                       config_.transcript_window_seconds);
        sampled.topics_in_window = transcript_utils::topicsAt(ctx.transcript.topics, candidate.timestamp_seconds);
        sampled.keywords = keywords;
        sampled.continuity_hint = previous_description;

        const std::string label = "Frame " + std::to_string(i + 1) + "/" + std::to_string(total) + " at " +
                                  transcript_utils::formatTimestamp(candidate.timestamp_seconds);
        try
        {
            FrameDescription description = machine.describe(sampled, ctx.job.context);
            previous_description = description.content;
            progress(ctx.job, description.fallback ? LogLevel::WARNING : LogLevel::INFO,
                     label + (description.fallback ? " described with fallback" : " analyzed"), ctx.observer);
            ctx.analyzed.push_back(AnalyzedFrame{candidate, std::move(description)});
        }
        catch (const std::exception &e)
        {
            progress(ctx.job, LogLevel::WARNING, label + " skipped: " + e.what(), ctx.observer);
            ctx.frames_store->release(candidate.image_ref);
        }
    }
}

void AnalysisPipeline::synthesize(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::SYNTHESIZING, ctx.observer);

    const std::string media_name = fs::path(ctx.job.media_path).filename().string();
    if (ctx.job.media_kind == MediaKind::AUDIO)
    {
        ctx.analysis = analyzer_.synthesizeAudio(ctx.transcript, ctx.info.duration_seconds, media_name,
                                                 ctx.job.context, ctx.job.analysis_mode);
    }
    else
    {
        std::vector<FrameSummaryInput> summaries;
        for (const auto &analyzed : ctx.analyzed)
        {
            summaries.push_back(FrameSummaryInput{analyzed.frame.timestamp_seconds, analyzed.description.content});
        }
        ctx.analysis = analyzer_.synthesizeVideo(ctx.transcript.transcript.full_text, summaries,
                                                 ctx.info.duration_seconds, media_name);
    }
    if (!ctx.analysis.is_object())
    {
        ctx.analysis = nlohmann::json{{"raw_response", ctx.analysis}};
    }
    ctx.analysis["_media_kind"] = PipelineStages::kindName(ctx.job.media_kind);
    progress(ctx.job, LogLevel::INFO, "Synthesis complete", ctx.observer);
}

void AnalysisPipeline::persist(JobContext &ctx)
{
    checkCancelled(ctx.job, ctx.observer);
    enterStage(ctx.job, PipelineStage::PERSISTING, ctx.observer);

    const std::string &job_id = ctx.job.job_id;

    DBOpResult result = services_.store->saveTranscript(job_id, ctx.transcript);
    if (!result.success)
    {
        throw PersistenceFailure("Saving transcript failed: " + result.error_message);
    }

    int sequence = 0;
    for (const auto &analyzed : ctx.analyzed)
    {
        const std::string local_path = ctx.frames_store->location(analyzed.frame.image_ref);
        std::string url;
        try
        {
            url = services_.storage->upload(local_path, keyframeObjectKey(job_id, sequence));
        }
        catch (const std::exception &e)
        {
            throw PersistenceFailure(std::string("Uploading keyframe failed: ") + e.what());
        }

        FrameRecord record;
        record.sequence = sequence;
        record.frame_index = analyzed.frame.frame_index;
        record.timestamp_seconds = analyzed.frame.timestamp_seconds;
        record.image_url = url;
        record.extraction_method = extractionMethodName(analyzed.frame.extraction_method);
        record.scene_change_score = analyzed.frame.scene_change_score;
        record.description = analyzed.description;

        result = services_.store->saveFrame(job_id, record);
        if (!result.success)
        {
            throw PersistenceFailure("Saving keyframe failed: " + result.error_message);
        }
        ctx.frames_store->release(analyzed.frame.image_ref);
        sequence++;
    }

    result = services_.store->saveAnalysis(job_id, ctx.analysis);
    if (!result.success)
    {
        throw PersistenceFailure("Saving analysis failed: " + result.error_message);
    }
    progress(ctx.job, LogLevel::INFO, "Saved transcript, " + std::to_string(sequence) + " keyframes and analysis",
             ctx.observer);
}

void AnalysisPipeline::enterStage(PipelineJob &job, PipelineStage stage, JobObserver *observer)
{
    job.stage = stage;
    job.updated_at = std::chrono::system_clock::now();
    if (observer)
        observer->onStageChanged(job.job_id, stage);
    saveJobRow(job);
    if (!PipelineStages::isTerminal(stage))
        progress(job, LogLevel::INFO, "Stage: " + PipelineStages::stageName(stage), observer);
}

void AnalysisPipeline::progress(PipelineJob &job, LogLevel level, const std::string &message, JobObserver *observer)
{
    ProgressEntry entry{std::chrono::system_clock::now(), level, message};
    job.progress_log.push_back(entry);

    const std::string line = "[" + job.job_id + "] " + message;
    if (level == LogLevel::ERROR)
        Logger::error(line);
    else if (level == LogLevel::WARNING)
        Logger::warn(line);
    else
        Logger::info(line);

    if (observer)
        observer->onProgress(job.job_id, entry);

    DBOpResult result = services_.store->appendProgress(job.job_id, entry);
    if (!result.success)
    {
        Logger::warn("Could not persist progress entry for job " + job.job_id + ": " + result.error_message);
    }
}

void AnalysisPipeline::checkCancelled(const PipelineJob &job, JobObserver *observer) const
{
    if (observer && observer->isCancelled(job.job_id))
    {
        throw JobCancelled();
    }
}

void AnalysisPipeline::saveJobRow(const PipelineJob &job)
{
    DBOpResult result = services_.store->saveJob(job);
    if (!result.success)
    {
        Logger::warn("Could not persist state of job " + job.job_id + ": " + result.error_message);
    }
}
