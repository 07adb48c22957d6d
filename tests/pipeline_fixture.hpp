#pragma once

#include "core/analysis_pipeline.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>

/**
 * @brief Pipeline collaborators wired to in-memory doubles: a 20 s synthetic video whose
 * picture changes every 5 s, a short transcript and scripted model answers
 */
class PipelineFixture : public ::testing::Test
{
protected:
    void SetUp() override
    {
        work_root_ = std::filesystem::temp_directory_path() /
                     ("media_insight_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(work_root_);

        config_.work_root = work_root_.string();
        config_.language = "it";
        config_.sampler.interval_seconds = 4.0;
        config_.sampler.min_frames = 3;
        config_.sampler.max_frames = 10;
        config_.max_concurrent_jobs = 2;

        media_ = std::make_shared<FakeMediaBackend>(20.0, 5.0, [](int64_t index)
                                                    {
            switch (static_cast<int>(index / 25))
            {
            case 0:
                return test_images::checkerboard(40, 320, 240);
            case 1:
                return test_images::gradient();
            case 2:
                return test_images::reverseGradient();
            default:
                return test_images::checkerboard(16, 320, 240);
            } });

        transcription_ = std::make_shared<FakeTranscriptionProvider>();
        transcription_->transcript.full_text = "Apriamo la lista ordini. Poi passiamo al pagamento.";
        transcription_->transcript.segments = {{0.0, 8.0, "Apriamo la lista ordini."},
                                               {8.0, 20.0, "Poi passiamo al pagamento."}};

        vision_ = std::make_shared<ScriptedVisionProvider>([](int index)
                                                           { return describedFrame(index); });

        analysis_ = std::make_shared<ScriptedAnalysisProvider>(
            [](const std::string &, const std::string &, const std::string &)
            { return std::string(R"({"summary": "Ordering flow", "screens": []})"); });

        enrichment_ = std::make_shared<ScriptedAnalysisProvider>(
            [](const std::string &, const std::string &, const std::string &format)
            {
                if (format == "json_object")
                    return std::string(R"({"content_type": "meeting", "confidence": "high"})");
                return std::string(R"({"semantic_summary": "Demo of orders and payments",
                                      "topics": [{"topic": "orders", "start_time": 0, "end_time": 8},
                                                 {"topic": "payments", "start_time": 8, "end_time": 20}],
                                      "keywords": ["ordini", "pagamento"],
                                      "tone": "instructional"})");
            });

        storage_ = std::make_shared<RecordingObjectStorage>();
        store_ = std::make_shared<MemoryResultStore>();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(work_root_, ec);
    }

    static std::string describedFrame(int index)
    {
        return nlohmann::json{{"summary", "screen " + std::to_string(index)},
                              {"screen_type", "list"},
                              {"module_name", "Orders"}}
            .dump();
    }

    PipelineServices services()
    {
        PipelineServices services;
        services.media = media_;
        services.transcription = transcription_;
        services.vision = vision_;
        services.analysis = analysis_;
        services.enrichment = enrichment_;
        services.storage = storage_;
        services.store = store_;
        return services;
    }

    PipelineJob makeJob(const std::string &media_path, const std::string &job_id = "job-1")
    {
        PipelineJob job;
        job.job_id = job_id;
        job.media_path = media_path;
        job.context = "Restaurant POS";
        job.media_kind = PipelineStages::kindFromPath(media_path);
        job.created_at = std::chrono::system_clock::now();
        job.updated_at = job.created_at;
        return job;
    }

    static bool logContains(const PipelineJob &job, const std::string &needle)
    {
        for (const auto &entry : job.progress_log)
        {
            if (entry.message.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    std::filesystem::path work_root_;
    PipelineConfig config_;
    std::shared_ptr<FakeMediaBackend> media_;
    std::shared_ptr<FakeTranscriptionProvider> transcription_;
    std::shared_ptr<ScriptedVisionProvider> vision_;
    std::shared_ptr<ScriptedAnalysisProvider> analysis_;
    std::shared_ptr<ScriptedAnalysisProvider> enrichment_;
    std::shared_ptr<RecordingObjectStorage> storage_;
    std::shared_ptr<MemoryResultStore> store_;
};
