#include "database/database_manager.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace fs = std::filesystem;

class DatabaseManagerTest : public ::testing::Test
{
protected:
    std::string db_path = (fs::temp_directory_path() / "media_insight_db_test.db").string();

    void SetUp() override
    {
        removeFiles();
        db_ = std::make_unique<DatabaseManager>(db_path);
        ASSERT_TRUE(db_->isValid());
    }

    void TearDown() override
    {
        db_.reset();
        removeFiles();
    }

    void removeFiles()
    {
        for (const auto &suffix : {"", "-shm", "-wal"})
        {
            std::error_code ec;
            fs::remove(db_path + suffix, ec);
        }
    }

    PipelineJob makeJob(const std::string &id)
    {
        PipelineJob job;
        job.job_id = id;
        job.media_path = "/media/demo.mp4";
        job.context = "Restaurant POS";
        job.analysis_mode = AnalysisMode::AUTO;
        job.media_kind = MediaKind::VIDEO;
        job.created_at = std::chrono::system_clock::now();
        job.updated_at = job.created_at;
        return job;
    }

    FrameRecord makeFrame(int sequence)
    {
        FrameRecord frame;
        frame.sequence = sequence;
        frame.frame_index = 100 + sequence;
        frame.timestamp_seconds = 4.0 * (sequence + 1);
        frame.image_url = "https://cdn.test/jobs/j1/keyframes/keyframe_00" + std::to_string(sequence) + ".jpg";
        frame.extraction_method = "uniform";
        frame.description.content = R"({"summary": "screen )" + std::to_string(sequence) + R"("})";
        frame.description.external_calls = 1;
        return frame;
    }

    std::unique_ptr<DatabaseManager> db_;
};

TEST_F(DatabaseManagerTest, SavesAndUpdatesJob)
{
    PipelineJob job = makeJob("j1");
    ASSERT_TRUE(db_->saveJob(job).success);

    job.stage = PipelineStage::FAILED;
    job.error_message = "cancelled";
    ASSERT_TRUE(db_->saveJob(job).success);

    auto stored = db_->getJob("j1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->media_path, "/media/demo.mp4");
    EXPECT_EQ(stored->context, "Restaurant POS");
    EXPECT_EQ(stored->analysis_mode, "auto");
    EXPECT_EQ(stored->media_kind, "video");
    EXPECT_EQ(stored->stage, "failed");
    EXPECT_EQ(stored->error_message, "cancelled");
    EXPECT_FALSE(db_->getJob("missing").has_value());
}

TEST_F(DatabaseManagerTest, ProgressLogKeepsInsertionOrder)
{
    ASSERT_TRUE(db_->saveJob(makeJob("j1")).success);
    auto now = std::chrono::system_clock::now();
    ASSERT_TRUE(db_->appendProgress("j1", ProgressEntry{now, LogLevel::INFO, "Stage: transcribing"}).success);
    ASSERT_TRUE(db_->appendProgress("j1", ProgressEntry{now, LogLevel::WARNING, "Frame 2/5 described with fallback"}).success);

    auto messages = db_->getProgressMessages("j1");
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "info: Stage: transcribing");
    EXPECT_EQ(messages[1], "warning: Frame 2/5 described with fallback");
}

TEST_F(DatabaseManagerTest, ResultsRoundTrip)
{
    ASSERT_TRUE(db_->saveJob(makeJob("j1")).success);

    EnrichedTranscript transcript;
    transcript.transcript.full_text = "hello world";
    transcript.transcript.language = "en";
    transcript.transcript.segments = {{0.0, 1.5, "hello"}, {1.5, 3.0, "world"}};
    transcript.enriched = true;
    transcript.keywords = {"greeting"};
    transcript.topics = {{"intro", 0.0, 3.0}};
    ASSERT_TRUE(db_->saveTranscript("j1", transcript).success);

    ASSERT_TRUE(db_->saveFrame("j1", makeFrame(1)).success);
    ASSERT_TRUE(db_->saveFrame("j1", makeFrame(0)).success);
    ASSERT_TRUE(db_->saveAnalysis("j1", {{"summary", "demo"}, {"_media_kind", "video"}}).success);

    auto stored_transcript = db_->getTranscript("j1");
    ASSERT_TRUE(stored_transcript.has_value());
    EXPECT_EQ((*stored_transcript)["full_text"], "hello world");
    EXPECT_EQ((*stored_transcript)["segments"].size(), 2u);
    EXPECT_EQ((*stored_transcript)["keywords"][0], "greeting");
    EXPECT_TRUE((*stored_transcript)["enriched"].get<bool>());

    auto frames = db_->getFrames("j1");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].sequence, 0);
    EXPECT_EQ(frames[1].sequence, 1);
    EXPECT_EQ(frames[1].frame_index, 101);
    EXPECT_DOUBLE_EQ(frames[1].timestamp_seconds, 8.0);
    EXPECT_EQ(frames[0].image_url, makeFrame(0).image_url);
    EXPECT_EQ(frames[0].description.content, makeFrame(0).description.content);
    EXPECT_EQ(frames[0].description.external_calls, 1);
    EXPECT_FALSE(frames[0].description.fallback);

    auto analysis = db_->getAnalysis("j1");
    ASSERT_TRUE(analysis.has_value());
    EXPECT_EQ((*analysis)["summary"], "demo");
}

TEST_F(DatabaseManagerTest, DuplicateFrameSequenceIsRejected)
{
    ASSERT_TRUE(db_->saveJob(makeJob("j1")).success);
    ASSERT_TRUE(db_->saveFrame("j1", makeFrame(0)).success);

    DBOpResult result = db_->saveFrame("j1", makeFrame(0));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(DatabaseManagerTest, ResultsForUnknownJobAreRejected)
{
    EXPECT_FALSE(db_->saveFrame("ghost", makeFrame(0)).success);
    EXPECT_FALSE(db_->saveAnalysis("ghost", {{"a", 1}}).success);
}

TEST_F(DatabaseManagerTest, ClearResultsKeepsJobAndProgress)
{
    ASSERT_TRUE(db_->saveJob(makeJob("j1")).success);
    ASSERT_TRUE(db_->appendProgress("j1", ProgressEntry{std::chrono::system_clock::now(), LogLevel::ERROR,
                                                        "Failed during persisting: disk full"})
                    .success);
    ASSERT_TRUE(db_->saveTranscript("j1", EnrichedTranscript{}).success);
    ASSERT_TRUE(db_->saveFrame("j1", makeFrame(0)).success);
    ASSERT_TRUE(db_->saveAnalysis("j1", {{"summary", "partial"}}).success);

    ASSERT_TRUE(db_->clearResults("j1").success);

    EXPECT_TRUE(db_->getJob("j1").has_value());
    EXPECT_EQ(db_->getProgressMessages("j1").size(), 1u);
    EXPECT_FALSE(db_->getTranscript("j1").has_value());
    EXPECT_TRUE(db_->getFrames("j1").empty());
    EXPECT_FALSE(db_->getAnalysis("j1").has_value());

    // Sequence numbers are free again after clearing
    EXPECT_TRUE(db_->saveFrame("j1", makeFrame(0)).success);
}

TEST_F(DatabaseManagerTest, InMemoryDatabaseWorks)
{
    DatabaseManager memory(":memory:");
    ASSERT_TRUE(memory.isValid());
    ASSERT_TRUE(memory.saveJob(makeJob("m1")).success);
    EXPECT_TRUE(memory.getJob("m1").has_value());
}
