#include "core/analysis_pipeline.hpp"
#include "core/ffmpeg_media_backend.hpp"
#include "core/job_manager.hpp"
#include "core/pipeline_config.hpp"
#include "core/poco_config_manager.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include "providers/provider_factory.hpp"
#include "storage/object_storage.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Media Insight - audio/video analysis worker" << std::endl;
        std::cout << "Usage: " << program << " [options] <media file>..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>   Configuration file (default: config.json, created if missing)" << std::endl;
        std::cout << "  --context <text>      Domain context passed to the vision and analysis prompts" << std::endl;
        std::cout << "  --mode <name>         auto, reverse_engineering, meeting, debrief, brainstorming, notes" << std::endl;
        std::cout << "  --retries <n>         Retry failed jobs up to n times (default: 0)" << std::endl;
        std::cout << "  --show <job id>       Print the stored results of a job and exit" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    json statusToJson(const JobStatus &status)
    {
        json progress = json::array();
        for (const auto &entry : status.progress_log)
        {
            progress.push_back({{"timestamp", formatTimePoint(entry.timestamp)},
                                {"level", logLevelName(entry.level)},
                                {"message", entry.message}});
        }
        json result = {{"job_id", status.job_id},
                       {"stage", PipelineStages::stageName(status.stage)},
                       {"attempts", status.attempts},
                       {"progress", progress}};
        if (!status.error_message.empty())
            result["error"] = status.error_message;
        return result;
    }

    int showJob(DatabaseManager &db, const std::string &job_id)
    {
        auto job = db.getJob(job_id);
        if (!job)
        {
            std::cerr << "Unknown job: " << job_id << std::endl;
            return 1;
        }

        json frames = json::array();
        for (const auto &frame : db.getFrames(job_id))
        {
            frames.push_back({{"sequence", frame.sequence},
                              {"frame_index", frame.frame_index},
                              {"timestamp", frame.timestamp_seconds},
                              {"image_url", frame.image_url},
                              {"extraction_method", frame.extraction_method},
                              {"scene_change_score", frame.scene_change_score},
                              {"fallback", frame.description.fallback},
                              {"description", frame.description.content}});
        }

        json output = {{"job_id", job->job_id},
                       {"media_path", job->media_path},
                       {"media_kind", job->media_kind},
                       {"analysis_mode", job->analysis_mode},
                       {"stage", job->stage},
                       {"created_at", job->created_at},
                       {"updated_at", job->updated_at},
                       {"progress", db.getProgressMessages(job_id)},
                       {"keyframes", frames}};
        if (!job->error_message.empty())
            output["error"] = job->error_message;
        if (auto transcript = db.getTranscript(job_id))
            output["transcript"] = *transcript;
        if (auto analysis = db.getAnalysis(job_id))
            output["analysis"] = *analysis;

        std::cout << output.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    std::string context;
    std::string mode_name = "auto";
    std::string show_job_id;
    int retries = 0;
    std::vector<std::string> media_files;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next = [&](const std::string &option) -> std::string
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << option << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
            config_path = next(arg);
        else if (arg == "--context")
            context = next(arg);
        else if (arg == "--mode")
            mode_name = next(arg);
        else if (arg == "--show")
            show_job_id = next(arg);
        else if (arg == "--retries")
        {
            try
            {
                retries = std::stoi(next(arg));
            }
            catch (const std::exception &)
            {
                std::cerr << "--retries expects a number" << std::endl;
                return 2;
            }
        }
        else
            media_files.push_back(arg);
    }

    auto &config_manager = PocoConfigManager::getInstance();
    if (!std::filesystem::exists(config_path))
    {
        std::ofstream out(config_path);
        out << PipelineConfig::defaultJson();
        if (!out)
        {
            std::cerr << "Cannot write default configuration to " << config_path << std::endl;
            return 1;
        }
    }
    if (!config_manager.load(config_path))
    {
        std::cerr << "Failed to load configuration from " << config_path << std::endl;
        return 1;
    }

    PipelineConfig config = PipelineConfig::fromConfig(config_manager);
    Logger::init(config.log_level);
    Logger::info("Configuration loaded from " + config_path);
    if (!config.validate())
    {
        Logger::error("Invalid configuration, exiting");
        return 1;
    }

    auto db = std::make_shared<DatabaseManager>(config.database_path);
    if (!db->isValid())
    {
        Logger::error("Failed to open database " + config.database_path);
        return 1;
    }

    if (!show_job_id.empty())
        return showJob(*db, show_job_id);

    if (media_files.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    AnalysisMode mode;
    try
    {
        mode = PipelineStages::parseMode(mode_name);
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error(e.what());
        return 2;
    }

    PipelineServices services;
    try
    {
        services.media = std::make_shared<FFmpegMediaBackend>();
        services.transcription = ProviderFactory::createTranscription(config.transcription);
        services.vision = ProviderFactory::createVision(config.vision);
        services.analysis = ProviderFactory::createAnalysis(config.analysis);
        services.enrichment = ProviderFactory::createAnalysis(config.enrichment);
        services.storage = std::make_shared<LocalObjectStorage>(config.publish_root, config.public_base_url);
        services.store = db;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Failed to set up providers: ") + e.what());
        return 1;
    }

    JobManager manager(services, config);
    std::vector<std::string> job_ids;
    for (const auto &file : media_files)
    {
        if (!std::filesystem::exists(file))
        {
            Logger::error("File not found: " + file);
            continue;
        }
        job_ids.push_back(manager.submit(std::filesystem::absolute(file).string(), context, mode));
    }

    manager.waitAll();
    for (int attempt = 0; attempt < retries; attempt++)
    {
        bool retried = false;
        for (const auto &job_id : job_ids)
        {
            auto status = manager.getStatus(job_id);
            if (status && status->stage == PipelineStage::FAILED && status->error_message != "cancelled")
                retried = manager.retry(job_id) || retried;
        }
        if (!retried)
            break;
        manager.waitAll();
    }

    int exit_code = job_ids.size() == media_files.size() ? 0 : 1;
    json report = json::array();
    for (const auto &job_id : job_ids)
    {
        auto status = manager.getStatus(job_id);
        if (!status)
            continue;
        if (status->stage != PipelineStage::COMPLETED)
            exit_code = 1;
        report.push_back(statusToJson(*status));
    }
    std::cout << report.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;

    manager.shutdown();
    return exit_code;
}
