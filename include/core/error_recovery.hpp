#pragma once
#include <chrono>
#include <string>
#include <thread>
#include <utility>
extern "C"
{
#include <libavutil/error.h>
}
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Human-readable text for an FFmpeg error code
    static std::string ffmpegError(int code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf);
    }

    // Retry mechanism for FFmpeg operations that return error codes
    template <typename Func, typename... Args>
    static int retryFFmpegOperation(Func func, int max_retries, const std::string &operation_name, Args &&...args)
    {
        int result = -1;
        for (int attempt = 0; attempt < max_retries; ++attempt)
        {
            result = func(std::forward<Args>(args)...);
            if (result >= 0)
            {
                return result;
            }

            if (attempt == max_retries - 1)
            {
                Logger::error("FFmpeg operation '" + operation_name + "' failed after " +
                              std::to_string(max_retries) + " attempts: " + ffmpegError(result) +
                              " (error code: " + std::to_string(result) + ")");
                break;
            }

            int delay_ms = (1 << attempt) * 100; // Exponential backoff: 100ms, 200ms, 400ms...
            Logger::warn("FFmpeg operation '" + operation_name + "' failed, retrying in " +
                         std::to_string(delay_ms) + "ms (attempt " + std::to_string(attempt + 1) +
                         "/" + std::to_string(max_retries) + "): " + ffmpegError(result));

            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        return result;
    }
};
