#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error raised by the media pipeline
 */
class PipelineError : public std::runtime_error
{
public:
    explicit PipelineError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief The video or audio source cannot be opened or has no readable frames.
 * Fatal for the job.
 */
class SourceUnreadable : public PipelineError
{
public:
    explicit SourceUnreadable(const std::string &message) : PipelineError(message) {}
};

/**
 * @brief A single frame image cannot be decoded. Callers treat the frame as unique.
 */
class DecodeError : public PipelineError
{
public:
    explicit DecodeError(const std::string &message) : PipelineError(message) {}
};

/**
 * @brief Two perceptual hashes of different length were compared
 */
class ShapeMismatch : public PipelineError
{
public:
    explicit ShapeMismatch(const std::string &message) : PipelineError(message) {}
};

/**
 * @brief An external capability was unreachable, timed out or answered with garbage
 */
class TransportFailure : public PipelineError
{
public:
    explicit TransportFailure(const std::string &message) : PipelineError(message) {}
};

/**
 * @brief The result store rejected a write. Fatal for the job.
 */
class PersistenceFailure : public PipelineError
{
public:
    explicit PersistenceFailure(const std::string &message) : PipelineError(message) {}
};

/**
 * @brief The job was cancelled while running
 */
class JobCancelled : public PipelineError
{
public:
    JobCancelled() : PipelineError("cancelled") {}
};
