#pragma once

#include <stdexcept>
#include <string>

namespace slide_ingest {

class SlideIngestError : public std::runtime_error {
public:
    explicit SlideIngestError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SlideIngestError {
public:
    explicit ConfigError(const std::string& message)
        : SlideIngestError("Config error: " + message) {}
};

class ValidationError : public SlideIngestError {
public:
    explicit ValidationError(const std::string& message)
        : SlideIngestError("Validation error: " + message) {}
};

class IOError : public SlideIngestError {
public:
    explicit IOError(const std::string& message)
        : SlideIngestError("I/O error: " + message) {}
};

// File vanished mid-poll or a directory could not be created yet.
// Callers log and retry on the next cycle.
class TransientIOError : public IOError {
public:
    explicit TransientIOError(const std::string& message)
        : IOError("transient: " + message) {}
};

class DecodeError : public SlideIngestError {
public:
    explicit DecodeError(const std::string& message)
        : SlideIngestError("Decode error: " + message) {}
};

class ModelUnavailable : public SlideIngestError {
public:
    explicit ModelUnavailable(const std::string& message)
        : SlideIngestError("Model unavailable: " + message) {}
};

class PipelineError : public SlideIngestError {
public:
    explicit PipelineError(const std::string& message)
        : SlideIngestError("Pipeline error: " + message) {}
};

} // namespace slide_ingest
