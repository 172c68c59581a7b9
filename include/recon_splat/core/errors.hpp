#pragma once

#include <stdexcept>
#include <string>

namespace recon_splat {

class ReconSplatError : public std::runtime_error {
public:
    explicit ReconSplatError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ReconSplatError {
public:
    explicit ConfigError(const std::string& message)
        : ReconSplatError("Config error: " + message) {}
};

class ValidationError : public ReconSplatError {
public:
    explicit ValidationError(const std::string& message)
        : ReconSplatError("Validation error: " + message) {}
};

class IOError : public ReconSplatError {
public:
    explicit IOError(const std::string& message)
        : ReconSplatError("I/O error: " + message) {}
};

class PipelineError : public ReconSplatError {
public:
    explicit PipelineError(const std::string& message)
        : ReconSplatError("Pipeline error: " + message) {}
};

} // namespace recon_splat
