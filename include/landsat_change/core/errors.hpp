#pragma once

#include <stdexcept>
#include <string>

namespace landsat_change {

class LandsatChangeError : public std::runtime_error {
public:
    explicit LandsatChangeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public LandsatChangeError {
public:
    explicit ConfigError(const std::string& message)
        : LandsatChangeError("Config error: " + message) {}
};

// A recognized spectral index that has no implementation yet.
class UnimplementedIndexError : public ConfigError {
public:
    explicit UnimplementedIndexError(const std::string& message)
        : ConfigError("Unimplemented index: " + message) {}
};

// A name that is not a spectral index at all.
class UnrecognizedIndexError : public ConfigError {
public:
    explicit UnrecognizedIndexError(const std::string& message)
        : ConfigError("Unrecognized index: " + message) {}
};

class ValidationError : public LandsatChangeError {
public:
    explicit ValidationError(const std::string& message)
        : LandsatChangeError("Validation error: " + message) {}
};

class DataError : public LandsatChangeError {
public:
    explicit DataError(const std::string& message)
        : LandsatChangeError("Data error: " + message) {}
};

class IOError : public LandsatChangeError {
public:
    explicit IOError(const std::string& message)
        : LandsatChangeError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public LandsatChangeError {
public:
    explicit PipelineError(const std::string& message)
        : LandsatChangeError("Pipeline error: " + message) {}
};

} // namespace landsat_change
