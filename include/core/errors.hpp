/*
 * Pipeline error hierarchy
 *
 * INFRASTRUCTURE:
 * - ExtractionUnavailable: model not loaded, backend failure, timeout
 * - StoreError: SQLite failure
 *
 * INPUT:
 * - UnreadableImage: bytes missing or not decodable
 *
 * INTEGRITY:
 * - DimensionMismatch: embedding length disagrees with the model
 *
 * FATAL:
 * - PurgeFailure: closing + purge rolled back
 *
 * "No face detected" is NOT an error anywhere in the pipeline.
 */

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

class ExtractionUnavailable : public PipelineError {
public:
    explicit ExtractionUnavailable(const std::string& what) : PipelineError(what) {}
};

class ExtractionTimeout : public ExtractionUnavailable {
public:
    explicit ExtractionTimeout(const std::string& what) : ExtractionUnavailable(what) {}
};

class UnreadableImage : public PipelineError {
public:
    explicit UnreadableImage(const std::string& what) : PipelineError(what) {}
};

class DimensionMismatch : public PipelineError {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : PipelineError("Embedding dimension mismatch: expected " + std::to_string(expected) +
                        ", got " + std::to_string(actual)),
          expected(expected), actual(actual) {}

    size_t expected;
    size_t actual;
};

class BackpressureError : public PipelineError {
public:
    explicit BackpressureError(const std::string& what) : PipelineError(what) {}
};

class StoreError : public PipelineError {
public:
    explicit StoreError(const std::string& what) : PipelineError(what) {}
};

class PurgeFailure : public PipelineError {
public:
    explicit PurgeFailure(const std::string& what) : PipelineError(what) {}
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& what) : PipelineError(what) {}
};
