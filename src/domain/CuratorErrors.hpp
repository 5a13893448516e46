/**
 * @file CuratorErrors.hpp
 * @brief Request-level failures surfaced to the caller of the curation pipeline.
 *
 * Per-line and per-record problems (decode failures, malformed metadata,
 * classification misses) never reach this level; they are absorbed by the
 * pipeline and counted in PipelineStats.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace channelcurator::domain {

/**
 * @class CuratorError
 * @brief Base class of every error that fails a playlist request.
 */
class CuratorError : public std::runtime_error {
public:
    explicit CuratorError(const std::string& msg) : std::runtime_error(msg) {}

    /** @brief Short name of the stage that failed ("configuration", "acquisition"). */
    virtual const char* stage() const = 0;
};

/**
 * @class ConfigurationError
 * @brief Missing credentials or invalid settings. Raised before any network call.
 */
class ConfigurationError : public CuratorError {
public:
    explicit ConfigurationError(const std::string& msg) : CuratorError(msg) {}
    const char* stage() const override { return "configuration"; }
};

/**
 * @class AcquisitionError
 * @brief Every origin/attempt failed to deliver a document with a valid header.
 */
class AcquisitionError : public CuratorError {
public:
    AcquisitionError(const std::string& msg, std::vector<std::string> originFailures)
        : CuratorError(msg), m_originFailures(std::move(originFailures)) {}

    const char* stage() const override { return "acquisition"; }

    /** @brief Last failure reason per origin, formatted as "label: reason". */
    const std::vector<std::string>& originFailures() const { return m_originFailures; }

private:
    std::vector<std::string> m_originFailures;
};

} // namespace channelcurator::domain
