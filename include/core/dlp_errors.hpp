#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error the redaction flow reports
 */
class DlpError : public std::runtime_error
{
public:
    explicit DlpError(const std::string &message) : std::runtime_error(message) {}
};

// Missing, conflicting or malformed command-line input
class UsageError : public DlpError
{
public:
    explicit UsageError(const std::string &message) : DlpError(message) {}
};

// The service could not be reached
class TransportError : public DlpError
{
public:
    explicit TransportError(const std::string &message) : DlpError(message) {}
};

// No credentials, or credentials rejected by the service
class AuthenticationError : public DlpError
{
public:
    explicit AuthenticationError(const std::string &message) : DlpError(message) {}
};

/**
 * @brief The service answered but rejected the request or returned something unusable
 */
class RemoteError : public DlpError
{
public:
    RemoteError(const std::string &message, int http_status = 0, const std::string &service_status = "")
        : DlpError(message), http_status_(http_status), service_status_(service_status) {}

    int httpStatus() const { return http_status_; }
    const std::string &serviceStatus() const { return service_status_; }

private:
    int http_status_;
    std::string service_status_;
};

// Reading the input file or writing the output file failed
class IoError : public DlpError
{
public:
    explicit IoError(const std::string &message) : DlpError(message) {}
};
