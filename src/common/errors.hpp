#pragma once

#include <stdexcept>
#include <string>

namespace krecon {

// Root of every error krecon raises. Commands catch this at their boundary.
class KreconError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The cluster client could not be created (kubectl missing, no context for
// the configured API server).
class ClientUnavailable : public KreconError
{
public:
    using KreconError::KreconError;
};

// The cluster answered, but its version/identity could not be read.
class InfoUnavailable : public KreconError
{
public:
    using KreconError::KreconError;
};

class UnknownStrategy : public KreconError
{
public:
    explicit UnknownStrategy(const std::string &strategy)
        : KreconError("unknown diff strategy '" + strategy + "'")
        , m_strategy(strategy)
    {
    }

    const std::string &strategy() const { return m_strategy; }

private:
    std::string m_strategy;
};

class CategoryQueryFailed : public KreconError
{
public:
    CategoryQueryFailed(const std::string &category, const std::string &cause)
        : KreconError("getting orphans of kind '" + category + "': " + cause)
        , m_category(category)
        , m_cause(cause)
    {
    }

    const std::string &category() const { return m_category; }
    const std::string &cause() const { return m_cause; }

private:
    std::string m_category;
    std::string m_cause;
};

class OrphanQueryTimeout : public KreconError
{
public:
    using KreconError::KreconError;
};

class NotConfirmed : public KreconError
{
public:
    using KreconError::KreconError;
};

class InvalidManifest : public KreconError
{
public:
    using KreconError::KreconError;
};

class ConfigError : public KreconError
{
public:
    using KreconError::KreconError;
};

// An external program (kubectl, diff, diffstat) failed to start or exited
// with an unexpected status.
class CommandFailed : public KreconError
{
public:
    CommandFailed(const std::string &command, int exitCode, const std::string &stdErr)
        : KreconError(buildMessage(command, exitCode, stdErr))
        , m_command(command)
        , m_exitCode(exitCode)
        , m_stdErr(stdErr)
    {
    }

    const std::string &command() const { return m_command; }
    int exitCode() const { return m_exitCode; }
    const std::string &stdErr() const { return m_stdErr; }

private:
    static std::string buildMessage(const std::string &command, int exitCode,
                                    const std::string &stdErr)
    {
        std::string message = "'" + command + "' ";
        if (exitCode < 0) {
            message += "did not complete";
        } else {
            message += "exited with status " + std::to_string(exitCode);
        }
        if (!stdErr.empty()) {
            message += ": " + stdErr;
        }
        return message;
    }

    std::string m_command;
    int m_exitCode;
    std::string m_stdErr;
};

// The external program was killed after running past its deadline.
class CommandTimedOut : public CommandFailed
{
public:
    CommandTimedOut(const std::string &command, long long timeoutMs)
        : CommandFailed(command, -1, "timed out after " + std::to_string(timeoutMs) + "ms")
    {
    }
};

} // namespace krecon
