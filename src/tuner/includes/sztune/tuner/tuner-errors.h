#pragma once

#include <stdexcept>
#include <string>

namespace sztune::tuner {

// Base exception for tuner errors
class TunerError : public std::runtime_error
{
public:
    explicit TunerError(const std::string& msg) : std::runtime_error(msg)
    {
    }

    // Constructor that wraps another exception
    TunerError(const std::string& msg, const std::exception& cause)
        : std::runtime_error(msg + ": " + cause.what())
    {
    }
};

// Disk usage utility missing, failed or produced output we cannot read
class SizeProbeError : public TunerError
{
public:
    using TunerError::TunerError;
};

// Compressor missing, exited abnormally or produced no archives
class CompressorError : public TunerError
{
public:
    using TunerError::TunerError;
};

// A sweep could not produce a winner (nothing to compress, empty table)
class SweepError : public TunerError
{
public:
    using TunerError::TunerError;
};

}  // namespace sztune::tuner
