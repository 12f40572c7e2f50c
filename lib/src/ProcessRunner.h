#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "PodSyncTypes.h"

/**
 * ProcessRunner
 *
 * Runs an external tool from an argv vector (no shell), capturing stdout and
 * stderr merged line by line. Every invocation carries a hard timeout; on
 * expiry the child (and its process group) is killed and the result reports ErrorKind::ProcessTimeout.
 * A program that cannot be spawned reports ErrorKind::ToolMissing.
 *
 * Abstract so device backends and stage engines can be driven by fakes.
 */
class ProcessRunner {
public:
    using LineCallback = std::function<void(const std::string& line)>;

    struct Result {
        ErrorKind error = ErrorKind::None;   // None, ProcessTimeout or ToolMissing
        int exit_code = -1;
        std::vector<std::string> output;     // captured lines (stdout + stderr)

        bool Succeeded() const { return error == ErrorKind::None && exit_code == 0; }
        std::string Joined() const;
    };

    virtual ~ProcessRunner() = default;

    virtual Result Run(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout,
                       const LineCallback& on_line = nullptr) = 0;

    // Creates the runner for the host platform
    static std::shared_ptr<ProcessRunner> CreateDefault();
};

#if defined(_WIN32)
class Win32ProcessRunner : public ProcessRunner {
public:
    Result Run(const std::vector<std::string>& argv,
               std::chrono::milliseconds timeout,
               const LineCallback& on_line = nullptr) override;
};
#else
class PosixProcessRunner : public ProcessRunner {
public:
    Result Run(const std::vector<std::string>& argv,
               std::chrono::milliseconds timeout,
               const LineCallback& on_line = nullptr) override;
};
#endif
