#pragma once
#include <string>
#include <vector>
#include <functional>

class WorkerPool;

enum class ProcessFailure {
    NONE,
    LAUNCH_FAILED,
    EXIT_FAILED
};

struct ProcessResult {
    bool success{false};
    std::string output;
    std::string error;
    int exitCode{-1};
    ProcessFailure failure{ProcessFailure::NONE};

    static ProcessResult completed(int exitCode, const std::string& output, const std::string& error = "");
    static ProcessResult launchFailed(const std::string& error);
};

using ProcessCompletion = std::function<void(const ProcessResult&)>;

// One OS process per call. No timeout is applied.
class ProcessRunner {
public:
    ProcessRunner() = default;
    virtual ~ProcessRunner() = default;

    // Blocks until the process exits; stdout and stderr are captured separately.
    virtual ProcessResult run(const std::string& path, const std::vector<std::string>& args);

    // Starts a process that outlives the call (new session, stdio on /dev/null).
    // Returns false if the binary could not be executed.
    virtual bool spawnDetached(const std::string& path, const std::vector<std::string>& args);

    // run() on a worker thread; completion is invoked on that worker thread.
    void runAsync(WorkerPool& pool, const std::string& path,
                  const std::vector<std::string>& args, ProcessCompletion completion);

    static std::string describe(const std::string& path, const std::vector<std::string>& args);

private:
    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;
};
