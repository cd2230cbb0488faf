#pragma once

#include "ProcessRunner.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// ProcessRunner with scripted answers keyed by the full command line ("path arg1 arg2").
// Several answers for one command are consumed in order and the last one keeps repeating.
// Commands without a script fail with exit code 1.
class FakeProcessRunner : public ProcessRunner {
public:
    void respond(const std::string& commandLine, const std::string& output, int exitCode = 0,
                 const std::string& error = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[commandLine] = {ProcessResult::completed(exitCode, output, error)};
    }

    void respondSequence(const std::string& commandLine, const std::vector<ProcessResult>& results) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[commandLine] = std::deque<ProcessResult>(results.begin(), results.end());
    }

    void failLaunch(const std::string& commandLine, const std::string& error = "No such file or directory") {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[commandLine] = {ProcessResult::launchFailed(error)};
    }

    // Runs after the command's answer has been picked, outside the runner's lock
    void onCommand(const std::string& commandLine, std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks_[commandLine] = hook;
    }

    ProcessResult run(const std::string& path, const std::vector<std::string>& args) override {
        std::string commandLine = describe(path, args);
        ProcessResult result = ProcessResult::completed(1, "", "unscripted: " + commandLine);
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(commandLine);
            auto it = responses_.find(commandLine);
            if (it != responses_.end() && !it->second.empty()) {
                result = it->second.front();
                if (it->second.size() > 1) {
                    it->second.pop_front();
                }
            }
            auto hookIt = hooks_.find(commandLine);
            if (hookIt != hooks_.end()) {
                hook = hookIt->second;
            }
        }
        if (hook) {
            hook();
        }
        return result;
    }

    bool spawnDetached(const std::string& path, const std::vector<std::string>& args) override {
        std::string commandLine = describe(path, args);
        std::function<void()> hook;
        bool succeed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            spawned_.push_back(commandLine);
            succeed = spawnSucceeds_;
            auto hookIt = hooks_.find(commandLine);
            if (hookIt != hooks_.end()) {
                hook = hookIt->second;
            }
        }
        if (hook) {
            hook();
        }
        return succeed;
    }

    void setSpawnSucceeds(bool succeed) {
        std::lock_guard<std::mutex> lock(mutex_);
        spawnSucceeds_ = succeed;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> spawned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spawned_;
    }

    size_t callCount(const std::string& commandLine) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(calls_.begin(), calls_.end(), commandLine));
    }

    // Index of the first call equal to commandLine, or -1
    int indexOf(const std::string& commandLine) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(calls_.begin(), calls_.end(), commandLine);
        return it == calls_.end() ? -1 : static_cast<int>(it - calls_.begin());
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<ProcessResult>> responses_;
    std::map<std::string, std::function<void()>> hooks_;
    std::vector<std::string> calls_;
    std::vector<std::string> spawned_;
    bool spawnSucceeds_ = true;
};
