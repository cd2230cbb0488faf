#pragma once
#include "ProcessRunner.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

enum class Tool {
    XCRUN,
    OPEN,
    SYSTEM_PROFILER,
    ADB,
    EMULATOR,
    PGREP,
    PS,
    WHICH
};

class ToolLocator {
public:
    using CandidateOverrides = std::map<std::string, std::vector<std::string>>;

    ToolLocator(ProcessRunner& runner, const CandidateOverrides& overrides = CandidateOverrides());

    // First existing candidate, else `which <tool>` if its answer exists on disk.
    std::optional<std::string> locate(Tool tool) const;

    std::vector<std::string> candidates(Tool tool) const;

    static std::string toolName(Tool tool);
    static std::vector<std::string> defaultCandidates(Tool tool);

private:
    std::optional<std::string> locateWithWhich(Tool tool) const;

    ProcessRunner& runner_;
    CandidateOverrides overrides_;
};
