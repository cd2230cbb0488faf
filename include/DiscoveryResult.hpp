#pragma once
#include <string>
#include <vector>

enum class DiscoveryError {
    NONE,
    TOOL_NOT_FOUND,
    PROCESS_LAUNCH_FAILURE,
    PROCESS_EXIT_FAILURE,
    PARSE_FAILURE,
    FILESYSTEM_FAILURE,
    DEVICE_NOT_RESOLVED
};

std::string discoveryErrorToString(DiscoveryError error);

// Outcome of one discovery fetch. items is empty whenever error != NONE.
template <typename T>
struct FetchResult {
    std::vector<T> items;
    DiscoveryError error{DiscoveryError::NONE};
    std::string detail;

    bool ok() const { return error == DiscoveryError::NONE; }

    static FetchResult failure(DiscoveryError error, const std::string& detail) {
        FetchResult result;
        result.error = error;
        result.detail = detail;
        return result;
    }
};

struct OperationResult {
    DiscoveryError error{DiscoveryError::NONE};
    std::string detail;

    bool ok() const { return error == DiscoveryError::NONE; }

    static OperationResult success() { return OperationResult(); }
    static OperationResult failure(DiscoveryError error, const std::string& detail) {
        OperationResult result;
        result.error = error;
        result.detail = detail;
        return result;
    }
};
