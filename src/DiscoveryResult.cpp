#include "DiscoveryResult.hpp"

std::string discoveryErrorToString(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::NONE: return "NONE";
        case DiscoveryError::TOOL_NOT_FOUND: return "TOOL_NOT_FOUND";
        case DiscoveryError::PROCESS_LAUNCH_FAILURE: return "PROCESS_LAUNCH_FAILURE";
        case DiscoveryError::PROCESS_EXIT_FAILURE: return "PROCESS_EXIT_FAILURE";
        case DiscoveryError::PARSE_FAILURE: return "PARSE_FAILURE";
        case DiscoveryError::FILESYSTEM_FAILURE: return "FILESYSTEM_FAILURE";
        case DiscoveryError::DEVICE_NOT_RESOLVED: return "DEVICE_NOT_RESOLVED";
        default: return "UNKNOWN";
    }
}
