#pragma once
// =============================================================================
// SimPilot - Artifact Store
// =============================================================================
// Screenshots and recordings land in one directory (created on demand) as
//   <prefix>_<YYYYmmdd_HHMMSS_mmm>.<ext>
// =============================================================================

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "result.hpp"

namespace simpilot {

class ArtifactStore {
public:
    explicit ArtifactStore(std::string directory);

    const std::string& directory() const { return directory_; }

    // Returns the written path
    Result<std::string> save(const std::string& prefix, const std::string& extension,
                             const std::vector<uint8_t>& data);

    // "<prefix>_20240131_094105_123.<ext>"
    static std::string fileName(const std::string& prefix, const std::string& extension,
                                std::chrono::system_clock::time_point when);

private:
    std::string directory_;
    std::mutex mutex_;  // serializes name selection
};

} // namespace simpilot
