#include "artifact_store.hpp"
#include "simpilot_log.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace simpilot {

namespace fs = std::filesystem;

namespace {

bool isSafeComponent(const std::string& s) {
    if (s.empty() || s.size() > 64) return false;
    for (char c : s) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // namespace

ArtifactStore::ArtifactStore(std::string directory) : directory_(std::move(directory)) {}

std::string ArtifactStore::fileName(const std::string& prefix, const std::string& extension,
                                    std::chrono::system_clock::time_point when) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        when.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);
    char millis[8];
    std::snprintf(millis, sizeof(millis), "%03d", static_cast<int>(ms));

    return prefix + "_" + stamp + "_" + millis + "." + extension;
}

Result<std::string> ArtifactStore::save(const std::string& prefix, const std::string& extension,
                                        const std::vector<uint8_t>& data) {
    if (!isSafeComponent(prefix) || !isSafeComponent(extension)) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "invalid artifact name: " + prefix + "." + extension);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        SPLOG_ERROR("artifacts", "cannot create %s: %s", directory_.c_str(), ec.message().c_str());
        return AutomationError(ErrorKind::InvalidArgument,
                               "cannot create artifact directory " + directory_ + ": " + ec.message());
    }

    // Same millisecond: step forward until the name is free
    auto when = std::chrono::system_clock::now();
    fs::path path = fs::path(directory_) / fileName(prefix, extension, when);
    while (fs::exists(path, ec)) {
        when += std::chrono::milliseconds(1);
        path = fs::path(directory_) / fileName(prefix, extension, when);
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return AutomationError(ErrorKind::InvalidArgument, "cannot open " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return AutomationError(ErrorKind::InvalidArgument, "write failed: " + path.string());
    }

    SPLOG_INFO("artifacts", "saved %s (%zu bytes)", path.string().c_str(), data.size());
    return path.string();
}

} // namespace simpilot
