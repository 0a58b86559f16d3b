#include <chrono>
#include <filesystem>
#include <fstream>

#include "TransitCore.h"

using namespace TransitEngine::Core::IO;

static std::string formatTime(FileTime t) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    return std::to_string(secs) + "s since epoch";
}

int main() {
    FileEntrySystem fs;

    const auto path = (std::filesystem::temp_directory_path() / "transit_metadata.txt").string();
    std::ofstream(path, std::ios::trunc) << "metadata example";

    auto entry = fs.handle(path);
    if (!entry) {
        TRANSIT_LOG_ERROR("Cannot create handle: " + entry.error.message);
        return 1;
    }

    TRANSIT_LOG_INFO("Entry: " + entry->name() + " in " + entry->directoryName() +
                     " (extension '" + entry->extension() + "')");

    if (auto len = entry->length()) {
        TRANSIT_LOG_INFO("Length: " + std::to_string(*len) + " bytes");
    } else {
        TRANSIT_LOG_ERROR("Length query failed: " + len.error.message);
        return 1;
    }

    if (auto created = entry->creationTime()) {
        TRANSIT_LOG_INFO("Created: " + formatTime(*created));
    } else {
        TRANSIT_LOG_INFO(std::string("Creation time unavailable: ") + toString(created.error.code));
    }
    if (auto modified = entry->lastWriteTime()) {
        TRANSIT_LOG_INFO("Modified: " + formatTime(*modified));
    }

    // Toggle read-only and observe it through the cached attributes
    if (auto err = entry->setReadOnly(true); !err.ok()) {
        TRANSIT_LOG_ERROR("setReadOnly failed: " + err.message);
        return 1;
    }
    TRANSIT_LOG_INFO(std::string("Read-only: ") + (entry->isReadOnly() ? "yes" : "no"));

    auto denied = entry->remove();
    TRANSIT_LOG_INFO(std::string("Remove without override: ") + toString(denied.code));

    if (auto err = entry->remove(true); !err.ok()) {
        TRANSIT_LOG_ERROR("Remove failed: " + err.message);
        return 1;
    }
    TRANSIT_LOG_INFO(std::string("Exists after remove: ") + (entry->exists() ? "yes" : "no"));
    return 0;
}
