#include <filesystem>
#include <fstream>

#include "TransitCore.h"

using namespace TransitEngine::Core::IO;

static std::string makeTempFile(const std::string& base, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / (base + ".bin");
    std::ofstream(path, std::ios::binary | std::ios::trunc) << contents;
    return path.string();
}

int main() {
    FileEntrySystem fs(FileEntrySystem::Config::fromEnvironment());

    const std::string src = makeTempFile("transit_copy_src", std::string(256 * 1024, 'x'));
    const std::string copyDst = (std::filesystem::temp_directory_path() / "transit_copy_dst.bin").string();
    const std::string moveDst = (std::filesystem::temp_directory_path() / "transit_move_dst.bin").string();

    auto entry = fs.handle(src);
    if (!entry) {
        TRANSIT_LOG_ERROR("Cannot create handle: " + entry.error.message);
        return 1;
    }

    // Copy with progress, replacing any previous run's output
    TransferOptions copyOpts;
    copyOpts.overwritePolicy = OverwritePolicy::Overwrite;
    copyOpts.preserveTimestamps = true;
    auto copied = entry->copyTo(copyDst, copyOpts, [](const ProgressReport& p) {
        TRANSIT_LOG_INFO("Copied " + std::to_string(p.bytesTransferred) + " / " + std::to_string(p.totalBytes));
        return ProgressResult::Continue;
    });
    if (!copied.ok()) {
        TRANSIT_LOG_ERROR(std::string("Copy failed: ") + copied.error.message);
        return 1;
    }
    TRANSIT_LOG_INFO("Copy complete: " + copied.destinationPath);

    // Move the copy; a handle on the old path goes stale
    auto copyEntry = fs.handle(copyDst);
    auto observer = fs.handle(copyDst);
    if (!copyEntry || !observer) {
        TRANSIT_LOG_ERROR("Cannot create handle for " + copyDst);
        return 1;
    }
    TransferOptions moveOpts;
    moveOpts.overwritePolicy = OverwritePolicy::Overwrite;
    moveOpts.allowCrossVolume = true;
    auto moved = copyEntry->moveTo(moveDst, moveOpts);
    if (!moved.ok()) {
        TRANSIT_LOG_ERROR(std::string("Move failed: ") + moved.error.message);
        return 1;
    }
    TRANSIT_LOG_INFO("Moved to " + copyEntry->canonicalPath() +
                     (observer->isStale() ? " (observer is stale)" : " (observer still valid)"));

    // Cancel a copy halfway through
    auto cancelled = entry->copyTo(copyDst, copyOpts, [](const ProgressReport& p) {
        return p.bytesTransferred * 2 >= p.totalBytes && p.bytesTransferred > 0 ? ProgressResult::Cancel
                                                                               : ProgressResult::Continue;
    });
    TRANSIT_LOG_INFO(std::string("Second copy ended ") + toString(cancelled.status));

    // Clean up
    for (auto* h : {&*entry, &*copyEntry}) {
        if (auto err = h->remove(true); !err.ok()) {
            TRANSIT_LOG_WARNING("Cleanup failed: " + err.message);
        }
    }
    return 0;
}
