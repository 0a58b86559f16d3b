#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "transit/transit_file_entry.h"
#include "TransitTestHelpers.h"

using transit::test_helpers::ScopedTempDir;
using transit::test_helpers::randomBytes;
using transit::test_helpers::readAllBytes;
using transit::test_helpers::writeAllBytes;

namespace {

struct CallbackState {
    int calls = 0;
    TransitProgressResult verdict = TRANSIT_PROGRESS_CONTINUE;
};

TransitProgressResult countingProgress(const TransitProgressReport* report, void* user_data) {
    auto* state = static_cast<CallbackState*>(user_data);
    ++state->calls;
    if (report->bytes_transferred == 0) return TRANSIT_PROGRESS_CONTINUE;
    return state->verdict;
}

class FileEntryCApi : public ::testing::Test {
protected:
    void SetUp() override {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        system = transit_file_entry_system_create(&status);
        ASSERT_EQ(status, TRANSIT_OK);
        ASSERT_NE(system, nullptr);
    }
    void TearDown() override {
        transit_file_entry_system_destroy(system);
    }

    transit_FileEntry open(const std::string& path) {
        TransitStatus status = TRANSIT_ERR_UNKNOWN;
        transit_FileEntry entry = transit_file_entry_create(system, path.c_str(), TRANSIT_PATH_RELATIVE, &status);
        EXPECT_EQ(status, TRANSIT_OK);
        return entry;
    }

    ScopedTempDir tmp;
    transit_FileEntrySystem system = nullptr;
};

} // namespace

TEST_F(FileEntryCApi, CreateRejectsBadArguments) {
    TransitStatus status = TRANSIT_OK;
    EXPECT_EQ(transit_file_entry_create(nullptr, "/tmp/x", TRANSIT_PATH_RELATIVE, &status), nullptr);
    EXPECT_EQ(status, TRANSIT_ERR_INVALID_ARG);

    status = TRANSIT_OK;
    EXPECT_EQ(transit_file_entry_create(system, "", TRANSIT_PATH_RELATIVE, &status), nullptr);
    EXPECT_EQ(status, TRANSIT_ERR_INVALID_ARG);

    status = TRANSIT_OK;
    EXPECT_EQ(transit_file_entry_create(system, "relative.txt", TRANSIT_PATH_ABSOLUTE_SHORT, &status), nullptr);
    EXPECT_EQ(status, TRANSIT_ERR_INVALID_ARG);
}

TEST_F(FileEntryCApi, MetadataQueries) {
    writeAllBytes(tmp.join("data.bin"), "0123456789");
    transit_FileEntry entry = open(tmp.str("data.bin"));
    ASSERT_NE(entry, nullptr);

    TransitStatus status = TRANSIT_ERR_UNKNOWN;
    EXPECT_EQ(transit_file_entry_exists(entry, &status), TRANSIT_TRUE);
    EXPECT_EQ(status, TRANSIT_OK);

    uint64_t length = 0;
    EXPECT_EQ(transit_file_entry_length(entry, &length), TRANSIT_OK);
    EXPECT_EQ(length, 10u);

    TransitOwnedString path{};
    ASSERT_EQ(transit_file_entry_canonical_path(entry, &path), TRANSIT_OK);
    EXPECT_EQ(std::string(path.ptr, path.len), tmp.join("data.bin").lexically_normal().generic_string());
    transit_string_dispose(path);

    EXPECT_EQ(transit_file_entry_refresh(entry), TRANSIT_OK);
    EXPECT_EQ(transit_file_entry_invalidate(entry), TRANSIT_OK);
    transit_file_entry_destroy(entry);

    transit_FileEntry missing = open(tmp.str("missing.bin"));
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(transit_file_entry_exists(missing, &status), TRANSIT_FALSE);
    EXPECT_EQ(transit_file_entry_length(missing, &length), TRANSIT_ERR_NOT_FOUND);
    transit_file_entry_destroy(missing);
}

TEST_F(FileEntryCApi, CopyWithOptionsAndProgress) {
    const auto data = randomBytes(300000);
    writeAllBytes(tmp.join("src.bin"), data);
    writeAllBytes(tmp.join("dst.bin"), "old");
    transit_FileEntry entry = open(tmp.str("src.bin"));
    ASSERT_NE(entry, nullptr);

    TransitTransferResult result{};
    CallbackState state;
    EXPECT_EQ(transit_file_entry_copy_to(entry, tmp.str("dst.bin").c_str(), nullptr, countingProgress, &state, &result),
              TRANSIT_ERR_ALREADY_EXISTS);
    EXPECT_EQ(result.status, TRANSIT_TRANSFER_FAILED);
    EXPECT_EQ(result.error, TRANSIT_ERR_ALREADY_EXISTS);
    transit_string_dispose(result.destination_path);

    TransitTransferOptions opts;
    transit_transfer_options_init(&opts);
    EXPECT_EQ(opts.overwrite_policy, TRANSIT_OVERWRITE_FAIL);
    EXPECT_EQ(opts.backup_path, nullptr);
    opts.overwrite_policy = TRANSIT_OVERWRITE_REPLACE;

    ASSERT_EQ(transit_file_entry_copy_to(entry, tmp.str("dst.bin").c_str(), &opts, countingProgress, &state, &result),
              TRANSIT_OK);
    EXPECT_EQ(result.status, TRANSIT_TRANSFER_COMPLETED);
    EXPECT_EQ(result.bytes_transferred, data.size());
    EXPECT_GT(state.calls, 1);
    EXPECT_EQ(readAllBytes(tmp.join("dst.bin")), data);
    EXPECT_STREQ(transit_transfer_status_to_string(result.status), "Completed");
    ASSERT_NE(result.destination_path.ptr, nullptr);
    EXPECT_EQ(std::string(result.destination_path.ptr, result.destination_path.len),
              tmp.join("dst.bin").lexically_normal().generic_string());
    transit_string_dispose(result.destination_path);

    transit_file_entry_destroy(entry);
}

TEST_F(FileEntryCApi, CopyReportsCanonicalDestination) {
    const auto data = randomBytes(100000, 0xc0de);
    writeAllBytes(tmp.join("src.bin"), data);
    std::filesystem::create_directory(tmp.join("sub"));
    transit_FileEntry entry = open(tmp.str("src.bin"));
    ASSERT_NE(entry, nullptr);

    TransitTransferOptions opts;
    transit_transfer_options_init(&opts);
    opts.no_buffering = TRANSIT_TRUE;
    TransitTransferResult result{};
    const std::string raw = tmp.str("sub/../sub/./copy.bin  ");
    ASSERT_EQ(transit_file_entry_copy_to(entry, raw.c_str(), &opts, nullptr, nullptr, &result), TRANSIT_OK);
    EXPECT_EQ(result.status, TRANSIT_TRANSFER_COMPLETED);
    ASSERT_NE(result.destination_path.ptr, nullptr);
    EXPECT_EQ(std::string(result.destination_path.ptr, result.destination_path.len),
              tmp.join("sub/copy.bin").lexically_normal().generic_string());
    transit_string_dispose(result.destination_path);
    EXPECT_EQ(readAllBytes(tmp.join("sub/copy.bin")), data);

    // Unresolvable destinations leave the path empty
    TransitTransferResult bad{};
    EXPECT_EQ(transit_file_entry_copy_to(entry, "   ", nullptr, nullptr, nullptr, &bad), TRANSIT_ERR_INVALID_ARG);
    EXPECT_EQ(bad.status, TRANSIT_TRANSFER_FAILED);
    EXPECT_EQ(bad.destination_path.ptr, nullptr);
    EXPECT_EQ(bad.destination_path.len, 0u);

    transit_file_entry_destroy(entry);
}

TEST_F(FileEntryCApi, CancelledCopyIsNotAnError) {
    writeAllBytes(tmp.join("src.bin"), randomBytes(300000));
    transit_FileEntry entry = open(tmp.str("src.bin"));
    ASSERT_NE(entry, nullptr);

    CallbackState state;
    state.verdict = TRANSIT_PROGRESS_CANCEL;
    TransitTransferResult result{};
    EXPECT_EQ(transit_file_entry_copy_to(entry, tmp.str("dst.bin").c_str(), nullptr, countingProgress, &state, &result),
              TRANSIT_OK);
    EXPECT_EQ(result.status, TRANSIT_TRANSFER_CANCELLED);
    EXPECT_EQ(state.calls, 2);
    transit_string_dispose(result.destination_path);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("dst.bin")));
    transit_file_entry_destroy(entry);
}

TEST_F(FileEntryCApi, MoveUpdatesCloneAndStalesOthers) {
    writeAllBytes(tmp.join("a.txt"), "abc");
    transit_FileEntry mover = open(tmp.str("a.txt"));
    transit_FileEntry other = open(tmp.str("a.txt"));
    ASSERT_NE(mover, nullptr);
    ASSERT_NE(other, nullptr);

    TransitStatus status = TRANSIT_ERR_UNKNOWN;
    transit_FileEntry clone = transit_file_entry_clone(mover, &status);
    ASSERT_EQ(status, TRANSIT_OK);
    ASSERT_NE(clone, nullptr);

    ASSERT_EQ(transit_file_entry_move_to(mover, tmp.str("b.txt").c_str(), nullptr, nullptr, nullptr, nullptr),
              TRANSIT_OK);

    EXPECT_EQ(transit_file_entry_is_stale(other, &status), TRANSIT_TRUE);
    uint64_t length = 0;
    EXPECT_EQ(transit_file_entry_length(other, &length), TRANSIT_ERR_STALE_HANDLE);

    EXPECT_EQ(transit_file_entry_is_stale(clone, &status), TRANSIT_FALSE);
    TransitOwnedString path{};
    ASSERT_EQ(transit_file_entry_canonical_path(clone, &path), TRANSIT_OK);
    EXPECT_EQ(std::string(path.ptr, path.len), tmp.join("b.txt").lexically_normal().generic_string());
    transit_string_dispose(path);

    transit_file_entry_destroy(clone);
    transit_file_entry_destroy(other);
    transit_file_entry_destroy(mover);
}

TEST_F(FileEntryCApi, ReplaceWithBackupAndRemove) {
    writeAllBytes(tmp.join("new.cfg"), "new");
    writeAllBytes(tmp.join("live.cfg"), "old");
    transit_FileEntry entry = open(tmp.str("new.cfg"));
    ASSERT_NE(entry, nullptr);

    TransitTransferOptions opts;
    transit_transfer_options_init(&opts);
    const std::string backup = tmp.str("live.cfg.bak");
    opts.backup_path = backup.c_str();
    TransitTransferResult result{};
    ASSERT_EQ(transit_file_entry_replace(entry, tmp.str("live.cfg").c_str(), &opts, nullptr, nullptr, &result),
              TRANSIT_OK);
    EXPECT_EQ(readAllBytes(tmp.join("live.cfg")), "new");
    EXPECT_EQ(readAllBytes(tmp.join("live.cfg.bak")), "old");
    transit_string_dispose(result.destination_path);

    EXPECT_EQ(transit_file_entry_remove(entry, TRANSIT_FALSE), TRANSIT_OK);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("live.cfg")));
    EXPECT_EQ(transit_file_entry_remove(entry, TRANSIT_FALSE), TRANSIT_OK);
    transit_file_entry_destroy(entry);
}

TEST(TransitCApi, StatusStrings) {
    EXPECT_STREQ(transit_status_to_string(TRANSIT_OK), "TRANSIT_OK");
    EXPECT_NE(transit_status_to_string(TRANSIT_ERR_STALE_HANDLE), nullptr);
    uint32_t major = 99, minor = 99, patch = 99, abi = 99;
    transit_get_version(&major, &minor, &patch, &abi);
    EXPECT_EQ(major, 1u);
    EXPECT_EQ(minor, 0u);
}
