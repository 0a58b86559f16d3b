#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "TransitCore.h"
#include "TransitTestHelpers.h"

using namespace TransitEngine::Core::IO;
using transit::test_helpers::ScopedEnv;
using transit::test_helpers::ScopedTempDir;
using transit::test_helpers::readAllBytes;
using transit::test_helpers::writeAllBytes;

namespace {
std::span<const std::byte> asBytes(const std::string& s) {
    return std::as_bytes(std::span<const char>(s.data(), s.size()));
}

std::string readStream(FileStream& stream) {
    std::string out;
    std::vector<std::byte> buffer(64);
    for (;;) {
        auto r = stream.read(buffer);
        if (!r.success() || r.bytesTransferred == 0) break;
        out.append(reinterpret_cast<const char*>(buffer.data()), r.bytesTransferred);
    }
    return out;
}
}

TEST(FileEntryHandle, CreationPerformsNoIo) {
    ScopedTempDir tmp;
    FileEntrySystem fs;
    auto h = fs.createEntryHandle(tmp.str("not-yet.txt"));
    ASSERT_TRUE(h);
    EXPECT_EQ(h->state(), HandleState::Valid);
    EXPECT_FALSE(h->exists());

    auto bad = fs.createEntryHandle("   ");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error.code, FileError::InvalidArgument);
}

TEST(FileEntryHandle, NameParts) {
    ScopedTempDir tmp;
    FileEntrySystem fs;
    const std::string raw = tmp.str("reports/../report.final.csv  ");
    auto h = fs.handle(raw);
    ASSERT_TRUE(h);
    EXPECT_EQ(h->name(), "report.final.csv");
    EXPECT_EQ(h->extension(), ".csv");
    EXPECT_EQ(h->directoryName(), tmp.path().lexically_normal().generic_string());
    EXPECT_EQ(h->toString(), raw);
    EXPECT_EQ(h->originalInput(), raw);
    EXPECT_EQ(h->canonicalPath(), tmp.join("report.final.csv").lexically_normal().generic_string());

    auto bare = fs.handle(tmp.str("Makefile"));
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->extension(), "");
}

TEST(FileEntryHandle, EqualityFollowsCanonicalPath) {
    ScopedTempDir tmp;
    FileEntrySystem fs;
    auto a = fs.handle(tmp.str("x.txt"));
    auto b = fs.handle(tmp.str("sub/../x.txt"));
    auto c = fs.handle(tmp.str("y.txt"));
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
}

TEST(FileEntryHandle, MetadataAccessors) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("data.bin"), "0123456789");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("data.bin"));
    ASSERT_TRUE(h);

    EXPECT_TRUE(h->exists());
    auto len = h->length();
    ASSERT_TRUE(len);
    EXPECT_EQ(*len, 10u);
    EXPECT_TRUE(h->lastWriteTime());
    EXPECT_TRUE(h->lastAccessTime());
    auto meta = h->metadata();
    ASSERT_TRUE(meta);
    EXPECT_TRUE(meta->valid);
    EXPECT_FALSE(meta->isDirectory());
    auto attrs = h->attributes();
    ASSERT_TRUE(attrs);
    EXPECT_FALSE(hasAttribute(*attrs, FileAttributes::Hidden));
    EXPECT_FALSE(hasAttribute(*attrs, FileAttributes::Directory));

    writeAllBytes(tmp.join("data.bin"), "01234");
    EXPECT_EQ(*h->length(), 10u);
    h->refresh();
    EXPECT_EQ(*h->length(), 5u);
    writeAllBytes(tmp.join("data.bin"), "0");
    h->invalidate();
    EXPECT_EQ(*h->length(), 1u);
}

TEST(FileEntryHandle, DotFilesAreHidden) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join(".secret"), "x");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str(".secret"));
    ASSERT_TRUE(h);
    auto attrs = h->attributes();
    ASSERT_TRUE(attrs);
    EXPECT_TRUE(hasAttribute(*attrs, FileAttributes::Hidden));
}

TEST(FileEntryHandle, SetReadOnlyTogglesAndInvalidatesPeers) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("doc.txt"), "x");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("doc.txt"));
    auto peer = fs.handle(tmp.str("doc.txt"));
    ASSERT_TRUE(h && peer);
    EXPECT_FALSE(peer->isReadOnly());

    ASSERT_TRUE(h->setReadOnly(true).ok());
    EXPECT_TRUE(h->isReadOnly());
    EXPECT_TRUE(peer->isReadOnly());
    auto perms = std::filesystem::status(tmp.join("doc.txt")).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::owner_write, std::filesystem::perms::none);

    ASSERT_TRUE(h->setReadOnly(false).ok());
    EXPECT_FALSE(peer->isReadOnly());
}

TEST(FileEntryHandle, RemoveHonorsReadOnly) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("locked.txt"), "x");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("locked.txt"));
    auto peer = fs.handle(tmp.str("locked.txt"));
    ASSERT_TRUE(h && peer);
    ASSERT_TRUE(h->setReadOnly(true).ok());

    auto denied = h->remove();
    EXPECT_EQ(denied.code, FileError::AccessDenied);
    EXPECT_TRUE(std::filesystem::exists(tmp.join("locked.txt")));

    EXPECT_TRUE(h->remove(true).ok());
    EXPECT_FALSE(std::filesystem::exists(tmp.join("locked.txt")));
    EXPECT_FALSE(h->isStale());
    EXPECT_FALSE(h->exists());
    EXPECT_TRUE(peer->isStale());

    // Removing a missing entry is a no-op
    EXPECT_TRUE(h->remove().ok());
}

TEST(FileEntryHandle, RemoveDirectoryIsNotAFile) {
    ScopedTempDir tmp;
    std::filesystem::create_directory(tmp.join("dir"));
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("dir"));
    ASSERT_TRUE(h);
    EXPECT_EQ(h->remove().code, FileError::NotAFile);
    EXPECT_EQ(h->length().error.code, FileError::NotAFile);
}

TEST(FileEntryHandle, OpenReadStreamsExistingContent) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("in.txt"), "hello stream");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("in.txt"));
    ASSERT_TRUE(h);

    auto stream = h->openRead();
    ASSERT_TRUE(stream) << stream.error.message;
    EXPECT_EQ(readStream(**stream), "hello stream");
    EXPECT_FALSE((*stream)->write(asBytes("x")).success());

    // Shared readers are fine
    auto second = h->openRead();
    EXPECT_TRUE(second);

    auto missing = fs.handle(tmp.str("missing.txt"));
    ASSERT_TRUE(missing);
    auto none = missing->openRead();
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error.code, FileError::NotFound);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("missing.txt")));
}

TEST(FileEntryHandle, OpenWriteCreatesWithoutTruncating) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("existing.txt"), "hello");
    FileEntrySystem fs;

    auto existing = fs.handle(tmp.str("existing.txt"));
    ASSERT_TRUE(existing);
    {
        auto stream = existing->openWrite();
        ASSERT_TRUE(stream) << stream.error.message;
        EXPECT_TRUE((*stream)->write(asBytes("XY")).success());
    }
    EXPECT_EQ(readAllBytes(tmp.join("existing.txt")), "XYllo");

    auto fresh = fs.handle(tmp.str("fresh.txt"));
    ASSERT_TRUE(fresh);
    EXPECT_FALSE(fresh->exists());
    {
        auto stream = fresh->openWrite();
        ASSERT_TRUE(stream) << stream.error.message;
        EXPECT_TRUE(fresh->exists());
        EXPECT_TRUE((*stream)->write(asBytes("new")).success());
    }
    EXPECT_EQ(readAllBytes(tmp.join("fresh.txt")), "new");
}

TEST(FileEntryHandle, CreateTruncatesAndInvalidatesPeers) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("out.bin"), "old contents");
    FileEntrySystem fs;
    auto h = fs.handle(tmp.str("out.bin"));
    auto peer = fs.handle(tmp.str("out.bin"));
    ASSERT_TRUE(h && peer);
    auto before = peer->length();
    ASSERT_TRUE(before);
    EXPECT_EQ(*before, 12u);

    auto stream = h->create();
    ASSERT_TRUE(stream) << stream.error.message;
    auto truncated = peer->length();
    ASSERT_TRUE(truncated);
    EXPECT_EQ(*truncated, 0u);

    // The stream is exclusive
    auto reader = peer->openRead();
    ASSERT_FALSE(reader);
    EXPECT_EQ(reader.error.code, FileError::Failed);

    EXPECT_TRUE((*stream)->write(asBytes("abc")).success());
    ASSERT_TRUE((*stream)->seek(0));
    EXPECT_EQ(readStream(**stream), "abc");
    (*stream)->close();
    EXPECT_FALSE((*stream)->fail());

    peer->refresh();
    EXPECT_EQ(*peer->length(), 3u);
}

TEST(FileEntryHandle, OpenRejectsStaleHandlesAndDirectories) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("a.txt"), "a");
    std::filesystem::create_directory(tmp.join("dir"));
    FileEntrySystem fs;

    auto mover = fs.handle(tmp.str("a.txt"));
    auto other = fs.handle(tmp.str("a.txt"));
    ASSERT_TRUE(mover && other);
    ASSERT_TRUE(mover->moveTo(tmp.str("b.txt")).ok());
    auto stale = other->openRead();
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error.code, FileError::StaleHandle);

    auto dir = fs.handle(tmp.str("dir"));
    ASSERT_TRUE(dir);
    auto opened = dir->openRead();
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error.code, FileError::NotAFile);
}

TEST(FileEntryHandle, MoveStalesOtherHandlesButNotCopies) {
    ScopedTempDir tmp;
    writeAllBytes(tmp.join("a.txt"), "abc");
    FileEntrySystem fs;
    auto mover = fs.handle(tmp.str("a.txt"));
    auto bystander = fs.handle(tmp.str("a.txt"));
    ASSERT_TRUE(mover && bystander);
    FileEntryHandle copy = *mover;
    EXPECT_EQ(fs.cache().liveHandleCount(mover->canonicalPath()), 2u);

    auto r = mover->moveTo(tmp.str("b.txt"));
    ASSERT_TRUE(r.ok()) << r.error.message;

    EXPECT_TRUE(bystander->isStale());
    EXPECT_EQ(bystander->length().error.code, FileError::StaleHandle);
    EXPECT_EQ(bystander->copyTo(tmp.str("c.txt")).error.code, FileError::StaleHandle);
    EXPECT_EQ(bystander->remove().code, FileError::StaleHandle);
    EXPECT_EQ(bystander->setReadOnly(true).code, FileError::StaleHandle);

    EXPECT_FALSE(copy.isStale());
    EXPECT_EQ(copy.canonicalPath(), r.destinationPath);
    EXPECT_EQ(*copy.length(), 3u);
    EXPECT_EQ(fs.cache().liveHandleCount(r.destinationPath), 1u);

    // A fresh handle on the old path is independent of the stale one
    auto reborn = fs.handle(tmp.str("a.txt"));
    ASSERT_TRUE(reborn);
    EXPECT_FALSE(reborn->isStale());
    EXPECT_FALSE(reborn->exists());
}

TEST(FileEntryHandle, LongPathsRoundTrip) {
    ScopedTempDir tmp;
    FileEntrySystem::Config cfg;
    cfg.paths.longPathThreshold = 16;
    FileEntrySystem fs(cfg);
    writeAllBytes(tmp.join("long-name-entry.bin"), "payload");

    auto h = fs.handle(tmp.str("long-name-entry.bin"));
    ASSERT_TRUE(h);
    EXPECT_NE(h->extendedPath(), h->canonicalPath());
    EXPECT_TRUE(PathResolver::hasLongPathPrefix(h->extendedPath()));
    EXPECT_TRUE(h->exists());
    EXPECT_EQ(*h->length(), 7u);

    auto r = h->copyTo(h->extendedPath() + ".copy");
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(readAllBytes(tmp.join("long-name-entry.bin.copy")), "payload");
}

TEST(FileEntrySystem, ConfigFromEnvironment) {
    ScopedEnv threshold("TRANSIT_LONG_PATH_THRESHOLD", "42");
    ScopedEnv chunk("TRANSIT_TRANSFER_CHUNK_SIZE", "4096");
    ScopedEnv strict("TRANSIT_STRICT_PATHS", "on");
    ScopedEnv crossVolume("TRANSIT_TEST_SIMULATE_CROSS_VOLUME", "1");
    auto cfg = FileEntrySystem::Config::fromEnvironment();
    EXPECT_EQ(cfg.paths.longPathThreshold, 42u);
    EXPECT_EQ(cfg.transfer.chunkSize, 4096u);
    EXPECT_TRUE(cfg.paths.strict);
    EXPECT_TRUE(cfg.transfer.simulateCrossVolume);

    FileEntrySystem fs(cfg);
    EXPECT_FALSE(fs.handle("/tmp/bad|name"));
}

TEST(FileEntrySystem, MalformedEnvironmentKeepsDefaults) {
    ScopedEnv threshold("TRANSIT_LONG_PATH_THRESHOLD", "lots");
    ScopedEnv chunk("TRANSIT_TRANSFER_CHUNK_SIZE", "0");
    ScopedEnv strict("TRANSIT_STRICT_PATHS", "maybe");
    ScopedEnv crossVolume("TRANSIT_TEST_SIMULATE_CROSS_VOLUME", "sometimes");
    auto cfg = FileEntrySystem::Config::fromEnvironment();
    FileEntrySystem::Config defaults;
    EXPECT_EQ(cfg.paths.longPathThreshold, defaults.paths.longPathThreshold);
    EXPECT_EQ(cfg.transfer.chunkSize, defaults.transfer.chunkSize);
    EXPECT_EQ(cfg.paths.strict, defaults.paths.strict);
    EXPECT_FALSE(cfg.transfer.simulateCrossVolume);
}
