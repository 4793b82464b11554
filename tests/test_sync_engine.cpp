/**
 * End-to-end pulls through a loopback listener: fresh, incremental, deletion
 * and type-change scenarios.
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "sync/peer_sync.hpp"
#include "sync/sync_engine.hpp"

namespace fs = std::filesystem;

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("peersync_sync_" + std::to_string(getpid()));
        remoteDir_ = testDir_ / "remote";
        localDir_ = testDir_ / "local";
        fs::create_directories(remoteDir_);
        fs::create_directories(localDir_);

        // empty root: request paths are used as given
        auto started = startListener("", 0);
        ASSERT_TRUE(started.success) << started.message;
        listener_ = started.data;
    }

    void TearDown() override {
        stopListener(listener_);
        std::error_code ec;
        // read-only directories left by a test would stop remove_all
        for (auto it = fs::recursive_directory_iterator(testDir_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
        ec.clear();
        fs::remove_all(testDir_, ec);
    }

    static uint32_t modeOf(const fs::path& path) {
        struct stat st{};
        if (stat(path.c_str(), &st) != 0) return 0;
        return st.st_mode & 07777;
    }

    void createFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    Result<SyncStats> pull() {
        return syncOnce(localDir_.string(), "127.0.0.1", remoteDir_.string(), listener_->port());
    }

    fs::path testDir_;
    fs::path remoteDir_;
    fs::path localDir_;
    ListenerHandle listener_;
};

TEST_F(SyncEngineTest, FreshSyncCopiesRemoteTree) {
    createFile(remoteDir_ / "test1.txt", "Hello from server test1");

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(stats.data.downloaded, 1u);
    EXPECT_EQ(readFile(localDir_ / "test1.txt"), "Hello from server test1");
}

TEST_F(SyncEngineTest, SecondRunDownloadsNothing) {
    createFile(remoteDir_ / "test1.txt", "Hello from server test1");
    createFile(remoteDir_ / "docs" / "notes.md", "# notes");

    auto first = pull();
    ASSERT_TRUE(first.success) << first.message;
    EXPECT_EQ(first.data.downloaded, 2u);

    auto second = pull();
    ASSERT_TRUE(second.success) << second.message;
    EXPECT_EQ(second.data.downloaded, 0u);
    EXPECT_EQ(second.data.skipped, 2u);
    EXPECT_EQ(second.data.deleted, 0u);
}

TEST_F(SyncEngineTest, ChangedRemoteFileIsDownloadedAgain) {
    createFile(remoteDir_ / "data.txt", "first version");
    ASSERT_TRUE(pull().success);

    createFile(remoteDir_ / "data.txt", "second version");
    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(stats.data.downloaded, 1u);
    EXPECT_EQ(readFile(localDir_ / "data.txt"), "second version");
}

TEST_F(SyncEngineTest, LocalOnlyEntriesAreDeleted) {
    createFile(remoteDir_ / "keep.txt", "keep");
    createFile(localDir_ / "keep.txt", "keep");
    createFile(localDir_ / "stale.txt", "stale");
    createFile(localDir_ / "old" / "nested" / "file.txt", "old");

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(stats.data.downloaded, 0u);
    EXPECT_EQ(stats.data.skipped, 1u);
    EXPECT_EQ(stats.data.deleted, 2u);
    EXPECT_EQ(stats.data.failedDeletions, 0u);

    EXPECT_TRUE(fs::exists(localDir_ / "keep.txt"));
    EXPECT_FALSE(fs::exists(localDir_ / "stale.txt"));
    EXPECT_FALSE(fs::exists(localDir_ / "old"));
}

TEST_F(SyncEngineTest, RemoteDirectoriesAreCreatedWithTheirMode) {
    fs::create_directories(remoteDir_ / "empty");
    ASSERT_EQ(chmod((remoteDir_ / "empty").c_str(), 0750), 0);
    createFile(remoteDir_ / "full" / "a.txt", "a");

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(stats.data.directoriesCreated, 2u);
    ASSERT_TRUE(fs::is_directory(localDir_ / "empty"));

    struct stat st{};
    ASSERT_EQ(stat((localDir_ / "empty").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0750u);
}

TEST_F(SyncEngineTest, ReadOnlyRemoteDirectoryIsFilledBeforeItsModeIsApplied) {
    createFile(remoteDir_ / "ro" / "a.txt", "inside a read-only directory");
    createFile(remoteDir_ / "ro" / "sub" / "b.txt", "nested");
    ASSERT_EQ(chmod((remoteDir_ / "ro" / "sub").c_str(), 0555), 0);
    ASSERT_EQ(chmod((remoteDir_ / "ro").c_str(), 0555), 0);

    auto first = pull();
    ASSERT_TRUE(first.success) << first.message;
    EXPECT_EQ(first.data.downloaded, 2u);
    EXPECT_EQ(readFile(localDir_ / "ro" / "a.txt"), "inside a read-only directory");
    EXPECT_EQ(readFile(localDir_ / "ro" / "sub" / "b.txt"), "nested");
    EXPECT_EQ(modeOf(localDir_ / "ro"), 0555u);
    EXPECT_EQ(modeOf(localDir_ / "ro" / "sub"), 0555u);

    auto second = pull();
    ASSERT_TRUE(second.success) << second.message;
    EXPECT_EQ(second.data.downloaded, 0u);
    EXPECT_EQ(modeOf(localDir_ / "ro"), 0555u);
}

TEST_F(SyncEngineTest, ReadOnlyMirroredDirectoryIsPrunedAndRefreshed) {
    createFile(remoteDir_ / "ro" / "a.txt", "version 1");
    ASSERT_EQ(chmod((remoteDir_ / "ro").c_str(), 0555), 0);
    ASSERT_TRUE(pull().success);
    ASSERT_EQ(modeOf(localDir_ / "ro"), 0555u);

    // local ro/ is read-only now; give it a stray file and change the remote one
    ASSERT_EQ(chmod((localDir_ / "ro").c_str(), 0755), 0);
    createFile(localDir_ / "ro" / "stray.txt", "not on the remote");
    ASSERT_EQ(chmod((localDir_ / "ro").c_str(), 0555), 0);
    ASSERT_EQ(chmod((remoteDir_ / "ro").c_str(), 0755), 0);
    createFile(remoteDir_ / "ro" / "a.txt", "version 2 is longer");
    ASSERT_EQ(chmod((remoteDir_ / "ro").c_str(), 0555), 0);

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(stats.data.downloaded, 1u);
    EXPECT_EQ(stats.data.deleted, 1u);
    EXPECT_FALSE(fs::exists(localDir_ / "ro" / "stray.txt"));
    EXPECT_EQ(readFile(localDir_ / "ro" / "a.txt"), "version 2 is longer");
    EXPECT_EQ(modeOf(localDir_ / "ro"), 0555u);
}

TEST_F(SyncEngineTest, FailedDeletionIsReportedAfterTheOthersRun) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    createFile(remoteDir_ / "keep.txt", "keep");
    createFile(localDir_ / "stale.txt", "stale");
    createFile(localDir_ / "locked" / "inner.txt", "cannot be removed");
    createFile(localDir_ / "zzz_stale.txt", "also stale");
    ASSERT_EQ(chmod((localDir_ / "locked").c_str(), 0555), 0);

    auto stats = pull();
    ASSERT_FALSE(stats.success);
    EXPECT_EQ(stats.code, ErrorCode::IOError);
    EXPECT_GT(stats.data.failedDeletions, 0u);
    EXPECT_EQ(stats.data.downloaded, 1u);
    EXPECT_EQ(stats.data.deleted, 2u);
    EXPECT_FALSE(fs::exists(localDir_ / "stale.txt"));
    EXPECT_FALSE(fs::exists(localDir_ / "zzz_stale.txt"));
    EXPECT_TRUE(fs::exists(localDir_ / "locked" / "inner.txt"));
    EXPECT_EQ(readFile(localDir_ / "keep.txt"), "keep");
}

TEST_F(SyncEngineTest, LocalFileInPlaceOfRemoteDirectoryIsReplaced) {
    createFile(remoteDir_ / "thing" / "inside.txt", "inside");
    createFile(localDir_ / "thing", "i am a file");

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    ASSERT_TRUE(fs::is_directory(localDir_ / "thing"));
    EXPECT_EQ(readFile(localDir_ / "thing" / "inside.txt"), "inside");
}

TEST_F(SyncEngineTest, LocalDirectoryInPlaceOfRemoteFileIsReplaced) {
    createFile(remoteDir_ / "thing", "now a file");
    createFile(localDir_ / "thing" / "child.txt", "child");

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    ASSERT_TRUE(fs::is_regular_file(localDir_ / "thing"));
    EXPECT_EQ(readFile(localDir_ / "thing"), "now a file");
}

TEST_F(SyncEngineTest, MissingLocalRootIsCreated) {
    createFile(remoteDir_ / "a.txt", "a");
    fs::path nested = testDir_ / "brand" / "new";

    auto stats = syncOnce(nested.string(), "127.0.0.1", remoteDir_.string(), listener_->port());
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(readFile(nested / "a.txt"), "a");
}

TEST_F(SyncEngineTest, MultiBlockFileIsSynced) {
    std::string content(2 * Config::BLOCK_SIZE + 321, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i % 199);
    createFile(remoteDir_ / "big.bin", content);

    auto stats = pull();
    ASSERT_TRUE(stats.success) << stats.message;
    EXPECT_EQ(readFile(localDir_ / "big.bin"), content);
}

TEST_F(SyncEngineTest, MissingRemoteDirectoryFails) {
    auto stats = syncOnce(localDir_.string(), "127.0.0.1", (remoteDir_ / "absent").string(), listener_->port());
    ASSERT_FALSE(stats.success);
    EXPECT_EQ(stats.code, ErrorCode::ProtocolError);
}

TEST_F(SyncEngineTest, UnreachablePeerIsIOError) {
    int port = listener_->port();
    stopListener(listener_);

    auto stats = syncOnce(localDir_.string(), "127.0.0.1", remoteDir_.string(), port);
    ASSERT_FALSE(stats.success);
    EXPECT_EQ(stats.code, ErrorCode::IOError);
}

TEST(SyncEngineEqualityTest, ModTimeAndModeAreIgnored) {
    FileRecord local;
    local.path = "a.txt";
    local.size = 10;
    local.hash = "d41d8cd98f00b204e9800998ecf8427e";
    local.modTime = 100;
    local.mode = 0600;

    FileRecord remote = local;
    remote.modTime = 999999;
    remote.mode = 0644;
    EXPECT_TRUE(SyncEngine::sameContent(local, remote));
}

TEST(SyncEngineEqualityTest, SizeHashAndKindMatter) {
    FileRecord local;
    local.path = "a.txt";
    local.size = 10;
    local.hash = "aaaa";

    FileRecord bigger = local;
    bigger.size = 11;
    EXPECT_FALSE(SyncEngine::sameContent(local, bigger));

    FileRecord otherHash = local;
    otherHash.hash = "bbbb";
    EXPECT_FALSE(SyncEngine::sameContent(local, otherHash));

    FileRecord dir = local;
    dir.isDir = true;
    EXPECT_FALSE(SyncEngine::sameContent(local, dir));

    FileRecord unknownHash = local;
    unknownHash.hash.clear();
    EXPECT_TRUE(SyncEngine::sameContent(local, unknownHash));
}
