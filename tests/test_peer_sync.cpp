/**
 * Listener and client talking over a loopback connection: listings, small and
 * multi-block downloads, protocol errors.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "sync/peer_client.hpp"
#include "sync/peer_sync.hpp"
#include "common/data_transfer.hpp"
#include "common/hash_utils.hpp"

namespace fs = std::filesystem;

class PeerSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("peersync_peer_" + std::to_string(getpid()));
        serverDir_ = testDir_ / "server";
        clientDir_ = testDir_ / "client";
        fs::create_directories(serverDir_);
        fs::create_directories(clientDir_);

        auto started = startListener(serverDir_.string(), 0);
        ASSERT_TRUE(started.success) << started.message;
        listener_ = started.data;
    }

    void TearDown() override {
        stopListener(listener_);
        std::error_code ec;
        fs::remove_all(testDir_, ec);
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

    static std::string patterned(size_t size) {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>((i * 17 + i / 4096) % 256);
        }
        return data;
    }

    PeerClient client() {
        return PeerClient("127.0.0.1", listener_->port());
    }

    fs::path testDir_;
    fs::path serverDir_;
    fs::path clientDir_;
    ListenerHandle listener_;
};

TEST_F(PeerSyncTest, ListenerReportsBoundPort) {
    EXPECT_TRUE(listener_->running());
    EXPECT_GT(listener_->port(), 0);
    EXPECT_TRUE(listenerStatus(listener_).success);
}

TEST_F(PeerSyncTest, ListReturnsEntriesRelativeToListedDirectory) {
    createFile(serverDir_ / "top.txt", "top");
    createFile(serverDir_ / "sub" / "inner.txt", "inner");

    auto files = client().listFiles("/");
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 3u);

    EXPECT_EQ(files.data[0].path, "sub");
    EXPECT_TRUE(files.data[0].isDir);
    EXPECT_EQ(files.data[1].path, "sub/inner.txt");
    EXPECT_EQ(files.data[1].size, 5u);
    EXPECT_EQ(files.data[1].hash, HashUtils::computeStrongHash("inner", 5));
    EXPECT_EQ(files.data[2].path, "top.txt");

    auto sub = client().listFiles("sub");
    ASSERT_TRUE(sub.success) << sub.message;
    ASSERT_EQ(sub.data.size(), 1u);
    EXPECT_EQ(sub.data[0].path, "inner.txt");
}

TEST_F(PeerSyncTest, ListOfEmptyDirectoryIsEmpty) {
    fs::create_directories(serverDir_ / "empty");
    auto files = client().listFiles("empty");
    ASSERT_TRUE(files.success) << files.message;
    EXPECT_TRUE(files.data.empty());
}

TEST_F(PeerSyncTest, ListOfMissingDirectoryIsProtocolError) {
    auto files = client().listFiles("does/not/exist");
    ASSERT_FALSE(files.success);
    EXPECT_EQ(files.code, ErrorCode::ProtocolError);
}

TEST_F(PeerSyncTest, PathsOutsideRootAreRefused) {
    auto files = client().listFiles("../");
    ASSERT_FALSE(files.success);
    EXPECT_EQ(files.code, ErrorCode::ProtocolError);
}

TEST_F(PeerSyncTest, DownloadSmallFile) {
    createFile(serverDir_ / "test1.txt", "Hello from server test1");
    fs::path local = clientDir_ / "test1.txt";

    auto result = client().downloadFile("test1.txt", local.string());
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(readFile(local), "Hello from server test1");
}

TEST_F(PeerSyncTest, DownloadCreatesParentDirectories) {
    createFile(serverDir_ / "a" / "b" / "c.txt", "deep");
    fs::path local = clientDir_ / "x" / "y" / "c.txt";

    auto result = client().downloadFile("a/b/c.txt", local.string());
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(readFile(local), "deep");
}

TEST_F(PeerSyncTest, DownloadedHashMatchesAdvertisedHash) {
    createFile(serverDir_ / "medium.bin", patterned(300000));

    auto files = client().listFiles("");
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 1u);

    fs::path local = clientDir_ / "medium.bin";
    auto result = client().downloadFile("medium.bin", local.string(), files.data[0]);
    ASSERT_TRUE(result.success) << result.message;

    auto hash = HashUtils::computeFileHash(local.string());
    ASSERT_TRUE(hash.success);
    EXPECT_EQ(hash.data, files.data[0].hash);
}

TEST_F(PeerSyncTest, MultiBlockFileIsFetchedInParallel) {
    std::string content = patterned(3 * Config::BLOCK_SIZE + 999);
    createFile(serverDir_ / "big.bin", content);

    auto files = client().listFiles("");
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 1u);

    fs::path local = clientDir_ / "big.bin";
    auto result = client().downloadFile("big.bin", local.string(), files.data[0]);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(readFile(local), content);
}

TEST_F(PeerSyncTest, DownloadOfMissingFileIsProtocolError) {
    fs::path local = clientDir_ / "ghost.txt";
    auto result = client().downloadFile("ghost.txt", local.string());
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ProtocolError);
    EXPECT_FALSE(fs::exists(local));
}

TEST_F(PeerSyncTest, DownloadOfDirectoryIsProtocolError) {
    fs::create_directories(serverDir_ / "folder");
    auto result = client().downloadFile("folder", (clientDir_ / "folder").string());
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ProtocolError);
}

TEST_F(PeerSyncTest, DownloadOfFifoIsRefusedWithoutBlocking) {
    ASSERT_EQ(mkfifo((serverDir_ / "pipe").c_str(), 0644), 0);

    PeerClient peer = client();
    fs::path local = clientDir_ / "pipe";
    auto pending = std::async(std::launch::async, [&peer, &local]() {
        return peer.downloadFile("pipe", local.string());
    });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    auto result = pending.get();
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ProtocolError);
    EXPECT_FALSE(fs::exists(local));

    // the listener is still serving
    EXPECT_TRUE(client().listFiles("").success);
}

TEST_F(PeerSyncTest, ListedFileAlreadyPresentLocallyIsNotFetched) {
    createFile(serverDir_ / "same.txt", "identical on both sides");
    createFile(clientDir_ / "same.txt", "identical on both sides");
    auto files = client().listFiles("");
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 1u);

    PeerClient peer = client();
    stopListener(listener_);

    auto result = peer.downloadFile("same.txt", (clientDir_ / "same.txt").string(), files.data[0]);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(readFile(clientDir_ / "same.txt"), "identical on both sides");
}

TEST_F(PeerSyncTest, LocalCheckCanBeSkippedByTheCaller) {
    createFile(serverDir_ / "same.txt", "identical on both sides");
    createFile(clientDir_ / "same.txt", "identical on both sides");
    auto files = client().listFiles("");
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 1u);

    PeerClient peer = client();
    stopListener(listener_);

    // without the local check the client has to reach the stopped listener
    auto result = peer.downloadFile("same.txt", (clientDir_ / "same.txt").string(), files.data[0], false);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::IOError);
    EXPECT_EQ(readFile(clientDir_ / "same.txt"), "identical on both sides");
}

TEST_F(PeerSyncTest, StaleListingIsContentMismatch) {
    createFile(serverDir_ / "changing.bin", patterned(2 * Config::BLOCK_SIZE + 10));
    auto files = client().listFiles("");
    ASSERT_TRUE(files.success) << files.message;

    createFile(serverDir_ / "changing.bin", patterned(2 * Config::BLOCK_SIZE + 20));

    fs::path local = clientDir_ / "changing.bin";
    auto result = client().downloadFile("changing.bin", local.string(), files.data[0]);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ContentMismatch);
    EXPECT_FALSE(fs::exists(local));
}

TEST_F(PeerSyncTest, BlockRequestReturnsOnlyThatBlock) {
    std::string content = patterned(2 * Config::BLOCK_SIZE + 50);
    createFile(serverDir_ / "blocks.bin", content);

    auto socketFD = DataTransfer::connectTo("127.0.0.1", listener_->port());
    ASSERT_TRUE(socketFD.success) << socketFD.message;
    DataTransfer pipe(socketFD.data);
    ASSERT_TRUE(pipe.sendRequest(Request::block("blocks.bin", 2, Config::BLOCK_SIZE)).success);

    auto response = pipe.receiveResponse();
    ASSERT_TRUE(response.success) << response.message;
    ASSERT_TRUE(response.data.ok()) << response.data.message;
    ASSERT_TRUE(response.data.file.has_value());
    EXPECT_EQ(response.data.file->size, content.size());
    EXPECT_EQ(response.data.file->numBlocks, 3u);
    ASSERT_TRUE(pipe.receiveSentinel().success);

    std::string received;
    char buffer[4096];
    ssize_t n;
    while ((n = pipe.receiveSome(buffer, sizeof(buffer))) > 0) {
        received.append(buffer, static_cast<size_t>(n));
    }
    EXPECT_EQ(received, content.substr(2 * Config::BLOCK_SIZE));
}

TEST_F(PeerSyncTest, UnknownRequestTypeGetsErrorResponse) {
    auto socketFD = DataTransfer::connectTo("127.0.0.1", listener_->port());
    ASSERT_TRUE(socketFD.success) << socketFD.message;
    DataTransfer pipe(socketFD.data);

    Request request = Request::list("");
    request.type = "push";
    ASSERT_TRUE(pipe.sendRequest(request).success);

    auto response = pipe.receiveResponse();
    ASSERT_TRUE(response.success) << response.message;
    EXPECT_FALSE(response.data.ok());
    EXPECT_FALSE(response.data.message.empty());
}

TEST_F(PeerSyncTest, StoppedListenerRefusesConnections) {
    int port = listener_->port();
    stopListener(listener_);
    EXPECT_FALSE(listener_->running());

    auto files = PeerClient("127.0.0.1", port).listFiles("");
    ASSERT_FALSE(files.success);
    EXPECT_EQ(files.code, ErrorCode::IOError);
}

TEST_F(PeerSyncTest, IdleConnectionsDoNotDelayOtherClients) {
    createFile(serverDir_ / "a.txt", "a");

    std::vector<std::unique_ptr<DataTransfer>> idle;
    for (int i = 0; i < 24; ++i) {
        auto socketFD = DataTransfer::connectTo("127.0.0.1", listener_->port());
        ASSERT_TRUE(socketFD.success) << socketFD.message;
        idle.emplace_back(new DataTransfer(socketFD.data));
    }

    PeerClient peer = client();
    auto pending = std::async(std::launch::async, [&peer]() { return peer.listFiles(""); });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    auto files = pending.get();
    ASSERT_TRUE(files.success) << files.message;
    ASSERT_EQ(files.data.size(), 1u);
    EXPECT_EQ(files.data[0].path, "a.txt");
}

TEST_F(PeerSyncTest, StopClosesIdleConnections) {
    auto socketFD = DataTransfer::connectTo("127.0.0.1", listener_->port());
    ASSERT_TRUE(socketFD.success) << socketFD.message;
    DataTransfer idle(socketFD.data);

    // the connection has to be accepted before stop for it to count
    ASSERT_TRUE(client().listFiles("").success);

    ListenerHandle handle = listener_;
    auto stopped = std::async(std::launch::async, [handle]() { stopListener(handle); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(listener_->running());

    char byte;
    EXPECT_LE(idle.receiveSome(&byte, 1), 0);
}

TEST(PeerListenerTest, IndependentListenersCoexist) {
    auto first = startListener("", 0);
    auto second = startListener("", 0);
    ASSERT_TRUE(first.success) << first.message;
    ASSERT_TRUE(second.success) << second.message;
    EXPECT_NE(first.data->port(), second.data->port());
    stopListener(first.data);
    stopListener(second.data);
}

TEST(PeerListenerTest, PortInUseFailsSynchronously) {
    auto first = startListener("", 0);
    ASSERT_TRUE(first.success) << first.message;

    auto second = startListener("", first.data->port());
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.code, ErrorCode::IOError);
    stopListener(first.data);
}
