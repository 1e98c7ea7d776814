#include <gtest/gtest.h>
#include "http_fixture.hpp"
#include "core/downloader.hpp"
#include "core/errors.hpp"
#include "core/progress.hpp"
#include "core/temp_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

/// Records every event for later inspection
class RecordingSink : public ProgressSink {
public:
    std::vector<ProgressEvent> events;
    std::vector<std::string> lines;

    void on_event(const ProgressEvent& event) override { events.push_back(event); }
    void log(const std::string& line) override { lines.push_back(line); }
    void error(const std::string& line) override { lines.push_back(line); }

    size_t count(ProgressEvent::Kind kind) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) ++n;
        }
        return n;
    }
};

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class DownloaderTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string payload;
    LocalHttpServer http;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / "discord-updater-test-downloader").string();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        // Large enough to arrive in several chunks
        payload.resize(256 * 1024);
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(i * 31 % 251);
        }

        http.server.Get("/sized.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(payload, "application/gzip");
        });
        http.server.Get("/chunked.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("application/gzip",
                [this](size_t offset, httplib::DataSink& sink) {
                    if (offset < payload.size()) {
                        size_t n = std::min<size_t>(16 * 1024, payload.size() - offset);
                        sink.write(payload.data() + offset, n);
                    } else {
                        sink.done();
                    }
                    return true;
                });
        });
        http.server.Get("/redirect.tar.gz", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/sized.tar.gz");
        });
        http.server.Get("/missing.tar.gz", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("not found", "text/plain");
        });
        http.start();
    }

    void TearDown() override {
        http.stop();
        fs::remove_all(test_dir);
    }
};

TEST_F(DownloaderTest, DownloadsWithContentLength) {
    Downloader downloader;
    RecordingSink sink;
    std::string dest = test_dir + "/discord.tar.gz";

    downloader.download(http.url("/sized.tar.gz"), dest, sink);

    EXPECT_EQ(read_file(dest), payload);

    ASSERT_FALSE(sink.events.empty());
    EXPECT_EQ(sink.events.front().kind, ProgressEvent::Kind::Started);
    EXPECT_EQ(sink.events.front().total, static_cast<int64_t>(payload.size()));
    EXPECT_EQ(sink.events.back().kind, ProgressEvent::Kind::Finished);
    EXPECT_EQ(sink.count(ProgressEvent::Kind::Started), 1u);
    EXPECT_EQ(sink.count(ProgressEvent::Kind::Finished), 1u);
    EXPECT_GE(sink.count(ProgressEvent::Kind::Advanced), 1u);

    // Received counts grow monotonically and end at the full size
    int64_t last = 0;
    for (const auto& e : sink.events) {
        if (e.kind != ProgressEvent::Kind::Advanced) continue;
        EXPECT_GT(e.received, last);
        EXPECT_EQ(e.total, static_cast<int64_t>(payload.size()));
        last = e.received;
    }
    EXPECT_EQ(last, static_cast<int64_t>(payload.size()));
}

TEST_F(DownloaderTest, MissingContentLengthMeansIndeterminate) {
    Downloader downloader;
    RecordingSink sink;
    std::string dest = test_dir + "/discord.tar.gz";

    downloader.download(http.url("/chunked.tar.gz"), dest, sink);

    EXPECT_EQ(read_file(dest), payload);
    ASSERT_FALSE(sink.events.empty());
    EXPECT_EQ(sink.events.front().kind, ProgressEvent::Kind::Started);
    EXPECT_EQ(sink.events.front().total, 0);
    EXPECT_EQ(sink.events.back().kind, ProgressEvent::Kind::Finished);
}

TEST_F(DownloaderTest, FollowsRedirects) {
    Downloader downloader;
    RecordingSink sink;
    std::string dest = test_dir + "/discord.tar.gz";

    downloader.download(http.url("/redirect.tar.gz"), dest, sink);
    EXPECT_EQ(read_file(dest), payload);
}

TEST_F(DownloaderTest, HttpErrorRemovesPartialFile) {
    Downloader downloader;
    RecordingSink sink;
    std::string dest = test_dir + "/discord.tar.gz";

    try {
        downloader.download(http.url("/missing.tar.gz"), dest, sink);
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
        EXPECT_NE(std::string(e.what()).find("404"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(DownloaderTest, UnreachableServerIsNetworkError) {
    Downloader downloader(HttpOptions{2, 2});
    RecordingSink sink;
    std::string dest = test_dir + "/discord.tar.gz";

    try {
        downloader.download("http://127.0.0.1:1/discord.tar.gz", dest, sink);
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
    }
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(DownloaderTest, UnwritableDestinationIsIoError) {
    Downloader downloader;
    RecordingSink sink;

    try {
        downloader.download(http.url("/sized.tar.gz"), test_dir + "/no/such/dir/file", sink);
        FAIL() << "expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

// ── TempDir ─────────────────────────────────────────────────

TEST_F(DownloaderTest, TempDirRemovedOnScopeExit) {
    fs::path created;
    {
        TempDir tmp(test_dir);
        created = tmp.path();
        EXPECT_TRUE(fs::is_directory(created));
        std::ofstream(created / "partial.tar.gz").put('x');
    }
    EXPECT_FALSE(fs::exists(created));
}

TEST_F(DownloaderTest, TempDirRemovedWhenDownloadThrows) {
    fs::path created;
    Downloader downloader;
    RecordingSink sink;

    try {
        TempDir tmp(test_dir);
        created = tmp.path();
        downloader.download(http.url("/missing.tar.gz"), (tmp.path() / "a.tar.gz").string(), sink);
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
    }
    EXPECT_FALSE(created.empty());
    EXPECT_FALSE(fs::exists(created));
    EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST_F(DownloaderTest, TempDirMoveTransfersOwnership) {
    fs::path created;
    {
        TempDir outer(test_dir);
        created = outer.path();
        {
            TempDir inner(std::move(outer));
            EXPECT_EQ(inner.path(), created);
            EXPECT_TRUE(outer.path().empty());
        }
        EXPECT_FALSE(fs::exists(created));
    }
}
