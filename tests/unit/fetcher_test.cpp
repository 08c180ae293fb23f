#include <loom/engine/fetcher.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace loom::engine;
namespace fs = std::filesystem;

// ============================================================================
// URL helpers
// ============================================================================

TEST(FileUrl, SchemeDetection) {
    EXPECT_TRUE(is_file_url("file:///tmp/a.html"));
    EXPECT_TRUE(is_file_url("FILE:///tmp/a.html"));
    EXPECT_FALSE(is_file_url("/tmp/a.html"));
    EXPECT_FALSE(is_file_url("http://example.com/"));

    EXPECT_TRUE(has_scheme("http://example.com/"));
    EXPECT_TRUE(has_scheme("data:text/html,hi"));
    EXPECT_TRUE(has_scheme("view-source:x"));
    EXPECT_FALSE(has_scheme("C:\\pages\\a.html"));
    EXPECT_FALSE(has_scheme("page.html"));
    EXPECT_FALSE(has_scheme("1abc:x"));
}

TEST(FileUrl, ToPath) {
    std::string path;
    std::string err;
    ASSERT_TRUE(file_url_to_path("file:///tmp/a%20b.html", path, err)) << err;
    EXPECT_EQ(path, "/tmp/a b.html");

    ASSERT_TRUE(file_url_to_path("file://localhost/srv/index.html?q=1#top", path, err)) << err;
    EXPECT_EQ(path, "/srv/index.html");

    ASSERT_TRUE(file_url_to_path("file:/abs/page.html", path, err)) << err;
    EXPECT_EQ(path, "/abs/page.html");
}

TEST(FileUrl, ToPathRejectsBadInput) {
    std::string path;
    std::string err;
    EXPECT_FALSE(file_url_to_path("http://example.com/", path, err));
    EXPECT_EQ(err, "URL is not a file URL");

    EXPECT_FALSE(file_url_to_path("file://remote/share/a.html", path, err));
    EXPECT_EQ(err, "Unsupported file URL host: remote");

    EXPECT_FALSE(file_url_to_path("file:relative.html", path, err));
    EXPECT_EQ(err, "File URL path must be absolute");

    EXPECT_FALSE(file_url_to_path("file:///bad%2", path, err));
    EXPECT_EQ(err, "Malformed %-escape in file URL path");
}

TEST(FileUrl, FromPathEscapesReservedCharacters) {
    EXPECT_EQ(path_to_file_url("/tmp/a b.html"), "file:///tmp/a%20b.html");
    EXPECT_EQ(path_to_file_url("/srv/x_y-z.~1/p.css"), "file:///srv/x_y-z.~1/p.css");
    EXPECT_EQ(path_to_file_url("/q/a#b"), "file:///q/a%23b");
}

TEST(FileUrl, ContentTypeByExtension) {
    EXPECT_EQ(content_type_for_path("/a/index.html"), "text/html");
    EXPECT_EQ(content_type_for_path("/a/INDEX.HTM"), "text/html");
    EXPECT_EQ(content_type_for_path("/a/site.css"), "text/css");
    EXPECT_EQ(content_type_for_path("/a/notes.txt"), "text/plain");
    EXPECT_EQ(content_type_for_path("/a/logo.png"), "image/png");
    EXPECT_EQ(content_type_for_path("/a/archive.tar"), "");
    EXPECT_EQ(content_type_for_path("/a/README"), "");
}

TEST(FileUrl, ResolveRelativeReferences) {
    std::string path;
    std::string err;
    ASSERT_TRUE(resolve_file_reference("style.css", "file:///site/index.html", path, err)) << err;
    EXPECT_EQ(path, "/site/style.css");

    ASSERT_TRUE(resolve_file_reference("../img/a.png", "/site/pages/index.html", path, err)) << err;
    EXPECT_EQ(path, "/site/img/a.png");

    ASSERT_TRUE(resolve_file_reference("a%20b.css?v=2#x", "/s/i.html", path, err)) << err;
    EXPECT_EQ(path, "/s/a b.css");

    ASSERT_TRUE(resolve_file_reference("/abs/x.css", "/s/i.html", path, err)) << err;
    EXPECT_EQ(path, "/abs/x.css");

    ASSERT_TRUE(resolve_file_reference("file:///t/./u/../v.html", "", path, err)) << err;
    EXPECT_EQ(path, "/t/v.html");
}

TEST(FileUrl, ResolveRejectsOtherSchemes) {
    std::string path;
    std::string err;
    EXPECT_FALSE(resolve_file_reference("http://example.com/a.css", "/s/i.html", path, err));
    EXPECT_EQ(err, "Unsupported URL scheme: http://example.com/a.css");
    EXPECT_TRUE(path.empty());
}

// ============================================================================
// FileFetcher
// ============================================================================

class FileFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("loom_fetcher_" + std::string(::testing::UnitTest::GetInstance()
                                                   ->current_test_info()
                                                   ->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& contents) {
        const fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path.generic_string();
    }

    fs::path dir_;
};

TEST_F(FileFetcherTest, ServesFileByPath) {
    const std::string path = write("index.html", "<p>hi</p>");
    FileFetcher fetcher;
    FetchResponse response = fetcher.fetch(path, "");
    ASSERT_TRUE(response.ok) << response.error;
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "text/html");
    EXPECT_EQ(response.body, "<p>hi</p>");
    EXPECT_EQ(response.url, path_to_file_url(path));
}

TEST_F(FileFetcherTest, ServesFileByUrlAndRelativeReference) {
    const std::string page = write("page.html", "<link rel=stylesheet href=site.css>");
    write("site.css", "p { color: red }");
    FileFetcher fetcher;

    FetchResponse response = fetcher.fetch(path_to_file_url(page), "");
    ASSERT_TRUE(response.ok) << response.error;

    FetchResponse sheet = fetcher.fetch("site.css", response.url);
    ASSERT_TRUE(sheet.ok) << sheet.error;
    EXPECT_EQ(sheet.content_type, "text/css");
    EXPECT_EQ(sheet.body, "p { color: red }");
}

TEST_F(FileFetcherTest, MissingFileIs404) {
    const std::string path = (dir_ / "missing.html").generic_string();
    FileFetcher fetcher;
    FetchResponse response = fetcher.fetch(path, "");
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.error, "File not found: " + path);
}

TEST_F(FileFetcherTest, DirectoryIsNotAFile) {
    FileFetcher fetcher;
    FetchResponse response = fetcher.fetch(dir_.generic_string(), "");
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.status, 404);
}

TEST_F(FileFetcherTest, UnsupportedSchemeHasNoStatus) {
    FileFetcher fetcher;
    FetchResponse response = fetcher.fetch("https://example.com/", "");
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, "Unsupported URL scheme: https://example.com/");
}
