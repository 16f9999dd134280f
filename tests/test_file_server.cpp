#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <string_view>

#include "http/file_server.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "temp_dir.hpp"

using namespace pasture::http;
using pasture::testing::TempDir;

namespace fs = std::filesystem;

namespace {

std::string content_type(const Response& response) {
    auto value = response.header("content-type");
    return value ? *value : std::string{};
}

std::string content_length(const Response& response) {
    auto value = response.header("content-length");
    return value ? *value : std::string{};
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace

class FileServerTest : public ::testing::Test
{
protected:
    void SetUp() override {
        root_ = dir_.make_dir("www");
        dir_.write_file("www/a.txt", "alpha\n");
        dir_.make_dir("www/sub");
        dir_.write_file("www/sub/inner.txt", "inner");
        dir_.write_file("www/index.html", "<!DOCTYPE html>\n<html><body>home</body></html>\n");
        dir_.write_file("secret.txt", "do not serve");
    }

    Response get(const std::string& target) const {
        FileServer server{root_};
        return server.handle_raw("GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
    }

    TempDir dir_;
    fs::path root_;
};

TEST_F(FileServerTest, ServesFileWithExactBytes) {
    auto response = get("/index.html");
    auto expected = std::string("<!DOCTYPE html>\n<html><body>home</body></html>\n");
    EXPECT_EQ(response.status(), Status::OK);
    EXPECT_EQ(content_type(response), "text/html");
    EXPECT_EQ(content_length(response), std::to_string(fs::file_size(root_ / "index.html")));
    EXPECT_EQ(response.body(), expected);
}

TEST_F(FileServerTest, FallsBackToExtension) {
    auto response = get("/a.txt");
    EXPECT_EQ(response.status(), Status::OK);
    EXPECT_EQ(content_type(response), "text/plain");
    EXPECT_EQ(response.body(), "alpha\n");
}

TEST_F(FileServerTest, UsesInjectedClassifier) {
    FileServer server{root_, [](const fs::path&, std::string_view) { return std::string("x-test/type"); }};
    auto response = server.handle_raw("GET /a.txt HTTP/1.1\r\n\r\n");
    EXPECT_EQ(content_type(response), "x-test/type");
}

TEST_F(FileServerTest, ListsDirectory) {
    auto response = get("/");
    EXPECT_EQ(response.status(), Status::OK);
    EXPECT_EQ(content_type(response), "text/html");
    EXPECT_EQ(content_length(response), std::to_string(response.body().size()));

    const auto& body = response.body();
    EXPECT_TRUE(contains(body, R"(<li><a href="/a.txt"><span class="file-icon"></span>a.txt</a></li>)"));
    EXPECT_TRUE(contains(body, R"(<li><a href="/sub/"><span class="folder-icon"></span>sub</a></li>)"));
    EXPECT_FALSE(contains(body, "parent-dir\""));
    EXPECT_TRUE(contains(body, "<h1>Directory listing for /</h1>"));
    EXPECT_TRUE(contains(body, "</ul></body></html>"));
}

TEST_F(FileServerTest, ListingIsSortedByName) {
    auto body = get("/").body();
    auto a = body.find(">a.txt<");
    auto index = body.find(">index.html<");
    auto sub = body.find(">sub<");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(index, std::string::npos);
    ASSERT_NE(sub, std::string::npos);
    EXPECT_LT(a, index);
    EXPECT_LT(index, sub);
}

TEST_F(FileServerTest, SubdirectoryListingHasParentLink) {
    auto response = get("/sub");
    EXPECT_EQ(response.status(), Status::OK);
    const auto& body = response.body();
    EXPECT_TRUE(contains(body, R"(<a href="/" class="parent-dir">)"));
    EXPECT_TRUE(contains(body, R"(<a href="/sub/inner.txt"><span class="file-icon"></span>inner.txt</a>)"));
    EXPECT_TRUE(contains(body, "<h1>Directory listing for /sub</h1>"));
}

TEST_F(FileServerTest, ListingEscapesNames) {
    dir_.write_file("www/<b>&x y.txt", "x");
    auto body = get("/").body();
    EXPECT_TRUE(contains(body, R"(<a href="/%3Cb%3E%26x%20y.txt"><span class="file-icon"></span>&lt;b&gt;&amp;x y.txt</a>)"));
    EXPECT_FALSE(contains(body, "<b>&x"));
}

TEST_F(FileServerTest, EncodedNamesAreDecoded) {
    dir_.write_file("www/my file.txt", "spaced");
    auto response = get("/my%20file.txt");
    EXPECT_EQ(response.status(), Status::OK);
    EXPECT_EQ(response.body(), "spaced");
}

TEST_F(FileServerTest, MissingPathIsNotFound) {
    auto response = get("/nope.txt");
    EXPECT_EQ(response.status(), Status::NotFound);
    EXPECT_EQ(response.path(), "Not Found");
    EXPECT_EQ(response.body(), "File not found");
    EXPECT_EQ(content_length(response), "14");
    EXPECT_EQ(content_type(response), "text/plain");
}

TEST_F(FileServerTest, MissingFileHandlerSaysFileNotFound) {
    FileServer server{root_};
    Request req;
    req.route = "nope.txt";
    auto response = server.serve_file(req, root_ / "nope.txt");
    EXPECT_EQ(response.status(), Status::NotFound);
    EXPECT_EQ(response.body(), "File not found");
    EXPECT_EQ(content_length(response), "14");
}

TEST_F(FileServerTest, ReadingADirectoryAsFileIsServerError) {
    FileServer server{root_};
    auto response = server.serve_file(Request{}, root_ / "sub");
    EXPECT_EQ(response.status(), Status::InternalServerError);
    EXPECT_EQ(response.body().rfind("An error occurred: ", 0), 0u);
}

TEST_F(FileServerTest, TraversalIsForbidden) {
    for (const auto* target : {"/../secret.txt", "/%2e%2e/secret.txt", "/..%2fsecret.txt",
                               "/../../../../../../../../etc/passwd",
                               "/%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2Fetc%2Fpasswd"}) {
        auto response = get(target);
        EXPECT_EQ(response.status(), Status::Forbidden) << target;
        EXPECT_FALSE(contains(response.body(), "do not serve")) << target;
    }
}

TEST_F(FileServerTest, UnresolvablePathIsNotFound) {
    auto response = get("/no/such/file.txt");
    EXPECT_EQ(response.status(), Status::NotFound);
    EXPECT_EQ(response.body(), "File not found");
}

TEST_F(FileServerTest, PostEchoesEscapedBody) {
    FileServer server{root_};
    auto response = server.handle_raw("POST /form HTTP/1.1\r\nContent-Length: 18\r\n\r\n<i>name</i>&age=30");
    EXPECT_EQ(response.status(), Status::OK);
    EXPECT_EQ(content_type(response), "text/html");
    EXPECT_EQ(response.body(),
              "<html><body><h1>Received POST request</h1>"
              "<p>Body: &lt;i&gt;name&lt;/i&gt;&amp;age=30</p></body></html>");
}

TEST_F(FileServerTest, OtherMethodsAreBadRequest) {
    FileServer server{root_};
    auto response = server.handle_raw("DELETE /a.txt HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.status(), Status::BadRequest);
    EXPECT_EQ(response.path(), "a.txt");
    EXPECT_EQ(content_length(response), "0");
    EXPECT_TRUE(fs::exists(root_ / "a.txt"));
}

TEST_F(FileServerTest, UnparseableRequestIsBadRequest) {
    FileServer server{root_};
    auto response = server.handle_raw("FOOBAR / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.status(), Status::BadRequest);
    EXPECT_EQ(response.version(), Version::Http11);
    EXPECT_EQ(response.path(), "Invalid Request");
    EXPECT_TRUE(response.body().empty());
    EXPECT_EQ(response.serialize().rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
}

TEST_F(FileServerTest, VersionIsEchoed) {
    FileServer server{root_};
    auto response = server.handle_raw("GET /a.txt HTTP/2.0\r\n\r\n");
    EXPECT_EQ(response.serialize().rfind("HTTP/2.0 200 OK\r\n", 0), 0u);
}
