#include <gtest/gtest.h>

#include <filesystem>

#include "file/path_resolver.hpp"
#include "temp_dir.hpp"

using namespace pasture::file;
using pasture::testing::TempDir;

namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test
{
protected:
    void SetUp() override {
        root_ = dir_.make_dir("root");
        dir_.write_file("root/a.txt", "a");
        dir_.write_file("root/sub/b.txt", "b");
        dir_.write_file("outside.txt", "secret");
    }

    TempDir dir_;
    fs::path root_;
};

TEST_F(PathResolverTest, ExistingFileIsSafe) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("a.txt");
    EXPECT_EQ(resolved.safety, PathSafety::Safe);
    EXPECT_EQ(resolved.path, root_ / "a.txt");
    EXPECT_EQ(resolved.canonical, fs::canonical(root_ / "a.txt"));
    EXPECT_EQ(resolved.relative(), "a.txt");
}

TEST_F(PathResolverTest, RootItselfIsSafe) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("");
    EXPECT_EQ(resolved.safety, PathSafety::Safe);
    EXPECT_EQ(resolved.relative(), "");
}

TEST_F(PathResolverTest, LeadingSlashesAreIgnored) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("//sub/b.txt");
    EXPECT_EQ(resolved.safety, PathSafety::Safe);
    EXPECT_EQ(resolved.relative(), "sub/b.txt");
}

TEST_F(PathResolverTest, MissingFileInsideRootIsSafe) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("nope.txt");
    EXPECT_EQ(resolved.safety, PathSafety::Safe);
    EXPECT_TRUE(resolved.canonical.empty());
}

TEST_F(PathResolverTest, TraversalIsUnsafe) {
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("../outside.txt").safety, PathSafety::Unsafe);
    EXPECT_EQ(resolver.resolve("sub/../../outside.txt").safety, PathSafety::Unsafe);
    EXPECT_EQ(resolver.resolve("../../../../../../../../etc/passwd").safety, PathSafety::Unsafe);
}

TEST_F(PathResolverTest, EncodedTraversalIsUnsafe) {
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("%2e%2e/outside.txt").safety, PathSafety::Unsafe);
    EXPECT_EQ(resolver.resolve("..%2Foutside.txt").safety, PathSafety::Unsafe);
    EXPECT_EQ(resolver.resolve("%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2F%2E%2E%2Fetc%2Fpasswd").safety,
              PathSafety::Unsafe);
}

TEST_F(PathResolverTest, MissingFileNextToRootIsUnsafe) {
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("../not-there.txt").safety, PathSafety::Unsafe);
}

TEST_F(PathResolverTest, SiblingWithCommonPrefixIsUnsafe) {
    dir_.write_file("root2/x.txt", "x");
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("../root2/x.txt").safety, PathSafety::Unsafe);
}

TEST_F(PathResolverTest, SymlinkOutOfRootIsUnsafe) {
    fs::create_symlink(dir_.path() / "outside.txt", root_ / "link.txt");
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("link.txt").safety, PathSafety::Unsafe);
}

TEST_F(PathResolverTest, NulByteIsUnsafe) {
    PathResolver resolver{root_};
    EXPECT_EQ(resolver.resolve("a.txt%00.html").safety, PathSafety::Unsafe);
}

TEST_F(PathResolverTest, QueryIsIgnored) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("a.txt?download=1");
    EXPECT_EQ(resolved.safety, PathSafety::Safe);
    EXPECT_EQ(resolved.relative(), "a.txt");
}

TEST_F(PathResolverTest, MissingIntermediateDirectoryIsResolutionError) {
    PathResolver resolver{root_};
    auto resolved = resolver.resolve("no/such/dir.txt");
    EXPECT_EQ(resolved.safety, PathSafety::ResolutionError);
    EXPECT_TRUE(resolved.error);
}

TEST_F(PathResolverTest, MissingRootIsResolutionError) {
    PathResolver resolver{dir_.path() / "gone"};
    EXPECT_EQ(resolver.resolve("a.txt").safety, PathSafety::ResolutionError);
}
