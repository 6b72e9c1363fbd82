#include <gtest/gtest.h>
#include "staging.h"
#include "test_support.h"

#include <sys/stat.h>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>

namespace confrun {
namespace {

namespace fs = std::filesystem;
using testing_support::TempDir;
using testing_support::read_file;

class StagingDirectoryTest : public ::testing::Test {
protected:
    TempDir base{"confrun_staging_base"};
};

TEST_F(StagingDirectoryTest, CreatesPrivateDirectoryUnderBase) {
    StagingDirectory staging(base.path());

    EXPECT_TRUE(fs::is_directory(staging.path()));
    EXPECT_EQ(fs::path(staging.path()).parent_path(), fs::path(base.path()));
    EXPECT_EQ(fs::path(staging.path()).filename().string().rfind("confrun-", 0), 0u);

    struct stat st;
    ASSERT_EQ(stat(staging.path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST_F(StagingDirectoryTest, NamesAreUnique) {
    std::set<std::string> paths;
    std::vector<std::unique_ptr<StagingDirectory>> live;
    for (int i = 0; i < 20; ++i) {
        live.push_back(std::make_unique<StagingDirectory>(base.path()));
        paths.insert(live.back()->path());
    }

    EXPECT_EQ(paths.size(), 20u);
}

TEST_F(StagingDirectoryTest, WritesContentVerbatim) {
    StagingDirectory staging(base.path());
    std::string content("binary\0data\r\n\xff", 14);

    std::string path = staging.write_file("program.data", content);

    EXPECT_EQ(fs::path(path).parent_path(), fs::path(staging.path()));
    EXPECT_EQ(read_file(path), content);
}

TEST_F(StagingDirectoryTest, WritesEmptyFile) {
    StagingDirectory staging(base.path());

    std::string path = staging.write_file("program.data", "");

    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 0u);
}

TEST_F(StagingDirectoryTest, RemovedOnScopeExit) {
    std::string path;
    {
        StagingDirectory staging(base.path());
        path = staging.path();
        staging.write_file("program.data", "x");
        fs::create_directories(fs::path(path) / "a" / "b");
    }

    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(base.entry_count(), 0u);
}

TEST_F(StagingDirectoryTest, RemovedWhenExceptionUnwinds) {
    std::string path;
    try {
        StagingDirectory staging(base.path());
        path = staging.path();
        staging.write_file("program.data", "x");
        throw std::runtime_error("handler failed");
    } catch (const std::runtime_error&) {
    }

    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(StagingDirectoryTest, RejectsNamesThatEscapeTheDirectory) {
    StagingDirectory staging(base.path());

    EXPECT_THROW(staging.write_file("../escape", "x"), std::runtime_error);
    EXPECT_THROW(staging.write_file("sub/file", "x"), std::runtime_error);
    EXPECT_THROW(staging.write_file("..", "x"), std::runtime_error);
    EXPECT_THROW(staging.write_file("", "x"), std::runtime_error);
    EXPECT_EQ(base.entry_count(), 1u);
}

TEST_F(StagingDirectoryTest, MissingBaseThrows) {
    EXPECT_THROW(StagingDirectory(base.file("does/not/exist")), std::runtime_error);
}

} // namespace
} // namespace confrun
