#include "sztune/tuner/tuner-errors.h"
#include "sztune/tuner/workspace.h"
#include "tuner-test-helpers.h"

#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace sztune::tuner;

class WorkspaceTest : public WorkingRootFixture
{
};

TEST_F(WorkspaceTest, ListsVisibleDirectoriesSorted)
{
    make_dir("beta");
    make_dir("alpha");
    make_dir(".git");
    make_dir("venv");
    make_dir("venv2");
    make_file("notes.txt", 10);
    make_file("alpha.7z", 10);

    auto dirs = list_directories(root_);
    ASSERT_EQ(dirs.size(), 3u);
    EXPECT_EQ(dirs[0], "alpha");
    EXPECT_EQ(dirs[1], "beta");
    EXPECT_EQ(dirs[2], "venv2");
}

TEST_F(WorkspaceTest, EmptyRootHasNoDirectories)
{
    EXPECT_TRUE(list_directories(root_).empty());
}

TEST_F(WorkspaceTest, TotalArchiveSizeCountsOnlyArchives)
{
    make_file("a.7z", 1000);
    make_file("b.7z", 234);
    make_file("c.zip", 5000);
    make_file("d.7z.tmp", 5000);
    make_dir("e.7z");

    EXPECT_EQ(total_archive_size(root_), 1234u);
}

TEST_F(WorkspaceTest, RemoveArchivesLeavesOtherFiles)
{
    make_file("a.7z", 10);
    make_file("b.7z", 10);
    make_file("keep.txt", 10);
    make_dir("data");

    EXPECT_EQ(remove_archives(root_), 2u);
    EXPECT_EQ(total_archive_size(root_), 0u);
    EXPECT_TRUE(fs::exists(root_ / "keep.txt"));
    EXPECT_TRUE(fs::is_directory(root_ / "data"));
    EXPECT_EQ(remove_archives(root_), 0u);
}

TEST_F(WorkspaceTest, ArchiveScopeIsHiddenAndRemoved)
{
    fs::path scratch;
    {
        ArchiveScope scope(root_);
        scratch = scope.path();
        EXPECT_TRUE(fs::is_directory(scratch));
        EXPECT_EQ(scratch.parent_path().string(), root_.string());
        EXPECT_EQ(scratch.filename().string().front(), '.');
        EXPECT_TRUE(list_directories(root_).empty());

        std::ofstream((scratch / "x.7z").string()) << "archive";
        EXPECT_EQ(scope.archive_size(), 7u);
        EXPECT_EQ(total_archive_size(root_), 0u);
    }
    EXPECT_FALSE(fs::exists(scratch));
}

TEST_F(WorkspaceTest, ArchiveScopeReleasedOnException)
{
    fs::path scratch;
    try
    {
        ArchiveScope scope(root_);
        scratch = scope.path();
        std::ofstream((scratch / "x.7z").string()) << "partial";
        throw CompressorError("simulated failure");
    }
    catch (const CompressorError&)
    {
    }
    EXPECT_FALSE(scratch.empty());
    EXPECT_FALSE(fs::exists(scratch));
}

TEST_F(WorkspaceTest, ArchiveScopesAreDistinct)
{
    ArchiveScope first(root_);
    ArchiveScope second(root_);
    EXPECT_NE(first.path().string(), second.path().string());
}

TEST_F(WorkspaceTest, ArchiveScopeFailsForMissingRoot)
{
    EXPECT_THROW(
        { ArchiveScope scope(root_ / "missing" / "deeper"); }, TunerError);
}

TEST(FormatFileSize, Units)
{
    EXPECT_EQ(format_file_size(0), "0.00 B");
    EXPECT_EQ(format_file_size(1023), "1023.00 B");
    EXPECT_EQ(format_file_size(1024), "1.00 KB");
    EXPECT_EQ(format_file_size(3145728), "3.00 MB");
    EXPECT_EQ(format_file_size(1536ull * 1024 * 1024), "1.50 GB");
}
