#include "sztune/tuner/size-probe.h"
#include "sztune/tuner/tuner-errors.h"
#include "tuner-test-helpers.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace sztune::tuner;

TEST(ParseDuOutput, ReadsSummaryLines)
{
    std::istringstream input("10\tA/\n5\tB/\n");
    auto usages = parse_du_output(input);

    ASSERT_EQ(usages.size(), 2u);
    EXPECT_EQ(usages[0].name, "A");
    EXPECT_EQ(usages[0].megabytes, 10u);
    EXPECT_EQ(usages[1].name, "B");
    EXPECT_EQ(usages[1].megabytes, 5u);
}

TEST(ParseDuOutput, KeepsSpacesAndSkipsBlankLines)
{
    std::istringstream input("\n1\tmy photos/\r\n\n2048\tdata\n");
    auto usages = parse_du_output(input);

    ASSERT_EQ(usages.size(), 2u);
    EXPECT_EQ(usages[0].name, "my photos");
    EXPECT_EQ(usages[0].megabytes, 1u);
    EXPECT_EQ(usages[1].name, "data");
    EXPECT_EQ(usages[1].megabytes, 2048u);
}

TEST(ParseDuOutput, EmptyInputGivesNoEntries)
{
    std::istringstream input("");
    EXPECT_TRUE(parse_du_output(input).empty());
}

TEST(ParseDuOutput, RejectsMalformedLines)
{
    for (const char* text :
         {"10 A/\n", "ten\tA/\n", "\tA/\n", "10\t\n", "-1\tA/\n", "1.5\tA/\n"})
    {
        std::istringstream input(text);
        EXPECT_THROW(parse_du_output(input), SizeProbeError) << text;
    }
}

TEST(ParseDuOutput, RejectsOutOfRangeSize)
{
    std::istringstream input("99999999999999999999999\tA/\n");
    EXPECT_THROW(parse_du_output(input), SizeProbeError);
}

TEST(LargestUsage, PicksMaximumAndSkipsVenv)
{
    std::vector<DirectoryUsage> usages = {
        {"A", 10}, {"venv", 900}, {"B", 5}, {"C", 10}};
    EXPECT_EQ(largest_usage_mb(usages), 10u);
}

TEST(LargestUsage, SkipsAnyPathContainingVenv)
{
    std::vector<DirectoryUsage> usages = {
        {"A", 10}, {"myvenv", 900}, {"venv-old", 800}, {"B", 5}};
    EXPECT_EQ(largest_usage_mb(usages), 10u);
}

TEST(LargestUsage, FailsWithoutEntries)
{
    EXPECT_THROW(largest_usage_mb({}), SizeProbeError);
    EXPECT_THROW(
        largest_usage_mb(std::vector<DirectoryUsage>{{"venv", 3}}),
        SizeProbeError);
    EXPECT_THROW(
        largest_usage_mb(std::vector<DirectoryUsage>{{".venv3", 3}}),
        SizeProbeError);
}

class DuSizeProbeTest : public WorkingRootFixture
{
};

TEST_F(DuSizeProbeTest, MeasuresTopLevelDirectories)
{
    make_dir("A", 2 * 1024 * 1024);
    make_dir("B", 1000);
    make_dir(".cache", 4 * 1024 * 1024);
    make_dir("venv", 4 * 1024 * 1024);

    DuSizeProbe probe(root_);
    auto usages = probe.measure();

    ASSERT_EQ(usages.size(), 2u);
    EXPECT_EQ(usages[0].name, "A");
    EXPECT_EQ(usages[1].name, "B");

    // du rounds up to whole megabytes, directory blocks may add one more
    auto largest = probe.largest_directory_size_mb();
    EXPECT_GE(largest, 2u);
    EXPECT_LE(largest, 3u);
    EXPECT_GE(usages[1].megabytes, 1u);
}

TEST_F(DuSizeProbeTest, FailsWithoutDirectories)
{
    DuSizeProbe probe(root_);
    EXPECT_THROW(probe.largest_directory_size_mb(), SizeProbeError);
}

TEST_F(DuSizeProbeTest, FailsWhenUtilityMissing)
{
    make_dir("A", 10);
    DuSizeProbe probe(root_, "sztune-no-such-du-utility");
    EXPECT_THROW(probe.largest_directory_size_mb(), SizeProbeError);
}
