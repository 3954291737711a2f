#include "label_format.hpp"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(FormatLabelTest, PlainTextUnchanged)
{
    EXPECT_EQ(format_label("compute", {}), "compute");
    EXPECT_EQ(format_label("", { "x" }), "");
}

TEST(FormatLabelTest, SubstitutesInOrder)
{
    EXPECT_EQ(format_label("job %d of %s", { "3", "queue" }), "job 3 of queue");
    EXPECT_EQ(format_label("%s-%s", { "a", "b", "extra" }), "a-b");
}

TEST(FormatLabelTest, NumericConversions)
{
    EXPECT_EQ(format_label("%.2f ms", { "3.14159" }), "3.14 ms");
    EXPECT_EQ(format_label("%05d", { "42" }), "00042");
    EXPECT_EQ(format_label("%x", { "255" }), "ff");
    EXPECT_EQ(format_label("%X", { "255" }), "FF");
    EXPECT_EQ(format_label("%d", { "7.9" }), "7");
    EXPECT_EQ(format_label("%ld items", { "12" }), "12 items");
    EXPECT_EQ(format_label("%e", { "1500" }), "1.500000e+03");
}

TEST(FormatLabelTest, NonNumericArgumentInsertedRaw)
{
    EXPECT_EQ(format_label("id=%d", { "abc" }), "id=abc");
    EXPECT_EQ(format_label("%f", { "n/a" }), "n/a");
}

TEST(FormatLabelTest, OutOfRangeIntegerInsertedRaw)
{
    EXPECT_EQ(format_label("id=%d", { "1e30" }), "id=1e30");
    EXPECT_EQ(format_label("id=%x", { "-1e19" }), "id=-1e19");
    EXPECT_EQ(format_label("id=%i", { "9.3e18" }), "id=9.3e18");
    EXPECT_EQ(format_label("id=%d", { "-9.2e18" }), "id=-9200000000000000000");
    EXPECT_EQ(format_label("%d", { "inf" }), "inf");
}

TEST(FormatLabelTest, HugeWidthKeepsPlaceholder)
{
    EXPECT_EQ(format_label("[w=%2147483648d]", { "5" }), "[w=%2147483648d]");
    EXPECT_EQ(format_label("[%.99999f]", { "1.5" }), "[%.99999f]");
    EXPECT_EQ(format_label("[%4096d]", { "5" }).size(), 4098u);
}

TEST(FormatLabelTest, PercentEscape)
{
    EXPECT_EQ(format_label("100%%", {}), "100%");
    EXPECT_EQ(format_label("%d%%", { "50" }), "50%");
}

TEST(FormatLabelTest, UnmatchedPlaceholderKept)
{
    EXPECT_EQ(format_label("%d and %d", { "1" }), "1 and %d");
    EXPECT_EQ(format_label("load %s", {}), "load %s");
    EXPECT_EQ(format_label("50%", { "x" }), "50%");
    EXPECT_EQ(format_label("%q?", { "x" }), "%q?");
}

TEST(FormatLabelTest, StringAndCharWidths)
{
    EXPECT_EQ(format_label("[%5s]", { "ab" }), "[   ab]");
    EXPECT_EQ(format_label("[%-4s]", { "ab" }), "[ab  ]");
    EXPECT_EQ(format_label("%c", { "z" }), "z");
    EXPECT_EQ(format_label("%c", { "zz" }), "zz");
}

TEST(SplitLabelArgsTest, BracketedColumnIsSplit)
{
    EXPECT_THAT(split_label_args({ "[1, 'two', \"three\"]" }), ElementsAre("1", "two", "three"));
    EXPECT_THAT(split_label_args({ " [ 5 ] " }), ElementsAre("5"));
    EXPECT_THAT(split_label_args({ "[]" }), IsEmpty());
}

TEST(SplitLabelArgsTest, PlainColumnsAreOneArgumentEach)
{
    EXPECT_THAT(split_label_args({ " 1 ", "b" }), ElementsAre("1", "b"));
    EXPECT_THAT(split_label_args({ "a,b" }), ElementsAre("a,b"));
    EXPECT_THAT(split_label_args({ "[a", "b]" }), ElementsAre("[a", "b]"));
    EXPECT_THAT(split_label_args({}), IsEmpty());
}

}  // namespace
