#include <gtest/gtest.h>

#include "errors.hh"
#include "section.hh"
#include "test-fixtures.hh"

using namespace Geometry;

TEST(SectionIndex, ConcatenatesDigits) {
  EXPECT_EQ(sectionIndex("sec1.dat"), 1u);
  EXPECT_EQ(sectionIndex("sec10.dat"), 10u);
  EXPECT_EQ(sectionIndex("/tmp/case_0001/sec2b3.dat"), 23u);
  EXPECT_EQ(sectionIndex("secA.dat"), 0u);
}

TEST(FindSections, NumericOrder) {
  TempCase c;
  for (auto name : { "sec10.dat", "sec2.dat", "sec1.dat", "sec21.dat", "sec3.dat" })
    c.writeText(name, "0 0 0\n");
  c.writeText("sec.dat", "0 0 0\n");
  c.writeText("secA.dat", "0 0 0\n");
  c.writeText("sec5.txt", "0 0 0\n");
  c.writeText("input.dat", "0 0 0\n");
  std::filesystem::create_directory(c.file("sec7.dat"));

  auto sections = findSections(c.dir());
  ASSERT_EQ(sections.size(), 5u);
  std::vector<size_t> indices;
  for (const auto &s : sections)
    indices.push_back(sectionIndex(s));
  EXPECT_EQ(indices, (std::vector<size_t>{ 1, 2, 3, 10, 21 }));
  EXPECT_EQ(sections.front(), c.file("sec1.dat"));
}

TEST(FindSections, EmptyDirectory) {
  TempCase c;
  c.writeText("notes.txt", "nothing here\n");
  EXPECT_THROW(findSections(c.dir()), SectionNotFoundError);
}

TEST(FindSections, MissingDirectory) {
  TempCase c;
  EXPECT_THROW(findSections(c.file("does-not-exist")), SectionNotFoundError);
}

TEST(ReadSection, FirstThreeColumns) {
  TempCase c;
  c.writeText("sec1.dat", "1 2 3 9\n\n4.5 -5 6e-1 9\n  7 8 9 9  \n");
  auto points = readSection(c.file("sec1.dat"));
  ASSERT_EQ(points.size(), 3u);
  EXPECT_DOUBLE_EQ(points[1][0], 4.5);
  EXPECT_DOUBLE_EQ(points[1][1], -5);
  EXPECT_DOUBLE_EQ(points[1][2], 0.6);
  EXPECT_DOUBLE_EQ(points[2][2], 9);
}

TEST(ReadSection, SingleRow) {
  TempCase c;
  c.writeText("sec1.dat", "1 2 3");
  auto points = readSection(c.file("sec1.dat"));
  ASSERT_EQ(points.size(), 1u);
  EXPECT_DOUBLE_EQ(points[0][2], 3);
}

TEST(ReadSection, TooFewColumns) {
  TempCase c;
  c.writeText("sec1.dat", "1 2\n3 4\n");
  EXPECT_THROW(readSection(c.file("sec1.dat")), DataFormatError);
}

TEST(ReadSection, MalformedTables) {
  TempCase c;
  c.writeText("ragged.dat", "1 2 3\n4 5\n");
  c.writeText("text.dat", "1 2 3\n4 five 6\n");
  c.writeText("empty.dat", "\n\n");
  EXPECT_THROW(readSection(c.file("ragged.dat")), DataFormatError);
  EXPECT_THROW(readSection(c.file("text.dat")), DataFormatError);
  EXPECT_THROW(readSection(c.file("empty.dat")), DataFormatError);
  EXPECT_THROW(readSection(c.file("missing.dat")), DataFormatError);
}

TEST(ReadSection, SkipsComments) {
  TempCase c;
  c.writeText("sec1.dat", "# x y z\n0 0 0\n1 0 0  # second point\n0 1 0\n#\n");
  auto points = readSection(c.file("sec1.dat"));
  ASSERT_EQ(points.size(), 3u);
  EXPECT_DOUBLE_EQ(points[1][0], 1);
  EXPECT_DOUBLE_EQ(points[2][1], 1);

  c.writeText("sec2.dat", "# only a header\n");
  EXPECT_THROW(readSection(c.file("sec2.dat")), DataFormatError);
}

TEST(SectionIndex, TooManyDigits) {
  EXPECT_EQ(sectionIndex("sec0007.dat"), 7u);
  EXPECT_EQ(sectionIndex("sec1234567890123456789.dat"), 1234567890123456789u);
  EXPECT_THROW(sectionIndex("sec99999999999999999999.dat"), DataFormatError);
}

TEST(FindSections, LongNumbersKeepOrder) {
  TempCase c;
  for (auto name : { "sec99999999999999999999.dat", "sec100.dat", "sec007.dat",
                     "sec100000000000000000000.dat" })
    c.writeText(name, "0 0 0\n");
  auto sections = findSections(c.dir());
  ASSERT_EQ(sections.size(), 4u);
  EXPECT_EQ(sections[0], c.file("sec007.dat"));
  EXPECT_EQ(sections[1], c.file("sec100.dat"));
  EXPECT_EQ(sections[2], c.file("sec99999999999999999999.dat"));
  EXPECT_EQ(sections[3], c.file("sec100000000000000000000.dat"));
}

TEST(FindSections, UnreadableDirectory) {
  TempCase c;
  c.writeText("sec1.dat", "0 0 0\n");
  std::filesystem::permissions(c.dir(), std::filesystem::perms::none);
  std::error_code ec;
  std::filesystem::directory_iterator listing(c.dir(), ec);
  if (!ec) {
    std::filesystem::permissions(c.dir(), std::filesystem::perms::owner_all);
    GTEST_SKIP() << "permissions are not enforced for this user";
  }
  EXPECT_THROW(findSections(c.dir()), SectionNotFoundError);
  std::filesystem::permissions(c.dir(), std::filesystem::perms::owner_all);
}

TEST(FindSections, NotADirectory) {
  TempCase c;
  c.writeText("sec1.dat", "0 0 0\n");
  EXPECT_THROW(findSections(c.file("sec1.dat")), SectionNotFoundError);
}
