#include <gtest/gtest.h>

#include <string>

#include "bff/basic/source_manager.hpp"

using bff::FileId;
using bff::Position;
using bff::SourceFile;
using bff::SourceRange;
using bff::SourceRegistry;

TEST(BasicSourceFile, OffsetsAndPositions)
{
  const SourceFile file("/p/a.bff", "file:///p/a.bff", ".A = 1\n.B = 2\r\n.C");

  EXPECT_EQ(file.get_line_count(), 3U);
  EXPECT_EQ(file.get_position(0), (Position{0, 0}));
  EXPECT_EQ(file.get_position(7), (Position{1, 0}));
  EXPECT_EQ(file.get_position(16), (Position{2, 1}));

  EXPECT_EQ(file.get_offset(Position{1, 3}), 10U);
  // Characters past the end of the line clamp to it.
  EXPECT_EQ(file.get_offset(Position{0, 99}), 6U);
  EXPECT_EQ(file.get_offset(Position{9, 0}), 17U);

  EXPECT_EQ(file.get_line(1), ".B = 2");
  EXPECT_EQ(file.get_line(2), ".C");
}

TEST(BasicSourceRegistry, RegistersFilesByUri)
{
  SourceRegistry sources;
  const FileId a = sources.register_file("file:///p/a.bff", ".A = 1\n");
  const FileId b = sources.register_file("file:///p/b.bff", ".B = 'x'\n");
  EXPECT_NE(a, b);
  EXPECT_EQ(sources.register_file("file:///p/a.bff", ".A = 1\n"), a);
  EXPECT_EQ(sources.size(), 2U);

  EXPECT_EQ(sources.find_by_uri("file:///p/b.bff").value_or(FileId::invalid()), b);
  EXPECT_FALSE(sources.find_by_uri("file:///p/c.bff").has_value());
  EXPECT_EQ(sources.get_path(a).string(), "/p/a.bff");
}

TEST(BasicSourceRegistry, ConvertsRangesToEditorRanges)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("file:///p/a.bff", ".A = 1\n.Bee = 'x'\n");
  const SourceRange range(id, 7, 11);

  EXPECT_EQ(sources.get_slice(range), ".Bee");
  const bff::FileRange file_range = sources.to_file_range(range);
  EXPECT_EQ(file_range.uri, "file:///p/a.bff");
  EXPECT_EQ(file_range.start, (Position{1, 0}));
  EXPECT_EQ(file_range.end, (Position{1, 4}));

  EXPECT_TRUE(file_range.contains(Position{1, 2}));
  EXPECT_FALSE(file_range.contains(Position{1, 4}));
}

TEST(BasicSourceRegistry, UpdateReplacesTheLineTable)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("file:///p/a.bff", "one line");
  sources.update_content(id, "two\nlines");
  EXPECT_EQ(sources.get_file(id)->get_line_count(), 2U);
  EXPECT_EQ(sources.get_slice(SourceRange(id, 4, 9)), "lines");
}

TEST(BasicSourceRange, JoinSpansBothRanges)
{
  const FileId id{0};
  const SourceRange joined = bff::join_ranges(SourceRange(id, 2, 4), SourceRange(id, 8, 12));
  EXPECT_EQ(joined, SourceRange(id, 2, 12));
  EXPECT_EQ(joined.size(), 10U);
  EXPECT_TRUE(SourceRange().is_invalid());
}
