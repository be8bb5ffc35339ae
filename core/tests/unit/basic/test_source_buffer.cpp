// test_source_buffer.cpp - Script buffers, positions and ranges
//
#include <gtest/gtest.h>

#include <string>

#include "gdparse/basic/source_buffer.hpp"

namespace gdparse
{

TEST(SourceBuffer, PositionsAreOneBased)
{
  const ScriptBuffer script("a.gd", "var a\n  pass\n\nend");
  EXPECT_EQ(script.line_count(), 4U);

  auto pos = script.position(0);
  EXPECT_EQ(pos.line, 1U);
  EXPECT_EQ(pos.column, 1U);

  pos = script.position(8);  // 'p'
  EXPECT_EQ(pos.line, 2U);
  EXPECT_EQ(pos.column, 3U);

  pos = script.position(13);  // the blank line
  EXPECT_EQ(pos.line, 3U);
  EXPECT_EQ(pos.column, 1U);

  // Past the end clamps to just after "end"
  pos = script.position(1000);
  EXPECT_EQ(pos.line, 4U);
  EXPECT_EQ(pos.column, 4U);
}

TEST(SourceBuffer, EmptyScriptHasOneLine)
{
  const ScriptBuffer script("empty.gd", "");
  EXPECT_EQ(script.line_count(), 1U);
  EXPECT_EQ(script.position(0).line, 1U);
  EXPECT_EQ(script.line(1), "");
}

TEST(SourceBuffer, LinesDropTheirTerminator)
{
  const ScriptBuffer script("a.gd", "one\r\ntwo\nthree");
  EXPECT_EQ(script.line(1), "one");
  EXPECT_EQ(script.line(2), "two");
  EXPECT_EQ(script.line(3), "three");
  EXPECT_EQ(script.line(0), "");
  EXPECT_EQ(script.line(4), "");
}

TEST(SourceBuffer, SliceByRange)
{
  SourceBuffers sources;
  const FileId id = sources.add("a.gd", "func f():\n    pass\n");
  ASSERT_TRUE(id.is_valid());

  const SourceRange pass_range(id, 14, 18);
  EXPECT_EQ(sources.slice(pass_range), "pass");

  const auto pos = sources.position(pass_range.get_begin());
  EXPECT_EQ(pos.line, 2U);
  EXPECT_EQ(pos.column, 5U);

  // Ends past the text are cut at the end
  EXPECT_EQ(sources.slice(SourceRange(id, 14, 500)), "pass\n");
  EXPECT_EQ(sources.slice(SourceRange{}), "");
  EXPECT_FALSE(sources.position(SourceLocation{}).is_valid());
}

TEST(SourceBuffer, EveryAddGetsItsOwnId)
{
  SourceBuffers sources;
  const FileId first = sources.add("a.gd", "first");
  const FileId second = sources.add("a.gd", "second");
  EXPECT_NE(first, second);
  EXPECT_EQ(sources.size(), 2U);
  EXPECT_EQ(sources.get(first)->text(), "first");
  EXPECT_EQ(sources.get(second)->text(), "second");
  EXPECT_EQ(sources.get(second)->path(), "a.gd");
}

TEST(SourceBuffer, ViewsSurviveLaterAdds)
{
  SourceBuffers sources;
  const FileId id = sources.add("a.gd", "extends Node");
  const std::string_view text = sources.get(id)->text();

  for (int i = 0; i < 64; ++i) {
    (void)sources.add("f" + std::to_string(i) + ".gd", std::string(128, 'x'));
  }
  EXPECT_EQ(text, "extends Node");
  EXPECT_EQ(text.data(), sources.get(id)->text().data());
}

TEST(SourceBuffer, UnknownIds)
{
  SourceBuffers sources;
  EXPECT_EQ(sources.get(FileId::invalid()), nullptr);
  EXPECT_EQ(sources.get(FileId{3}), nullptr);
  EXPECT_EQ(sources.slice(SourceRange(FileId{3}, 0, 1)), "");
}

TEST(SourceBuffer, JoinRanges)
{
  const FileId id{0};
  const SourceRange a(id, 2, 5);
  const SourceRange b(id, 8, 12);

  const SourceRange joined = join_ranges(a, b);
  EXPECT_EQ(joined.get_begin().offset(), 2U);
  EXPECT_EQ(joined.get_end().offset(), 12U);

  EXPECT_EQ(join_ranges(SourceRange{}, b).get_begin().offset(), 8U);
  EXPECT_EQ(join_ranges(a, SourceRange{}).get_end().offset(), 5U);
  EXPECT_TRUE(join_ranges(SourceRange{}, SourceRange{}).is_invalid());
}

}  // namespace gdparse
