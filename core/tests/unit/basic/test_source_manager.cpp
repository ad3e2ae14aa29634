#include <gtest/gtest.h>

#include "ts_decode/basic/source_manager.hpp"

using ts_decode::SourceLocation;
using ts_decode::SourceManager;
using ts_decode::SourceRange;

TEST(SourceLocation, OrdersByOffset)
{
  constexpr SourceLocation a(3);
  constexpr SourceLocation b(7);
  static_assert(a < b && a <= b && b > a && b >= a);
  EXPECT_TRUE(a >= SourceLocation(3));
  EXPECT_FALSE(a > SourceLocation(3));
}

TEST(SourceRange, ContainsNestedRanges)
{
  constexpr SourceRange outer(2, 10);
  static_assert(outer.contains(SourceRange(4, 6)));
  EXPECT_TRUE(outer.contains(outer));
  EXPECT_TRUE(outer.contains(SourceRange(10, 10)));
  EXPECT_FALSE(outer.contains(SourceRange(1, 5)));
  EXPECT_FALSE(outer.contains(SourceRange(5, 11)));
}

TEST(SourceManager, LineColumnAndSlices)
{
  const SourceManager sm("ab\ncd\n");
  EXPECT_EQ(sm.get_line_column(0).line, 1u);
  EXPECT_EQ(sm.get_line_column(4).line, 2u);
  EXPECT_EQ(sm.get_line_column(4).column, 2u);
  EXPECT_EQ(sm.get_line(1), "cd");
  EXPECT_EQ(sm.get_source_slice(SourceRange(3, 100)), "cd\n");
  EXPECT_TRUE(sm.get_source_slice(SourceRange()).empty());
}
