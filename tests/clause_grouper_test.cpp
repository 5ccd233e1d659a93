#include <erlflow/contiguous_clause_grouper.h>
#include <erlflow/deadline.h>
#include <erlflow/erlang_parser.h>

#include <gtest/gtest.h>

#include <string>

namespace erlflow {
namespace {

GroupingResult GroupSource(const std::string &content) {
  SourceFile file;
  file.path = "src/shapes.erl";
  file.relative_path = "src/shapes.erl";
  file.content = content;
  const auto tree = ErlangParser().Parse(file, Deadline::Unbounded());
  return ContiguousClauseGrouper().Group(tree);
}

TEST(ContiguousClauseGrouperTest, GroupsClausesByNameAndArity) {
  const auto result = GroupSource("-module(shapes).\n"
                                  "area({square, S}) -> S * S;\n"
                                  "area({circle, R}) -> 3.14 * R * R.\n"
                                  "area(W, H) -> W * H.\n");

  ASSERT_EQ(result.groups.size(), 2u);
  EXPECT_TRUE(result.rejected.empty());
  EXPECT_EQ(result.groups[0].id.ToString(), "shapes:area/1");
  EXPECT_EQ(result.groups[0].clauses.size(), 2u);
  EXPECT_EQ(result.groups[1].id.ToString(), "shapes:area/2");
  EXPECT_EQ(result.groups[1].clauses.size(), 1u);
}

TEST(ContiguousClauseGrouperTest, GroupSpansFirstClauseToFinalTerminator) {
  const auto result = GroupSource("-module(m).\n"
                                  "f(0) -> zero;\n"
                                  "f(_) -> other.\n");

  ASSERT_EQ(result.groups.size(), 1u);
  const auto &group = result.groups[0];
  EXPECT_EQ(group.first_token, group.clauses.front().first_token);
  EXPECT_EQ(group.last_token, group.clauses.back().terminator_token);
}

TEST(ContiguousClauseGrouperTest, PreservesSourceOrderOfGroups) {
  const auto result = GroupSource("-module(m).\n"
                                  "c() -> 3.\n"
                                  "a() -> 1.\n"
                                  "b() -> 2.\n");

  ASSERT_EQ(result.groups.size(), 3u);
  EXPECT_EQ(result.groups[0].id.name, "c");
  EXPECT_EQ(result.groups[1].id.name, "a");
  EXPECT_EQ(result.groups[2].id.name, "b");
}

TEST(ContiguousClauseGrouperTest, RejectsInterruptedFunctionAndKeepsOthers) {
  const auto result = GroupSource("-module(m).\n"
                                  "f(1) -> one.\n"
                                  "g() -> ok.\n"
                                  "f(2) -> two.\n"
                                  "h() -> done.\n");

  ASSERT_EQ(result.rejected.size(), 1u);
  const auto &error = result.rejected[0];
  EXPECT_EQ(error.Function(), "f");
  EXPECT_EQ(error.Arity(), 1u);
  EXPECT_EQ(error.FirstLine(), 2u);
  EXPECT_EQ(error.RepeatLine(), 4u);
  EXPECT_EQ(error.Kind(), ErrorKind::kNonContiguousClause);

  ASSERT_EQ(result.groups.size(), 2u);
  EXPECT_EQ(result.groups[0].id.name, "g");
  EXPECT_EQ(result.groups[1].id.name, "h");
}

TEST(ContiguousClauseGrouperTest, ReportsEachInterruptedFunctionOnce) {
  const auto result = GroupSource("-module(m).\n"
                                  "f(1) -> one.\n"
                                  "g() -> ok.\n"
                                  "f(2) -> two.\n"
                                  "g2() -> ok.\n"
                                  "f(3) -> three.\n");

  ASSERT_EQ(result.rejected.size(), 1u);
  EXPECT_EQ(result.groups.size(), 2u);
}

TEST(ContiguousClauseGrouperTest, SameNameWithDifferentArityIsIndependent) {
  const auto result = GroupSource("-module(m).\n"
                                  "f(A) -> A.\n"
                                  "f(A, B) -> {A, B}.\n"
                                  "f(A, B, C) -> {A, B, C}.\n");

  EXPECT_TRUE(result.rejected.empty());
  EXPECT_EQ(result.groups.size(), 3u);
}

} // namespace
} // namespace erlflow
