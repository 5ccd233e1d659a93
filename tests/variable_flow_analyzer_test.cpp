#include <erlflow/contiguous_clause_grouper.h>
#include <erlflow/deadline.h>
#include <erlflow/erlang_parser.h>
#include <erlflow/errors.h>
#include <erlflow/variable_flow_analyzer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace erlflow {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using Edge = std::pair<std::size_t, std::size_t>;

struct Analyzed {
  SyntaxTree tree;
  FlowGraph graph;
};

Analyzed AnalyzeSource(const std::string &content, FlowOptions options = {}) {
  SourceFile file;
  file.path = "src/flow.erl";
  file.relative_path = "src/flow.erl";
  file.content = "-module(flow).\n" + content;
  Analyzed result;
  result.tree = ErlangParser().Parse(file, Deadline::Unbounded());
  const auto grouping = ContiguousClauseGrouper().Group(result.tree);
  EXPECT_EQ(grouping.groups.size(), 1u);
  result.graph = VariableFlowAnalyzer().Analyze(grouping.groups.at(0), options,
                                                Deadline::Unbounded());
  return result;
}

std::vector<Edge> Pairs(const std::vector<FlowEdge> &edges) {
  std::vector<Edge> pairs;
  for (const auto &edge : edges) {
    pairs.emplace_back(edge.source, edge.target);
  }
  return pairs;
}

std::vector<std::string> Names(const FlowGraph &graph) {
  std::vector<std::string> names;
  for (const auto &occurrence : graph.occurrences) {
    names.push_back(occurrence.name);
  }
  return names;
}

TEST(VariableFlowAnalyzerTest, GuardedMaxKeepsClausesIndependent) {
  const auto result =
      AnalyzeSource("max(A, B) when A > B -> A; max(A, B) -> B.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph),
              ElementsAre("A", "B", "A", "B", "A", "A", "B", "B"));
  EXPECT_EQ(graph.occurrences[0].role, OccurrenceRole::kBoundInPattern);
  EXPECT_EQ(graph.occurrences[2].role, OccurrenceRole::kReadInGuard);
  EXPECT_EQ(graph.occurrences[4].role, OccurrenceRole::kReadInBody);
  EXPECT_EQ(graph.occurrences[5].clause_index, 1u);
  EXPECT_EQ(result.tree.tokens[graph.occurrences[0].token_index].text, "A");

  EXPECT_THAT(Pairs(graph.edges),
              ElementsAre(Edge{0, 2}, Edge{0, 4}, Edge{1, 3}, Edge{6, 7}));
  EXPECT_EQ(graph.edges[0].kind, EdgeKind::kGuard);
  EXPECT_EQ(graph.edges[1].kind, EdgeKind::kBody);
  EXPECT_THAT(graph.scope_errors, IsEmpty());
}

TEST(VariableFlowAnalyzerTest, WildcardAndLiteralParametersBindNothing) {
  const auto result = AnalyzeSource(
      "divide(A, B) when B =/= 0 -> A / B; divide(_, 0) -> error.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph), ElementsAre("A", "B", "B", "A", "B"));
  EXPECT_TRUE(std::none_of(graph.occurrences.begin(), graph.occurrences.end(),
                           [](const VariableOccurrence &occurrence) {
                             return occurrence.clause_index == 1;
                           }));
  EXPECT_THAT(Pairs(graph.edges),
              ElementsAre(Edge{0, 3}, Edge{1, 2}, Edge{1, 4}));
}

TEST(VariableFlowAnalyzerTest, TuplePatternDestructuresFromMatchInput) {
  const auto result =
      AnalyzeSource("handle({update, NewState}) -> NewState.\n");
  const auto &graph = result.graph;

  ASSERT_EQ(graph.occurrences.size(), 3u);
  EXPECT_EQ(graph.occurrences[0].role, OccurrenceRole::kMatchInput);
  EXPECT_TRUE(graph.occurrences[0].synthetic);
  EXPECT_EQ(result.tree.tokens[graph.occurrences[0].token_index].text, "{");
  EXPECT_EQ(graph.occurrences[1].name, "NewState");
  EXPECT_EQ(graph.occurrences[1].role, OccurrenceRole::kBoundInPattern);

  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{0, 1}, Edge{1, 2}));
  EXPECT_EQ(graph.edges[0].kind, EdgeKind::kDestructure);
}

TEST(VariableFlowAnalyzerTest, ReceiveBranchesAreScopedToTheirBodies) {
  const auto result = AnalyzeSource("loop(S) ->\n"
                                    "  receive\n"
                                    "    {a, X} -> X;\n"
                                    "    {b, Y} -> Y\n"
                                    "  end.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph),
              ElementsAre("S", "<tuple>", "X", "X", "<tuple>", "Y", "Y"));
  EXPECT_EQ(graph.occurrences[2].role, OccurrenceRole::kReceivedInPattern);
  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{1, 2}, Edge{2, 3},
                                              Edge{4, 5}, Edge{5, 6}));
}

TEST(VariableFlowAnalyzerTest, ReadOfOtherBranchBindingIsScopeError) {
  const auto result = AnalyzeSource("loop() ->\n"
                                    "  receive\n"
                                    "    {a, X} -> X;\n"
                                    "    {b, _} -> X\n"
                                    "  end.\n");
  const auto &graph = result.graph;

  ASSERT_EQ(graph.scope_errors.size(), 1u);
  EXPECT_EQ(graph.scope_errors[0].variable, "X");
  EXPECT_FALSE(graph.scope_errors[0].in_guard);
  EXPECT_EQ(result.tree.tokens[graph.scope_errors[0].token_index].line, 5u);
}

TEST(VariableFlowAnalyzerTest, UnboundGuardReadIsRecordedAndSkipped) {
  const auto result = AnalyzeSource("f(A) when B > 0 -> A.\n");
  const auto &graph = result.graph;

  ASSERT_EQ(graph.scope_errors.size(), 1u);
  EXPECT_EQ(graph.scope_errors[0].variable, "B");
  EXPECT_TRUE(graph.scope_errors[0].in_guard);
  EXPECT_THAT(Names(graph), ElementsAre("A", "A"));
  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{0, 1}));
}

TEST(VariableFlowAnalyzerTest, BodyMatchDestructuresValueReads) {
  const auto result = AnalyzeSource("f(P) -> {ok, V} = P, V.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph), ElementsAre("P", "P", "<tuple>", "V", "V"));
  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{0, 1}, Edge{1, 2},
                                              Edge{2, 3}, Edge{3, 4}));
  EXPECT_EQ(graph.edges[1].kind, EdgeKind::kMatch);
}

TEST(VariableFlowAnalyzerTest, CaseBranchBindingsReachLaterReads) {
  const auto result = AnalyzeSource("f(A) ->\n"
                                    "  case A of\n"
                                    "    1 -> R = one;\n"
                                    "    _ -> R = other\n"
                                    "  end,\n"
                                    "  R.\n");

  EXPECT_THAT(Pairs(result.graph.edges),
              ElementsAre(Edge{0, 1}, Edge{2, 4}, Edge{3, 4}));
  EXPECT_THAT(result.graph.scope_errors, IsEmpty());
}

TEST(VariableFlowAnalyzerTest, FunParametersShadowOuterBindings) {
  const auto result =
      AnalyzeSource("f(X) -> F = fun(X) -> X end, F(X).\n");

  EXPECT_THAT(Names(result.graph),
              ElementsAre("X", "X", "X", "F", "F", "X"));
  EXPECT_THAT(Pairs(result.graph.edges),
              ElementsAre(Edge{0, 5}, Edge{1, 2}, Edge{3, 4}));
}

TEST(VariableFlowAnalyzerTest, LinksSendToSelfWithFollowingReceive) {
  const auto result = AnalyzeSource(
      "ping(X) -> self() ! {hello, X}, receive {hello, N} -> N end.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph), ElementsAre("X", "X", "<tuple>", "N", "N"));
  EXPECT_EQ(graph.occurrences[1].role, OccurrenceRole::kSentInMessage);
  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{0, 1}, Edge{1, 3},
                                              Edge{2, 3}, Edge{3, 4}));
  const auto message =
      std::find_if(graph.edges.begin(), graph.edges.end(),
                   [](const FlowEdge &edge) { return edge.source == 1; });
  ASSERT_NE(message, graph.edges.end());
  EXPECT_EQ(message->kind, EdgeKind::kMessage);
}

TEST(VariableFlowAnalyzerTest, FollowsSelfAliasAsSendDestination) {
  const auto result = AnalyzeSource("ping(X) ->\n"
                                    "  Me = self(),\n"
                                    "  Me ! {hello, X},\n"
                                    "  receive {hello, N} -> N end.\n");

  const auto edges = result.graph.edges;
  EXPECT_TRUE(std::any_of(edges.begin(), edges.end(), [](const FlowEdge &e) {
    return e.kind == EdgeKind::kMessage;
  }));
}

TEST(VariableFlowAnalyzerTest, SendToOtherProcessYieldsNoMessageEdge) {
  const auto result = AnalyzeSource(
      "call(Pid, X) -> Pid ! {msg, X}, receive {msg, Y} -> Y end.\n");

  const auto edges = result.graph.edges;
  EXPECT_TRUE(std::none_of(edges.begin(), edges.end(), [](const FlowEdge &e) {
    return e.kind == EdgeKind::kMessage;
  }));
}

TEST(VariableFlowAnalyzerTest, FollowsRegisteredNameAsSendDestination) {
  const auto result = AnalyzeSource("f(X) ->\n"
                                    "  register(me, self()),\n"
                                    "  me ! {m, X},\n"
                                    "  receive {m, Y} -> Y end.\n");
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph), ElementsAre("X", "X", "<tuple>", "Y", "Y"));
  EXPECT_THAT(Pairs(graph.edges), ElementsAre(Edge{0, 1}, Edge{1, 3},
                                              Edge{2, 3}, Edge{3, 4}));
  EXPECT_EQ(graph.edges[1].kind, EdgeKind::kMessage);
  EXPECT_FALSE(graph.edges[1].Approximate());
}

TEST(VariableFlowAnalyzerTest, SendAfterReceiveInSameClauseIsNotLinked) {
  const auto result = AnalyzeSource(
      "f(X) -> receive {m, Y} -> Y end, self() ! {m, X}.\n");

  const auto edges = result.graph.edges;
  EXPECT_TRUE(std::none_of(edges.begin(), edges.end(), [](const FlowEdge &e) {
    return e.kind == EdgeKind::kMessage;
  }));
}

TEST(VariableFlowAnalyzerTest, LinksSendInOtherClauseAsApproximate) {
  const auto source = "loop(init, X) -> self() ! {tick, X}, loop(run, X);\n"
                      "loop(run, _) -> receive {tick, N} -> N end.\n";
  const auto result = AnalyzeSource(source);
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph), ElementsAre("X", "X", "X", "<tuple>", "N", "N"));
  EXPECT_EQ(graph.occurrences[4].clause_index, 1u);
  EXPECT_THAT(Pairs(graph.ExactEdges()), ElementsAre(Edge{0, 1}, Edge{0, 2},
                                                     Edge{3, 4}, Edge{4, 5}));
  const auto approximate = graph.ApproximateEdges();
  EXPECT_THAT(Pairs(approximate), ElementsAre(Edge{1, 4}));
  ASSERT_EQ(approximate.size(), 1u);
  EXPECT_EQ(approximate[0].kind, EdgeKind::kMessage);

  FlowOptions exact_only;
  exact_only.include_recursive_edges = false;
  const auto without = AnalyzeSource(source, exact_only);
  EXPECT_THAT(without.graph.ApproximateEdges(), IsEmpty());
  EXPECT_EQ(Pairs(without.graph.edges), Pairs(graph.ExactEdges()));
}

TEST(VariableFlowAnalyzerTest, RecursiveCallsYieldApproximateEdges) {
  const auto source = "count([], N) -> N;\n"
                      "count([_ | T], N) -> count(T, N + 1).\n";
  const auto result = AnalyzeSource(source);
  const auto &graph = result.graph;

  EXPECT_THAT(Names(graph),
              ElementsAre("N", "N", "<list>", "T", "N", "T", "N"));
  EXPECT_THAT(Pairs(graph.ExactEdges()), ElementsAre(Edge{0, 1}, Edge{2, 3},
                                                     Edge{3, 5}, Edge{4, 6}));
  EXPECT_THAT(Pairs(graph.ApproximateEdges()),
              ElementsAre(Edge{5, 2}, Edge{6, 0}, Edge{6, 4}));
  for (const auto &edge : graph.ApproximateEdges()) {
    EXPECT_EQ(edge.kind, EdgeKind::kRecursiveCall);
  }

  FlowOptions exact_only;
  exact_only.include_recursive_edges = false;
  const auto without = AnalyzeSource(source, exact_only);
  EXPECT_THAT(without.graph.ApproximateEdges(), IsEmpty());
  EXPECT_EQ(Pairs(without.graph.edges), Pairs(graph.ExactEdges()));
}

TEST(VariableFlowAnalyzerTest, RecursiveEdgesSkipIncompatibleClauses) {
  const auto result = AnalyzeSource("run({done, R}) -> R;\n"
                                    "run({next, V}) -> run({done, V}).\n");

  EXPECT_THAT(Pairs(result.graph.ApproximateEdges()),
              ElementsAre(Edge{5, 1}));
}

TEST(VariableFlowAnalyzerTest, EdgesAreTotallyOrdered) {
  const auto result = AnalyzeSource(
      "f(#{a := A, b := B}, [H | T]) when is_list(T) ->\n"
      "  <<X:8, _/binary>> = A,\n"
      "  [Y * H || Y <- T, Y > B],\n"
      "  f(#{a => X, b => B}, T).\n");
  const auto &edges = result.graph.edges;

  EXPECT_TRUE(std::is_sorted(edges.begin(), edges.end(),
                             [](const FlowEdge &left, const FlowEdge &right) {
                               return std::make_pair(left.source,
                                                     left.target) <
                                      std::make_pair(right.source,
                                                     right.target);
                             }));
  EXPECT_THAT(result.graph.scope_errors, IsEmpty());
  for (const auto &edge : edges) {
    EXPECT_NE(edge.source, edge.target);
  }
}

TEST(VariableFlowAnalyzerTest, RejectsTreesNestedBeyondLimit) {
  SyntaxNode value;
  value.kind = NodeKind::kInteger;
  value.text = "1";
  for (std::size_t i = 0; i < kMaxNestingDepth + 500; ++i) {
    SyntaxNode tuple;
    tuple.kind = NodeKind::kTuple;
    tuple.children.push_back(std::move(value));
    value = std::move(tuple);
  }
  Clause clause;
  clause.body.push_back(std::move(value));
  ClauseGroup group;
  group.id = {"flow", "f", 0};
  group.clauses.push_back(std::move(clause));

  EXPECT_THROW(VariableFlowAnalyzer().Analyze(group, {}, Deadline::Unbounded()),
               NestingDepthError);
}

TEST(VariableFlowAnalyzerTest, NamesRolesAndEdgeKinds) {
  EXPECT_EQ(OccurrenceRoleName(OccurrenceRole::kSentInMessage),
            "sent-in-message");
  EXPECT_EQ(OccurrenceRoleName(OccurrenceRole::kMatchInput), "match-input");
  EXPECT_EQ(EdgeKindName(EdgeKind::kMessage), "message");
  EXPECT_EQ(EdgeKindName(EdgeKind::kRecursiveCall), "recursive-call");
}

TEST(VariableFlowAnalyzerTest, ExpiredDeadlineRaisesTimeout) {
  SourceFile file;
  file.path = "slow.erl";
  file.content = "f(X) -> X.\n";
  const auto tree = ErlangParser().Parse(file, Deadline::Unbounded());
  const auto grouping = ContiguousClauseGrouper().Group(tree);
  const Deadline deadline(std::chrono::milliseconds(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  EXPECT_THROW(VariableFlowAnalyzer().Analyze(grouping.groups.at(0), {},
                                              deadline),
               FileTimeoutError);
}

} // namespace
} // namespace erlflow
