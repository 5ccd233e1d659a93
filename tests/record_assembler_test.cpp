#include <erlflow/contiguous_clause_grouper.h>
#include <erlflow/deadline.h>
#include <erlflow/erlang_parser.h>
#include <erlflow/graph_code_record_assembler.h>
#include <erlflow/variable_flow_analyzer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace erlflow {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class RecordAssemblerTest : public ::testing::Test {
protected:
  void Load(const std::string &content) {
    file_.path = "/work/repo/src/calc.erl";
    file_.relative_path = "src/calc.erl";
    file_.content = content;
    tree_ = ErlangParser().Parse(file_, Deadline::Unbounded());
    groups_ = ContiguousClauseGrouper().Group(tree_).groups;
  }

  TrainingRecord AssembleGroup(std::size_t index,
                               std::string docstring = "") const {
    const auto &group = groups_.at(index);
    const auto graph = VariableFlowAnalyzer().Analyze(group, config_.flow,
                                                      Deadline::Unbounded());
    return GraphCodeRecordAssembler().Assemble(file_, tree_, group, graph,
                                               std::move(docstring), config_);
  }

  SourceFile file_;
  SyntaxTree tree_;
  std::vector<ClauseGroup> groups_;
  CorpusConfig config_;
};

TEST_F(RecordAssemblerTest, RemapsEdgesOntoGroupTokens) {
  Load("-module(calc).\n"
       "max(A, B) when A > B -> A;\n"
       "max(_, B) -> B.\n");

  const auto record = AssembleGroup(0);

  EXPECT_EQ(record.idx, "src/calc.erl:max/2");
  EXPECT_EQ(record.url, "src/calc.erl#L2-L3");
  EXPECT_EQ(record.code, "max(A, B) when A > B -> A;\nmax(_, B) -> B.");
  ASSERT_EQ(record.code_tokens.size(), 22u);
  EXPECT_EQ(record.code_tokens.front(), "max");
  EXPECT_EQ(record.code_tokens.back(), ".");
  EXPECT_THAT(record.dfg, ElementsAre(TokenEdge{2, 7}, TokenEdge{2, 11},
                                      TokenEdge{4, 9}, TokenEdge{17, 20}));
  EXPECT_TRUE(record.emit_approximate);
  EXPECT_THAT(record.dfg_approximate, IsEmpty());
  EXPECT_EQ(GroupLineSpan(tree_, groups_[0]), 2u);
}

TEST_F(RecordAssemblerTest, EveryEdgeIndexesIntoCodeTokens) {
  Load("-module(calc).\n"
       "sum([], Acc) -> Acc;\n"
       "sum([H | T], Acc) ->\n"
       "  Next = Acc + H,\n"
       "  sum(T, Next).\n"
       "first({pair, A, _}) -> A.\n");

  for (std::size_t i = 0; i < groups_.size(); ++i) {
    const auto record = AssembleGroup(i);
    for (const auto &[source, target] : record.dfg) {
      EXPECT_LT(source, record.code_tokens.size());
      EXPECT_LT(target, record.code_tokens.size());
    }
    for (const auto &[source, target] : record.dfg_approximate) {
      EXPECT_LT(source, record.code_tokens.size());
      EXPECT_LT(target, record.code_tokens.size());
    }
  }
  EXPECT_FALSE(AssembleGroup(0).dfg_approximate.empty());
}

TEST_F(RecordAssemblerTest, PrefixesConfiguredSourceUrlAndKeepsDocstring) {
  Load("-module(calc).\nid(X) -> X.\n");
  config_.source_url = "https://example.com/repo/blob/main";

  const auto record = AssembleGroup(0, "Returns its argument.");

  EXPECT_EQ(record.url,
            "https://example.com/repo/blob/main/src/calc.erl#L2-L2");
  EXPECT_EQ(record.docstring, "Returns its argument.");
}

TEST_F(RecordAssemblerTest, OmitsApproximateEdgesWhenDisabled) {
  Load("-module(calc).\nloop(N) -> loop(N).\n");
  config_.flow.include_recursive_edges = false;

  const auto record = AssembleGroup(0);

  EXPECT_FALSE(record.emit_approximate);
  EXPECT_THAT(record.dfg_approximate, IsEmpty());
}

TEST_F(RecordAssemblerTest, RejectsEmptyClauseGroup) {
  Load("-module(calc).\nid(X) -> X.\n");
  ClauseGroup empty = groups_[0];
  empty.clauses.clear();

  EXPECT_THROW(GraphCodeRecordAssembler().Assemble(file_, tree_, empty, {}, "",
                                                   config_),
               EmptyClauseGroupError);
}

TEST_F(RecordAssemblerTest, RejectsEdgeOutsideCodeTokens) {
  Load("-module(calc).\nid(X) -> X.\n");
  FlowGraph graph;
  VariableOccurrence inside;
  inside.name = "X";
  inside.token_index = groups_[0].first_token + 2;
  VariableOccurrence outside;
  outside.name = "Y";
  outside.token_index = 0;
  graph.occurrences = {inside, outside};
  graph.edges.push_back(FlowEdge{0, 1, EdgeKind::kBody});

  EXPECT_THROW(GraphCodeRecordAssembler().Assemble(file_, tree_, groups_[0],
                                                   graph, "", config_),
               RecordValidationError);
}

} // namespace
} // namespace erlflow
