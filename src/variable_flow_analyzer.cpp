#include <erlflow/variable_flow_analyzer.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace erlflow {
namespace {

// Reaching bindings per variable name. Several bindings reach a read after a
// branching expression that binds the name in more than one branch.
using Scope = std::map<std::string, std::set<std::size_t>>;

struct ReadContext {
  OccurrenceRole role = OccurrenceRole::kReadInBody;
  EdgeKind edge = EdgeKind::kBody;
  bool in_guard = false;
};

const ReadContext kBodyRead{};
const ReadContext kGuardRead{OccurrenceRole::kReadInGuard, EdgeKind::kGuard,
                             true};

struct PatternContext {
  OccurrenceRole role = OccurrenceRole::kBoundInPattern;
  // Fun heads and generator patterns introduce fresh variables even when the
  // name is already bound outside.
  bool shadow = false;
  std::set<std::string> fresh;
};

struct CallSite {
  std::vector<const SyntaxNode *> arguments;
};

struct SendSite {
  const SyntaxNode *message = nullptr;
  std::size_t clause_index = 0;
  std::size_t rank = 0;
};

struct ReceiveSite {
  const SyntaxNode *pattern = nullptr;
  std::size_t clause_index = 0;
  std::size_t rank = 0;
};

bool IsLiteral(const SyntaxNode &node) {
  switch (node.kind) {
  case NodeKind::kAtom:
  case NodeKind::kInteger:
  case NodeKind::kFloat:
  case NodeKind::kChar:
  case NodeKind::kString:
    return true;
  default:
    return false;
  }
}

bool IsSelfCall(const SyntaxNode &node) {
  return node.kind == NodeKind::kCall && node.children.size() == 1 &&
         node.children[0].kind == NodeKind::kAtom &&
         node.children[0].text == "self";
}

// Whether a value shaped like `expr` could match `pattern`. Only literal
// mismatches and structural size mismatches rule a clause out.
bool Compatible(const SyntaxNode &expr, const SyntaxNode &pattern) {
  if (pattern.kind == NodeKind::kMatch && pattern.children.size() == 2) {
    return Compatible(expr, pattern.children[0]) &&
           Compatible(expr, pattern.children[1]);
  }
  if (pattern.kind == NodeKind::kVariable ||
      pattern.kind == NodeKind::kWildcard) {
    return true;
  }
  if (IsLiteral(pattern)) {
    if (IsLiteral(expr)) {
      return expr.kind == pattern.kind && expr.text == pattern.text;
    }
    return !(expr.kind == NodeKind::kTuple || expr.kind == NodeKind::kList ||
             expr.kind == NodeKind::kMap || expr.kind == NodeKind::kBinary);
  }
  if (pattern.kind == NodeKind::kTuple) {
    if (expr.kind == NodeKind::kTuple) {
      if (expr.children.size() != pattern.children.size()) {
        return false;
      }
      for (std::size_t i = 0; i < expr.children.size(); ++i) {
        if (!Compatible(expr.children[i], pattern.children[i])) {
          return false;
        }
      }
      return true;
    }
    return !IsLiteral(expr) && expr.kind != NodeKind::kList;
  }
  if (pattern.kind == NodeKind::kList) {
    if (IsLiteral(expr) && expr.kind != NodeKind::kString) {
      return false;
    }
    if (expr.kind == NodeKind::kList) {
      const bool expr_empty = expr.children.empty();
      const bool pattern_empty = pattern.children.empty();
      if (expr_empty != pattern_empty) {
        return false;
      }
    }
    return expr.kind != NodeKind::kTuple;
  }
  return true;
}

class GroupAnalysis {
public:
  GroupAnalysis(const ClauseGroup &group, const FlowOptions &options,
                const Deadline &deadline)
      : group_(group), options_(options), deadline_(deadline) {}

  FlowGraph Run() {
    for (std::size_t index = 0; index < group_.clauses.size(); ++index) {
      deadline_.Check("flow analysis");
      clause_index_ = index;
      AnalyzeClause(group_.clauses[index]);
    }
    LinkMessages();
    if (options_.include_recursive_edges) {
      LinkRecursiveCalls();
    }
    SortAndDeduplicateEdges(graph_.edges);
    return std::move(graph_);
  }

private:
  void AnalyzeClause(const Clause &clause) {
    Scope scope;
    self_aliases_.clear();
    registered_self_.clear();

    PatternContext parameters;
    for (const auto &pattern : clause.patterns) {
      Bind(pattern, scope, parameters, std::nullopt);
    }
    AnalyzeGuards(clause.guards, scope);
    for (const auto &expr : clause.body) {
      Expr(expr, scope, kBodyRead, nullptr);
    }
  }

  void AnalyzeGuards(const GuardSequence &guards, Scope &scope) {
    for (const auto &alternative : guards) {
      for (const auto &test : alternative) {
        Expr(test, scope, kGuardRead, nullptr);
      }
    }
  }

  std::size_t AddOccurrence(std::string name, OccurrenceRole role,
                            std::size_t token, bool synthetic = false) {
    VariableOccurrence occurrence;
    occurrence.name = std::move(name);
    occurrence.role = role;
    occurrence.clause_index = clause_index_;
    occurrence.token_index = token;
    occurrence.synthetic = synthetic;
    const auto index = graph_.occurrences.size();
    graph_.occurrences.push_back(std::move(occurrence));
    occurrence_at_token_[token] = index;
    return index;
  }

  void AddEdge(std::size_t source, std::size_t target, EdgeKind kind,
               bool approximate = false) {
    if (source == target) {
      return;
    }
    graph_.edges.push_back(FlowEdge{source, target, kind, approximate});
  }

  NestingGuard Descend() {
    if (depth_ >= kMaxNestingDepth) {
      throw NestingDepthError(group_.id.ToString(), kMaxNestingDepth);
    }
    return NestingGuard(depth_);
  }

  void Read(const SyntaxNode &node, const Scope &scope,
            const ReadContext &context, std::vector<std::size_t> *reads) {
    const auto binding = scope.find(node.text);
    if (binding == scope.end() || binding->second.empty()) {
      ScopeError error;
      error.variable = node.text;
      error.clause_index = clause_index_;
      error.token_index = node.token;
      error.in_guard = context.in_guard;
      graph_.scope_errors.push_back(std::move(error));
      return;
    }
    const auto occurrence = AddOccurrence(node.text, context.role, node.token);
    for (const auto source : binding->second) {
      AddEdge(source, occurrence, context.edge);
    }
    if (reads != nullptr) {
      reads->push_back(occurrence);
    }
  }

  // Patterns

  std::vector<std::size_t> Bind(const SyntaxNode &pattern, Scope &scope,
                                PatternContext &context,
                                std::optional<std::size_t> input) {
    const auto nesting = Descend();
    switch (pattern.kind) {
    case NodeKind::kVariable:
      return {BindVariable(pattern, scope, context, input)};
    case NodeKind::kMatch: {
      std::vector<std::size_t> entries;
      for (const auto &child : pattern.children) {
        const auto side = Bind(child, scope, context, input);
        entries.insert(entries.end(), side.begin(), side.end());
      }
      return entries;
    }
    case NodeKind::kBinaryOp:
      if (pattern.text == "++" && pattern.children.size() == 2) {
        return Bind(pattern.children[1], scope, context, input);
      }
      Expr(pattern, scope, kBodyRead, nullptr);
      return {};
    case NodeKind::kWildcard:
    case NodeKind::kAtom:
    case NodeKind::kInteger:
    case NodeKind::kFloat:
    case NodeKind::kChar:
    case NodeKind::kString:
    case NodeKind::kRecordIndex:
      return {};
    default:
      break;
    }

    if (!IsCompoundPattern(pattern)) {
      Expr(pattern, scope, kBodyRead, nullptr);
      return {};
    }

    const auto match_input =
        AddOccurrence("<" + NodeKindName(pattern.kind) + ">",
                      OccurrenceRole::kMatchInput, pattern.token, true);
    if (input) {
      AddEdge(*input, match_input, EdgeKind::kDestructure);
    }
    for (const auto &child : pattern.children) {
      BindElement(child, scope, context, match_input);
    }
    return {match_input};
  }

  void BindElement(const SyntaxNode &element, Scope &scope,
                   PatternContext &context, std::size_t input) {
    switch (element.kind) {
    case NodeKind::kBinaryElement:
      if (!element.children.empty()) {
        Bind(element.children[0], scope, context, input);
      }
      if (element.children.size() > 1) {
        Expr(element.children[1], scope, kBodyRead, nullptr);
      }
      return;
    case NodeKind::kMapField:
      if (element.children.size() == 2) {
        Expr(element.children[0], scope, kBodyRead, nullptr);
        Bind(element.children[1], scope, context, input);
      }
      return;
    case NodeKind::kRecordField:
      if (!element.children.empty()) {
        Bind(element.children[0], scope, context, input);
      }
      return;
    default:
      Bind(element, scope, context, input);
      return;
    }
  }

  std::size_t BindVariable(const SyntaxNode &node, Scope &scope,
                           PatternContext &context,
                           std::optional<std::size_t> input) {
    const bool already_bound =
        context.shadow ? context.fresh.count(node.text) > 0
                       : scope.count(node.text) > 0;
    if (already_bound) {
      // A bound variable in a pattern is an equality test on its value.
      const auto occurrence =
          AddOccurrence(node.text, OccurrenceRole::kReadInBody, node.token);
      for (const auto source : scope[node.text]) {
        AddEdge(source, occurrence, EdgeKind::kBody);
      }
      if (input) {
        AddEdge(*input, occurrence, EdgeKind::kDestructure);
      }
      return occurrence;
    }
    const auto occurrence = AddOccurrence(node.text, context.role, node.token);
    if (input) {
      AddEdge(*input, occurrence, EdgeKind::kDestructure);
    }
    scope[node.text] = {occurrence};
    context.fresh.insert(node.text);
    return occurrence;
  }

  // Expressions

  void Children(const SyntaxNode &node, Scope &scope,
                const ReadContext &context, std::vector<std::size_t> *reads) {
    for (const auto &child : node.children) {
      Expr(child, scope, context, reads);
    }
  }

  void Expr(const SyntaxNode &node, Scope &scope, const ReadContext &context,
            std::vector<std::size_t> *reads) {
    const auto nesting = Descend();
    switch (node.kind) {
    case NodeKind::kVariable:
      Read(node, scope, context, reads);
      return;
    case NodeKind::kWildcard:
    case NodeKind::kAtom:
    case NodeKind::kInteger:
    case NodeKind::kFloat:
    case NodeKind::kChar:
    case NodeKind::kString:
    case NodeKind::kRecordIndex:
      return;
    case NodeKind::kMatch:
      MatchExpr(node, scope, context, reads);
      return;
    case NodeKind::kSend:
      SendExpr(node, scope, context, reads);
      return;
    case NodeKind::kCall:
      CallExpr(node, scope, context, reads);
      return;
    case NodeKind::kCase:
      CaseExpr(node, scope, context);
      return;
    case NodeKind::kReceive:
      ReceiveExpr(node, scope, context);
      return;
    case NodeKind::kIf:
      IfExpr(node, scope);
      return;
    case NodeKind::kTry:
      TryExpr(node, scope, context);
      return;
    case NodeKind::kFun:
      FunExpr(node, scope);
      return;
    case NodeKind::kListComprehension:
    case NodeKind::kBinaryComprehension:
      ComprehensionExpr(node, scope, context, reads);
      return;
    case NodeKind::kCatch: {
      Scope local = scope;
      Children(node, local, context, reads);
      return;
    }
    default:
      Children(node, scope, context, reads);
      return;
    }
  }

  void MatchExpr(const SyntaxNode &node, Scope &scope,
                 const ReadContext &context, std::vector<std::size_t> *reads) {
    if (node.children.size() != 2) {
      Children(node, scope, context, reads);
      return;
    }
    const auto &pattern = node.children[0];
    const auto &value = node.children[1];

    std::vector<std::size_t> value_reads;
    Expr(value, scope, context, &value_reads);

    PatternContext binding;
    const auto entries = Bind(pattern, scope, binding, std::nullopt);
    for (const auto source : value_reads) {
      for (const auto target : entries) {
        AddEdge(source, target, EdgeKind::kMatch);
      }
    }
    if (pattern.kind == NodeKind::kVariable && IsSelfCall(value)) {
      self_aliases_.insert(pattern.text);
    }
    if (reads != nullptr) {
      reads->insert(reads->end(), value_reads.begin(), value_reads.end());
    }
  }

  // Only messages the analyzed process sends to itself can be received by
  // the same clause group.
  bool SendsToSelf(const SyntaxNode &destination) const {
    switch (destination.kind) {
    case NodeKind::kCall:
      return IsSelfCall(destination);
    case NodeKind::kVariable:
      return self_aliases_.count(destination.text) > 0;
    case NodeKind::kAtom:
      return registered_self_.count(destination.text) > 0;
    default:
      return false;
    }
  }

  void SendExpr(const SyntaxNode &node, Scope &scope,
                const ReadContext &context, std::vector<std::size_t> *reads) {
    if (node.children.size() != 2) {
      Children(node, scope, context, reads);
      return;
    }
    Expr(node.children[0], scope, context, reads);
    ReadContext message = context;
    message.role = OccurrenceRole::kSentInMessage;
    Expr(node.children[1], scope, message, reads);
    if (SendsToSelf(node.children[0])) {
      sends_.push_back(SendSite{&node.children[1], clause_index_,
                                graph_.occurrences.size()});
    }
  }

  bool IsRecursiveCall(const SyntaxNode &node) const {
    if (node.children.empty() ||
        node.children.size() - 1 != group_.id.arity) {
      return false;
    }
    const auto &callee = node.children[0];
    if (callee.kind == NodeKind::kAtom) {
      return callee.text == group_.id.name;
    }
    if (callee.kind == NodeKind::kRemote && callee.children.size() == 2) {
      const auto &module = callee.children[0];
      const auto &function = callee.children[1];
      const bool same_module =
          (module.kind == NodeKind::kAtom &&
           module.text == group_.id.module) ||
          (module.kind == NodeKind::kMacro && module.text == "?MODULE");
      return same_module && function.kind == NodeKind::kAtom &&
             function.text == group_.id.name;
    }
    return false;
  }

  void CallExpr(const SyntaxNode &node, Scope &scope,
                const ReadContext &context, std::vector<std::size_t> *reads) {
    Children(node, scope, context, reads);
    if (IsRecursiveCall(node)) {
      CallSite site;
      for (std::size_t i = 1; i < node.children.size(); ++i) {
        site.arguments.push_back(&node.children[i]);
      }
      calls_.push_back(std::move(site));
    }
    const bool registers_self =
        node.children.size() == 3 &&
        node.children[0].kind == NodeKind::kAtom &&
        node.children[0].text == "register" &&
        node.children[1].kind == NodeKind::kAtom &&
        IsSelfCall(node.children[2]);
    if (registers_self) {
      registered_self_.insert(node.children[1].text);
    }
  }

  static void ExportBranches(Scope &scope, const std::vector<Scope> &branches) {
    const Scope before = scope;
    for (const auto &branch : branches) {
      for (const auto &[name, bindings] : branch) {
        const auto outer = before.find(name);
        if (outer != before.end() && outer->second == bindings) {
          continue;
        }
        scope[name].insert(bindings.begin(), bindings.end());
      }
    }
  }

  // Runs one pattern clause in a private copy of `scope` and returns it.
  Scope BranchClause(const Clause &clause, const Scope &scope,
                     const std::vector<std::size_t> &subject_reads,
                     OccurrenceRole role) {
    Scope branch = scope;
    PatternContext binding;
    binding.role = role;
    for (const auto &pattern : clause.patterns) {
      const auto entries = Bind(pattern, branch, binding, std::nullopt);
      for (const auto source : subject_reads) {
        for (const auto target : entries) {
          AddEdge(source, target, EdgeKind::kMatch);
        }
      }
    }
    AnalyzeGuards(clause.guards, branch);
    for (const auto &expr : clause.body) {
      Expr(expr, branch, kBodyRead, nullptr);
    }
    return branch;
  }

  void CaseExpr(const SyntaxNode &node, Scope &scope,
                const ReadContext &context) {
    std::vector<std::size_t> subject_reads;
    if (!node.children.empty()) {
      Expr(node.children[0], scope, context, &subject_reads);
    }
    std::vector<Scope> branches;
    for (const auto &clause : node.clauses) {
      branches.push_back(BranchClause(clause, scope, subject_reads,
                                      OccurrenceRole::kBoundInPattern));
    }
    ExportBranches(scope, branches);
  }

  void ReceiveExpr(const SyntaxNode &node, Scope &scope,
                   const ReadContext &context) {
    std::vector<Scope> branches;
    for (const auto &clause : node.clauses) {
      for (const auto &pattern : clause.patterns) {
        receives_.push_back(
            ReceiveSite{&pattern, clause_index_, graph_.occurrences.size()});
      }
      branches.push_back(BranchClause(clause, scope, {},
                                      OccurrenceRole::kReceivedInPattern));
    }
    if (node.children.size() == 2) {
      Expr(node.children[0], scope, context, nullptr);
      Scope after = scope;
      Expr(node.children[1], after, kBodyRead, nullptr);
      branches.push_back(std::move(after));
    }
    ExportBranches(scope, branches);
  }

  void IfExpr(const SyntaxNode &node, Scope &scope) {
    std::vector<Scope> branches;
    for (const auto &clause : node.clauses) {
      branches.push_back(
          BranchClause(clause, scope, {}, OccurrenceRole::kBoundInPattern));
    }
    ExportBranches(scope, branches);
  }

  void TryExpr(const SyntaxNode &node, Scope &scope,
               const ReadContext &context) {
    if (node.children.size() != 4) {
      Scope local = scope;
      Children(node, local, context, nullptr);
      return;
    }
    Scope body = scope;
    std::vector<std::size_t> body_reads;
    const auto &body_exprs = node.children[0].children;
    for (std::size_t i = 0; i < body_exprs.size(); ++i) {
      const bool last = i + 1 == body_exprs.size();
      Expr(body_exprs[i], body, kBodyRead, last ? &body_reads : nullptr);
    }
    for (const auto &clause : node.children[1].clauses) {
      BranchClause(clause, body, body_reads, OccurrenceRole::kBoundInPattern);
    }
    for (const auto &clause : node.children[2].clauses) {
      BranchClause(clause, scope, {}, OccurrenceRole::kBoundInPattern);
    }
    Scope after = scope;
    Children(node.children[3], after, kBodyRead, nullptr);
  }

  void FunExpr(const SyntaxNode &node, const Scope &scope) {
    Scope outer = scope;
    if (!node.children.empty() &&
        node.children[0].kind == NodeKind::kVariable) {
      PatternContext name_binding;
      name_binding.shadow = true;
      Bind(node.children[0], outer, name_binding, std::nullopt);
    }
    for (const auto &clause : node.clauses) {
      Scope local = outer;
      PatternContext parameters;
      parameters.shadow = true;
      for (const auto &pattern : clause.patterns) {
        Bind(pattern, local, parameters, std::nullopt);
      }
      AnalyzeGuards(clause.guards, local);
      for (const auto &expr : clause.body) {
        Expr(expr, local, kBodyRead, nullptr);
      }
    }
  }

  void ComprehensionExpr(const SyntaxNode &node, const Scope &scope,
                         const ReadContext &context,
                         std::vector<std::size_t> *reads) {
    if (node.children.empty()) {
      return;
    }
    Scope local = scope;
    for (std::size_t i = 1; i < node.children.size(); ++i) {
      const auto &qualifier = node.children[i];
      const bool generator = qualifier.kind == NodeKind::kGenerator ||
                             qualifier.kind == NodeKind::kBinaryGenerator;
      if (!generator || qualifier.children.size() != 2) {
        Expr(qualifier, local, context, nullptr);
        continue;
      }
      std::vector<std::size_t> source_reads;
      Expr(qualifier.children[1], local, context, &source_reads);
      PatternContext binding;
      binding.shadow = true;
      const auto entries =
          Bind(qualifier.children[0], local, binding, std::nullopt);
      for (const auto source : source_reads) {
        for (const auto target : entries) {
          AddEdge(source, target, EdgeKind::kMatch);
        }
      }
    }
    Expr(node.children[0], local, context, reads);
  }

  // Second pass

  std::optional<std::size_t> OccurrenceAt(std::size_t token) const {
    const auto found = occurrence_at_token_.find(token);
    if (found == occurrence_at_token_.end()) {
      return std::nullopt;
    }
    return found->second;
  }

  void CollectReads(const SyntaxNode &node,
                    std::vector<std::size_t> &reads) const {
    if (node.kind == NodeKind::kVariable) {
      const auto occurrence = OccurrenceAt(node.token);
      if (occurrence) {
        const auto role = graph_.occurrences[*occurrence].role;
        if (role == OccurrenceRole::kReadInBody ||
            role == OccurrenceRole::kReadInGuard ||
            role == OccurrenceRole::kSentInMessage) {
          reads.push_back(*occurrence);
        }
      }
    }
    for (const auto &child : node.children) {
      CollectReads(child, reads);
    }
  }

  std::vector<std::size_t> PatternEntries(const SyntaxNode &pattern) const {
    if (pattern.kind == NodeKind::kMatch) {
      std::vector<std::size_t> entries;
      for (const auto &side : pattern.children) {
        const auto more = PatternEntries(side);
        entries.insert(entries.end(), more.begin(), more.end());
      }
      return entries;
    }
    if (pattern.kind == NodeKind::kBinaryOp && pattern.text == "++" &&
        pattern.children.size() == 2) {
      return PatternEntries(pattern.children[1]);
    }
    if (pattern.kind == NodeKind::kVariable || IsCompoundPattern(pattern)) {
      const auto occurrence = OccurrenceAt(pattern.token);
      if (occurrence) {
        return {*occurrence};
      }
    }
    return {};
  }

  // Aligns a value expression with a pattern and adds edges from the reads
  // of each sub-expression to the occurrence that binds its counterpart.
  void Link(const SyntaxNode &expr, const SyntaxNode &pattern, EdgeKind kind,
            bool approximate) {
    if (pattern.kind == NodeKind::kMatch) {
      for (const auto &side : pattern.children) {
        Link(expr, side, kind, approximate);
      }
      return;
    }
    const bool same_shape =
        expr.kind == pattern.kind &&
        expr.children.size() == pattern.children.size() &&
        expr.has_tail == pattern.has_tail &&
        (expr.kind == NodeKind::kTuple || expr.kind == NodeKind::kList);
    if (same_shape) {
      for (std::size_t i = 0; i < expr.children.size(); ++i) {
        Link(expr.children[i], pattern.children[i], kind, approximate);
      }
      return;
    }
    std::vector<std::size_t> reads;
    CollectReads(expr, reads);
    for (const auto target : PatternEntries(pattern)) {
      for (const auto source : reads) {
        AddEdge(source, target, kind, approximate);
      }
    }
  }

  // Within one clause a send must precede the receive. A send in another
  // clause reaches the receive only through a later call, so those links are
  // approximate.
  void LinkMessages() {
    for (const auto &receive : receives_) {
      for (const auto &send : sends_) {
        const bool same_clause = send.clause_index == receive.clause_index;
        if (same_clause && send.rank > receive.rank) {
          continue;
        }
        if (!same_clause && !options_.include_recursive_edges) {
          continue;
        }
        if (!Compatible(*send.message, *receive.pattern)) {
          continue;
        }
        Link(*send.message, *receive.pattern, EdgeKind::kMessage,
             !same_clause);
      }
    }
  }

  void LinkRecursiveCalls() {
    for (const auto &call : calls_) {
      for (const auto &clause : group_.clauses) {
        if (clause.patterns.size() != call.arguments.size()) {
          continue;
        }
        bool compatible = true;
        for (std::size_t i = 0; i < clause.patterns.size() && compatible;
             ++i) {
          compatible = Compatible(*call.arguments[i], clause.patterns[i]);
        }
        if (!compatible) {
          continue;
        }
        for (std::size_t i = 0; i < clause.patterns.size(); ++i) {
          Link(*call.arguments[i], clause.patterns[i],
               EdgeKind::kRecursiveCall, true);
        }
      }
    }
  }

  const ClauseGroup &group_;
  const FlowOptions &options_;
  const Deadline &deadline_;
  FlowGraph graph_;
  std::size_t clause_index_ = 0;
  std::size_t depth_ = 0;
  std::map<std::size_t, std::size_t> occurrence_at_token_;
  std::set<std::string> self_aliases_;
  std::set<std::string> registered_self_;
  std::vector<CallSite> calls_;
  std::vector<SendSite> sends_;
  std::vector<ReceiveSite> receives_;
};

} // namespace

FlowGraph VariableFlowAnalyzer::Analyze(const ClauseGroup &group,
                                        const FlowOptions &options,
                                        const Deadline &deadline) const {
  GroupAnalysis analysis(group, options, deadline);
  return analysis.Run();
}

} // namespace erlflow
