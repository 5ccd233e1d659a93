#include <erlflow/syntax_tree.h>

namespace erlflow {

std::string ClauseGroupId::ToString() const {
  return module + ":" + name + "/" + std::to_string(arity);
}

std::string NodeKindName(NodeKind kind) {
  switch (kind) {
  case NodeKind::kVariable:
    return "variable";
  case NodeKind::kWildcard:
    return "wildcard";
  case NodeKind::kAtom:
    return "atom";
  case NodeKind::kInteger:
    return "integer";
  case NodeKind::kFloat:
    return "float";
  case NodeKind::kChar:
    return "char";
  case NodeKind::kString:
    return "string";
  case NodeKind::kMacro:
    return "macro";
  case NodeKind::kTuple:
    return "tuple";
  case NodeKind::kList:
    return "list";
  case NodeKind::kBinary:
    return "binary";
  case NodeKind::kBinaryElement:
    return "binary_element";
  case NodeKind::kMap:
    return "map";
  case NodeKind::kMapUpdate:
    return "map_update";
  case NodeKind::kMapField:
    return "map_field";
  case NodeKind::kRecord:
    return "record";
  case NodeKind::kRecordUpdate:
    return "record_update";
  case NodeKind::kRecordField:
    return "record_field";
  case NodeKind::kRecordIndex:
    return "record_index";
  case NodeKind::kRecordAccess:
    return "record_access";
  case NodeKind::kMatch:
    return "match";
  case NodeKind::kSend:
    return "send";
  case NodeKind::kBinaryOp:
    return "binary_op";
  case NodeKind::kUnaryOp:
    return "unary_op";
  case NodeKind::kCall:
    return "call";
  case NodeKind::kRemote:
    return "remote";
  case NodeKind::kFun:
    return "fun";
  case NodeKind::kFunRef:
    return "fun_ref";
  case NodeKind::kCase:
    return "case";
  case NodeKind::kReceive:
    return "receive";
  case NodeKind::kIf:
    return "if";
  case NodeKind::kTry:
    return "try";
  case NodeKind::kBlock:
    return "block";
  case NodeKind::kCatch:
    return "catch";
  case NodeKind::kCatchPattern:
    return "catch_pattern";
  case NodeKind::kClauseList:
    return "clause_list";
  case NodeKind::kListComprehension:
    return "list_comprehension";
  case NodeKind::kBinaryComprehension:
    return "binary_comprehension";
  case NodeKind::kGenerator:
    return "generator";
  case NodeKind::kBinaryGenerator:
    return "binary_generator";
  }
  return "unknown";
}

bool IsCompoundPattern(const SyntaxNode &node) {
  switch (node.kind) {
  case NodeKind::kTuple:
  case NodeKind::kList:
  case NodeKind::kBinary:
  case NodeKind::kMap:
  case NodeKind::kRecord:
  case NodeKind::kCatchPattern:
    return !node.children.empty();
  default:
    return false;
  }
}

} // namespace erlflow
