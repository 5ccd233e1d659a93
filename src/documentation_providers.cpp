#include <erlflow/documentation_providers.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <string_view>

namespace erlflow {
namespace {

const std::set<std::string> kSkippedAttributes = {"spec", "doc", "deprecated"};

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return std::string(text.substr(first, last - first + 1));
}

std::string StripCommentMarker(const std::string &text) {
  std::size_t start = 0;
  while (start < text.size() && text[start] == '%') {
    ++start;
  }
  return Trim(std::string_view(text).substr(start));
}

bool IsSeparator(const std::string &line) {
  return line.empty() ||
         std::all_of(line.begin(), line.end(), [](char character) {
           return character == '-' || character == '=' || character == '*' ||
                  character == '%';
         });
}

bool StartsWith(const std::string &text, std::string_view prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

std::size_t DocumentedStart(const SyntaxTree &tree, std::size_t start) {
  bool moved = true;
  while (moved && start > 0) {
    moved = false;
    for (const auto &attribute : tree.attributes) {
      if (attribute.last_token + 1 == start &&
          kSkippedAttributes.count(attribute.name) > 0) {
        start = attribute.first_token;
        moved = true;
        break;
      }
    }
  }
  return start;
}

std::vector<std::string> PrecedingCommentBlock(const SyntaxTree &tree,
                                               const ClauseGroup &group) {
  const auto head = group.first_token;
  if (head >= tree.tokens.size()) {
    return {};
  }
  const auto start = DocumentedStart(tree, head);
  std::size_t window_begin = 0;
  std::size_t previous_line = 0;
  if (start > 0) {
    const auto &previous = tree.tokens[start - 1];
    window_begin = previous.offset + previous.length;
    previous_line = previous.line;
  }
  const auto window_end = tree.tokens[head].offset;

  std::vector<const Comment *> block;
  for (const auto &comment : tree.comments) {
    if (comment.offset < window_begin || comment.offset >= window_end ||
        comment.line == previous_line) {
      continue;
    }
    if (!block.empty() && block.back()->line + 1 != comment.line) {
      block.clear();
    }
    block.push_back(&comment);
  }

  std::vector<std::string> lines;
  lines.reserve(block.size());
  for (const auto *comment : block) {
    lines.push_back(StripCommentMarker(comment->text));
  }
  return lines;
}

std::string JoinLines(const std::vector<std::string> &lines) {
  std::string joined;
  for (const auto &line : lines) {
    if (IsSeparator(line)) {
      continue;
    }
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += line;
  }
  return joined;
}

} // namespace

std::string NoDocumentationProvider::Lookup(const SyntaxTree &,
                                            const ClauseGroup &) const {
  return {};
}

std::string EdocDocumentationProvider::Lookup(const SyntaxTree &tree,
                                              const ClauseGroup &group) const {
  const auto lines = PrecedingCommentBlock(tree, group);
  if (lines.empty()) {
    return {};
  }

  std::vector<std::string> tagged;
  bool in_tag = false;
  for (const auto &line : lines) {
    if (StartsWith(line, "@doc") || StartsWith(line, "@brief")) {
      in_tag = true;
      const auto tag_end = line.find_first_of(" \t");
      tagged.push_back(tag_end == std::string::npos
                           ? std::string()
                           : Trim(std::string_view(line).substr(tag_end)));
      continue;
    }
    if (StartsWith(line, "@")) {
      in_tag = false;
      continue;
    }
    if (in_tag) {
      tagged.push_back(line);
    }
  }
  if (!tagged.empty()) {
    return JoinLines(tagged);
  }

  std::vector<std::string> untagged;
  std::copy_if(lines.begin(), lines.end(), std::back_inserter(untagged),
               [](const std::string &line) { return !StartsWith(line, "@"); });
  return JoinLines(untagged);
}

} // namespace erlflow
