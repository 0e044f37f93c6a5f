#pragma once
#include <gumbo.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::html {

class Node;

// Element predicate in the spirit of a CSS simple selector. Empty string
// members match anything.
struct Selector {
  GumboTag Tag{GUMBO_TAG_UNKNOWN};
  std::string Class;
  std::string AttributeName;
  std::string AttributeValue;
  std::string HrefSuffix;

  bool matches(const Node &Candidate) const;
};

// Non-owning view of a node inside a Document.
class Node {
public:
  explicit Node(const GumboNode *Raw) : Raw(Raw) {}

  bool isElement() const;
  GumboTag tag() const;
  std::optional<std::string_view> attribute(const std::string &Name) const;
  bool hasClass(std::string_view Token) const;

  // Concatenation of all descendant text as it appears in the source.
  std::string text() const;
  // Each descendant text run trimmed, then concatenated.
  std::string strippedText() const;

  // Descendant search in document order; the node itself never matches.
  std::optional<Node> findFirst(const Selector &Match) const;
  std::vector<Node> findAll(const Selector &Match) const;

  const GumboNode *raw() const { return Raw; }

private:
  void visitDescendants(const std::function<bool(const Node &)> &Visit) const;

  const GumboNode *Raw;
};

// Owns a parsed HTML tree. Gumbo recovers from malformed markup the way a
// browser does, so parsing never fails on bad input.
class Document {
public:
  static Document parse(std::string_view Html);

  Document(const Document &) = delete;
  Document &operator=(const Document &) = delete;
  Document(Document &&Other) noexcept;
  Document &operator=(Document &&Other) noexcept;
  ~Document();

  Node root() const;

private:
  Document(std::string Source, GumboOutput *Output);

  std::string Source;
  GumboOutput *Output{nullptr};
};

} // namespace trending::html
