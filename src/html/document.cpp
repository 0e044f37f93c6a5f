#include "trending/html/document.hpp"

#include "trending/core/text.hpp"

#include <utility>

namespace trending::html {

namespace {

bool hasChildren(const GumboNode *Raw) {
  return Raw->type == GUMBO_NODE_ELEMENT || Raw->type == GUMBO_NODE_TEMPLATE ||
         Raw->type == GUMBO_NODE_DOCUMENT;
}

const GumboVector &children(const GumboNode *Raw) {
  if (Raw->type == GUMBO_NODE_DOCUMENT) {
    return Raw->v.document.children;
  }
  return Raw->v.element.children;
}

bool isTextRun(const GumboNode *Raw) {
  return Raw->type == GUMBO_NODE_TEXT || Raw->type == GUMBO_NODE_WHITESPACE ||
         Raw->type == GUMBO_NODE_CDATA;
}

// Pre-order walk. Returns false once Visit asked to stop.
bool walk(const GumboNode *Raw, const std::function<bool(const Node &)> &Visit) {
  if (!hasChildren(Raw)) {
    return true;
  }
  const GumboVector &Kids = children(Raw);
  for (unsigned int I = 0; I < Kids.length; ++I) {
    auto *Child = static_cast<const GumboNode *>(Kids.data[I]);
    if (!Visit(Node{Child})) {
      return false;
    }
    if (!walk(Child, Visit)) {
      return false;
    }
  }
  return true;
}

} // namespace

bool Selector::matches(const Node &Candidate) const {
  if (!Candidate.isElement()) {
    return false;
  }
  if (Tag != GUMBO_TAG_UNKNOWN && Candidate.tag() != Tag) {
    return false;
  }
  if (!Class.empty() && !Candidate.hasClass(Class)) {
    return false;
  }
  if (!AttributeName.empty()) {
    auto Value = Candidate.attribute(AttributeName);
    if (!Value || (!AttributeValue.empty() && *Value != AttributeValue)) {
      return false;
    }
  }
  if (!HrefSuffix.empty()) {
    auto Href = Candidate.attribute("href");
    if (!Href || !Href->ends_with(HrefSuffix)) {
      return false;
    }
  }
  return true;
}

bool Node::isElement() const {
  return Raw->type == GUMBO_NODE_ELEMENT || Raw->type == GUMBO_NODE_TEMPLATE;
}

GumboTag Node::tag() const {
  return isElement() ? Raw->v.element.tag : GUMBO_TAG_UNKNOWN;
}

std::optional<std::string_view> Node::attribute(const std::string &Name) const {
  if (!isElement()) {
    return std::nullopt;
  }
  const GumboAttribute *Attr =
      gumbo_get_attribute(&Raw->v.element.attributes, Name.c_str());
  if (Attr == nullptr || Attr->value == nullptr) {
    return std::nullopt;
  }
  return std::string_view{Attr->value};
}

bool Node::hasClass(std::string_view Token) const {
  auto Classes = attribute("class");
  if (!Classes) {
    return false;
  }
  std::string_view Rest = *Classes;
  while (!Rest.empty()) {
    auto Start = Rest.find_first_not_of(" \t\n\r\f");
    if (Start == std::string_view::npos) {
      break;
    }
    Rest.remove_prefix(Start);
    auto End = Rest.find_first_of(" \t\n\r\f");
    if (Rest.substr(0, End) == Token) {
      return true;
    }
    if (End == std::string_view::npos) {
      break;
    }
    Rest.remove_prefix(End);
  }
  return false;
}

std::string Node::text() const {
  std::string Collected;
  visitDescendants([&Collected](const Node &Each) {
    if (isTextRun(Each.raw())) {
      Collected += Each.raw()->v.text.text;
    }
    return true;
  });
  return Collected;
}

std::string Node::strippedText() const {
  std::string Collected;
  visitDescendants([&Collected](const Node &Each) {
    if (isTextRun(Each.raw())) {
      Collected += core::text::trim(Each.raw()->v.text.text);
    }
    return true;
  });
  return Collected;
}

std::optional<Node> Node::findFirst(const Selector &Match) const {
  std::optional<Node> Found;
  visitDescendants([&](const Node &Each) {
    if (Match.matches(Each)) {
      Found = Each;
      return false;
    }
    return true;
  });
  return Found;
}

std::vector<Node> Node::findAll(const Selector &Match) const {
  std::vector<Node> Found;
  visitDescendants([&](const Node &Each) {
    if (Match.matches(Each)) {
      Found.push_back(Each);
    }
    return true;
  });
  return Found;
}

void Node::visitDescendants(
    const std::function<bool(const Node &)> &Visit
) const {
  walk(Raw, Visit);
}

Document Document::parse(std::string_view Html) {
  std::string Source{Html};
  GumboOutput *Output = gumbo_parse_with_options(
      &kGumboDefaultOptions, Source.data(), Source.size()
  );
  return Document{std::move(Source), Output};
}

Document::Document(std::string Source, GumboOutput *Output)
    : Source(std::move(Source)), Output(Output) {}

Document::Document(Document &&Other) noexcept
    : Source(std::move(Other.Source)),
      Output(std::exchange(Other.Output, nullptr)) {}

Document &Document::operator=(Document &&Other) noexcept {
  if (this != &Other) {
    if (Output != nullptr) {
      gumbo_destroy_output(&kGumboDefaultOptions, Output);
    }
    Source = std::move(Other.Source);
    Output = std::exchange(Other.Output, nullptr);
  }
  return *this;
}

Document::~Document() {
  if (Output != nullptr) {
    gumbo_destroy_output(&kGumboDefaultOptions, Output);
  }
}

Node Document::root() const { return Node{Output->document}; }

} // namespace trending::html
