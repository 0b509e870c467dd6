#ifndef INCLUDE_STACHE_NODE_HPP_
#define INCLUDE_STACHE_NODE_HPP_

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "exceptions.hpp"

namespace stache {

class NodeVisitor;
class BlockNode;
class TextNode;
class VariableNode;
class SectionNode;
class PartialNode;
struct Template;

class NodeVisitor {
public:
  virtual ~NodeVisitor() = default;

  virtual void visit(const BlockNode& node) = 0;
  virtual void visit(const TextNode& node) = 0;
  virtual void visit(const VariableNode& node) = 0;
  virtual void visit(const SectionNode& node) = 0;
  virtual void visit(const PartialNode& node) = 0;
};

/*!
 * \brief Base node class for the element tree
 */
class AstNode {
public:
  virtual void accept(NodeVisitor& v) const = 0;

  size_t pos;

  explicit AstNode(size_t pos): pos(pos) {}
  virtual ~AstNode() = default;
};

class BlockNode : public AstNode {
public:
  std::vector<std::shared_ptr<AstNode>> nodes;

  explicit BlockNode(): AstNode(0) {}

  void accept(NodeVisitor& v) const override {
    v.visit(*this);
  }
};

/// Literal text, a span of the owning template's content
class TextNode : public AstNode {
public:
  const size_t length;

  explicit TextNode(size_t pos, size_t length): AstNode(pos), length(length) {}

  void accept(NodeVisitor& v) const override {
    v.visit(*this);
  }
};

class VariableNode : public AstNode {
public:
  const std::string name;
  const bool escape;
  const SourceLocation location;

  explicit VariableNode(std::string_view name, bool escape, SourceLocation location, size_t pos)
      : AstNode(pos), name(static_cast<std::string>(name)), escape(escape), location(location) {}

  void accept(NodeVisitor& v) const override {
    v.visit(*this);
  }
};

class SectionNode : public AstNode {
public:
  const std::string name;
  const bool inverted;
  const SourceLocation location;
  BlockNode block;

  explicit SectionNode(std::string_view name, bool inverted, SourceLocation location, size_t pos)
      : AstNode(pos), name(static_cast<std::string>(name)), inverted(inverted), location(location) {}

  size_t line() const {
    return location.line;
  }

  void accept(NodeVisitor& v) const override {
    v.visit(*this);
  }
};

/*!
 * \brief A partial reference, already parsed and inlined at parse time.
 */
class PartialNode : public AstNode {
public:
  const std::string name;
  const std::filesystem::path path;
  const std::shared_ptr<const Template> partial;

  explicit PartialNode(std::string_view name, const std::filesystem::path& path, std::shared_ptr<const Template> partial, size_t pos)
      : AstNode(pos), name(static_cast<std::string>(name)), path(path), partial(std::move(partial)) {}

  void accept(NodeVisitor& v) const override {
    v.visit(*this);
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_NODE_HPP_
