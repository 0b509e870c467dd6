#ifndef INCLUDE_STACHE_TEMPLATE_HPP_
#define INCLUDE_STACHE_TEMPLATE_HPP_

#include <filesystem>
#include <string>

#include "node.hpp"

namespace stache {

/*!
 * \brief The main compiled template.
 *
 * A template is complete once the parser returns it: every partial it
 * references is parsed and embedded in the tree. Rendering only reads it, so
 * one template can be rendered from several threads at once.
 */
struct Template {
  BlockNode root;
  std::string content;

  /// Delimiters active at the end of the template
  std::string open_delimiter {"{{"};
  std::string close_delimiter {"}}"};

  /// Base directory for partial lookup
  std::filesystem::path directory;

  explicit Template() {}
  explicit Template(const std::string& content): content(content) {}
};

} // namespace stache

#endif // INCLUDE_STACHE_TEMPLATE_HPP_
