#ifndef INCLUDE_STACHE_PARSER_HPP_
#define INCLUDE_STACHE_PARSER_HPP_

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "config.hpp"
#include "exceptions.hpp"
#include "lexer.hpp"
#include "node.hpp"
#include "template.hpp"
#include "throw.hpp"

namespace stache {

inline std::string_view trim_view(std::string_view view) {
  const auto first = view.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = view.find_last_not_of(" \t\r\n");
  return view.substr(first, last - first + 1);
}

/*!
 * \brief Throws a StacheError unless open and close form a usable delimiter pair.
 */
inline void validate_delimiters(std::string_view open, std::string_view close) {
  if (open.empty() || close.empty()) {
    STACHE_THROW(StacheError("config_error", "delimiters must not be empty"));
  }
  if (open == close) {
    STACHE_THROW(StacheError("config_error", "open and close delimiters must differ"));
  }
}

/*!
 * \brief Class for parsing a template string or file into an element tree.
 */
class Parser {
  const ParserConfig& config;
  const LexerConfig& lexer_config;

  Lexer lexer;
  Template* current_template {nullptr};

  std::string open_delimiter;
  std::string close_delimiter;

  // Canonical paths of the files currently being parsed, outermost first
  std::vector<std::filesystem::path> include_stack;

  [[noreturn]] void throw_parser_error(const std::string& message, SourceLocation location) const {
    STACHE_THROW(ParseError(message, location));
  }

  void add_text(BlockNode& block, const Lexer::Chunk& chunk) {
    if (!chunk.text.empty()) {
      block.nodes.emplace_back(std::make_shared<TextNode>(chunk.pos, chunk.text.size()));
    }
  }

  std::string_view tag_name(std::string_view tag, SourceLocation location) const {
    const auto name = trim_view(tag.substr(1));
    if (name.empty()) {
      throw_parser_error("empty tag", location);
    }
    return name;
  }

  void parse_delimiters(std::string_view tag, SourceLocation location) {
    if (tag.size() < 2 || tag.back() != '=') {
      throw_parser_error("invalid delimiter tag", location);
    }

    const auto body = trim_view(tag.substr(1, tag.size() - 2));
    const auto split = body.find_first_of(" \t\r\n");
    if (split == std::string_view::npos) {
      throw_parser_error("invalid delimiter tag", location);
    }

    const auto open = body.substr(0, split);
    const auto close = trim_view(body.substr(split));
    if (close.find_first_of(" \t\r\n") != std::string_view::npos || open == close) {
      throw_parser_error("invalid delimiter tag", location);
    }

    open_delimiter = static_cast<std::string>(open);
    close_delimiter = static_cast<std::string>(close);
  }

  std::optional<std::filesystem::path> find_partial(std::string_view name) const {
    std::vector<std::filesystem::path> candidates;
    const auto add_candidates = [&](const std::filesystem::path& base) {
      candidates.emplace_back(base / name);
      for (const auto& extension : config.partial_extensions) {
        candidates.emplace_back(base / (static_cast<std::string>(name) + extension));
      }
    };

    add_candidates(current_template->directory);
    if (config.search_working_directory) {
      add_candidates(std::filesystem::path {});
    }

    for (const auto& candidate : candidates) {
      std::error_code ec;
      if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
      }
    }
    return std::nullopt;
  }

  std::shared_ptr<PartialNode> parse_partial(std::string_view name, SourceLocation location, size_t pos) {
    const auto path = find_partial(name);
    if (!path) {
      throw_parser_error("could not find partial " + static_cast<std::string>(name), location);
    }

    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(*path, ec);
    if (ec) {
      canonical = std::filesystem::absolute(*path, ec);
    }
    if (std::find(include_stack.begin(), include_stack.end(), canonical) != include_stack.end()) {
      throw_parser_error("recursive partial " + static_cast<std::string>(name), location);
    }

    const auto content = read_file(*path);
    if (!content) {
      throw_parser_error("could not read partial " + static_cast<std::string>(name), location);
    }

    auto partial = std::make_shared<Template>(*content);
    partial->directory = path->parent_path();

    Parser sub_parser(config, lexer_config, include_stack);
    sub_parser.include_stack.push_back(canonical);
    sub_parser.parse_into_template(*partial);

    return std::make_shared<PartialNode>(name, *path, std::move(partial), pos);
  }

  /*!
   * \brief Parses elements into block until the enclosing section is closed.
   *
   * Without an enclosing section the block ends at the end of the input;
   * inside a section, reaching the end of the input is an error.
   */
  void parse_block(BlockNode& block, const SectionNode* section) {
    for (;;) {
      const auto text = lexer.read_until(open_delimiter);
      add_text(block, text);
      if (text.end_of_input) {
        if (section != nullptr) {
          throw_parser_error("section " + section->name + " has no closing tag", section->location);
        }
        return;
      }

      const SourceLocation location = text.marker_location;
      const size_t tag_pos = text.pos + text.text.size();

      const bool raw = (lexer.peek() == '{');
      const auto body = lexer.read_until(raw ? "}" + close_delimiter : close_delimiter);
      if (body.end_of_input) {
        throw_parser_error("unmatched open tag", location);
      }

      // The closing brace of a raw tag is part of the marker
      std::string tag = static_cast<std::string>(trim_view(body.text));
      if (raw) {
        tag += '}';
      }
      if (tag.empty()) {
        throw_parser_error("empty tag", location);
      }

      switch (tag[0]) {
      case '!': {
        // comment
      } break;
      case '#':
      case '^': {
        const auto name = tag_name(tag, location);
        lexer.skip_line_break();

        auto section_node = std::make_shared<SectionNode>(name, tag[0] == '^', location, tag_pos);
        parse_block(section_node->block, section_node.get());
        block.nodes.emplace_back(std::move(section_node));
      } break;
      case '/': {
        const auto name = tag_name(tag, location);
        if (section == nullptr) {
          throw_parser_error("unmatched close tag: " + static_cast<std::string>(name), location);
        }
        if (name != section->name) {
          throw_parser_error("interleaved closing tag: " + static_cast<std::string>(name), location);
        }
        return;
      }
      case '>': {
        const auto name = tag_name(tag, location);
        block.nodes.emplace_back(parse_partial(name, location, tag_pos));
      } break;
      case '=': {
        parse_delimiters(tag, location);
      } break;
      case '{': {
        if (tag.size() < 2 || tag.back() != '}') {
          throw_parser_error("unmatched raw tag", location);
        }
        const auto name = trim_view(std::string_view(tag).substr(1, tag.size() - 2));
        if (name.empty()) {
          throw_parser_error("empty tag", location);
        }
        block.nodes.emplace_back(std::make_shared<VariableNode>(name, false, location, tag_pos));
      } break;
      default: {
        block.nodes.emplace_back(std::make_shared<VariableNode>(tag, true, location, tag_pos));
      } break;
      }
    }
  }

public:
  explicit Parser(const ParserConfig& parser_config, const LexerConfig& lexer_config)
      : config(parser_config), lexer_config(lexer_config) {}

  explicit Parser(const ParserConfig& parser_config, const LexerConfig& lexer_config, std::vector<std::filesystem::path> include_stack)
      : config(parser_config), lexer_config(lexer_config), include_stack(std::move(include_stack)) {}

  Template parse(std::string_view input, const std::filesystem::path& directory) {
    auto result = Template(static_cast<std::string>(input));
    result.directory = directory;
    parse_into_template(result);
    return result;
  }

  Template parse_file(const std::filesystem::path& filename) {
    auto result = Template(load_file(filename));
    result.directory = filename.parent_path();

    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(filename, ec);
    if (!ec) {
      include_stack.push_back(canonical);
    }
    parse_into_template(result);
    return result;
  }

  void parse_into_template(Template& tmpl) {
    validate_delimiters(lexer_config.open_delimiter, lexer_config.close_delimiter);

    current_template = &tmpl;
    open_delimiter = lexer_config.open_delimiter;
    close_delimiter = lexer_config.close_delimiter;

    lexer.start(tmpl.content);
    parse_block(tmpl.root, nullptr);

    tmpl.open_delimiter = open_delimiter;
    tmpl.close_delimiter = close_delimiter;
  }

  static std::optional<std::string> read_file(const std::filesystem::path& filename) {
    std::ifstream file;
    file.open(filename, std::ios::binary);
    if (file.fail()) {
      return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  static std::string load_file(const std::filesystem::path& filename) {
    auto content = read_file(filename);
    if (!content) {
      STACHE_THROW(FileError("failed accessing file at '" + filename.string() + "'"));
    }
    return std::move(*content);
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_PARSER_HPP_
