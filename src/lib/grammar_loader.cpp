#include <segram/grammar_loader.hpp>

#include <segram/any_number_of.hpp>
#include <segram/keyword.hpp>
#include <segram/ref.hpp>
#include <segram/sequence.hpp>

#include "xml_read_util.hpp"

#include <charconv>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace segram {

  namespace {

    constexpr const char* component = "grammar_loader";

    std::runtime_error
    error(const xml_reader& reader, const std::string& message) {
      return detail::load_error(component, reader, message);
    }

    std::string
    element_name(const xml_reader& reader) {
      return std::string(reader.local_name());
    }

    std::string
    require_attribute(const xml_reader& reader, std::string_view name) {
      auto value = reader.attribute(name);
      if (!value || value->empty()) {
        throw error(reader, "<" + element_name(reader) +
                                "> requires a '" + std::string(name) +
                                "' attribute");
      }
      return std::string(*value);
    }

    bool
    bool_attribute(const xml_reader& reader, std::string_view name,
                   bool fallback) {
      auto value = reader.attribute(name);
      if (!value) return fallback;
      if (*value == "true" || *value == "1") return true;
      if (*value == "false" || *value == "0") return false;
      throw error(reader, "attribute '" + std::string(name) +
                              "' is not a boolean: '" + std::string(*value) +
                              "'");
    }

    std::size_t
    parse_count(const xml_reader& reader, std::string_view name,
                std::string_view text) {
      std::size_t result = 0;
      auto [ptr, ec] =
          std::from_chars(text.data(), text.data() + text.size(), result);
      if (text.empty() || ec != std::errc() ||
          ptr != text.data() + text.size()) {
        throw error(reader, "attribute '" + std::string(name) +
                                "' is not a non-negative integer: '" +
                                std::string(text) + "'");
      }
      return result;
    }

    // Consume the end tag of a childless element.
    void
    expect_end(xml_reader& reader, std::string_view name) {
      if (!detail::read_skip_ws(reader) ||
          !detail::is_end(reader, grammar_ns, name)) {
        throw error(reader,
                    "<" + std::string(name) + "> must not have content");
      }
    }

    matchable_ptr
    read_element(xml_reader& reader);

    struct group_content {
      std::vector<matchable_ptr> elements;
      matchable_ptr exclude;
    };

    // Reads child elements up to the end tag of `name`. <exclude> is only
    // accepted when allow_exclude is set.
    group_content
    read_group(xml_reader& reader, const std::string& name,
               bool allow_exclude) {
      group_content content;

      while (detail::read_skip_ws(reader)) {
        if (detail::is_end(reader, grammar_ns, name)) {
          if (content.elements.empty()) {
            throw error(reader, "<" + name + "> needs at least one element");
          }
          return content;
        }

        if (detail::is_start(reader, grammar_ns, "exclude")) {
          if (!allow_exclude) {
            throw error(reader, "<exclude> is not allowed in <" + name + ">");
          }
          if (content.exclude) {
            throw error(reader, "<" + name + "> has more than one <exclude>");
          }
          if (!detail::read_skip_ws(reader) ||
              reader.node_type() != xml_node_type::start_element) {
            throw error(reader, "<exclude> must hold exactly one element");
          }
          content.exclude = read_element(reader);
          if (!detail::read_skip_ws(reader) ||
              !detail::is_end(reader, grammar_ns, "exclude")) {
            throw error(reader, "<exclude> must hold exactly one element");
          }
          continue;
        }

        if (reader.node_type() != xml_node_type::start_element) {
          throw error(reader, "unexpected text in <" + name + ">");
        }
        content.elements.push_back(read_element(reader));
      }

      throw error(reader, "unterminated <" + name + ">");
    }

    repetition_options
    read_repetition(const xml_reader& reader) {
      repetition_options options;
      if (auto min = reader.attribute("min"))
        options.min_times = parse_count(reader, "min", *min);
      if (auto max = reader.attribute("max"); max && *max != "unbounded")
        options.max_times = parse_count(reader, "max", *max);
      options.allow_gaps = bool_attribute(reader, "allow-gaps", true);
      options.optional = bool_attribute(reader, "optional", false);
      return options;
    }

    matchable_ptr
    read_element(xml_reader& reader) {
      if (reader.namespace_uri() != grammar_ns) {
        throw error(reader, "element <" + element_name(reader) +
                                "> is not in namespace " + grammar_ns);
      }

      const std::string name = element_name(reader);

      try {
        if (name == "keyword") {
          auto value = require_attribute(reader, "value");
          bool optional = bool_attribute(reader, "optional", false);
          expect_end(reader, name);
          return std::make_shared<keyword>(std::move(value), optional);
        }

        if (name == "ref") {
          auto rule = require_attribute(reader, "name");
          bool optional = bool_attribute(reader, "optional", false);
          expect_end(reader, name);
          return std::make_shared<ref>(std::move(rule), optional);
        }

        if (name == "sequence") {
          sequence_options options;
          options.allow_gaps = bool_attribute(reader, "allow-gaps", true);
          options.optional = bool_attribute(reader, "optional", false);
          auto content = read_group(reader, name, false);
          return std::make_shared<sequence>(std::move(content.elements),
                                            options);
        }

        if (name == "any-number-of" || name == "one-of") {
          auto options = read_repetition(reader);
          if (name == "one-of" &&
              (reader.attribute("min") || reader.attribute("max"))) {
            throw error(reader, "<one-of> does not take min or max");
          }
          auto content = read_group(reader, name, true);
          options.exclude = std::move(content.exclude);
          if (name == "one-of") {
            return std::make_shared<one_of>(std::move(content.elements),
                                            std::move(options));
          }
          return std::make_shared<any_number_of>(std::move(content.elements),
                                                 std::move(options));
        }
      } catch (const std::invalid_argument& e) {
        throw error(reader, e.what());
      }

      throw error(reader, "unknown grammar element <" + name + ">");
    }

  } // namespace

  grammar_library
  grammar_loader::load(xml_reader& reader) {
    if (!detail::read_skip_ws(reader) ||
        !detail::is_start(reader, grammar_ns, "grammar")) {
      throw std::runtime_error(
          "grammar_loader: expected <grammar> root element in namespace " +
          grammar_ns);
    }

    grammar_library library;
    std::string root;
    if (auto r = reader.attribute("root")) root = std::string(*r);

    while (detail::read_skip_ws(reader)) {
      if (detail::is_end(reader, grammar_ns, "grammar")) break;

      if (!detail::is_start(reader, grammar_ns, "rule")) {
        throw error(reader, "expected <rule> inside <grammar>");
      }

      auto name = require_attribute(reader, "name");
      if (library.contains(name)) {
        throw error(reader, "duplicate rule '" + name + "'");
      }

      if (!detail::read_skip_ws(reader) ||
          reader.node_type() != xml_node_type::start_element) {
        throw error(reader, "rule '" + name + "' is empty");
      }
      auto element = read_element(reader);

      if (!detail::read_skip_ws(reader) ||
          !detail::is_end(reader, grammar_ns, "rule")) {
        throw error(reader,
                    "rule '" + name + "' must hold exactly one element");
      }

      library.add(std::move(name), std::move(element));
    }

    if (!root.empty()) {
      if (!library.contains(root)) {
        throw std::runtime_error("grammar_loader: root rule '" + root +
                                 "' is not defined");
      }
      library.set_root(std::move(root));
    }

    return library;
  }

} // namespace segram
