#include <segram/segment_loader.hpp>

#include "xml_read_util.hpp"

#include <optional>
#include <string>

namespace segram {

  namespace {

    constexpr const char* component = "segment_loader";

    std::optional<segment_kind>
    leaf_kind(std::string_view name) {
      if (name == "code") return segment_kind::code;
      if (name == "whitespace") return segment_kind::whitespace;
      if (name == "newline") return segment_kind::newline;
      if (name == "comment") return segment_kind::comment;
      return std::nullopt;
    }

    segment
    read_segment(xml_reader& reader) {
      if (reader.namespace_uri() != segments_ns) {
        throw detail::load_error(component, reader,
                                 "element <" +
                                     std::string(reader.local_name()) +
                                     "> is not in namespace " + segments_ns);
      }

      const std::string name(reader.local_name());

      if (name == "group") {
        std::vector<segment> children;
        while (detail::read_skip_ws(reader)) {
          if (detail::is_end(reader, segments_ns, "group")) {
            if (children.empty()) {
              throw detail::load_error(component, reader, "empty <group>");
            }
            return segment(segment_kind::code, std::move(children));
          }
          if (reader.node_type() != xml_node_type::start_element) {
            throw detail::load_error(component, reader,
                                     "unexpected text in <group>");
          }
          children.push_back(read_segment(reader));
        }
        throw detail::load_error(component, reader, "unterminated <group>");
      }

      auto kind = leaf_kind(name);
      if (!kind) {
        throw detail::load_error(component, reader,
                                 "unknown segment element <" + name + ">");
      }

      // Leaf text is taken verbatim, whitespace included.
      std::string raw;
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters) {
          raw += reader.text();
          continue;
        }
        if (reader.node_type() == xml_node_type::end_element) {
          if (raw.empty()) {
            throw detail::load_error(component, reader,
                                     "empty <" + name + "> segment");
          }
          return segment(*kind, std::move(raw));
        }
        throw detail::load_error(component, reader,
                                 "<" + name + "> must only hold text");
      }
      throw detail::load_error(component, reader,
                               "unterminated <" + name + ">");
    }

  } // namespace

  segment_list
  segment_document::view() const {
    segment_list result;
    result.reserve(segments_.size());
    for (const auto& seg : segments_)
      result.push_back(&seg);
    return result;
  }

  segment_document
  segment_loader::load(xml_reader& reader) {
    if (!detail::read_skip_ws(reader) ||
        !detail::is_start(reader, segments_ns, "segments")) {
      throw std::runtime_error(
          "segment_loader: expected <segments> root element in namespace " +
          segments_ns);
    }

    std::vector<segment> segments;
    while (detail::read_skip_ws(reader)) {
      if (detail::is_end(reader, segments_ns, "segments"))
        return segment_document(std::move(segments));

      if (reader.node_type() != xml_node_type::start_element) {
        throw detail::load_error(component, reader,
                                 "unexpected text in <segments>");
      }
      segments.push_back(read_segment(reader));
    }

    throw std::runtime_error("segment_loader: unterminated <segments>");
  }

} // namespace segram
