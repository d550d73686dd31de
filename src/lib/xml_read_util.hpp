#pragma once

#include <segram/xml_reader.hpp>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace segram::detail {

  inline bool
  is_whitespace_only(std::string_view sv) {
    return std::all_of(sv.begin(), sv.end(), [](char c) {
      return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    });
  }

  // Advance to the next node, skipping whitespace-only character data.
  inline bool
  read_skip_ws(xml_reader& reader) {
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::characters &&
          is_whitespace_only(reader.text()))
        continue;
      return true;
    }
    return false;
  }

  inline bool
  is_start(const xml_reader& reader, const std::string& ns,
           std::string_view name) {
    return reader.node_type() == xml_node_type::start_element &&
           reader.namespace_uri() == ns && reader.local_name() == name;
  }

  inline bool
  is_end(const xml_reader& reader, const std::string& ns,
         std::string_view name) {
    return reader.node_type() == xml_node_type::end_element &&
           reader.namespace_uri() == ns && reader.local_name() == name;
  }

  inline std::runtime_error
  load_error(const char* component, const xml_reader& reader,
             const std::string& message) {
    return std::runtime_error(std::string(component) + ": line " +
                              std::to_string(reader.line()) + ": " + message);
  }

} // namespace segram::detail
