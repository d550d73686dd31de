#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace segram {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style reader over a parsed XML document.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual std::string_view
    namespace_uri() const = 0;

    virtual std::string_view
    local_name() const = 0;

    // Unqualified attribute lookup on the current start element.
    virtual std::optional<std::string_view>
    attribute(std::string_view name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    virtual std::size_t
    line() const = 0;
  };

} // namespace segram
