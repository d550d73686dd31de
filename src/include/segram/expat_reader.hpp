#pragma once

#include <segram/xml_reader.hpp>

#include <memory>
#include <string_view>

namespace segram {

  class expat_reader : public xml_reader {
  public:
    // Parses the whole document up front. Throws std::runtime_error on
    // malformed XML.
    explicit expat_reader(std::string_view xml);
    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

    bool
    read() override;

    xml_node_type
    node_type() const override;

    std::string_view
    namespace_uri() const override;

    std::string_view
    local_name() const override;

    std::optional<std::string_view>
    attribute(std::string_view name) const override;

    std::string_view
    text() const override;

    std::size_t
    depth() const override;

    std::size_t
    line() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace segram
