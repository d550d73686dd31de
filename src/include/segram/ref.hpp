#pragma once

#include <segram/matchable.hpp>

#include <string>

namespace segram {

  // Reference to a named rule, resolved through the context's library at
  // match time.
  class ref : public matchable {
    std::string name_;
    bool optional_;

  public:
    explicit ref(std::string name, bool optional = false);

    match_result
    match(const segment_list& segments,
          const parse_context& ctx) const override;

    simple_set
    simple(const parse_context& ctx) const override;

    bool
    is_optional() const override {
      return optional_;
    }

    std::string
    describe() const override;

    const std::string&
    name() const {
      return name_;
    }
  };

} // namespace segram
