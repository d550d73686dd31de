#pragma once

#include <segram/matchable.hpp>

#include <string>

namespace segram {

  // Matches a single leading leaf code segment, case-insensitively. Groups
  // never match, even when their leaves spell the template.
  class keyword : public matchable {
    std::string template_;
    bool optional_;

  public:
    explicit keyword(std::string text, bool optional = false);

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
    template_text() const {
      return template_;
    }
  };

} // namespace segram
