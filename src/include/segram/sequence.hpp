#pragma once

#include <segram/matchable.hpp>

#include <string>
#include <vector>

namespace segram {

  struct sequence_options {
    bool allow_gaps = true;
    bool optional = false;
  };

  class sequence : public matchable {
    std::vector<matchable_ptr> elements_;
    sequence_options options_;

  public:
    explicit sequence(std::vector<matchable_ptr> elements,
                      sequence_options options = {});

    match_result
    match(const segment_list& segments,
          const parse_context& ctx) const override;

    simple_set
    simple(const parse_context& ctx) const override;

    bool
    is_optional() const override {
      return options_.optional;
    }

    std::string
    describe() const override;

    const std::vector<matchable_ptr>&
    elements() const {
      return elements_;
    }
  };

} // namespace segram
