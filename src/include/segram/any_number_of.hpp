#pragma once

#include <segram/matchable.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace segram {

  struct repetition_options {
    std::size_t min_times = 0;
    std::optional<std::size_t> max_times;
    bool allow_gaps = true;
    matchable_ptr exclude;
    bool optional = false;
  };

  // Matches any of its elements, repeated between min_times and max_times.
  //
  // Within one repetition the first complete match wins. Otherwise the
  // longest partial match is kept and ties go to the earliest element.
  // Repetitions never backtrack into each other.
  class any_number_of : public matchable {
    std::vector<matchable_ptr> elements_;
    repetition_options options_;

  public:
    explicit any_number_of(std::vector<matchable_ptr> elements,
                           repetition_options options = {});

    match_result
    match(const segment_list& segments,
          const parse_context& ctx) const override;

    // Supported only when every element is.
    simple_set
    simple(const parse_context& ctx) const override;

    bool
    is_optional() const override;

    std::string
    describe() const override;

    const std::vector<matchable_ptr>&
    elements() const {
      return elements_;
    }

    const repetition_options&
    options() const {
      return options_;
    }

    // Elements that still need a full match attempt against segments.
    std::vector<matchable_ptr>
    prune_options(const segment_list& segments,
                  const parse_context& ctx) const;

    // A single repetition, never loops.
    match_result
    match_once(const segment_list& segments, const parse_context& ctx) const;

  protected:
    virtual const char*
    kind_name() const {
      return "any_number_of";
    }
  };

  class one_of : public any_number_of {
  public:
    explicit one_of(std::vector<matchable_ptr> elements,
                    repetition_options options = {});

  protected:
    const char*
    kind_name() const override {
      return "one_of";
    }
  };

} // namespace segram
