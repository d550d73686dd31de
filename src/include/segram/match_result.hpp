#pragma once

#include <segram/segment.hpp>

#include <cstddef>
#include <string>

namespace segram {

  class match_result {
    segment_list matched_;
    segment_list unmatched_;

  public:
    match_result() = default;

    match_result(segment_list matched, segment_list unmatched)
        : matched_(std::move(matched)), unmatched_(std::move(unmatched)) {}

    static match_result
    from_unmatched(segment_list segments);

    static match_result
    from_empty();

    static match_result
    from_matched(segment_list segments);

    const segment_list&
    matched() const {
      return matched_;
    }

    const segment_list&
    unmatched() const {
      return unmatched_;
    }

    std::size_t
    matched_length() const {
      return matched_.size();
    }

    bool
    has_match() const {
      return !matched_.empty();
    }

    explicit operator bool() const { return has_match(); }

    bool
    is_complete() const {
      return unmatched_.empty();
    }

    std::string
    raw_matched() const;

    // Left-to-right combination: matched segments concatenate, the
    // unmatched tail comes from the right-hand side.
    friend match_result
    operator+(const match_result& lhs, const match_result& rhs);

    bool
    operator==(const match_result&) const = default;
  };

} // namespace segram
