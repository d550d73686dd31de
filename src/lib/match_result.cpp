#include <segram/match_result.hpp>

namespace segram {

  match_result
  match_result::from_unmatched(segment_list segments) {
    return match_result({}, std::move(segments));
  }

  match_result
  match_result::from_empty() {
    return match_result({}, {});
  }

  match_result
  match_result::from_matched(segment_list segments) {
    return match_result(std::move(segments), {});
  }

  std::string
  match_result::raw_matched() const {
    return raw_text(matched_);
  }

  match_result
  operator+(const match_result& lhs, const match_result& rhs) {
    return match_result(concat(lhs.matched_, rhs.matched_), rhs.unmatched_);
  }

} // namespace segram
