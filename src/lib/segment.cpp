#include <segram/segment.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace segram {

  segment::segment(segment_kind kind, std::string raw)
      : kind_(kind), raw_(std::move(raw)), raw_upper_(to_upper(raw_)) {}

  segment::segment(segment_kind kind, std::vector<segment> children)
      : kind_(kind), children_(std::move(children)) {
    if (children_.empty()) {
      throw std::invalid_argument("segment: composite segment needs children");
    }
    for (const auto& child : children_)
      raw_ += child.raw();
    raw_upper_ = to_upper(raw_);
  }

  std::vector<const segment*>
  segment::leaves() const {
    std::vector<const segment*> result;
    for_each_leaf([&](const segment& leaf) { result.push_back(&leaf); });
    return result;
  }

  std::string
  to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::toupper(c));
                   });
    return result;
  }

  bool
  is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
      return std::isspace(c) != 0;
    });
  }

  std::vector<std::string>
  raw_upper_leaves(const segment_list& segments) {
    std::vector<std::string> result;
    for (const segment* seg : segments) {
      seg->for_each_leaf(
          [&](const segment& leaf) { result.push_back(leaf.raw_upper()); });
    }
    return result;
  }

  std::string
  raw_text(const segment_list& segments) {
    std::string result;
    for (const segment* seg : segments)
      result += seg->raw();
    return result;
  }

  trimmed_segments
  trim_non_code(const segment_list& segments) {
    auto first = std::find_if(segments.begin(), segments.end(),
                              [](const segment* s) { return s->is_code(); });
    if (first == segments.end()) return {segments, {}, {}};

    auto last = std::find_if(segments.rbegin(), segments.rend(),
                             [](const segment* s) { return s->is_code(); })
                    .base();

    return {segment_list(segments.begin(), first),
            segment_list(first, last),
            segment_list(last, segments.end())};
  }

  segment_list
  concat(segment_list lhs, const segment_list& rhs) {
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
  }

} // namespace segram
