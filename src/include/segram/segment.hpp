#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace segram {

  enum class segment_kind { code, whitespace, newline, comment };

  class segment;

  // Borrowed, ordered view of segments. Segments are owned by the caller.
  using segment_list = std::vector<const segment*>;

  class segment {
    segment_kind kind_;
    std::string raw_;
    std::string raw_upper_;
    std::vector<segment> children_;

  public:
    segment(segment_kind kind, std::string raw);

    // Composite segment. Its raw text is the concatenation of its leaves.
    segment(segment_kind kind, std::vector<segment> children);

    segment_kind
    kind() const {
      return kind_;
    }

    const std::string&
    raw() const {
      return raw_;
    }

    const std::string&
    raw_upper() const {
      return raw_upper_;
    }

    bool
    is_code() const {
      return kind_ == segment_kind::code;
    }

    bool
    is_whitespace() const {
      return kind_ == segment_kind::whitespace ||
             kind_ == segment_kind::newline;
    }

    bool
    is_composite() const {
      return !children_.empty();
    }

    const std::vector<segment>&
    children() const {
      return children_;
    }

    // Depth-first traversal of the leaf segments in document order. A leaf
    // yields itself. Each call starts a fresh traversal.
    template <typename F>
    void
    for_each_leaf(F&& f) const {
      if (children_.empty()) {
        f(*this);
        return;
      }
      for (const auto& child : children_)
        child.for_each_leaf(f);
    }

    std::vector<const segment*>
    leaves() const;
  };

  std::string
  to_upper(std::string_view s);

  // True when the string has no non-whitespace content.
  bool
  is_blank(std::string_view s);

  std::vector<std::string>
  raw_upper_leaves(const segment_list& segments);

  std::string
  raw_text(const segment_list& segments);

  struct trimmed_segments {
    segment_list leading;
    segment_list middle;
    segment_list trailing;
  };

  // Split off the leading and trailing runs of non-code segments.
  trimmed_segments
  trim_non_code(const segment_list& segments);

  segment_list
  concat(segment_list lhs, const segment_list& rhs);

} // namespace segram
