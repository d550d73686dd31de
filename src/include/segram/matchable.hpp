#pragma once

#include <segram/match_result.hpp>
#include <segram/parse_context.hpp>
#include <segram/segment.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace segram {

  // Candidate leading raw_upper strings. std::nullopt means the element
  // cannot provide them and must always be matched in full.
  using simple_set = std::optional<std::vector<std::string>>;

  class matchable {
  public:
    virtual ~matchable() = default;

    virtual match_result
    match(const segment_list& segments, const parse_context& ctx) const = 0;

    virtual simple_set
    simple(const parse_context& ctx) const = 0;

    virtual bool
    is_optional() const = 0;

    virtual std::string
    describe() const = 0;
  };

  using matchable_ptr = std::shared_ptr<const matchable>;

} // namespace segram
