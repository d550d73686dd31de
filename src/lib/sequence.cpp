#include <segram/sequence.hpp>

#include <algorithm>
#include <stdexcept>

namespace segram {

  sequence::sequence(std::vector<matchable_ptr> elements,
                     sequence_options options)
      : elements_(std::move(elements)), options_(options) {
    if (elements_.empty()) {
      throw std::invalid_argument("sequence: needs at least one element");
    }
    if (std::any_of(elements_.begin(), elements_.end(),
                    [](const matchable_ptr& e) { return !e; })) {
      throw std::invalid_argument("sequence: null element");
    }
  }

  match_result
  sequence::match(const segment_list& segments,
                  const parse_context& ctx) const {
    segment_list matched;
    segment_list unmatched = segments;

    for (std::size_t i = 0; i < elements_.size(); ++i) {
      const auto& element = elements_[i];

      segment_list gap;
      if (i > 0 && options_.allow_gaps) {
        auto trimmed = trim_non_code(unmatched);
        gap = std::move(trimmed.leading);
        unmatched = concat(std::move(trimmed.middle), trimmed.trailing);
      }

      match_result m = match_result::from_unmatched(unmatched);
      if (!unmatched.empty()) {
        auto child = ctx.deeper_match();
        m = element->match(unmatched, child);
      }

      if (!m) {
        if (!element->is_optional()) {
          return match_result::from_unmatched(segments);
        }
        unmatched = concat(std::move(gap), unmatched);
        continue;
      }

      matched = concat(concat(std::move(matched), gap), m.matched());
      unmatched = m.unmatched();
    }

    return match_result(std::move(matched), std::move(unmatched));
  }

  simple_set
  sequence::simple(const parse_context& ctx) const {
    std::vector<std::string> result;
    for (const auto& element : elements_) {
      auto s = element->simple(ctx);
      if (!s) return std::nullopt;
      result.insert(result.end(), s->begin(), s->end());
      if (!element->is_optional()) break;
    }
    return result;
  }

  std::string
  sequence::describe() const {
    std::string result = "sequence(";
    for (std::size_t i = 0; i < elements_.size(); ++i) {
      if (i > 0) result += ", ";
      result += elements_[i]->describe();
    }
    return result + ")";
  }

} // namespace segram
