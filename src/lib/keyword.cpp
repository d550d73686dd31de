#include <segram/keyword.hpp>

#include <stdexcept>

namespace segram {

  keyword::keyword(std::string text, bool optional)
      : template_(to_upper(text)), optional_(optional) {
    if (is_blank(template_)) {
      throw std::invalid_argument("keyword: template must not be blank");
    }
  }

  match_result
  keyword::match(const segment_list& segments, const parse_context&) const {
    if (segments.empty()) return match_result::from_unmatched(segments);

    const segment* first = segments.front();
    if (!first->is_code() || first->is_composite() ||
        first->raw_upper() != template_) {
      return match_result::from_unmatched(segments);
    }

    return match_result({first},
                        segment_list(segments.begin() + 1, segments.end()));
  }

  simple_set
  keyword::simple(const parse_context&) const {
    return std::vector<std::string>{template_};
  }

  std::string
  keyword::describe() const {
    return "'" + template_ + "'";
  }

} // namespace segram
