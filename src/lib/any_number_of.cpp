#include <segram/any_number_of.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace segram {

  namespace {

    void
    validate(const std::vector<matchable_ptr>& elements,
             const repetition_options& options) {
      if (std::any_of(elements.begin(), elements.end(),
                      [](const matchable_ptr& e) { return !e; })) {
        throw std::invalid_argument("any_number_of: null element");
      }
      if (options.max_times) {
        if (*options.max_times == 0) {
          throw std::invalid_argument(
              "any_number_of: max_times must be positive");
        }
        if (*options.max_times < options.min_times) {
          throw std::invalid_argument(
              "any_number_of: max_times is less than min_times");
        }
      }
    }

    repetition_options
    exactly_once(repetition_options options) {
      options.min_times = 1;
      options.max_times = 1;
      return options;
    }

    std::string
    describe_all(const std::vector<matchable_ptr>& elements) {
      std::string result;
      for (const auto& e : elements) {
        if (!result.empty()) result += ", ";
        result += e->describe();
      }
      return result;
    }

    // First leaf string with non-whitespace content.
    const std::string*
    first_meaningful(const std::vector<std::string>& leaves) {
      for (const auto& s : leaves) {
        if (!is_blank(s)) return &s;
      }
      return nullptr;
    }

  } // namespace

  any_number_of::any_number_of(std::vector<matchable_ptr> elements,
                               repetition_options options)
      : elements_(std::move(elements)), options_(std::move(options)) {
    validate(elements_, options_);
  }

  simple_set
  any_number_of::simple(const parse_context& ctx) const {
    std::vector<std::string> result;
    for (const auto& e : elements_) {
      auto s = e->simple(ctx);
      if (!s) return std::nullopt;
      result.insert(result.end(), s->begin(), s->end());
    }
    return result;
  }

  bool
  any_number_of::is_optional() const {
    return options_.optional || options_.min_times == 0;
  }

  std::string
  any_number_of::describe() const {
    return std::string(kind_name()) + "(" + describe_all(elements_) + ")";
  }

  std::vector<matchable_ptr>
  any_number_of::prune_options(const segment_list& segments,
                               const parse_context& ctx) const {
    if (!ctx.settings().prune_options) return elements_;

    const auto leaves = raw_upper_leaves(segments);
    const std::string* first = first_meaningful(leaves);

    std::vector<matchable_ptr> available;
    std::vector<matchable_ptr> pruned;
    std::size_t non_simple = 0;
    std::size_t matched_simple = 0;

    for (const auto& e : elements_) {
      auto candidates = e->simple(ctx);
      if (!candidates) {
        available.push_back(e);
        ++non_simple;
        continue;
      }

      bool keep = false;
      for (const auto& candidate : *candidates) {
        if (std::find(leaves.begin(), leaves.end(), candidate) ==
            leaves.end())
          continue;

        // A meaningful candidate has to be the first meaningful leaf, not
        // just appear somewhere ahead.
        if (!is_blank(candidate)) {
          if (first == nullptr) {
            throw std::logic_error(
                "any_number_of: meaningful lookahead candidate '" +
                candidate + "' checked against input with no meaningful "
                "segments");
          }
          if (*first != candidate) continue;
        }

        keep = true;
        break;
      }

      if (keep) {
        available.push_back(e);
        ++matched_simple;
      } else {
        pruned.push_back(e);
      }
    }

    auto& log = ctx.logger();
    if (log.should_log(spdlog::level::trace)) {
      log.trace("{:>{}}{} PRN ns={} ps={} ms={} pruned=[{}] opts=[{}]", "",
                ctx.match_depth(), kind_name(), non_simple, pruned.size(),
                matched_simple, describe_all(pruned),
                available.empty() ? std::string("ALL")
                                  : describe_all(available));
    }

    return available;
  }

  match_result
  any_number_of::match_once(const segment_list& segments,
                            const parse_context& ctx) const {
    auto available = prune_options(segments, ctx);
    if (available.empty()) return match_result::from_unmatched(segments);

    std::optional<match_result> best;
    for (const auto& option : available) {
      match_result m;
      {
        auto child = ctx.deeper_match();
        m = option->match(segments, child);
      }

      if (m.is_complete()) return m;

      if (!m) continue;

      // Strictly longer only, so ties stay with the earlier element.
      if (best && m.matched_length() <= best->matched_length()) continue;

      best = std::move(m);
      if (ctx.logger().should_log(spdlog::level::trace)) {
        ctx.logger().trace("{:>{}}{} SAVE match_length={} opt={} m={}", "",
                           ctx.match_depth(), kind_name(),
                           best->matched_length(), option->describe(),
                           best->raw_matched());
      }
    }

    if (best) return std::move(*best);
    return match_result::from_unmatched(segments);
  }

  match_result
  any_number_of::match(const segment_list& segments,
                       const parse_context& ctx) const {
    ctx.logger().debug("{:>{}}{} match: {} segment(s)", "", ctx.match_depth(),
                       kind_name(), segments.size());

    if (options_.exclude) {
      auto child = ctx.deeper_match();
      if (options_.exclude->match(segments, child)) {
        ctx.logger().debug("{:>{}}{} excluded by {}", "", ctx.match_depth(),
                           kind_name(), options_.exclude->describe());
        return match_result::from_unmatched(segments);
      }
    }

    segment_list matched;
    segment_list unmatched = segments;
    std::size_t n_matches = 0;

    while (true) {
      if (options_.max_times && n_matches >= *options_.max_times) {
        return match_result(std::move(matched), std::move(unmatched));
      }

      if (unmatched.empty()) {
        if (n_matches >= options_.min_times) {
          return match_result::from_matched(std::move(matched));
        }
        return match_result::from_unmatched(segments);
      }

      segment_list gap;
      if (n_matches > 0 && options_.allow_gaps) {
        auto trimmed = trim_non_code(unmatched);
        gap = std::move(trimmed.leading);
        unmatched = concat(std::move(trimmed.middle), trimmed.trailing);
      }

      auto m = match_once(unmatched, ctx);
      if (!m) {
        if (n_matches >= options_.min_times) {
          return match_result(std::move(matched),
                              concat(std::move(gap), unmatched));
        }
        return match_result::from_unmatched(segments);
      }

      matched = concat(concat(std::move(matched), gap), m.matched());
      unmatched = m.unmatched();
      ++n_matches;
    }
  }

  one_of::one_of(std::vector<matchable_ptr> elements,
                 repetition_options options)
      : any_number_of(std::move(elements), exactly_once(std::move(options))) {}

} // namespace segram
