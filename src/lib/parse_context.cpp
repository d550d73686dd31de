#include <segram/parse_context.hpp>

#include <spdlog/spdlog.h>

namespace segram {

  recursion_error::recursion_error(std::size_t depth)
      : std::runtime_error("parse_context: maximum match depth of " +
                           std::to_string(depth) +
                           " exceeded (cyclic grammar?)"),
        depth_(depth) {}

  parse_context::parse_context(const parse_settings& settings,
                               const grammar_library* library,
                               std::shared_ptr<spdlog::logger> logger)
      : settings_(&settings), library_(library), logger_(std::move(logger)) {
    if (!logger_) logger_ = spdlog::default_logger();
  }

  parse_context::parse_context(const parse_context& parent, std::size_t depth)
      : settings_(parent.settings_), library_(parent.library_),
        logger_(parent.logger_), match_depth_(depth) {}

  parse_context
  parse_context::deeper_match() const {
    if (match_depth_ + 1 > settings_->max_match_depth) {
      throw recursion_error(settings_->max_match_depth);
    }
    return parse_context(*this, match_depth_ + 1);
  }

} // namespace segram
