#pragma once

#include <spdlog/logger.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace segram {

  class grammar_library;

  struct parse_settings {
    std::size_t max_match_depth = 255;
    bool prune_options = true;
    int verbosity = 0;
  };

  class recursion_error : public std::runtime_error {
  public:
    explicit recursion_error(std::size_t depth);

    std::size_t
    depth() const {
      return depth_;
    }

  private:
    std::size_t depth_;
  };

  // Per-attempt matching context. Child contexts are values scoped to the
  // nested match that requested them; nothing flows back to the parent.
  class parse_context {
    const parse_settings* settings_;
    const grammar_library* library_;
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t match_depth_ = 0;

  public:
    explicit parse_context(const parse_settings& settings,
                           const grammar_library* library = nullptr,
                           std::shared_ptr<spdlog::logger> logger = nullptr);

    parse_context(const parse_context&) = delete;
    parse_context&
    operator=(const parse_context&) = delete;

    parse_context(parse_context&&) = default;
    parse_context&
    operator=(parse_context&&) = delete;

    // Throws recursion_error when the child would exceed max_match_depth.
    parse_context
    deeper_match() const;

    std::size_t
    match_depth() const {
      return match_depth_;
    }

    const parse_settings&
    settings() const {
      return *settings_;
    }

    const grammar_library*
    library() const {
      return library_;
    }

    spdlog::logger&
    logger() const {
      return *logger_;
    }

  private:
    parse_context(const parse_context& parent, std::size_t depth);
  };

} // namespace segram
