#pragma once

#include <segram/matchable.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace segram {

  class grammar_library {
    std::map<std::string, matchable_ptr> rules_;
    std::string root_;

  public:
    grammar_library() = default;

    // Throws std::invalid_argument on a duplicate name or a null rule.
    void
    add(std::string name, matchable_ptr rule);

    const matchable*
    find(const std::string& name) const;

    bool
    contains(const std::string& name) const;

    std::size_t
    size() const;

    std::vector<std::string>
    names() const;

    const std::string&
    root() const {
      return root_;
    }

    void
    set_root(std::string name) {
      root_ = std::move(name);
    }
  };

} // namespace segram
