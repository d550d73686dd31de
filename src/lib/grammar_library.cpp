#include <segram/grammar_library.hpp>

#include <stdexcept>

namespace segram {

  void
  grammar_library::add(std::string name, matchable_ptr rule) {
    if (!rule) {
      throw std::invalid_argument("grammar_library: null rule '" + name +
                                  "'");
    }
    if (rules_.count(name) != 0) {
      throw std::invalid_argument("grammar_library: duplicate rule '" + name +
                                  "'");
    }
    rules_.emplace(std::move(name), std::move(rule));
  }

  const matchable*
  grammar_library::find(const std::string& name) const {
    auto it = rules_.find(name);
    if (it == rules_.end()) return nullptr;
    return it->second.get();
  }

  bool
  grammar_library::contains(const std::string& name) const {
    return rules_.count(name) != 0;
  }

  std::size_t
  grammar_library::size() const {
    return rules_.size();
  }

  std::vector<std::string>
  grammar_library::names() const {
    std::vector<std::string> result;
    result.reserve(rules_.size());
    for (const auto& [name, rule] : rules_)
      result.push_back(name);
    return result;
  }

} // namespace segram
