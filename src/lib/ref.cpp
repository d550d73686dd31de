#include <segram/ref.hpp>

#include <segram/grammar_library.hpp>

#include <stdexcept>

namespace segram {

  namespace {

    const matchable&
    resolve(const std::string& name, const parse_context& ctx) {
      if (ctx.library() == nullptr) {
        throw std::runtime_error("ref: no grammar library to resolve '" +
                                 name + "'");
      }
      const matchable* rule = ctx.library()->find(name);
      if (rule == nullptr) {
        throw std::runtime_error("ref: unknown rule '" + name + "'");
      }
      return *rule;
    }

  } // namespace

  ref::ref(std::string name, bool optional)
      : name_(std::move(name)), optional_(optional) {
    if (name_.empty()) {
      throw std::invalid_argument("ref: rule name must not be empty");
    }
  }

  match_result
  ref::match(const segment_list& segments, const parse_context& ctx) const {
    const matchable& rule = resolve(name_, ctx);
    auto child = ctx.deeper_match();
    return rule.match(segments, child);
  }

  simple_set
  ref::simple(const parse_context& ctx) const {
    if (ctx.library() == nullptr) return std::nullopt;
    const matchable* rule = ctx.library()->find(name_);
    if (rule == nullptr) return std::nullopt;

    auto child = ctx.deeper_match();
    return rule->simple(child);
  }

  std::string
  ref::describe() const {
    return "<" + name_ + ">";
  }

} // namespace segram
