#include <segram/expat_reader.hpp>

#include <expat.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace segram {

  namespace {

    struct event {
      xml_node_type type;
      std::string namespace_uri;
      std::string local_name;
      std::string text;
      std::vector<std::pair<std::string, std::string>> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

    // Expat reports namespaced names as "uri\nlocal".
    std::pair<std::string, std::string>
    split_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) return {std::string(), std::string(expat_name)};
      return {std::string(expat_name, sep), std::string(sep + 1)};
    }

  } // namespace

  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<event> events;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;

    std::size_t
    current_line() const {
      return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
    }

    const event&
    current() const {
      if (cursor == 0 || cursor > events.size()) {
        throw std::logic_error("expat_reader: no current node");
      }
      return events[cursor - 1];
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      event ev;
      ev.type = xml_node_type::start_element;
      std::tie(ev.namespace_uri, ev.local_name) = split_expat_name(name);
      ev.depth = self->current_depth;
      ev.line = self->current_line();

      for (const char** p = atts; *p != nullptr; p += 2) {
        // Only unqualified attributes are meaningful to the loaders.
        auto [uri, local] = split_expat_name(p[0]);
        if (uri.empty()) ev.attributes.emplace_back(std::move(local), p[1]);
      }

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      event ev;
      ev.type = xml_node_type::end_element;
      std::tie(ev.namespace_uri, ev.local_name) = split_expat_name(name);
      ev.depth = self->current_depth;
      ev.line = self->current_line();

      self->events.push_back(std::move(ev));
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      if (!self->events.empty() &&
          self->events.back().type == xml_node_type::characters) {
        self->events.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      event ev;
      ev.type = xml_node_type::characters;
      ev.text.assign(s, static_cast<std::size_t>(len));
      ev.depth = self->current_depth;
      ev.line = self->current_line();
      self->events.push_back(std::move(ev));
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    XML_Parser parser = XML_ParserCreateNS(nullptr, '\n');
    if (parser == nullptr) {
      throw std::runtime_error("expat_reader: failed to create parser");
    }
    impl_->parser = parser;

    XML_SetUserData(parser, impl_.get());
    XML_SetElementHandler(parser, impl::on_start_element,
                          impl::on_end_element);
    XML_SetCharacterDataHandler(parser, impl::on_character_data);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    std::string error;
    if (status == XML_STATUS_ERROR) {
      error = "expat_reader: XML parse error at line " +
              std::to_string(XML_GetCurrentLineNumber(parser)) + ": " +
              XML_ErrorString(XML_GetErrorCode(parser));
    }

    impl_->parser = nullptr;
    XML_ParserFree(parser);

    if (!error.empty()) throw std::runtime_error(error);
    if (impl_->events.empty()) {
      throw std::runtime_error("expat_reader: no content");
    }
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->events.size()) return false;
    impl_->cursor++;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  std::string_view
  expat_reader::namespace_uri() const {
    return impl_->current().namespace_uri;
  }

  std::string_view
  expat_reader::local_name() const {
    return impl_->current().local_name;
  }

  std::optional<std::string_view>
  expat_reader::attribute(std::string_view name) const {
    for (const auto& [key, value] : impl_->current().attributes) {
      if (key == name) return std::string_view(value);
    }
    return std::nullopt;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

} // namespace segram
