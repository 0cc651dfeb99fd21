#include <rdfdec/expat_reader.hpp>

#include <rdfdec/errors.hpp>

#include <expat.h>

#include <cstring>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rdfdec {

  namespace {

    struct attribute {
      qname name;
      std::string prefix;
      std::string value;
    };

    struct event {
      xml_node_type type = xml_node_type::characters;
      qname name;
      std::string prefix;
      std::string text;
      std::vector<attribute> attributes;
      std::size_t depth = 0;
      std::size_t line = 1;
      std::size_t column = 1;
    };

    struct expanded_name {
      qname name;
      std::string prefix;
    };

    // Parse "uri\nlocal\nprefix" into a qname and prefix. Unqualified names
    // have no separator and unprefixed ones no third part.
    expanded_name
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) return {qname{"", std::string(expat_name)}, ""};
      std::string uri(expat_name, sep);
      const char* local = sep + 1;
      const char* sep2 = std::strchr(local, '\n');
      if (sep2 == nullptr) return {qname{std::move(uri), std::string(local)}, ""};
      return {qname{std::move(uri), std::string(local, sep2)},
              std::string(sep2 + 1)};
    }

    bool
    is_whitespace_only(const char* s, std::size_t len) {
      for (std::size_t i = 0; i < len; ++i) {
        if (s[i] != ' ' && s[i] != '\t' && s[i] != '\r' && s[i] != '\n')
          return false;
      }
      return true;
    }

  } // namespace

  struct expat_reader::impl {
    std::istream* in;
    std::size_t chunk_size;
    XML_Parser parser = nullptr;
    std::deque<event> events;
    event current;
    std::size_t current_depth = 0;
    bool finished = false;
    bool seen_content = false;
    // Raised once the events parsed ahead of it have been read.
    std::optional<fault> error;

    impl(std::istream& stream, std::size_t size)
        : in(&stream), chunk_size(size == 0 ? 4096 : size) {
      // '\n' as the namespace separator, with prefixes returned as well
      parser = XML_ParserCreateNS(nullptr, '\n');
      if (parser == nullptr)
        throw std::runtime_error("failed to create expat parser");
      XML_SetReturnNSTriplet(parser, XML_TRUE);
      XML_SetUserData(parser, this);
      XML_SetElementHandler(parser, on_start_element, on_end_element);
      XML_SetCharacterDataHandler(parser, on_character_data);
    }

    ~impl() {
      if (parser != nullptr) XML_ParserFree(parser);
    }

    impl(const impl&) = delete;
    impl&
    operator=(const impl&) = delete;

    void
    stamp(event& ev) const {
      ev.line = static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
      ev.column =
          static_cast<std::size_t>(XML_GetCurrentColumnNumber(parser)) + 1;
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      event ev;
      ev.type = xml_node_type::start_element;
      auto expanded = parse_expat_name(name);
      ev.name = std::move(expanded.name);
      ev.prefix = std::move(expanded.prefix);
      ev.depth = self->current_depth;
      self->stamp(ev);

      for (const char** p = atts; *p != nullptr; p += 2) {
        auto attr_name = parse_expat_name(p[0]);
        ev.attributes.push_back({std::move(attr_name.name),
                                 std::move(attr_name.prefix),
                                 std::string(p[1])});
      }

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      event ev;
      ev.type = xml_node_type::end_element;
      auto expanded = parse_expat_name(name);
      ev.name = std::move(expanded.name);
      ev.prefix = std::move(expanded.prefix);
      ev.depth = self->current_depth;
      self->stamp(ev);

      self->events.push_back(std::move(ev));
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      // Coalesce adjacent character data into a single event
      if (!self->events.empty() &&
          self->events.back().type == xml_node_type::characters) {
        self->events.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      event ev;
      ev.type = xml_node_type::characters;
      ev.text.assign(s, static_cast<std::size_t>(len));
      ev.depth = self->current_depth;
      self->stamp(ev);
      self->events.push_back(std::move(ev));
    }

    // Parse one more chunk of input.
    void
    feed() {
      std::vector<char> buf(chunk_size);
      std::size_t got = 0;
      if (*in) {
        in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
        got = static_cast<std::size_t>(in->gcount());
      }
      bool final = got < buf.size();
      if (!seen_content && !is_whitespace_only(buf.data(), got))
        seen_content = true;

      XML_Status status = XML_Parse(parser, buf.data(), static_cast<int>(got),
                                    final ? XML_TRUE : XML_FALSE);
      if (final) finished = true;
      if (status != XML_STATUS_ERROR) return;

      XML_Error code = XML_GetErrorCode(parser);
      // An empty document holds no statements rather than being malformed.
      if (code == XML_ERROR_NO_ELEMENTS && !seen_content) return;

      auto line = static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
      auto column =
          static_cast<std::size_t>(XML_GetCurrentColumnNumber(parser)) + 1;
      finished = true;
      error = lexical_fault(line, column,
                            std::string("XML: ") + XML_ErrorString(code));
    }

    // A characters event is only complete once something follows it.
    bool
    front_ready() const {
      if (events.empty()) return false;
      return events.front().type != xml_node_type::characters ||
             events.size() > 1 || finished;
    }
  };

  expat_reader::expat_reader(std::istream& in, std::size_t chunk_size)
      : impl_(std::make_unique<impl>(in, chunk_size)) {}

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader& expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    while (!impl_->front_ready() && !impl_->finished)
      impl_->feed();
    if (impl_->events.empty()) {
      if (impl_->error) throw parse_error(*impl_->error);
      return false;
    }
    impl_->current = std::move(impl_->events.front());
    impl_->events.pop_front();
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current.type;
  }

  const qname&
  expat_reader::name() const {
    return impl_->current.name;
  }

  std::string_view
  expat_reader::prefix() const {
    return impl_->current.prefix;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->current.attributes.size();
  }

  const qname&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->current.attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_prefix(std::size_t index) const {
    return impl_->current.attributes[index].prefix;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->current.attributes[index].value;
  }

  std::string_view
  expat_reader::attribute_value(const qname& attr_name) const {
    for (const auto& attr : impl_->current.attributes) {
      if (attr.name == attr_name) return attr.value;
    }
    return {};
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current.text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current.depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current.line;
  }

  std::size_t
  expat_reader::column() const {
    return impl_->current.column;
  }

} // namespace rdfdec
