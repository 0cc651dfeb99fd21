#include "rdfxml_decoder.hpp"

#include <rdfdec/blank_scope.hpp>
#include <rdfdec/expat_reader.hpp>
#include <rdfdec/iri.hpp>

#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rdfdec::detail {

  namespace {

    bool
    is_rdf(const qname& name, std::string_view local) {
      return name.is(vocab::rdf_ns, local);
    }

    bool
    is_whitespace_only(std::string_view sv) {
      return sv.find_first_not_of(" \n\r\t") == std::string_view::npos;
    }

    // Names with a fixed syntactic role, never usable as node or property
    // names.
    bool
    is_syntax_term(const qname& name) {
      if (!name.in_namespace(vocab::rdf_ns)) return false;
      static const char* const terms[] = {
          "RDF",      "ID",         "about",           "parseType",
          "resource", "nodeID",     "datatype",        "aboutEach",
          "bagID",    "aboutEachPrefix"};
      for (const char* t : terms) {
        if (name.local_name() == t) return true;
      }
      return false;
    }

    void
    escape_text(std::string& out, std::string_view s) {
      for (char c : s) {
        switch (c) {
          case '&':
            out += "&amp;";
            break;
          case '<':
            out += "&lt;";
            break;
          case '>':
            out += "&gt;";
            break;
          case '\r':
            out += "&#xD;";
            break;
          default:
            out += c;
        }
      }
    }

    void
    escape_attribute(std::string& out, std::string_view s) {
      for (char c : s) {
        switch (c) {
          case '&':
            out += "&amp;";
            break;
          case '<':
            out += "&lt;";
            break;
          case '"':
            out += "&quot;";
            break;
          case '\t':
            out += "&#x9;";
            break;
          case '\n':
            out += "&#xA;";
            break;
          case '\r':
            out += "&#xD;";
            break;
          default:
            out += c;
        }
      }
    }

    enum class frame_kind {
      root,     // rdf:RDF
      node,     // node element
      property, // property element
      markup,   // element inside an rdf:parseType="Literal" property
    };

    enum class property_mode {
      text,       // literal text or a single nested node element
      empty,      // object given by attributes; no content allowed
      resource,   // rdf:parseType="Resource"
      literal,    // rdf:parseType="Literal"
      collection, // rdf:parseType="Collection"
    };

    struct frame {
      frame_kind kind = frame_kind::node;
      std::optional<std::string> base; // xml:base in effect from here down
      std::string lang;                // inherited xml:lang
      std::size_t line = 0;
      std::size_t column = 0;

      // node frames, and resource-mode property frames for their children
      resource subject;
      int li_counter = 0;

      // property frames
      iri predicate;
      property_mode mode = property_mode::text;
      std::string datatype;
      std::optional<iri> reify_as;
      std::string text;
      bool has_object = false;
      std::vector<resource> items;
      std::string markup;
      // prefix -> namespace declared in the markup written so far, per depth
      std::vector<std::map<std::string, std::string>> declared;
    };

    class rdfxml_decoder : public triple_decoder {
    public:
      rdfxml_decoder(std::istream& in, const decoder_options& options)
          : reader_(in, options.chunk_size), base_(options.base) {}

      decode_result<triple>
      decode() override {
        try {
          while (pending_.empty()) {
            if (!reader_.read()) return end_of_stream{};
            switch (reader_.node_type()) {
              case xml_node_type::start_element:
                start_element();
                break;
              case xml_node_type::end_element:
                end_element();
                break;
              case xml_node_type::characters:
                characters();
                break;
            }
          }
        } catch (const parse_error& e) {
          pending_.clear();
          return e.details();
        }
        triple t = std::move(pending_.front());
        pending_.pop_front();
        return t;
      }

      void
      set_base(const iri& base) override {
        base_ = base.value();
      }

    private:
      expat_reader reader_;
      std::string base_;
      blank_scope blanks_;
      std::vector<frame> stack_;
      std::deque<triple> pending_;

      [[noreturn]] void
      fail(const std::string& context, const std::string& description) const {
        throw parse_error(syntax_fault(reader_.line(), reader_.column(),
                                       context, description));
      }

      void
      emit(const resource& s, const iri& p, term o) {
        pending_.push_back(triple{s, p, std::move(o)});
      }

      std::string
      current_base() const {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
          if (it->base) return *it->base;
        }
        return base_;
      }

      iri
      resolve(std::string_view ref, const std::string& base) const {
        return iri(resolve_iri(base, ref));
      }

      // rdf:ID values name a fragment of the in-scope base.
      iri
      resolve_id(std::string_view id, const std::string& base) const {
        auto hash = base.find('#');
        auto without_fragment = base.substr(0, hash);
        return iri(resolve_iri(without_fragment, "#" + std::string(id)));
      }

      std::optional<std::string>
      rdf_attr(std::string_view local) const {
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          if (is_rdf(reader_.attribute_name(i), local))
            return std::string(reader_.attribute_value(i));
        }
        return std::nullopt;
      }

      // rdf:aboutEach, rdf:aboutEachPrefix and rdf:bagID were dropped from
      // the grammar.
      void
      reject_removed_attributes(const std::string& context) const {
        static const char* const removed[] = {"aboutEach", "aboutEachPrefix",
                                              "bagID"};
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          for (const char* r : removed) {
            if (is_rdf(reader_.attribute_name(i), r))
              fail(context, std::string("rdf:") + r + " is not supported");
          }
        }
      }

      // Attributes that state properties of the subject.
      bool
      is_property_attribute(const qname& name) const {
        if (!name.qualified() || name.in_namespace(xml_namespace)) return false;
        if (is_syntax_term(name)) return false;
        if (is_rdf(name, "Description") || is_rdf(name, "li")) return false;
        return true;
      }

      void
      emit_property_attributes(const resource& subject, const frame& f) {
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          const auto& name = reader_.attribute_name(i);
          if (!is_property_attribute(name)) continue;
          std::string value(reader_.attribute_value(i));
          if (is_rdf(name, "type")) {
            emit(subject, vocab::rdf_type,
                 resolve(value, f.base ? *f.base : current_base()));
          } else if (f.lang.empty()) {
            emit(subject, iri(name.concatenated()), literal(std::move(value)));
          } else {
            emit(subject, iri(name.concatenated()),
                 literal(std::move(value), f.lang));
          }
        }
      }

      bool
      has_property_attributes() const {
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          if (is_property_attribute(reader_.attribute_name(i))) return true;
        }
        return false;
      }

      void
      reify(const iri& statement, const resource& s, const iri& p,
            const term& o) {
        emit(statement, vocab::rdf_type, vocab::rdf_statement);
        emit(statement, vocab::rdf_subject, to_term(s));
        emit(statement, vocab::rdf_predicate, p);
        emit(statement, vocab::rdf_object, o);
      }

      // Emit subject-predicate-object for a property frame, reified when the
      // property element carried rdf:ID.
      void
      emit_statement(const frame& prop, const resource& s, term o) {
        if (prop.reify_as) {
          emit(s, prop.predicate, o);
          reify(*prop.reify_as, s, prop.predicate, o);
        } else {
          emit(s, prop.predicate, std::move(o));
        }
      }

      // A frame for the current element with xml:base and xml:lang applied.
      frame
      open_frame(frame_kind kind) const {
        frame f;
        f.kind = kind;
        f.line = reader_.line();
        f.column = reader_.column();
        f.lang = stack_.empty() ? std::string() : stack_.back().lang;
        auto outer_base = current_base();
        auto xml_base =
            reader_.attribute_value(qname{std::string(xml_namespace), "base"});
        if (!xml_base.empty()) f.base = resolve_iri(outer_base, xml_base);
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          if (reader_.attribute_name(i).is(xml_namespace, "lang"))
            f.lang = std::string(reader_.attribute_value(i));
        }
        return f;
      }

      // -------------------------------------------------------------------
      // Events
      // -------------------------------------------------------------------

      void
      start_element() {
        if (stack_.empty()) {
          if (is_rdf(reader_.name(), "RDF")) {
            stack_.push_back(open_frame(frame_kind::root));
            return;
          }
          start_node_element();
          return;
        }

        auto& parent = stack_.back();
        switch (parent.kind) {
          case frame_kind::root:
            start_node_element();
            return;
          case frame_kind::node:
            start_property_element(stack_.size() - 1);
            return;
          case frame_kind::markup:
            start_markup();
            return;
          case frame_kind::property:
            break;
        }

        switch (parent.mode) {
          case property_mode::text:
            if (parent.has_object)
              fail("property element",
                   "property element has more than one object");
            if (!is_whitespace_only(parent.text))
              fail("property element",
                   "property element mixes text and a node element");
            if (!parent.datatype.empty())
              fail("property element",
                   "rdf:datatype on a property element with a node element");
            start_node_element();
            return;
          case property_mode::resource:
            start_property_element(stack_.size() - 1);
            return;
          case property_mode::collection:
            start_node_element();
            return;
          case property_mode::literal:
            start_markup();
            return;
          case property_mode::empty:
            fail("empty property element",
                 "element content in a property element whose object is "
                 "given by attributes");
        }
      }

      void
      start_node_element() {
        const auto& name = reader_.name();
        if (!name.qualified())
          fail("node element", "element '" + name.local_name() +
                                   "' has no namespace");
        if (is_syntax_term(name) || is_rdf(name, "li"))
          fail("node element", "rdf:" + name.local_name() +
                                   " is not allowed as a node element");
        reject_removed_attributes("node element");

        frame f = open_frame(frame_kind::node);
        auto base = f.base ? *f.base : current_base();

        auto about = rdf_attr("about");
        auto id = rdf_attr("ID");
        auto node_id = rdf_attr("nodeID");
        if (int(about.has_value()) + int(id.has_value()) +
                int(node_id.has_value()) >
            1)
          fail("node element",
               "rdf:about, rdf:ID and rdf:nodeID are mutually exclusive");

        if (about)
          f.subject = resolve(*about, base);
        else if (id)
          f.subject = resolve_id(*id, base);
        else if (node_id)
          f.subject = blanks_.labelled(*node_id);
        else
          f.subject = blanks_.fresh();

        if (!stack_.empty() && stack_.back().kind == frame_kind::property) {
          auto& prop = stack_.back();
          if (prop.mode == property_mode::collection) {
            prop.items.push_back(f.subject);
          } else {
            prop.has_object = true;
            const auto& subject = stack_[stack_.size() - 2].subject;
            emit_statement(prop, subject, to_term(f.subject));
          }
        }

        if (!is_rdf(name, "Description"))
          emit(f.subject, vocab::rdf_type, iri(name.concatenated()));
        emit_property_attributes(f.subject, f);
        stack_.push_back(std::move(f));
      }

      // `owner` indexes the frame whose subject the property describes.
      void
      start_property_element(std::size_t owner) {
        const auto& name = reader_.name();
        if (!name.qualified())
          fail("property element", "element '" + name.local_name() +
                                       "' has no namespace");
        if (is_syntax_term(name) || is_rdf(name, "Description"))
          fail("property element", "rdf:" + name.local_name() +
                                       " is not allowed as a property element");
        reject_removed_attributes("property element");

        frame f = open_frame(frame_kind::property);
        auto base = f.base ? *f.base : current_base();
        resource subject = stack_[owner].subject;

        if (is_rdf(name, "li"))
          f.predicate = iri(vocab::rdf_ns + "_" +
                            std::to_string(++stack_[owner].li_counter));
        else
          f.predicate = iri(name.concatenated());

        if (auto id = rdf_attr("ID")) f.reify_as = resolve_id(*id, base);
        if (auto dt = rdf_attr("datatype")) f.datatype = resolve(*dt, base).value();

        auto parse_type = rdf_attr("parseType");
        auto resource_ref = rdf_attr("resource");
        auto node_id = rdf_attr("nodeID");

        if (parse_type) {
          if (resource_ref || node_id || has_property_attributes())
            fail("property element",
                 "rdf:parseType cannot be combined with rdf:resource, "
                 "rdf:nodeID or property attributes");
          if (*parse_type == "Resource") {
            f.mode = property_mode::resource;
            auto node = blanks_.fresh();
            emit_statement(f, subject, node);
            f.subject = node;
          } else if (*parse_type == "Collection") {
            f.mode = property_mode::collection;
          } else {
            f.mode = property_mode::literal;
            f.declared.emplace_back();
          }
          stack_.push_back(std::move(f));
          return;
        }

        if (resource_ref && node_id)
          fail("property element",
               "rdf:resource and rdf:nodeID are mutually exclusive");

        if (resource_ref || node_id || has_property_attributes()) {
          f.mode = property_mode::empty;
          resource object;
          if (resource_ref)
            object = resolve(*resource_ref, base);
          else if (node_id)
            object = blanks_.labelled(*node_id);
          else
            object = blanks_.fresh();
          emit_statement(f, subject, to_term(object));
          emit_property_attributes(object, f);
          f.has_object = true;
        }
        stack_.push_back(std::move(f));
      }

      frame&
      literal_owner() {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
          if (it->kind == frame_kind::property &&
              it->mode == property_mode::literal)
            return *it;
        }
        throw std::logic_error("rdfxml_decoder: markup outside a literal");
      }

      // Declare a namespace binding in the literal markup unless an
      // enclosing element of the literal already did.
      void
      declare(frame& owner, std::string& tag, std::string_view prefix,
              const std::string& uri) {
        std::string key(prefix);
        for (auto it = owner.declared.rbegin(); it != owner.declared.rend();
             ++it) {
          auto found = it->find(key);
          if (found != it->end()) {
            if (found->second == uri) return;
            break;
          }
        }
        owner.declared.back()[key] = uri;
        tag += key.empty() ? " xmlns=\"" : " xmlns:" + key + "=\"";
        escape_attribute(tag, uri);
        tag += '"';
      }

      void
      start_markup() {
        frame& owner = literal_owner();
        owner.declared.emplace_back();

        std::string tag = "<";
        if (!reader_.prefix().empty()) {
          tag += reader_.prefix();
          tag += ':';
        }
        tag += reader_.name().local_name();
        if (reader_.name().qualified())
          declare(owner, tag, reader_.prefix(), reader_.name().namespace_uri());

        std::string attrs;
        for (std::size_t i = 0; i < reader_.attribute_count(); ++i) {
          const auto& an = reader_.attribute_name(i);
          auto ap = reader_.attribute_prefix(i);
          attrs += ' ';
          if (!ap.empty()) {
            if (!an.in_namespace(xml_namespace))
              declare(owner, tag, ap, an.namespace_uri());
            attrs += ap;
            attrs += ':';
          }
          attrs += an.local_name();
          attrs += "=\"";
          escape_attribute(attrs, reader_.attribute_value(i));
          attrs += '"';
        }
        owner.markup += tag + attrs + ">";
        stack_.push_back(open_frame(frame_kind::markup));
      }

      void
      end_element() {
        frame f = std::move(stack_.back());
        stack_.pop_back();

        if (f.kind == frame_kind::markup) {
          frame& owner = literal_owner();
          owner.declared.pop_back();
          owner.markup += "</";
          if (!reader_.prefix().empty()) {
            owner.markup += reader_.prefix();
            owner.markup += ':';
          }
          owner.markup += reader_.name().local_name();
          owner.markup += '>';
          return;
        }
        if (f.kind != frame_kind::property) return;

        const auto& subject = stack_.back().subject;
        switch (f.mode) {
          case property_mode::text:
            if (f.has_object) return;
            if (!f.datatype.empty())
              emit_statement(f, subject, literal(f.text, iri(f.datatype)));
            else if (!f.lang.empty())
              emit_statement(f, subject, literal(f.text, f.lang));
            else
              emit_statement(f, subject, literal(f.text));
            return;
          case property_mode::literal:
            emit_statement(f, subject,
                           literal(f.markup, vocab::rdf_xml_literal));
            return;
          case property_mode::collection:
            end_collection(f, subject);
            return;
          case property_mode::empty:
          case property_mode::resource:
            return;
        }
      }

      void
      end_collection(const frame& f, const resource& subject) {
        if (f.items.empty()) {
          emit_statement(f, subject, vocab::rdf_nil);
          return;
        }
        blank_node node = blanks_.fresh();
        emit_statement(f, subject, node);
        for (std::size_t i = 0; i < f.items.size(); ++i) {
          emit(node, vocab::rdf_first, to_term(f.items[i]));
          if (i + 1 == f.items.size()) {
            emit(node, vocab::rdf_rest, vocab::rdf_nil);
          } else {
            auto next = blanks_.fresh();
            emit(node, vocab::rdf_rest, next);
            node = std::move(next);
          }
        }
      }

      void
      characters() {
        if (stack_.empty()) return;
        auto& top = stack_.back();
        if (top.kind == frame_kind::markup ||
            (top.kind == frame_kind::property &&
             top.mode == property_mode::literal)) {
          escape_text(literal_owner().markup, reader_.text());
          return;
        }
        if (top.kind == frame_kind::property &&
            top.mode == property_mode::text) {
          if (top.has_object && !is_whitespace_only(reader_.text()))
            fail("property element",
                 "property element mixes text and a node element");
          top.text += reader_.text();
          return;
        }
        if (!is_whitespace_only(reader_.text()))
          fail("element content", "unexpected text '" +
                                      std::string(reader_.text()) + "'");
      }
    };

  } // namespace

  std::unique_ptr<triple_decoder>
  make_rdfxml_decoder(std::istream& in, const decoder_options& options) {
    return std::make_unique<rdfxml_decoder>(in, options);
  }

} // namespace rdfdec::detail
