#include "turtle_decoder.hpp"

#include "grammar.hpp"

#include <rdfdec/blank_scope.hpp>
#include <rdfdec/iri.hpp>
#include <rdfdec/token_buffer.hpp>
#include <rdfdec/turtle_lexer.hpp>

#include <deque>
#include <string>
#include <unordered_map>
#include <utility>

namespace rdfdec::detail {

  namespace {

    class turtle_decoder : public triple_decoder {
    public:
      turtle_decoder(std::istream& in, const decoder_options& options)
          : tokens_(turtle_lexer(in)), base_(options.base) {}

      decode_result<triple>
      decode() override {
        try {
          while (pending_.empty()) {
            if (tokens_.peek().kind == token_kind::eof) return end_of_stream{};
            parse_statement();
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
      token_buffer<turtle_lexer> tokens_;
      std::string base_;
      std::unordered_map<std::string, std::string> prefixes_;
      blank_scope blanks_;
      // Triples of the last statement not yet handed out. Cleared when a
      // statement fails part way.
      std::deque<triple> pending_;

      void
      emit(const resource& s, const iri& p, term o) {
        pending_.push_back(triple{s, p, std::move(o)});
      }

      iri
      resolve(const std::string& ref) const {
        return iri(resolve_iri(base_, ref));
      }

      iri
      expand(const token& t) const {
        auto colon = t.text.find(':');
        auto prefix = t.text.substr(0, colon);
        auto it = prefixes_.find(prefix);
        if (it == prefixes_.end())
          throw parse_error(syntax_fault(t.line, t.column, "prefixed name",
                                         "undefined prefix '" + prefix + "'"));
        return iri(it->second + t.text.substr(colon + 1));
      }

      // -------------------------------------------------------------------
      // Statements
      // -------------------------------------------------------------------

      void
      parse_statement() {
        switch (tokens_.peek().kind) {
          case token_kind::kw_prefix:
            tokens_.next();
            parse_prefix_id();
            expect(tokens_, "dot", {token_kind::dot});
            return;
          case token_kind::kw_base:
            tokens_.next();
            parse_base();
            expect(tokens_, "dot", {token_kind::dot});
            return;
          case token_kind::kw_sparql_prefix:
            tokens_.next();
            parse_prefix_id();
            return;
          case token_kind::kw_sparql_base:
            tokens_.next();
            parse_base();
            return;
          default:
            break;
        }

        parse_triples();
        expect(tokens_, "dot", {token_kind::dot});
      }

      void
      parse_prefix_id() {
        token name = expect(tokens_, "prefix name", {token_kind::prefixed_name});
        auto colon = name.text.find(':');
        if (colon + 1 != name.text.size())
          throw parse_error(syntax_fault(name.line, name.column, "prefix name",
                                         "invalid prefix name '" + name.text +
                                             "'"));
        token ref = expect(tokens_, "prefix IRI", {token_kind::iri_ref});
        prefixes_[name.text.substr(0, colon)] = resolve(ref.text).value();
      }

      void
      parse_base() {
        token ref = expect(tokens_, "base IRI", {token_kind::iri_ref});
        base_ = resolve(ref.text).value();
      }

      void
      parse_triples() {
        if (accept(tokens_, token_kind::lbracket)) {
          resource subject = blanks_.fresh();
          parse_predicate_object_list(subject);
          expect(tokens_, "']'", {token_kind::rbracket});
          if (tokens_.peek().kind != token_kind::dot)
            parse_predicate_object_list(subject);
          return;
        }
        resource subject = parse_subject();
        parse_predicate_object_list(subject);
      }

      resource
      parse_subject() {
        token t = tokens_.next();
        switch (t.kind) {
          case token_kind::iri_ref:
            return resolve(t.text);
          case token_kind::prefixed_name:
            return expand(t);
          case token_kind::blank_node_label:
            return blanks_.labelled(t.text);
          case token_kind::anon:
            return blanks_.fresh();
          case token_kind::lparen: {
            if (accept(tokens_, token_kind::rparen)) return vocab::rdf_nil;
            auto head = blanks_.fresh();
            parse_collection(head);
            return head;
          }
          default:
            unexpected(t, "subject");
        }
      }

      void
      parse_predicate_object_list(const resource& subject) {
        while (true) {
          iri predicate = parse_verb();
          parse_object_list(subject, predicate);
          if (!accept(tokens_, token_kind::semicolon)) return;
          while (accept(tokens_, token_kind::semicolon)) {}
          auto next = tokens_.peek().kind;
          if (next == token_kind::dot || next == token_kind::rbracket) return;
        }
      }

      iri
      parse_verb() {
        token t = tokens_.next();
        switch (t.kind) {
          case token_kind::kw_a:
            return vocab::rdf_type;
          case token_kind::iri_ref:
            return resolve(t.text);
          case token_kind::prefixed_name:
            return expand(t);
          default:
            unexpected(t, "predicate");
        }
      }

      void
      parse_object_list(const resource& subject, const iri& predicate) {
        do {
          parse_object(subject, predicate);
        } while (accept(tokens_, token_kind::comma));
      }

      // Emits the triple for this object before any triples nested in it.
      void
      parse_object(const resource& subject, const iri& predicate) {
        token t = tokens_.next();
        switch (t.kind) {
          case token_kind::iri_ref:
            emit(subject, predicate, resolve(t.text));
            return;
          case token_kind::prefixed_name:
            emit(subject, predicate, expand(t));
            return;
          case token_kind::blank_node_label:
            emit(subject, predicate, blanks_.labelled(t.text));
            return;
          case token_kind::anon:
            emit(subject, predicate, blanks_.fresh());
            return;
          case token_kind::lbracket: {
            auto node = blanks_.fresh();
            emit(subject, predicate, node);
            parse_predicate_object_list(node);
            expect(tokens_, "']'", {token_kind::rbracket});
            return;
          }
          case token_kind::lparen: {
            if (accept(tokens_, token_kind::rparen)) {
              emit(subject, predicate, vocab::rdf_nil);
              return;
            }
            auto head = blanks_.fresh();
            emit(subject, predicate, head);
            parse_collection(head);
            return;
          }
          case token_kind::literal:
            emit(subject, predicate, parse_literal_suffix(std::move(t.text)));
            return;
          case token_kind::integer:
            emit(subject, predicate,
                 literal(std::move(t.text), vocab::xsd_integer));
            return;
          case token_kind::decimal:
            emit(subject, predicate,
                 literal(std::move(t.text), vocab::xsd_decimal));
            return;
          case token_kind::double_literal:
            emit(subject, predicate,
                 literal(std::move(t.text), vocab::xsd_double));
            return;
          case token_kind::boolean:
            emit(subject, predicate,
                 literal(std::move(t.text), vocab::xsd_boolean));
            return;
          default:
            unexpected(t, "object");
        }
      }

      literal
      parse_literal_suffix(std::string lexical) {
        if (tokens_.peek().kind == token_kind::lang_tag)
          return literal(std::move(lexical), tokens_.next().text);
        if (accept(tokens_, token_kind::datatype_marker)) {
          token t = expect(tokens_, "datatype",
                           {token_kind::iri_ref, token_kind::prefixed_name});
          auto datatype =
              t.kind == token_kind::iri_ref ? resolve(t.text) : expand(t);
          return literal(std::move(lexical), std::move(datatype));
        }
        return literal(std::move(lexical));
      }

      // Items after '(' up to and including ')', chained from `node`.
      void
      parse_collection(blank_node node) {
        while (true) {
          parse_object(node, vocab::rdf_first);
          if (accept(tokens_, token_kind::rparen)) {
            emit(node, vocab::rdf_rest, vocab::rdf_nil);
            return;
          }
          auto next = blanks_.fresh();
          emit(node, vocab::rdf_rest, next);
          node = std::move(next);
        }
      }
    };

  } // namespace

  std::unique_ptr<triple_decoder>
  make_turtle_decoder(std::istream& in, const decoder_options& options) {
    return std::make_unique<turtle_decoder>(in, options);
  }

} // namespace rdfdec::detail
