#include <rdfdec/decoder.hpp>

#include "nquads_parser.hpp"
#include "rdfxml_decoder.hpp"
#include "turtle_decoder.hpp"

#include <utility>
#include <vector>

namespace rdfdec {

  namespace {

    class ntriples_decoder : public triple_decoder {
    public:
      explicit ntriples_decoder(std::istream& in)
          : parser_(in, false, blank_node::default_graph()) {}

      decode_result<triple>
      decode() override {
        try {
          auto q = parser_.parse();
          if (!q) return end_of_stream{};
          return q->as_triple();
        } catch (const parse_error& e) {
          return e.details();
        }
      }

      void
      set_base(const iri&) override {}

    private:
      detail::nquads_parser parser_;
    };

    [[noreturn]] void
    not_implemented(format f, const char* decoder) {
      throw configuration_error(std::string(decoder) +
                                " for serialization format " +
                                std::string(to_string(f)) + " not implemented");
    }

  } // namespace

  decode_all_result<triple>
  triple_decoder::decode_all() {
    std::vector<triple> triples;
    for (auto r = decode(); !r.at_end(); r = decode()) {
      if (r.failed()) return r.error();
      triples.push_back(std::move(r.value()));
    }
    return triples;
  }

  std::unique_ptr<triple_decoder>
  make_triple_decoder(std::istream& in, format f,
                      const decoder_options& options) {
    switch (f) {
      case format::ntriples:
        return std::make_unique<ntriples_decoder>(in);
      case format::turtle:
        return detail::make_turtle_decoder(in, options);
      case format::rdfxml:
        return detail::make_rdfxml_decoder(in, options);
      case format::nquads:
        break;
    }
    not_implemented(f, "triple decoder");
  }

  // ---------------------------------------------------------------------------
  // quad_decoder
  // ---------------------------------------------------------------------------

  struct quad_decoder::impl {
    format input_format;
    detail::nquads_parser parser;

    impl(std::istream& in, format f)
        : input_format(f),
          parser(in, f == format::nquads, blank_node::default_graph()) {}
  };

  quad_decoder::quad_decoder(std::istream& in, format f,
                             const decoder_options&) {
    if (f != format::nquads && f != format::ntriples)
      not_implemented(f, "quad decoder");
    impl_ = std::make_unique<impl>(in, f);
  }

  quad_decoder::~quad_decoder() = default;
  quad_decoder::quad_decoder(quad_decoder&&) noexcept = default;
  quad_decoder& quad_decoder::operator=(quad_decoder&&) noexcept = default;

  decode_result<quad>
  quad_decoder::decode() {
    try {
      auto q = impl_->parser.parse();
      if (!q) return end_of_stream{};
      return std::move(*q);
    } catch (const parse_error& e) {
      return e.details();
    }
  }

  decode_all_result<quad>
  quad_decoder::decode_all() {
    std::vector<quad> quads;
    for (auto r = decode(); !r.at_end(); r = decode()) {
      if (r.failed()) return r.error();
      quads.push_back(std::move(r.value()));
    }
    return quads;
  }

  void
  quad_decoder::set_base(const iri&) {}

  const blank_node&
  quad_decoder::default_graph() const {
    return impl_->parser.default_graph();
  }

  format
  quad_decoder::input_format() const {
    return impl_->input_format;
  }

} // namespace rdfdec
