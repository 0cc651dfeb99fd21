#pragma once

#include <rdfdec/decode_result.hpp>
#include <rdfdec/format.hpp>
#include <rdfdec/term.hpp>

#include <cstddef>
#include <istream>
#include <memory>
#include <string>

namespace rdfdec {

  struct decoder_options {
    // Base IRI for relative references (Turtle, RDF/XML). Empty means none.
    std::string base;
    // Bytes read from the stream per chunk by the RDF/XML reader.
    std::size_t chunk_size = 4096;
  };

  // Decodes the statements of an RDF graph one triple at a time. A decoder
  // reads from the stream it was built on for its whole lifetime and must
  // not be used from more than one thread at once.
  class triple_decoder {
  public:
    virtual ~triple_decoder() = default;

    // The next triple, end of stream once the source is exhausted, or the
    // fault that stopped decoding.
    virtual decode_result<triple>
    decode() = 0;

    // Every remaining triple in document order, or the first fault. Nothing
    // is returned on failure.
    decode_all_result<triple>
    decode_all();

    // Base IRI for relative references parsed from now on. A no-op for
    // N-Triples.
    virtual void
    set_base(const iri& base) = 0;
  };

  // Throws configuration_error for formats without a triple grammar
  // (N-Quads).
  std::unique_ptr<triple_decoder>
  make_triple_decoder(std::istream& in, format f,
                      const decoder_options& options = {});

  // Decodes N-Quads (or N-Triples, as quads in the default graph).
  class quad_decoder {
  public:
    // Throws configuration_error for any format other than N-Quads and
    // N-Triples.
    quad_decoder(std::istream& in, format f,
                 const decoder_options& options = {});
    ~quad_decoder();

    quad_decoder(const quad_decoder&) = delete;
    quad_decoder&
    operator=(const quad_decoder&) = delete;
    quad_decoder(quad_decoder&&) noexcept;
    quad_decoder&
    operator=(quad_decoder&&) noexcept;

    decode_result<quad>
    decode();

    decode_all_result<quad>
    decode_all();

    // Neither line grammar has relative IRIs, so this is a no-op.
    void
    set_base(const iri& base);

    // Context assigned to quads without a graph label.
    const blank_node&
    default_graph() const;

    format
    input_format() const;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace rdfdec
