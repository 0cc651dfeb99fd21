#pragma once

#include <rdfdec/decoder.hpp>

#include <istream>
#include <memory>

namespace rdfdec::detail {

  std::unique_ptr<triple_decoder>
  make_turtle_decoder(std::istream& in, const decoder_options& options);

} // namespace rdfdec::detail
