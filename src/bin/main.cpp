#include <rdfdec/decoder.hpp>
#include <rdfdec/errors.hpp>
#include <rdfdec/format.hpp>

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_config = 4;

struct cli_options {
  std::vector<std::string> input_files;
  std::optional<rdfdec::format> forced_format;
  std::string base;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: rdfdec [options] <file> [file ...]\n"
     << "\n"
     << "Options:\n"
     << "  -f <format>       Input format: ntriples, nquads, turtle, rdfxml\n"
     << "                    (default: chosen by file extension)\n"
     << "  -b <iri>          Base IRI for relative references\n"
     << "  -q                Print nothing on success\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "rdfdec " << RDFDEC_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-q") {
      opts.quiet = true;
      continue;
    }

    if (arg == "-f") {
      if (i + 1 >= argc) {
        std::cerr << "rdfdec: -f requires an argument\n";
        std::exit(exit_usage);
      }
      std::string name = argv[++i];
      opts.forced_format = rdfdec::format_from_name(name);
      if (!opts.forced_format) {
        std::cerr << "rdfdec: unknown format: " << name << "\n";
        std::exit(exit_config);
      }
      continue;
    }

    if (arg == "-b") {
      if (i + 1 >= argc) {
        std::cerr << "rdfdec: -b requires an argument\n";
        std::exit(exit_usage);
      }
      opts.base = argv[++i];
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "rdfdec: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.input_files.push_back(arg);
  }

  return opts;
}

static void
report(const std::string& file, const rdfdec::fault& f) {
  std::cerr << "rdfdec: " << file << ":" << f.message << "\n";
}

// Number of statements in the file, or the fault that stopped decoding.
template <typename Decoder>
static std::optional<std::size_t>
count_statements(Decoder& decoder, const std::string& file) {
  std::size_t n = 0;
  for (auto r = decoder.decode(); !r.at_end(); r = decoder.decode()) {
    if (r.failed()) {
      report(file, r.error());
      return std::nullopt;
    }
    ++n;
  }
  return n;
}

static int
decode_file(const cli_options& opts, const std::string& file) {
  auto f = opts.forced_format ? opts.forced_format
                              : rdfdec::format_from_extension(file);
  if (!f) {
    std::cerr << "rdfdec: cannot determine format of " << file
              << " (use -f)\n";
    return exit_config;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    std::cerr << "rdfdec: cannot open file: " << file << "\n";
    return exit_io;
  }

  rdfdec::decoder_options options;
  options.base = opts.base;

  std::optional<std::size_t> count;
  try {
    if (*f == rdfdec::format::nquads) {
      rdfdec::quad_decoder decoder(in, *f, options);
      count = count_statements(decoder, file);
    } else {
      auto decoder = rdfdec::make_triple_decoder(in, *f, options);
      count = count_statements(*decoder, file);
    }
  } catch (const rdfdec::configuration_error& e) {
    std::cerr << "rdfdec: " << e.what() << "\n";
    return exit_config;
  }

  if (!count) return exit_parse;
  if (in.bad()) {
    std::cerr << "rdfdec: error reading file: " << file << "\n";
    return exit_io;
  }
  if (!opts.quiet) std::cout << file << ": " << *count << " statements\n";
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.input_files.empty()) {
    std::cerr << "rdfdec: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  for (const auto& file : opts.input_files) {
    int rc = decode_file(opts, file);
    if (rc != exit_success) return rc;
  }
  return exit_success;
}
