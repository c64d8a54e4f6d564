#include <tar-chunker/errors.hxx>
#include <tar-chunker/options.hxx>

#include <cctype>
#include <limits>

namespace tar_chunker {
namespace {

std::uint64_t unit_multiplier(char unit) {
  switch (std::toupper(static_cast<unsigned char>(unit))) {
  case 'K':
    return std::uint64_t(1) << 10;
  case 'M':
    return std::uint64_t(1) << 20;
  case 'G':
    return std::uint64_t(1) << 30;
  case 'T':
    return std::uint64_t(1) << 40;
  default:
    return 0;
  }
}

/// Flags that take a value.
bool takes_value(const std::string &flag) {
  return flag == "--compression" || flag == "--split-to" ||
         flag == "--split-size" || flag == "--unpack-from" ||
         flag == "--unpack-to" || flag == "--reassemble-to" ||
         flag == "--log-level" || flag == "--log-file";
}

void select_mode(Options &options, Mode mode, const std::string &flag) {
  if (options.mode != Mode::Help && options.mode != mode)
    throw UsageError("'" + flag + "' conflicts with the mode already selected");
  options.mode = mode;
}

} // unnamed namespace

std::uint64_t parse_size(const std::string &text) {
  std::size_t pos = 0;
  std::uint64_t value = 0;
  constexpr auto max = std::numeric_limits<std::uint64_t>::max();

  while (pos < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos]))) {
    const auto digit = static_cast<std::uint64_t>(text[pos] - '0');
    if (value > (max - digit) / 10)
      throw UsageError("size '" + text + "' is too large");
    value = value * 10 + digit;
    ++pos;
  }
  if (pos == 0)
    throw UsageError("size '" + text + "' does not start with a number");

  auto suffix = text.substr(pos);
  if (suffix.empty() || suffix == "B" || suffix == "b")
    return value;

  const auto multiplier = unit_multiplier(suffix[0]);
  suffix.erase(0, 1);
  if (multiplier == 0 ||
      !(suffix.empty() || suffix == "i" || suffix == "B" || suffix == "iB"))
    throw UsageError("size '" + text + "' has an unknown unit");
  if (value > max / multiplier)
    throw UsageError("size '" + text + "' is too large");
  return value * multiplier;
}

Options parse_options(int argc, const char *const *argv) {
  Options options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.mode = Mode::Help;
      return options;
    }
    if (arg == "--hash") {
      options.hash = true;
      continue;
    }

    std::string value;
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg.erase(eq);
      if (!takes_value(arg))
        throw UsageError("option '" + arg + "' does not take a value");
    } else if (takes_value(arg)) {
      if (i + 1 >= argc)
        throw UsageError("option '" + arg + "' requires an argument");
      value = argv[++i];
    } else {
      throw UsageError("unknown argument '" + arg + "'");
    }

    if (arg == "--compression") {
      options.compression = parse_codec(value);
    } else if (arg == "--split-to") {
      select_mode(options, Mode::Split, arg);
      options.split_to = value;
    } else if (arg == "--split-size") {
      options.split_size = parse_size(value);
    } else if (arg == "--unpack-from") {
      select_mode(options, Mode::Unpack, arg);
      options.unpack_from = value;
    } else if (arg == "--unpack-to") {
      options.unpack_to = value;
    } else if (arg == "--reassemble-to") {
      options.reassemble_to = value;
    } else if (arg == "--log-level") {
      options.log_level = parse_severity(value);
    } else if (arg == "--log-file") {
      options.log_file = value;
    }
  }

  switch (options.mode) {
  case Mode::Help:
    throw UsageError("one of --split-to or --unpack-from is required");
  case Mode::Split:
    if (options.split_size == 0)
      throw UsageError("--split-to requires --split-size");
    if (options.unpack_to || options.reassemble_to)
      throw UsageError("--unpack-to and --reassemble-to need --unpack-from");
    if (!options.compression)
      options.compression = CodecKind::None;
    break;
  case Mode::Unpack:
    if (!options.unpack_to && !options.reassemble_to)
      throw UsageError("--unpack-from requires --unpack-to or --reassemble-to");
    if (options.split_size != 0 || options.hash)
      throw UsageError("--split-size and --hash need --split-to");
    break;
  }
  return options;
}

void print_usage(std::ostream &os) {
  os << "Usage:\n"
        "  tar-chunker --split-to <prefix> --split-size <size> [options] "
        "< archive.tar\n"
        "  tar-chunker --unpack-from <dir|prefix> [--unpack-to <dir>] "
        "[--reassemble-to <file|->] [options]\n"
        "\n"
        "Options:\n"
        "  --compression <none|gzip|zstd>  Codec for each chunk\n"
        "  --split-size <size>             Maximum chunk size (512K, 5M, "
        "1GiB)\n"
        "  --hash                          Write SHA-256 files next to each "
        "chunk\n"
        "  --unpack-to <dir>               Extract entries into <dir>\n"
        "  --reassemble-to <file|->        Write the original archive "
        "stream\n"
        "  --log-level <level>             trace, debug, info, warning, "
        "error, fatal\n"
        "  --log-file <path>               Also write log records to "
        "<path>\n"
        "  -h, --help                      Show this help\n";
}

} // namespace tar_chunker
