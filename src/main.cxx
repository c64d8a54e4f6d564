#include <tar-chunker/chunk-sink.hxx>
#include <tar-chunker/chunk-source.hxx>
#include <tar-chunker/errors.hxx>
#include <tar-chunker/extractor.hxx>
#include <tar-chunker/logging.hxx>
#include <tar-chunker/options.hxx>
#include <tar-chunker/reassembler.hxx>
#include <tar-chunker/splitter.hxx>

#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/log/trivial.hpp>

#include <exception>
#include <ios>
#include <iostream>
#include <memory>
#include <optional>

#include <unistd.h>

namespace io = boost::iostreams;
using namespace tar_chunker;

namespace {

enum ExitCode { kExitOk = 0, kExitUsage = 2, kExitIntegrity = 3, kExitIo = 4 };

int run_split(const Options &options) {
  io::stream<io::file_descriptor_source> input(STDIN_FILENO,
                                               io::never_close_handle);
  input.exceptions(std::ios::badbit);

  ChunkSink sink(options.split_to, *options.compression, options.hash);
  Splitter splitter(sink, chunk_blocks_for(options.split_size));
  BOOST_LOG_TRIVIAL(info) << "Splitting standard input into "
                          << options.split_to.string() << ".NNN (at most "
                          << options.split_size << " bytes, "
                          << to_string(*options.compression) << ")";
  splitter.split(input);
  return kExitOk;
}

int run_unpack(const Options &options) {
  const auto source = ChunkSource::discover(options.unpack_from);
  BOOST_LOG_TRIVIAL(info) << "Unpacking " << source.chunks().size()
                          << " chunks of " << source.prefix().string();

  TeeConsumer consumers;

  std::unique_ptr<io::stream<io::file_descriptor_sink>> output;
  std::optional<StreamWriter> writer;
  if (options.reassemble_to) {
    if (*options.reassemble_to == "-")
      output = std::make_unique<io::stream<io::file_descriptor_sink>>(
          STDOUT_FILENO, io::never_close_handle);
    else
      output = std::make_unique<io::stream<io::file_descriptor_sink>>(
          *options.reassemble_to,
          std::ios::out | std::ios::trunc | std::ios::binary);
    writer.emplace(*output);
    consumers.add(*writer);
  }

  std::optional<Extractor> extractor;
  if (options.unpack_to) {
    extractor.emplace(*options.unpack_to);
    consumers.add(*extractor);
  }

  Reassembler(options.compression).run(source, consumers);
  if (output)
    output->close();
  if (extractor)
    BOOST_LOG_TRIVIAL(info) << "Extracted " << extractor->entries_extracted()
                            << " entries into " << options.unpack_to->string();
  return kExitOk;
}

} // unnamed namespace

int main(int argc, char **argv) {
  Options options;
  try {
    options = parse_options(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "tar-chunker: " << e.what() << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
  }
  if (options.mode == Mode::Help) {
    print_usage(std::cout);
    return kExitOk;
  }

  try {
    init_logging(options.log_level, options.log_file);
  } catch (const std::exception &e) {
    std::cerr << "tar-chunker: cannot set up logging: " << e.what() << "\n";
    return kExitIo;
  }

  try {
    return options.mode == Mode::Split ? run_split(options)
                                       : run_unpack(options);
  } catch (const UsageError &e) {
    BOOST_LOG_TRIVIAL(fatal) << e.what();
    return kExitUsage;
  } catch (const Error &e) {
    BOOST_LOG_TRIVIAL(fatal) << e.what();
    return kExitIntegrity;
  } catch (const std::ios_base::failure &e) {
    BOOST_LOG_TRIVIAL(fatal) << "I/O failure: " << e.what();
    return kExitIo;
  } catch (const std::filesystem::filesystem_error &e) {
    BOOST_LOG_TRIVIAL(fatal) << "I/O failure: " << e.what();
    return kExitIo;
  }
}
