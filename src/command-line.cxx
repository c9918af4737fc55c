#include <split-join/command-line.hxx>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <sstream>

namespace split_join {
namespace po = boost::program_options;

namespace {

/// @brief Options accepted only on the command line.
po::options_description generic_options_impl() {
  po::options_description desc("Generic options");
  desc.add_options()
      ("help,h", "show this help")
      ("config,c", po::value<std::string>(), "read options from an INI file")
      ("info", "print header, parts and ranges, do not join")
      ("no-verify", "skip checksum verification")
      ("in-place", po::bool_switch(),
       "write straight to the output name, no temporary file")
      ("quiet,q", "only log errors, no progress bar")
      ("verbose,v", "debug logging");
  return desc;
}

/// @brief Options accepted everywhere.
po::options_description join_options_impl() {
  po::options_description desc("Join options");
  desc.add_options()
      ("output-dir,o", po::value<std::string>(),
       "directory for the output file (default: current directory)")
      ("output-name,n", po::value<std::string>(),
       "override the output name stored in the archive")
      ("extension,e", po::value<std::string>(),
       "part file extension (default: xtm)")
      ("block-size,b", po::value<std::int64_t>(),
       "streaming block size in bytes, at most 64 MiB (default: 65536)")
      ("log-level", po::value<std::string>(),
       "error, warning, info or debug (default: info)");
  return desc;
}

/**
 * @brief Settings read only from the environment or a config file.
 *
 * In a config file every option is written `name = value`; in the environment
 * as `SPLIT_JOIN_NAME` with dashes turned into underscores.
 */
po::options_description settings_options_impl() {
  po::options_description desc("Config file and environment settings");
  desc.add_options()
      ("in-place", po::value<bool>(), "same as --in-place")
      ("verify", po::value<bool>(), "check part checksums (default: true)")
      ("progress", po::value<bool>(), "draw progress bars (default: true)");
  return desc;
}

/// @brief Map SPLIT_JOIN_BLOCK_SIZE to "block-size"; ignore anything else.
std::string environment_name_impl(const po::options_description &desc,
                                  const std::string &variable) {
  if (!boost::algorithm::starts_with(variable, kEnvironmentPrefix))
    return {};
  auto name = boost::algorithm::to_lower_copy(
      variable.substr(std::string(kEnvironmentPrefix).size()));
  boost::algorithm::replace_all(name, "_", "-");
  return desc.find_nothrow(name, false) ? name : std::string();
}

/// @brief Copy the values found in @p vm over the defaults in @p options.
void apply_join_options_impl(const po::variables_map &vm,
                             JoinOptions &options) {
  if (vm.count("output-dir"))
    options.output_directory = vm["output-dir"].as<std::string>();
  if (vm.count("output-name"))
    options.output_name = vm["output-name"].as<std::string>();
  if (vm.count("extension"))
    options.extension = vm["extension"].as<std::string>();
  if (vm.count("block-size")) {
    auto const size = vm["block-size"].as<std::int64_t>();
    if (size <= 0 || static_cast<std::uint64_t>(size) > kMaxBlockSize)
      throw UsageError(fmt::format(
          "block size must be between 1 and {} bytes, got {}", kMaxBlockSize,
          size));
    options.block_size = static_cast<std::size_t>(size);
  }
  if (vm.count("in-place"))
    options.in_place = vm["in-place"].as<bool>();
  if (vm.count("verify"))
    options.verify = vm["verify"].as<bool>();
  if (vm.count("progress"))
    options.show_progress = vm["progress"].as<bool>();
  if (vm.count("log-level")) {
    auto const &name = vm["log-level"].as<std::string>();
    auto const level = log::parse_level(name);
    if (!level)
      throw UsageError(fmt::format("unknown log level \"{}\"", name));
    options.log_level = *level;
  }
}

} // unnamed namespace

CommandLine parse_command_line(int argc, const char *const argv[]) {
  auto const generic = generic_options_impl();
  auto const join = join_options_impl();

  po::options_description settings;
  settings.add(join).add(settings_options_impl());

  po::options_description hidden;
  hidden.add_options()("part", po::value<std::string>(), "part file");

  po::options_description command_line;
  command_line.add(generic).add(join).add(hidden);

  po::positional_options_description positional;
  positional.add("part", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    po::store(po::parse_environment(
                  settings,
                  [&settings](const std::string &variable) {
                    return environment_name_impl(settings, variable);
                  }),
              vm);
    if (vm.count("config")) {
      auto const &file = vm["config"].as<std::string>();
      po::store(po::parse_config_file(file.c_str(), settings), vm);
    }
    po::notify(vm);
  } catch (const po::error &e) {
    throw UsageError(e.what());
  }

  CommandLine result;
  result.help = vm.count("help") > 0;
  if (result.help)
    return result;

  result.info = vm.count("info") > 0;
  auto &options = result.options;
  apply_join_options_impl(vm, options);
  if (vm.count("no-verify"))
    options.verify = false;
  if (vm.count("quiet")) {
    options.log_level = log::Level::error;
    options.show_progress = false;
  }
  if (vm.count("verbose"))
    options.log_level = log::Level::debug;

  if (options.extension.empty())
    throw UsageError("extension must not be empty");
  if (!vm.count("part"))
    throw UsageError("missing part file");
  result.part = vm["part"].as<std::string>();
  return result;
}

std::string usage() {
  std::ostringstream out;
  out << "Usage: split-join [options] <part-file>\n\n"
      << "Joins <base>.001.xtm, <base>.002.xtm, ... into the file named in "
         "the archive.\n\n"
      << generic_options_impl() << '\n'
      << join_options_impl() << '\n'
      << settings_options_impl();
  return out.str();
}
} // namespace split_join
