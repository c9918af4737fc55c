#include <split-join/errors.hxx>
#include <split-join/join.hxx>
#include <split-join/joiner.hxx>
#include <split-join/part-boundary.hxx>

#include <fmt/format.h>

#include <iterator>
#include <system_error>

namespace split_join {
namespace fs = std::filesystem;

namespace {

/// @brief Temporary sibling used until the output is complete.
fs::path temporary_path_impl(const fs::path &destination) {
  auto temporary = destination;
  temporary += ".partial";
  return temporary;
}

/// @brief True when @p destination names an existing part file.
bool overwrites_part_impl(const fs::path &destination,
                          const std::vector<PartDescriptor> &parts) {
  std::error_code ec;
  if (!fs::exists(destination, ec))
    return false;
  for (auto const &part : parts)
    if (fs::equivalent(destination, part.path, ec))
      return true;
  return false;
}

} // unnamed namespace

JoinContext prepare_join(const fs::path &any_part,
                         const JoinOptions &options) {
  JoinContext context;
  context.options = options;
  context.parts = locate_parts(any_part, options.extension);

  auto const &first = context.parts.front();
  auto const &last = context.parts.back();

  context.header = read_header(first.path);
  if (context.header.part_count == 0)
    throw InvalidHeaderError(first.path, "declares zero parts");
  if (context.parts.size() != context.header.part_count)
    throw PartCountMismatchError(last.path, context.parts.size(),
                                 context.header.part_count);

  if (context.header.has_checksums)
    context.manifest = read_manifest(last.path, context.header.part_count);

  context.payload_total = resolve_payload_ranges(context.parts, context.header);
  if (context.payload_total != context.header.payload_size)
    log::warning("{}: parts hold {} payload bytes, header declares {}",
                 first.path.string(), context.payload_total,
                 context.header.payload_size);

  log::info("{}: {} part(s), {} bytes{}", context.header.output_name,
            context.parts.size(), context.header.payload_size,
            context.header.has_checksums ? ", with checksums" : "");
  return context;
}

fs::path output_path(const JoinContext &context) {
  auto const &declared =
      context.options.output_name.value_or(context.header.output_name);
  auto const name = fs::path(declared).filename();
  if (name.empty() || name == "." || name == "..")
    throw InvalidHeaderError(
        context.parts.front().path,
        fmt::format("output name \"{}\" is not a file name", declared));

  auto destination = context.options.output_directory / name;
  if (overwrites_part_impl(destination, context.parts))
    throw InvalidHeaderError(
        context.parts.front().path,
        fmt::format("output {} would overwrite a part", destination.string()));
  return destination;
}

JoinResult join_archive(const fs::path &any_part, const JoinOptions &options,
                        ProgressSink *join_progress,
                        ProgressSink *verify_progress) {
  auto const context = prepare_join(any_part, options);

  JoinResult result;
  result.output = output_path(context);

  if (context.header.has_checksums && options.verify) {
    log::info("verifying {} part(s)", context.parts.size());
    IntegrityChecker checker(default_digest_factory(), options.block_size);
    checker.verify(context.parts, context.manifest,
                   trailer_length(context.header), verify_progress);
    result.verified = true;
  } else if (context.header.has_checksums) {
    log::info("skipping checksum verification");
  }

  auto const target =
      options.in_place ? result.output : temporary_path_impl(result.output);
  log::info("writing {}", result.output.string());

  Joiner joiner(options.block_size, join_progress);
  try {
    result.bytes_written =
        joiner.join(context.parts, target, context.header.payload_size);
  } catch (const std::exception &) {
    if (!options.in_place) {
      std::error_code ec;
      if (!fs::remove(target, ec) && ec)
        log::warning("{}: cannot remove: {}", target.string(), ec.message());
    }
    throw;
  }

  if (!options.in_place) {
    std::error_code ec;
    fs::rename(target, result.output, ec);
    if (ec)
      throw FileAccessError(result.output,
                            fmt::format("cannot rename {}: {}",
                                        target.string(), ec.message()));
  }
  return result;
}

std::string describe(const JoinContext &context) {
  auto const &header = context.header;
  std::string text;
  auto out = std::back_inserter(text);
  fmt::format_to(out, "software:     {}\n", header.software_name);
  fmt::format_to(out, "output name:  {}\n", header.output_name);
  fmt::format_to(out, "parts:        {}\n", header.part_count);
  fmt::format_to(out, "payload size: {}\n", header.payload_size);
  fmt::format_to(out, "checksums:    {}\n",
                 header.has_checksums ? "yes" : "no");
  for (std::size_t i = 0; i < context.parts.size(); ++i) {
    auto const &part = context.parts[i];
    fmt::format_to(out, "  {:03} {:<6} [{}, {}) {}{}\n", part.index,
                   to_string(part.role), part.range.begin, part.range.end,
                   part.path.filename().string(),
                   i < context.manifest.size()
                       ? fmt::format(" {}", context.manifest[i])
                       : std::string());
  }
  return text;
}
} // namespace split_join
