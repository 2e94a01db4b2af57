#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace ferry::args_parser {

auto to_string(Command command) -> std::string_view {
    switch (command) {
        case Command::Pack:     return "pack";
        case Command::List:     return "list";
        case Command::Extract:  return "extract";
        case Command::Upload:   return "upload";
        case Command::Download: return "download";
    }
    return "unknown";
}

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"ferry: move directory trees through object storage as resumable .tar.gz archives"};
    app.require_subcommand(1);
    app.fallthrough();

    // Глобальные опции
    bool progress_value = true;
    auto* progress_opt = app.add_flag("--progress,!--no-progress", progress_value,
                                      "Show or hide the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--follow-symlinks", args.follow_symlinks,
                 "Archive the targets of symlinks to regular files");
    app.add_option("--exclude", args.exclude_patterns,
                   "Regex matched against file names (repeatable)");
    std::string prefix_value;
    auto* prefix_opt = app.add_option("--prefix", prefix_value,
                   "Member name prefix (default: source directory name, \"\" for none)");
    int level = 0;
    auto* level_opt = app.add_option("--compression-level", level, "gzip level 0..9")
        ->check(CLI::Range(0, 9));
    app.add_option("--store-root", args.store_root, "Root directory of the object store");

    auto* pack = app.add_subcommand("pack", "Build or resume an archive of a directory");
    pack->add_option("-s,--source", args.source, "Source directory")->required();
    pack->add_option("-a,--archive", args.archive, "Archive path (.tar.gz)")->required();

    auto* list = app.add_subcommand("list", "Print the archive's table of contents");
    list->add_option("-a,--archive", args.archive, "Archive path")
        ->required()->check(CLI::ExistingFile);

    auto* extract = app.add_subcommand("extract", "Unpack an archive");
    extract->add_option("-a,--archive", args.archive, "Archive path")
        ->required()->check(CLI::ExistingFile);
    extract->add_option("-d,--destination", args.destination, "Target directory")->required();

    auto* upload = app.add_subcommand("upload", "Archive a directory and store it as bucket:key");
    upload->add_option("-s,--source", args.source, "Source directory")
        ->required()->check(CLI::ExistingDirectory);
    upload->add_option("-d,--destination", args.destination, "bucket:key (key defaults to the archive name)")
        ->required();
    upload->add_option("--temp-path", args.temp_path, "Where the archive is built");
    upload->add_flag("--overwrite", args.overwrite, "Replace an existing object");

    auto* download = app.add_subcommand("download", "Fetch bucket:key into a local directory");
    download->add_option("-s,--source", args.source, "bucket:key")->required();
    download->add_option("-d,--destination", args.destination, "Local directory")->required();
    download->add_flag("--extract", args.extract, "Unpack after download");
    download->add_flag("--delete-remote", args.delete_remote, "Remove the object after success");
    download->add_flag("--overwrite", args.overwrite, "Replace an existing local file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (progress_opt->count() > 0) args.progress = progress_value;
    if (level_opt->count() > 0) args.compression_level = level;
    if (prefix_opt->count() > 0) args.prefix = prefix_value;

    if (pack->parsed())          args.command = Command::Pack;
    else if (list->parsed())     args.command = Command::List;
    else if (extract->parsed())  args.command = Command::Extract;
    else if (upload->parsed())   args.command = Command::Upload;
    else if (download->parsed()) args.command = Command::Download;

    return args;
}

} // namespace ferry::args_parser
