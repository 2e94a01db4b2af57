#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

namespace ferry::args_parser {

enum class Command {
    Pack,      // resumable build only
    List,      // table of contents
    Extract,
    Upload,    // build + put into the object store
    Download,  // get (+ extract, + delete remote)
};

[[nodiscard]] auto to_string(Command command) -> std::string_view;

struct CLIArgs
{
    Command command{Command::Pack};

    std::string source;                          // -s, --source
    std::string destination;                     // -d, --destination
    std::string archive;                         // -a, --archive (pack/list/extract)

    bool extract{false};                         // download --extract
    bool delete_remote{false};                   // download --delete-remote
    bool overwrite{false};                       // --overwrite

    std::optional<std::string> temp_path;        // --temp-path
    std::optional<std::string> store_root;       // --store-root
    std::optional<std::string> prefix;           // --prefix
    std::optional<int> compression_level;        // --compression-level=N
    std::vector<std::string> exclude_patterns;   // --exclude (repeatable)

    bool follow_symlinks{false};                 // --follow-symlinks
    std::optional<bool> progress;                // --progress / --no-progress
    bool quiet{false};                           // -q, --quiet
    bool verbose{false};                         // -v, --verbose
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// nullopt after --help or a parse error (CLI11 has already printed it).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace ferry::args_parser
