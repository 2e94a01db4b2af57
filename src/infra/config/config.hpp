#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace ferry::args_parser {
    struct CLIArgs;
}

namespace ferry::infra {

inline constexpr int default_compression_level = 6;

struct Config {
    // Archive
    std::optional<int> compression_level;       // 0..9, zlib
    std::optional<std::string> member_prefix;   // пустая строка = без префикса
    bool follow_symlinks = false;
    std::vector<std::string> exclude_patterns;

    // Output
    bool progress = true;
    bool quiet = false;
    bool verbose = false;

    // Transfer
    std::optional<std::string> store_root;
    std::optional<std::string> temp_path;
    std::vector<std::string> required_env;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.ferry.yaml
///   2. $XDG_CONFIG_HOME/ferry/config.yaml
///   3. ~/.config/ferry/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл.
[[nodiscard]] auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Every variable named in required_env must be set and non-empty.
[[nodiscard]] auto check_required_env(const Config& config) -> std::expected<void, Error>;

} // namespace ferry::infra
