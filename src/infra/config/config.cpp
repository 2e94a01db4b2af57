#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace ferry::infra {
    void Config::merge_with(const Config& other) {
        if (other.compression_level) compression_level = other.compression_level;
        if (other.member_prefix) member_prefix = other.member_prefix;
        if (other.follow_symlinks) follow_symlinks = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.verbose) verbose = true;
        if (other.store_root) store_root = other.store_root;
        if (other.temp_path) temp_path = other.temp_path;

        if (!other.exclude_patterns.empty()) exclude_patterns = other.exclude_patterns;
        if (!other.required_env.empty()) required_env = other.required_env;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".ferry.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "ferry" / "config.yaml");
        }
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "ferry" / "config.yaml");
        }

        return paths;
    }

    static auto read_string_list(const YAML::Node& node) -> std::vector<std::string> {
        std::vector<std::string> out;
        if (node.IsScalar()) {
            out.push_back(node.as<std::string>());
            return out;
        }
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
        return out;
    }

    auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["compression_level"]) {
                const int level = config["compression_level"].as<int>();
                if (level < 0 || level > 9) {
                    return std::unexpected(fmt::format("{}: compression_level must be 0..9, got {}",
                                                       path.string(), level));
                }
                cfg.compression_level = level;
            }
            if (config["member_prefix"]) {
                cfg.member_prefix = config["member_prefix"].IsNull()
                    ? std::string{} : config["member_prefix"].as<std::string>();
            }
            if (config["follow_symlinks"]) cfg.follow_symlinks = config["follow_symlinks"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
            if (config["store_root"]) cfg.store_root = config["store_root"].as<std::string>();
            if (config["temp_path"]) cfg.temp_path = config["temp_path"].as<std::string>();

            if (config["exclude"]) cfg.exclude_patterns = read_string_list(config["exclude"]);
            if (config["required_env"]) cfg.required_env = read_string_list(config["required_env"]);

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from(path);
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.compression_level = args.compression_level;
        cfg.member_prefix = args.prefix;
        cfg.follow_symlinks = args.follow_symlinks;
        cfg.progress = args.progress.value_or(true);
        cfg.quiet = args.quiet;
        cfg.verbose = args.verbose;
        cfg.store_root = args.store_root;
        cfg.temp_path = args.temp_path;
        cfg.exclude_patterns = args.exclude_patterns;
        return cfg;
    }

    auto check_required_env(const Config& config) -> std::expected<void, Error> {
        for (const auto& name : config.required_env) {
            const char* value = std::getenv(name.c_str());
            if (value == nullptr || *value == '\0') {
                return std::unexpected(make_error(ErrorCode::PreconditionFailed,
                    fmt::format("Required environment variable {} is not set", name)));
            }
        }
        return {};
    }

} // namespace ferry::infra
