#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "unclobber/Config.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Files.hpp"
#include "unclobber/Loader.hpp"
#include "unclobber/Logging.hpp"
#include "unclobber/Unclobber.hpp"
#include "unclobber/Util.hpp"

using namespace unclobber;

namespace {

bool ask_user_confirmation(const std::string& prompt) {
    std::cout << prompt << " [N/y] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return to_lower(trim(answer)) == "y";
}

// Terminal front end for interactive conflict mode. End of input skips the file.
ConflictChoice prompt_conflict(const fs::path& file, const std::string& key,
                               const Value& existing, const Value& incoming) {
    std::cout << "\nConflict for key '" << key << "' in " << file.string() << "\n";
    std::cout << "  1: " << display(existing) << "\n";
    std::cout << "  2: " << display(incoming) << "\n";
    while (true) {
        std::cout << "Choose which value to keep (1, 2, or s to skip this file): " << std::flush;
        std::string choice;
        if (!std::getline(std::cin, choice)) return ConflictChoice::Skip;
        choice = to_lower(trim(choice));
        if (choice == "1") return ConflictChoice::KeepExisting;
        if (choice == "2") return ConflictChoice::TakeIncoming;
        if (choice == "s") return ConflictChoice::Skip;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("unclobber", "Merge duplicated YAML frontmatter blocks in Markdown files");
        options.positional_help("[DIRECTORY]");

        options.add_options()
            ("go", "Apply changes to files (default is a dry run)")
            ("y,yes", "Do not ask for confirmation before writing")
            ("interactive", "Ask which value to keep on each conflict")
            ("date-policy", "Winner between two dates: latest or earliest", cxxopts::value<std::string>())
            ("keep-list-order", "Write list values in merged order instead of sorted")
            ("ext", "Comma-separated file extensions to scan (default .md)", cxxopts::value<std::string>())
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("log-dir", "Directory for run logs and backups", cxxopts::value<std::string>())
            ("v,verbose", "Show debug messages")
            ("h,help", "Show help");

        options.add_options()
            ("directory", "Directory to scan (defaults to VAULT_PATH)", cxxopts::value<std::string>());

        options.parse_positional({"directory"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        // Layers: defaults -> settings file -> UNCLOBBER_* env -> command line
        LoadOptions load;
        load.defaults = default_settings();
        load.prefix = kEnvPrefix;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("go")) load.overrides["apply"] = true;
        if (result.count("yes")) load.overrides["assume_yes"] = true;
        if (result.count("interactive")) load.overrides["conflict_mode"] = "interactive";
        if (result.count("date-policy")) load.overrides["date_policy"] = result["date-policy"].as<std::string>();
        if (result.count("keep-list-order")) load.overrides["sort_sequences"] = false;
        if (result.count("ext")) load.overrides["extensions"] = result["ext"].as<std::string>();
        if (result.count("log-dir")) load.overrides["log_dir"] = result["log-dir"].as<std::string>();
        if (result.count("verbose")) load.overrides["verbose"] = true;

        Settings settings = Settings::from_config(Config::load(load));

        fs::path run_dir = setup_logging(settings.log_dir, "unclobber", settings.verbose);
        spdlog::info("Starting unclobber...");
        spdlog::debug("conflict_mode={} date_policy={} sort_sequences={}",
                      to_string(settings.conflict_mode), to_string(settings.date_policy),
                      settings.sort_sequences);
        if (!settings.apply) {
            spdlog::info("Running in dry-run mode. No files will be modified.");
        }

        fs::path root;
        if (result.count("directory")) {
            root = result["directory"].as<std::string>();
        } else if (settings.vault_path) {
            root = *settings.vault_path;
        } else if (auto env = get_env_var(kVaultPathEnv)) {
            root = *env;
            spdlog::info("Using directory from {}: {}", kVaultPathEnv, root.string());
        } else {
            spdlog::error("No directory specified and {} environment variable not set.", kVaultPathEnv);
            return 1;
        }

        try {
            validate_directory(root);
        } catch (const IoError& e) {
            spdlog::error("{}", e.what());
            return 1;
        }

        UnclobberOptions pipeline = settings.pipeline_options();
        fs::path current_file;
        if (settings.conflict_mode == ConflictMode::Interactive) {
            pipeline.merge.resolver = [&current_file](const std::string& key, const Value& existing,
                                                      const Value& incoming) {
                return prompt_conflict(current_file, key, existing, incoming);
            };
        }

        std::vector<std::pair<fs::path, std::string>> files_to_modify;
        for (const auto& path : find_documents(root, settings.extensions)) {
            try {
                auto text = read_document(path);
                if (!text) {
                    spdlog::warn("Skipping {} due to encoding error.", path.string());
                    continue;
                }

                current_file = path;
                UnclobberResult outcome = unclobber_document(*text, pipeline);
                if (outcome.block_count > 1) {
                    spdlog::info("Found {} frontmatter blocks in: {}", outcome.block_count, path.string());
                }
                for (const auto& conflict : outcome.conflicts) {
                    spdlog::warn("Conflict for key '{}' in {}: kept '{}' over '{}'.", conflict.key,
                                 path.string(), display(conflict.winning), display(conflict.losing));
                }
                if (outcome.skipped) {
                    spdlog::info("Skipped {} on request.", path.string());
                }
                if (outcome.replaced()) {
                    files_to_modify.emplace_back(path, std::move(outcome.text));
                }
            } catch (const std::exception& e) {
                spdlog::error("Error processing {}: {}", path.string(), e.what());
            }
        }

        if (files_to_modify.empty()) {
            spdlog::info("No files to modify.");
            return 0;
        }

        if (!settings.apply) {
            spdlog::info("Dry run complete. The following files would be modified:");
            for (const auto& entry : files_to_modify) {
                spdlog::info("- {}", entry.first.string());
            }
            spdlog::info("Scan complete.");
            return 0;
        }

        if (!settings.assume_yes &&
            !ask_user_confirmation("About to modify " + std::to_string(files_to_modify.size()) +
                                   " files. Are you sure?")) {
            spdlog::info("User cancelled operation.");
            return 0;
        }

        for (const auto& [path, content] : files_to_modify) {
            try {
                fs::path backup = backup_file(path, root, run_dir);
                spdlog::debug("Backed up {} to {}", path.string(), backup.string());
                write_document(path, content);
                spdlog::info("Successfully merged and updated {}", path.string());
            } catch (const IoError& e) {
                spdlog::error("Error writing to {}: {}", path.string(), e.what());
            }
        }

        spdlog::info("Scan complete.");
        return 0;

    } catch (const ConfigError& ce) {
        std::cerr << "Error: " << ce.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
