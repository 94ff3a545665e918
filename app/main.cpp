#include "DualPaneManager.hpp"
#include "FilesystemHierarchySource.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <QCoreApplication>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/fmt/fmt.h>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

struct ParsedArguments {
    std::string directory;
    std::optional<bool> include_files;
    std::optional<SortCriterion> sort_by;
    std::optional<int> max_depth;
    std::optional<SearchMode> search_mode;
    std::string query;
    std::string focus;
    std::string reveal;
    bool expand_all{false};
    bool hidden{false};
    bool restore_state{false};
    bool save_state{false};
    bool show_help{false};
};

void print_usage()
{
    std::cout << "Usage: dualpane_tree <directory> [options]\n"
              << "  --files              show files in the tree\n"
              << "  --hidden             include hidden entries\n"
              << "  --sort <criterion>   name, modified or size\n"
              << "  --depth <n>          maximum render depth\n"
              << "  --query <text>       filter the tree\n"
              << "  --mode <mode>        plain, regex or glob\n"
              << "  --expand-all         expand every folder\n"
              << "  --focus <path>       root the tree at a folder (relative path)\n"
              << "  --reveal <path>      expand to and select an entry\n"
              << "  --restore            load the saved pane state first\n"
              << "  --save               save the pane state on exit\n";
}

std::optional<ParsedArguments> parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next_value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_help = true;
        } else if (std::strcmp(arg, "--files") == 0) {
            parsed.include_files = true;
        } else if (std::strcmp(arg, "--hidden") == 0) {
            parsed.hidden = true;
        } else if (std::strcmp(arg, "--expand-all") == 0) {
            parsed.expand_all = true;
        } else if (std::strcmp(arg, "--restore") == 0) {
            parsed.restore_state = true;
        } else if (std::strcmp(arg, "--save") == 0) {
            parsed.save_state = true;
        } else if (std::strcmp(arg, "--sort") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            parsed.sort_by = sort_criterion_from_string(*value);
        } else if (std::strcmp(arg, "--depth") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            try {
                parsed.max_depth = std::stoi(*value);
            } catch (const std::exception&) {
                std::fprintf(stderr, "Invalid depth: %s\n", value->c_str());
                return std::nullopt;
            }
        } else if (std::strcmp(arg, "--query") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            parsed.query = *value;
        } else if (std::strcmp(arg, "--mode") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            parsed.search_mode = search_mode_from_string(*value);
        } else if (std::strcmp(arg, "--focus") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            parsed.focus = *value;
        } else if (std::strcmp(arg, "--reveal") == 0) {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            parsed.reveal = *value;
        } else if (arg[0] == '-') {
            std::fprintf(stderr, "Unknown option: %s\n", arg);
            return std::nullopt;
        } else {
            parsed.directory = arg;
        }
    }
    return parsed;
}

PaneConfig pane_config_for(const Settings& settings, const ParsedArguments& args)
{
    PaneConfig config = settings.get_pane_config(PaneId::Left);
    if (args.include_files) config.show_files_in_tree = *args.include_files;
    if (args.sort_by) config.sort_by = *args.sort_by;
    if (args.max_depth) config.max_render_depth = *args.max_depth;
    if (args.search_mode) config.search_mode = *args.search_mode;
    // The CLI renders once, so nothing may wait on a timer.
    config.search_debounce_ms = 0;
    config.change_debounce_ms = 0;
    return config;
}

void print_rows(const TreePane& pane)
{
    if (!pane.breadcrumb_trail().empty()) {
        std::string trail;
        for (const auto& item : pane.breadcrumb_trail()) {
            trail += trail.empty() ? item.name : " / " + item.name;
        }
        std::cout << "[" << trail << "]\n";
    }

    for (const auto& row : pane.rows()) {
        const bool selected = pane.selected_path() && *pane.selected_path() == row.path;
        std::string marker = " ";
        if (row.type == NodeType::Folder) {
            marker = row.has_children ? (row.is_expanded ? "-" : "+") : " ";
        }
        std::string line = fmt::format("{}{}{} {}", selected ? ">" : " ",
                                       std::string(static_cast<std::size_t>(row.level) * 2, ' '),
                                       marker, row.label);
        if (row.type == NodeType::Folder) {
            line += fmt::format(" ({})", row.file_count);
        }
        if (row.depth_limited) {
            line += " ...";
        }
        if (row.search_score) {
            line += fmt::format("  [{:.2f}]", *row.search_score);
        }
        std::cout << line << "\n";
    }
}

int run_application(int argc, char** argv)
{
    auto parsed = parse_command_line(argc, argv);
    if (!parsed) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (parsed->show_help || parsed->directory.empty()) {
        print_usage();
        return parsed->show_help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("DualPaneTree"));

    Settings settings;
    settings.load();
    const PaneConfig config = pane_config_for(settings, *parsed);

    FileScanOptions options = FileScanOptions::Files | FileScanOptions::Directories;
    if (parsed->hidden) {
        options = options | FileScanOptions::HiddenFiles;
    }
    FilesystemHierarchySource source(Utils::utf8_to_path(parsed->directory), options);

    DualPaneManager manager(source, config, settings.get_pane_config(PaneId::Right));
    manager.initialize();
    TreePane& pane = manager.left();

    if (parsed->restore_state) {
        manager.load_state(settings.get_config_dir());
        if (parsed->include_files) pane.set_include_files(*parsed->include_files);
        if (parsed->sort_by) pane.set_sort_criterion(*parsed->sort_by);
        if (parsed->max_depth) pane.set_max_render_depth(*parsed->max_depth);
    }
    if (!parsed->focus.empty()) {
        auto result = pane.focus_on(parsed->focus);
        if (!result) {
            std::fprintf(stderr, "%s: %s\n", to_string(result.code).c_str(), result.message.c_str());
            return EXIT_FAILURE;
        }
    }
    if (parsed->expand_all) {
        pane.expand_all();
    }
    if (!parsed->reveal.empty()) {
        auto result = pane.reveal_path(parsed->reveal);
        if (!result) {
            std::fprintf(stderr, "%s: %s\n", to_string(result.code).c_str(), result.message.c_str());
        }
    }
    if (!parsed->query.empty()) {
        pane.set_search_query(parsed->query);
        pane.flush_pending();
        if (pane.last_build().pattern_fell_back) {
            std::fprintf(stderr, "Invalid pattern, matched literally: %s\n",
                         pane.last_build().pattern_error.c_str());
        }
    }

    print_rows(pane);

    if (parsed->save_state && !manager.save_state(settings.get_config_dir())) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }
    try {
        return run_application(argc, argv);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
