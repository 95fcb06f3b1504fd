#include "config/Config.hpp"
#include "config/SelectorOptions.hpp"
#include "model/Candidates.hpp"
#include "ui/Terminal.hpp"
#include "ui/SelectorLayout.hpp"
#include "ui/widgets/HelpBar.hpp"
#include "ui/widgets/Selector.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <format>
#include <iostream>
#include <optional>
#include <poll.h>
#include <sstream>
#include <string>

namespace {

constexpr int EXIT_ACCEPTED = 0;
constexpr int EXIT_CANCELLED = 1;
constexpr int EXIT_ERROR = 2;

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

struct Arguments {
    std::optional<std::string> config_path;
    std::optional<std::string> write_config_path;
    std::optional<std::string> candidates_path;
    bool describe = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "usage: colpick [--config PATH] [--write-config PATH] [--describe] FILE\n"
        << "\n"
        << "Pick one entry from FILE and print its title.\n"
        << "\n"
        << "  --config PATH        read settings from PATH instead of ~/.config/colpick/config.toml\n"
        << "  --write-config PATH  write the effective settings to PATH and exit\n"
        << "  --describe           also print the description of the chosen entry\n"
        << "\n"
        << "FILE holds '[Category]' headers and 'title<TAB>description' lines.\n"
        << "Exit status: 0 accepted, 1 cancelled, 2 error.\n";
}

std::optional<Arguments> parse_arguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "colpick: " << flag << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            args.config_path = value("--config");
            if (!args.config_path) return std::nullopt;
        } else if (arg == "--write-config") {
            args.write_config_path = value("--write-config");
            if (!args.write_config_path) return std::nullopt;
        } else if (arg == "--describe") {
            args.describe = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "colpick: unknown option " << arg << "\n";
            return std::nullopt;
        } else if (args.candidates_path) {
            std::cerr << "colpick: only one candidate file is accepted\n";
            return std::nullopt;
        } else {
            args.candidates_path = arg;
        }
    }
    return args;
}

// Selector height budget on a terminal of `rows` rows, below the help bar
int selector_height_for(int rows, int help_rows) {
    return rows - colpick::ui::SelectorLayout::FRAME_ROWS - help_rows;
}

void draw(colpick::ui::Terminal& terminal, const colpick::ui::widgets::Selector& selector, bool show_help) {
    std::string frame = "\033[2J";
    int y = 0;
    auto emit = [&frame, &y](const std::string& block) {
        if (block.empty()) return;
        std::istringstream lines(block);
        std::string line;
        while (std::getline(lines, line)) {
            frame += std::format("\033[{};1H{}", y + 1, line);
            ++y;
        }
    };
    emit(selector.view());
    if (show_help) emit(selector.help_view());
    terminal.write_raw(frame);
}

int help_rows_of(const colpick::ui::widgets::Selector& selector, bool show_help) {
    if (!show_help) return 0;
    if (!selector.show_full_help()) return 1;
    colpick::ui::widgets::HelpBar bar;
    bar.set_groups(selector.full_help());
    return bar.rows();
}

void fit_to_terminal(colpick::ui::widgets::Selector& selector, const colpick::ui::Terminal& terminal, bool show_help) {
    int width = terminal.get_terminal_width();
    int height = selector_height_for(terminal.get_terminal_height(), help_rows_of(selector, show_help));
    selector.update(colpick::ui::InputEvent::resize(width, height));
}

int run(const Arguments& args) {
    namespace config = colpick::config;
    using colpick::util::Logger;

    auto cfg = args.config_path
        ? config::ConfigLoader::load_from_file(*args.config_path)
        : config::ConfigLoader::load_config();
    Logger::init(cfg.log_file, Logger::parse_level(cfg.log_level, Logger::Level::Info));
    Logger::info("colpick starting");

    if (args.write_config_path) {
        if (!config::ConfigLoader::save_config(cfg, *args.write_config_path)) {
            std::cerr << "colpick: cannot write " << *args.write_config_path << "\n";
            return EXIT_ERROR;
        }
        return EXIT_ACCEPTED;
    }

    if (!args.candidates_path) {
        print_usage(std::cerr);
        return EXIT_ERROR;
    }

    auto candidates = colpick::model::load_candidates(*args.candidates_path);
    if (!candidates) {
        std::cerr << "colpick: cannot read " << *args.candidates_path << "\n";
        return EXIT_ERROR;
    }

    colpick::ui::widgets::Selector selector(config::make_options(cfg));
    selector.set_values(*candidates);
    if (selector.done()) {
        Logger::info("No candidates in " + *args.candidates_path);
        return EXIT_CANCELLED;
    }

    auto& terminal = colpick::ui::Terminal::instance();
    if (!terminal.init()) {
        std::cerr << "colpick: no terminal available\n";
        return EXIT_ERROR;
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    const bool show_help = cfg.show_help;
    fit_to_terminal(selector, terminal, show_help);
    draw(terminal, selector, show_help);

    while (!g_shutdown.load() && !selector.done()) {
        struct pollfd pfd = {terminal.input_fd(), POLLIN, 0};
        int ret = poll(&pfd, 1, 100);

        if (ret < 0) {
            if (errno == EINTR) continue;  // SIGWINCH lands here
            Logger::error("Poll failed: " + std::string(std::strerror(errno)));
            break;
        }

        bool needs_render = false;
        while (true) {
            auto event = terminal.read_input();
            if (event.type == colpick::ui::InputEvent::Type::Resize) {
                fit_to_terminal(selector, terminal, show_help);
                needs_render = true;
                continue;
            }
            if (event.key_name.empty()) break;

            const bool full_help_before = selector.show_full_help();
            selector.update(event);
            if (selector.show_full_help() != full_help_before) {
                // Help grew or shrank: give the selector the rest
                fit_to_terminal(selector, terminal, show_help);
            }
            needs_render = true;
            if (selector.done()) break;
        }

        if (needs_render && !selector.done()) {
            draw(terminal, selector, show_help);
        }
    }

    terminal.shutdown();

    if (g_shutdown.load()) {
        Logger::info("Terminated by signal");
        return EXIT_CANCELLED;
    }

    const auto& accepted = selector.accepted_entry();
    if (!accepted) {
        Logger::info("Selection cancelled");
        return EXIT_CANCELLED;
    }

    std::cout << accepted->title << "\n";
    if (args.describe && !accepted->description.empty()) {
        std::cout << accepted->description << "\n";
    }
    Logger::info("Selected: " + accepted->title);
    return EXIT_ACCEPTED;
}

}  // namespace

int main(int argc, char** argv) {
    colpick::util::Logger::init();

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(std::cerr);
        return EXIT_ERROR;
    }
    if (args->help) {
        print_usage(std::cout);
        return EXIT_ACCEPTED;
    }

    try {
        return run(*args);
    } catch (const std::exception& e) {
        // Restore the terminal before reporting
        colpick::ui::Terminal::instance().shutdown();
        colpick::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "colpick: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}
