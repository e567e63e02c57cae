#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include <diagnostics/diagnostics.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <run.hpp>

namespace
{
constexpr auto prompt = "> ";

// sysexits.h
constexpr auto exit_usage = 64;
constexpr auto exit_data_error = 65;
constexpr auto exit_software = 70;
constexpr auto exit_io_error = 74;

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = exit_usage;
    }
    fmt::print("Usage: {} [-d] [-h] [<script>]\n\n", program);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg.empty()) {
            continue;
        }
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (!opts.file.empty()) {
                show_usage(program, fmt::format("only one script can be run, got {} and {}", opts.file, arg));
            }
            opts.file = arg;
        }
    }
    return opts;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return exit_io_error;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    diagnostics diag;
    run(contents, diag, std::cout, opts.debug ? &std::cerr : nullptr);
    if (diag.had_error()) {
        return exit_data_error;
    }
    if (diag.had_runtime_error()) {
        return exit_software;
    }
    return EXIT_SUCCESS;
}

auto run_repl(const command_line_args& opts) -> int
{
    diagnostics diag;
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        run(input, diag, std::cout, opts.debug ? &std::cerr : nullptr);
        diag.reset();
        show_prompt();
    }
    std::cout << '\n';
    return EXIT_SUCCESS;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return exit_software;
    }
}
