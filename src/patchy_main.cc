#include "config/config.hpp"
#include "io/target_store.hpp"
#include "patch/diff_text.hpp"
#include "patch/document.hpp"
#include "patch/format_converter.hpp"
#include "patch/header_fixup.hpp"
#include "patch/hunk_parser.hpp"
#include "patch/hunk_applier.hpp"
#include "patch/source_locator.hpp"
#include "processing/hunk_refine.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#ifndef PATCHY_VERSION
#define PATCHY_VERSION "unknown"
#endif

#ifndef PATCHY_BUILD_HASH
#define PATCHY_BUILD_HASH "unknown"
#endif

namespace {

const int kExitOk = 0;
const int kExitHunkFailures = 1;
const int kExitUsage = 2;

enum class Command {
    Apply,
    Test,
    Locate,
    ToContext,
    ToUnified,
    Reverse,
    Fixup,
    Refine,
    Split,
    KillHunk,
    KillFile,
    Check,
};

// clang-format off
const std::vector<std::tuple<Command, std::string>> kCommandNames = {
    { Command::Apply,     "apply"      },
    { Command::Test,      "test"       },
    { Command::Locate,    "locate"     },
    { Command::ToContext, "to-context" },
    { Command::ToUnified, "to-unified" },
    { Command::Reverse,   "reverse"    },
    { Command::Fixup,     "fixup"      },
    { Command::Refine,    "refine"     },
    { Command::Split,     "split"      },
    { Command::KillHunk,  "kill-hunk"  },
    { Command::KillFile,  "kill-file"  },
    { Command::Check,     "check"      },
};
// clang-format on

std::optional<Command>
command_from_string(const std::string& s) {
    for (const auto& [command, name] : kCommandNames) {
        if (name == s) {
            return command;
        }
    }
    return std::nullopt;
}

std::string
repr(Command command) {
    for (const auto& [value, name] : kCommandNames) {
        if (value == command) {
            return name;
        }
    }
    return "unknown";
}

struct CommandLine {
    Command command = Command::Check;
    std::string patch_path;

    bool help = false;
    bool reverse = false;
    bool force = false;
    bool prefer_old = false;
    bool in_place = false;
    bool auto_fix = false;
    int verbosity = 0;
    bool quiet = false;

    std::optional<int64_t> strip;
    std::optional<int64_t> line;
    std::string root = ".";
    std::string output;
};

std::optional<int64_t>
parse_int(const char* s) {
    if (s == nullptr || *s == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long long value = strtoll(s, &end, 10);
    if (errno != 0 || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

// Text produced by a command goes to -o, back into the patch with -i, or
// to stdout.
bool
write_output(const CommandLine& cl, const std::string& text, patchy::Logger& logger) {
    patchy::Error error;
    if (cl.in_place || !cl.output.empty()) {
        const std::string& path = cl.in_place ? cl.patch_path : cl.output;
        if (!patchy::write_file(path, text, error)) {
            logger.error("{}", error.message);
            return false;
        }
        return true;
    }
    fwrite(text.data(), 1, text.size(), stdout);
    return true;
}

// Start of every hunk, or of the one containing the selected line.
std::vector<patchy::Pos>
selected_hunks(const patchy::DiffDocument& document, const CommandLine& cl) {
    std::vector<patchy::Pos> result;
    if (cl.line) {
        result.push_back(patchy::line_position(document.text(), *cl.line));
        return result;
    }
    for (const auto& section : document.sections()) {
        for (const auto& hunk : section.hunks) {
            result.push_back(hunk.span.begin);
        }
    }
    return result;
}

patchy::ApplyOptions
apply_options(const CommandLine& cl, const patchy::EngineSettings& settings) {
    patchy::ApplyOptions options;
    options.reverse = cl.reverse;
    options.force = cl.force;
    options.files = settings.files;
    options.fuzzy_max_chars = settings.fuzzy_max_chars;
    return options;
}

int
run_apply(const CommandLine& cl,
          const patchy::DiffDocument& document,
          const patchy::EngineSettings& settings,
          patchy::Logger& logger) {
    patchy::FileTargetStore store(cl.root);
    patchy::ApplyContext context{store, logger, settings.parse};
    auto options = apply_options(cl, settings);

    if (cl.line) {
        options.save = true;
        auto status = patchy::apply_hunk(document, patchy::line_position(document.text(), *cl.line), options,
                                         context);
        if (status.outcome == patchy::HunkOutcome::Failed) {
            return kExitHunkFailures;
        }
        fmt::print("{}: {}\n", status.location.target, status.message);
        return kExitOk;
    }

    auto result = patchy::apply_all(document, {0, document.text().size()}, options, context);
    for (const auto& status : result.statuses) {
        if (status.outcome != patchy::HunkOutcome::Failed) {
            fmt::print("{}: {}\n", status.location.target, status.message);
        }
    }
    fmt::print("{}\n", result.message);
    return result.failures == 0 && result.save_failures == 0 ? kExitOk : kExitHunkFailures;
}

int
run_test(const CommandLine& cl,
         const patchy::DiffDocument& document,
         const patchy::EngineSettings& settings,
         patchy::Logger& logger) {
    patchy::FileTargetStore store(cl.root);
    patchy::ApplyContext context{store, logger, settings.parse};
    auto options = apply_options(cl, settings);

    int failures = 0;
    for (auto pos : selected_hunks(document, cl)) {
        auto status = patchy::test_hunk(document, pos, options, context);
        if (status.outcome == patchy::HunkOutcome::Failed) {
            failures++;
            continue;
        }

        const auto& location = status.location;
        if (cl.command == Command::Locate) {
            fmt::print("{}:{}: offset {}, characters {}-{}{}{}\n", location.target,
                       patchy::count_lines(std::string_view(document.text()).substr(0, pos)) + 1,
                       location.line_offset, location.span.begin, location.span.end,
                       location.switched ? ", already applied" : "", location.fuzzy ? ", fuzzy" : "");
        } else {
            fmt::print("{}: {}\n", location.target, status.message);
        }
    }
    return failures == 0 ? kExitOk : kExitHunkFailures;
}

int
run_convert(const CommandLine& cl, const patchy::DiffDocument& document, patchy::Logger& logger) {
    const auto& text = document.text();
    patchy::Conversion conversion;
    patchy::Error error;

    bool ok = false;
    switch (cl.command) {
        case Command::ToContext:
            ok = patchy::unified_to_context(text, {0, text.size()}, document.options(), conversion, error);
            break;
        case Command::ToUnified:
            ok = patchy::context_to_unified(text, {0, text.size()}, document.options(), conversion, error);
            break;
        default:
            ok = patchy::reverse_direction(text, {0, text.size()}, document.options(), conversion, error);
            break;
    }

    if (!ok) {
        logger.error("{}", error.message);
        return kExitHunkFailures;
    }
    if (!conversion.reversible) {
        logger.info("The conversion can't be undone exactly");
    }
    logger.info("Converted {} hunks", conversion.hunks);
    return write_output(cl, conversion.text, logger) ? kExitOk : kExitUsage;
}

int
run_refine(const CommandLine& cl, const patchy::DiffDocument& document, const patchy::EngineSettings& settings) {
    const auto& text = document.text();
    for (auto pos : selected_hunks(document, cl)) {
        patchy::Hunk hunk;
        patchy::Error error;
        auto bounds = patchy::find_hunk_bounds(text, pos, document.options());
        if (!bounds || !patchy::parse_hunk(text, bounds->begin, document.options(), hunk, error)) {
            continue;
        }

        for (const auto& region : patchy::refine_hunk(text, hunk, settings.refine)) {
            auto line_start = patchy::line_begin(text, region.span.begin);
            fmt::print("{}:{}: {} '{}'\n", patchy::count_lines(std::string_view(text).substr(0, line_start)) + 1,
                       region.span.begin - line_start + 1, patchy::repr(region.kind),
                       text.substr(region.span.begin, region.span.size()));
        }
    }
    return kExitOk;
}

int
run_edit(const CommandLine& cl, patchy::DiffDocument& document, patchy::Logger& logger) {
    if (!cl.line) {
        logger.error("{} needs --line", repr(cl.command));
        return kExitUsage;
    }

    auto pos = patchy::line_position(document.text(), *cl.line);
    patchy::Error error;
    bool ok = false;
    switch (cl.command) {
        case Command::Split:
            ok = document.split_hunk(pos, error);
            break;
        case Command::KillHunk:
            ok = document.kill_hunk(pos, error);
            break;
        default:
            ok = document.kill_file(pos, error);
            break;
    }
    if (!ok) {
        logger.error("{}", error.message);
        return kExitHunkFailures;
    }

    if (document.flush_fixups()) {
        logger.debug("Updated the hunk headers around line {}", *cl.line);
    }
    return write_output(cl, document.text(), logger) ? kExitOk : kExitUsage;
}

int
run_check(const CommandLine& cl, patchy::DiffDocument& document, patchy::Logger& logger) {
    int failures = 0;

    patchy::Error error;
    for (const auto& section : document.sections()) {
        if (!patchy::check_section_order(section, error)) {
            logger.warning("{}", error.message);
            failures++;
        }
    }

    patchy::AutoFixPolicy policy = [&](const std::string& question) {
        logger.info("{} {}", question, cl.auto_fix ? "yes" : "no");
        return cl.auto_fix;
    };

    // Repairs change the text, so positions are taken again after each hunk.
    std::size_t index = 0;
    while (true) {
        auto hunks = selected_hunks(document, cl);
        if (index >= hunks.size()) {
            break;
        }
        error = patchy::Error{};
        if (!document.sanity_check(hunks[index], policy, error)) {
            logger.warning("Hunk at line {}: {}",
                           patchy::count_lines(std::string_view(document.text()).substr(0, hunks[index])) + 1,
                           error.message);
            failures++;
        }
        index++;
    }

    if (cl.auto_fix && !write_output(cl, document.text(), logger)) {
        return kExitUsage;
    }
    if (failures == 0) {
        logger.info("No problems found");
    }
    return failures == 0 ? kExitOk : kExitHunkFailures;
}

}  // namespace

int
main(int argc, char* argv[]) {
    CommandLine cl;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} COMMAND [options] PATCH

Apply, convert and repair unified, context and normal diffs

Commands:
    apply                      apply every hunk, or the one at --line; all or nothing
    test                       check where each hunk would apply without changing files
    locate                     print the position of each hunk in its target
    to-context                 convert unified hunks to context format
    to-unified                 convert context hunks to unified format
    reverse                    swap the old and new sides of the diff
    fixup                      recompute the line counts of every hunk header
    refine                     list the changed words of each hunk
    split                      split the hunk at --line into two hunks
    kill-hunk                  remove the hunk at --line
    kill-file                  remove the file section at --line
    check                      verify hunk counts and order, repairing with --auto-fix

Options:
    -R, --reverse              undo the hunks instead of applying them
    -f, --force                undo hunks that look already applied
    -p, --strip N              leading directories to drop from file names
    -d, --directory DIR        directory the file names are relative to
    -o, --output FILE          write the resulting diff to FILE
    -i, --in-place             write the resulting diff back to PATCH
        --old                  prefer the old file name
        --line N               only the hunk or file containing line N of PATCH
        --auto-fix             repair damaged hunks found by `check`
    -v, --verbose              more messages; twice for debug output
    -q, --quiet                no messages
    -h, --help                 show this help
        --version              show program version and exit
)",
                                       argv[0]);

        help += "\nConfig directory:\n    " + patchy::config_get_directory() + "\n";

        if (!optional_error_message.empty()) {
            help += "\n" + optional_error_message + "\n";
        }
        fputs(help.c_str(), optional_error_message.empty() ? stdout : stderr);
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        enum LongOnly {
            kOld = 256,
            kLine,
            kAutoFix,
            kVersion,
        };
        static struct option long_options[] = {{"reverse", no_argument, 0, 'R'},
                                               {"force", no_argument, 0, 'f'},
                                               {"strip", required_argument, 0, 'p'},
                                               {"directory", required_argument, 0, 'd'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"old", no_argument, 0, kOld},
                                               {"line", required_argument, 0, kLine},
                                               {"auto-fix", no_argument, 0, kAutoFix},
                                               {"verbose", no_argument, 0, 'v'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, kVersion},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "Rfp:d:o:ivqh", long_options, &option_index)) >= 0) {
            switch (c) {
                case kVersion:
                    fmt::print("version: {}\n", PATCHY_VERSION);
                    fmt::print("vcs hash: {}\n", PATCHY_BUILD_HASH);
                    exit(kExitOk);
                case 'h':
                    cl.help = true;
                    return true;
                case 'R':
                    cl.reverse = true;
                    break;
                case 'f':
                    cl.force = true;
                    break;
                case 'p':
                    cl.strip = parse_int(optarg);
                    if (!cl.strip || *cl.strip < 0) {
                        show_help(fmt::format("error: invalid value for -p ({})", optarg));
                        return false;
                    }
                    break;
                case 'd':
                    cl.root = optarg;
                    break;
                case 'o':
                    cl.output = optarg;
                    break;
                case 'i':
                    cl.in_place = true;
                    break;
                case kOld:
                    cl.prefer_old = true;
                    break;
                case kLine:
                    cl.line = parse_int(optarg);
                    if (!cl.line || *cl.line < 1) {
                        show_help(fmt::format("error: invalid value for --line ({})", optarg));
                        return false;
                    }
                    break;
                case kAutoFix:
                    cl.auto_fix = true;
                    break;
                case 'v':
                    cl.verbosity++;
                    break;
                case 'q':
                    cl.quiet = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (cl.in_place && !cl.output.empty()) {
            show_help("error: -i and -o are mutually exclusive");
            return false;
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: expected a command and a patch file");
            return false;
        }

        auto command = command_from_string(in_argv[optind]);
        if (!command) {
            show_help(fmt::format("error: unknown command '{}'", in_argv[optind]));
            return false;
        }
        cl.command = *command;
        cl.patch_path = in_argv[optind + 1];

        auto status = patchy::check_file_status(cl.patch_path);
        if (status != patchy::FileStatus::Ok) {
            show_help(fmt::format("error: '{}': {}", cl.patch_path, patchy::repr(status)));
            return false;
        }
        return true;
    };

    if (!parse_args(argc, argv)) {
        return kExitUsage;
    }
    if (cl.help) {
        show_help("");
        return kExitOk;
    }

    patchy::Logger logger;

    // Load the global defaults before we override them with command line args
    patchy::ProgramOptions opts;
    if (!patchy::config_apply_options(opts, logger)) {
        return kExitUsage;
    }
    if (cl.strip) {
        opts.strip = *cl.strip;
    }
    if (cl.prefer_old) {
        opts.prefer_old_file = true;
    }

    patchy::EngineSettings settings;
    patchy::Error error;
    if (!patchy::config_settings(opts, settings, error)) {
        logger.error("{}", error.message);
        return kExitUsage;
    }

    logger.level = settings.log_level;
    if (cl.quiet) {
        logger.level = patchy::LogLevel::Quiet;
    } else if (cl.verbosity > 0) {
        logger.level = cl.verbosity > 1 ? patchy::LogLevel::Debug : patchy::LogLevel::Info;
    }

    std::string patch_text;
    if (!patchy::read_file(cl.patch_path, patch_text, error)) {
        logger.error("{}", error.message);
        return kExitUsage;
    }

    patchy::DiffDocument document(std::move(patch_text), settings.parse, settings.fixup_policy);

    switch (cl.command) {
        case Command::Apply:
            return run_apply(cl, document, settings, logger);
        case Command::Test:
        case Command::Locate:
            return run_test(cl, document, settings, logger);
        case Command::ToContext:
        case Command::ToUnified:
        case Command::Reverse:
            return run_convert(cl, document, logger);
        case Command::Fixup: {
            std::string text = document.text();
            if (!patchy::fixup_hunk_headers(text, {0, text.size()}, settings.parse)) {
                logger.info("All hunk headers already match their bodies");
            }
            return write_output(cl, text, logger) ? kExitOk : kExitUsage;
        }
        case Command::Refine:
            return run_refine(cl, document, settings);
        case Command::Split:
        case Command::KillHunk:
        case Command::KillFile:
            return run_edit(cl, document, logger);
        case Command::Check:
            return run_check(cl, document, logger);
    }
    return kExitUsage;
}
