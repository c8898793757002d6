#include "source_locator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <regex>

using namespace patchy;

namespace {

bool
is_line_start(std::string_view text, Pos pos) {
    return pos == 0 || text[pos - 1] == '\n';
}

bool
is_fuzzy_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string
regex_escape(std::string_view word) {
    static const std::string_view kSpecial = "\\^$.|?*+()[]{}/";
    std::string out;
    out.reserve(word.size() * 2);
    for (char c : word) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::optional<Span>
closest(std::optional<Span> forward, std::optional<Span> backward, Pos orig) {
    if (!forward) {
        return backward;
    }
    if (!backward) {
        return forward;
    }
    return forward->begin - orig <= orig - backward->begin ? forward : backward;
}

int64_t
lines_between(std::string_view text, Pos from, Pos to) {
    if (to >= from) {
        return std::count(text.begin() + from, text.begin() + to, '\n');
    }
    return -std::count(text.begin() + to, text.begin() + from, '\n');
}

}  // namespace

Pos
patchy::line_position(std::string_view text, int64_t line) {
    Pos pos = 0;
    for (int64_t i = 1; i < line && pos < text.size(); i++) {
        pos = next_line(text, pos);
    }
    return pos;
}

std::optional<Span>
patchy::find_text(std::string_view haystack, std::string_view needle, Pos orig) {
    orig = std::min(orig, haystack.size());

    std::optional<Span> forward;
    for (Pos p = haystack.find(needle, orig); p != std::string_view::npos; p = haystack.find(needle, p + 1)) {
        if (is_line_start(haystack, p)) {
            forward = Span{p, p + needle.size()};
            break;
        }
        if (p >= haystack.size()) {
            break;
        }
    }

    std::optional<Span> backward;
    for (Pos p = haystack.rfind(needle, orig); p != std::string_view::npos; p = haystack.rfind(needle, p - 1)) {
        if (is_line_start(haystack, p)) {
            backward = Span{p, p + needle.size()};
            break;
        }
        if (p == 0) {
            break;
        }
    }

    return closest(forward, backward, orig);
}

std::string
patchy::fuzzy_pattern(std::string_view needle) {
    static const std::string kSpace = "[ \\t\\n\\r\\f\\v]";
    static const std::string kBlank = "[ \\t\\r\\f\\v]";

    std::string words;
    std::size_t i = 0;
    while (i < needle.size()) {
        while (i < needle.size() && is_fuzzy_space(needle[i])) {
            i++;
        }
        std::size_t start = i;
        while (i < needle.size() && !is_fuzzy_space(needle[i])) {
            i++;
        }
        if (i == start) {
            break;
        }
        if (!words.empty()) {
            words += kSpace + "+";
        }
        words += regex_escape(needle.substr(start, i - start));
    }

    if (words.empty()) {
        return {};
    }
    // The ends stay on the first and last line so a match never takes the
    // blank lines around the hunk with it.
    return fmt::format("{}*{}{}*(?:\\n|$)", kBlank, words, kBlank);
}

std::optional<Span>
patchy::find_fuzzy(std::string_view haystack, std::string_view needle, Pos orig, std::size_t max_chars, Logger& logger) {
    if (needle.size() > max_chars) {
        logger.info("Hunk text too long for a fuzzy search ({} > {} characters)", needle.size(), max_chars);
        return std::nullopt;
    }
    auto pattern = fuzzy_pattern(needle);
    if (pattern.empty()) {
        return std::nullopt;
    }
    orig = std::min(orig, haystack.size());

    try {
        const std::regex re(pattern, std::regex::ECMAScript);

        // A match covers at most twice the capped hunk size. std::regex
        // recurses per matched character, so the window bounds its depth.
        const std::size_t window = 2 * max_chars;

        auto match_at = [&](Pos p) -> std::optional<Span> {
            auto flags = std::regex_constants::match_continuous;
            if (p > 0) {
                flags |= std::regex_constants::match_prev_avail;
            }
            std::size_t length = std::min(window, haystack.size() - p);
            if (p + length < haystack.size()) {
                flags |= std::regex_constants::match_not_eol;
            }
            std::match_results<std::string_view::const_iterator> m;
            if (std::regex_search(haystack.begin() + p, haystack.begin() + p + length, m, re, flags)) {
                return Span{p, p + static_cast<Pos>(m.length(0))};
            }
            return std::nullopt;
        };

        std::optional<Span> forward;
        for (Pos p = line_begin(haystack, orig); p < haystack.size(); p = next_line(haystack, p)) {
            if (p >= orig && (forward = match_at(p))) {
                break;
            }
        }

        std::optional<Span> backward;
        Pos p = line_begin(haystack, orig);
        while (true) {
            if ((backward = match_at(p)) || p == 0) {
                break;
            }
            p = previous_line(haystack, p);
        }

        return closest(forward, backward, orig);
    } catch (const std::regex_error& e) {
        logger.warning("Fuzzy search failed: {}", e.what());
        return std::nullopt;
    }
}

bool
patchy::locate(std::string_view diff,
               Span hunk,
               std::string_view target_text,
               const LocateOptions& options,
               const HunkParseOptions& parse_options,
               Logger& logger,
               SourceLocation& location,
               Error& error) {
    location = SourceLocation{};

    HunkHeader header;
    if (!parse_header(diff, hunk.begin, header, error, parse_options)) {
        return false;
    }

    HunkText old_text;
    HunkText new_text;
    if (!extract_hunk_text(diff, hunk, false, std::nullopt, parse_options, old_text, error) ||
        !extract_hunk_text(diff, hunk, true, std::nullopt, parse_options, new_text, error)) {
        return false;
    }
    location.from = options.reverse ? new_text.text : old_text.text;
    location.to = options.reverse ? old_text.text : new_text.text;

    // An empty range starts after the line it names.
    const LineRange& range = options.prefer_old_side ? header.old_range : header.new_range;
    int64_t line = range.count == 0 ? range.start + 1 : range.start;
    Pos orig = line_position(target_text, line);

    auto from = find_text(target_text, location.from, orig);
    auto to = find_text(target_text, location.to, orig);

    // An empty text is found anywhere, so it says nothing about whether
    // the hunk is applied.
    std::optional<Span> found;
    if (from && to && !options.reverse && !location.to.empty()) {
        found = to;
        location.switched = true;
    } else if (from) {
        found = from;
    } else if (to) {
        found = to;
        location.switched = true;
    } else if ((from = find_fuzzy(target_text, location.from, orig, options.fuzzy_max_chars, logger))) {
        found = from;
        location.fuzzy = true;
    } else if ((to = find_fuzzy(target_text, location.to, orig, options.fuzzy_max_chars, logger))) {
        found = to;
        location.switched = true;
        location.fuzzy = true;
    }

    if (!found) {
        return error.set(ErrorKind::NotFound, "Hunk text not found");
    }

    location.span = *found;
    location.line_offset = lines_between(target_text, orig, found->begin);
    logger.debug("Hunk at line {} found at offset {}{}{}", line, location.line_offset,
                 location.switched ? " (switched)" : "", location.fuzzy ? " (fuzzy)" : "");
    return true;
}
