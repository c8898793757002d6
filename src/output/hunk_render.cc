#include "hunk_render.hpp"

#include <fmt/format.h>

using namespace patchy;

std::string
patchy::render_unified_range(const LineRange& range, bool count_given) {
    if (!count_given) {
        return fmt::format("{}", range.start);
    }
    return fmt::format("{},{}", range.start, range.count);
}

std::string
patchy::render_end_range(const LineRange& range, bool end_given) {
    if (!end_given) {
        return fmt::format("{}", range.start);
    }
    return fmt::format("{},{}", range.start, range.last());
}

std::string
patchy::render_unified_header(const HunkHeader& header) {
    return fmt::format("@@ -{} +{} @@{}\n", render_unified_range(header.old_range, header.old_count_given),
                       render_unified_range(header.new_range, header.new_count_given), header.heading);
}

std::string
patchy::render_context_header(const HunkHeader& header) {
    return fmt::format("***************{}\n*** {} ****\n", header.heading,
                       render_end_range(header.old_range, header.old_count_given));
}

std::string
patchy::render_context_mid_header(const HunkHeader& header) {
    return fmt::format("--- {} ----\n", render_end_range(header.new_range, header.new_count_given));
}

std::string
patchy::render_normal_header(const HunkHeader& header) {
    // The side an 'a' or 'd' leaves untouched is a single line number.
    LineRange old_range = header.old_range;
    LineRange new_range = header.new_range;
    bool old_given = header.old_count_given && header.normal_op != 'a';
    bool new_given = header.new_count_given && header.normal_op != 'd';
    return fmt::format("{}{}{}\n", render_end_range(old_range, old_given), header.normal_op,
                       render_end_range(new_range, new_given));
}

std::string
patchy::render_header(const HunkHeader& header) {
    switch (header.style) {
        case HunkStyle::Unified:
            return render_unified_header(header);
        case HunkStyle::Context:
            return render_context_header(header);
        case HunkStyle::Normal:
            return render_normal_header(header);
    }
    return {};
}

std::string
patchy::render_hunk(std::string_view text, const Hunk& hunk) {
    std::string out = render_header(hunk.header);
    for (const auto& line : hunk.body) {
        if (line.kind == LineKind::Separator && hunk.header.style == HunkStyle::Context) {
            out += render_context_mid_header(hunk.header);
            continue;
        }
        out.append(text.substr(line.span.begin, line.span.size()));
        if (line.has_newline) {
            out += '\n';
        }
    }
    return out;
}
