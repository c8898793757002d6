#pragma once

#include "patch/document.hpp"
#include "patch/file_names.hpp"
#include "patch/hunk_parser.hpp"
#include "processing/hunk_refine.hpp"
#include "util/config_parser/config_parser.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

#include <cstdint>
#include <string>

namespace patchy {

// Values as they are stored in patchy.conf. Command-line flags are applied
// on top after loading.
struct ProgramOptions {
    // [general]
    bool valid_unified_empty_line = true;
    bool prefer_old_file = false;
    int64_t strip = -1;
    std::string fixup_policy = "on-edit";
    int64_t fuzzy_max_chars = 8192;
    std::string log_level = "warning";

    // [refine]
    std::string granularity = "token";
    int64_t max_tokens = 20000;
    bool tag_unpaired_lines = false;
    bool use_changed_kind = false;
};

// ProgramOptions checked and converted for the engine.
struct EngineSettings {
    HunkParseOptions parse;
    FileNameOptions files;
    FixupPolicy fixup_policy = FixupPolicy::OnEdit;
    std::size_t fuzzy_max_chars = 8192;
    LogLevel log_level = LogLevel::Warning;
    RefineOptions refine;
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
repr(ConfigLoadResult result);

// <config home>/patchy
std::string
config_get_directory();

ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result);

// Read the options from a config file. Keys missing from the file keep the
// values already in program_options; a missing file is written with them.
// Returns false when the file exists but can't be used.
bool
config_apply_file(const std::string& config_path, ProgramOptions& program_options, Logger& logger);

// config_apply_file on <config home>/patchy/patchy.conf
bool
config_apply_options(ProgramOptions& program_options, Logger& logger);

bool
config_settings(const ProgramOptions& program_options, EngineSettings& settings, Error& error);

}  // namespace patchy
