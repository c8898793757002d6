#include "config.hpp"

#include "util/config_parser/config_serializer.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace patchy;

namespace {

const std::string kConfigFileName = "patchy.conf";

const std::string kConfigDocGeneral = R"foo(# General configuration for `patchy`
#
# Defaults for every command. Command-line flags override them.
#
#   strip            leading directories to drop from file names, -1 tries all
#   fixup_policy     'on-edit' or 'before-save'
#   fuzzy_max_chars  longest hunk text searched with whitespace fuzz
#   log_level        'quiet', 'error', 'warning', 'info' or 'debug')foo";

const std::string kConfigDocRefine = R"foo(# Word-level highlighting of changed lines
#
#   granularity  'token' or 'char')foo";

// clang-format off
const std::vector<std::tuple<ConfigLoadResult, std::string>> kLoadResultNames = {
    { ConfigLoadResult::Ok,           "ok"             },
    { ConfigLoadResult::Invalid,      "invalid"        },
    { ConfigLoadResult::DoesNotExist, "does-not-exist" },
};
// clang-format on

enum class ConfigVariableType {
    Bool,
    Int,
    String,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

bool
config_save(const std::string& config_path, const Value& config_value, Logger& logger) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config_path).parent_path(), ec);
    if (ec) {
        logger.warning("Failed to create the config directory for '{}': {}", config_path, ec.message());
        return false;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        logger.warning("Failed to open '{}' for writing: {}", config_path, strerror(errno));
        return false;
    }

    std::string serialized = cfg_serialize(config_value);
    bool ok = fwrite(serialized.data(), 1, serialized.size(), f) == serialized.size();
    ok = fclose(f) == 0 && ok;
    if (!ok) {
        logger.warning("Failed to write '{}'", config_path);
    }
    return ok;
}

// Copy stored values into the option fields, and store the field value for
// every option the config doesn't have. Returns whether anything was added.
bool
config_apply_option_vector(Value& config, const OptionVector& options, Logger& logger) {
    bool added = false;
    for (const auto& [path, type, ptr] : options) {
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            Value& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *((bool*) ptr) = value.as_bool();
                    } else {
                        logger.warning("Ignoring '{}' in {}: expected a boolean, found {}", path, kConfigFileName,
                                       repr(value));
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (value.is_int()) {
                        *((int64_t*) ptr) = value.as_int();
                    } else {
                        logger.warning("Ignoring '{}' in {}: expected an integer, found {}", path, kConfigFileName,
                                       repr(value));
                    }
                } break;
                case ConfigVariableType::String: {
                    if (value.is_string()) {
                        *((std::string*) ptr) = value.as_string();
                    } else {
                        logger.warning("Ignoring '{}' in {}: expected a string, found {}", path, kConfigFileName,
                                       repr(value));
                    }
                } break;
            }
            continue;
        }

        switch (type) {
            case ConfigVariableType::Bool: {
                config.set_value_at(path, Value{Value::Bool{*(bool*) ptr}});
            } break;
            case ConfigVariableType::Int: {
                config.set_value_at(path, Value{Value::Int{*(int64_t*) ptr}});
            } break;
            case ConfigVariableType::String: {
                config.set_value_at(path, Value{Value::String{*(std::string*) ptr}});
            } break;
        }
        added = true;
    }
    return added;
}

}  // namespace

std::string
patchy::repr(ConfigLoadResult result) {
    for (const auto& [value, name] : kLoadResultNames) {
        if (value == result) {
            return name;
        }
    }
    return "unknown";
}

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

ConfigLoadResult
patchy::config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        load_result.kind = ParseErrorKind::File;
        load_result.error = "File does not exist";
        return ConfigLoadResult::DoesNotExist;
    }

    if (!cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Invalid;
    }
    return config_table.is_table() ? ConfigLoadResult::Ok : ConfigLoadResult::Invalid;
}

bool
patchy::config_apply_file(const std::string& config_path, ProgramOptions& program_options, Logger& logger) {
    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value{Value::Table{}};
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            logger.error("{}\n\twhile parsing: {}", config_parse_result.error, config_path);
            return false;
        }
        case ConfigLoadResult::DoesNotExist: {
            logger.info("Could not find a config file, creating {}", config_path);
            config_file_table_value = Value{Value::Table{}};
            flush_config_to_disk = true;
        } break;
    }

    // clang-format off
    const OptionVector options = {
        { "general.valid_unified_empty_line", ConfigVariableType::Bool,   &program_options.valid_unified_empty_line },
        { "general.prefer_old_file",          ConfigVariableType::Bool,   &program_options.prefer_old_file },
        { "general.strip",                    ConfigVariableType::Int,    &program_options.strip },
        { "general.fixup_policy",             ConfigVariableType::String, &program_options.fixup_policy },
        { "general.fuzzy_max_chars",          ConfigVariableType::Int,    &program_options.fuzzy_max_chars },
        { "general.log_level",                ConfigVariableType::String, &program_options.log_level },
        { "refine.granularity",               ConfigVariableType::String, &program_options.granularity },
        { "refine.max_tokens",                ConfigVariableType::Int,    &program_options.max_tokens },
        { "refine.tag_unpaired_lines",        ConfigVariableType::Bool,   &program_options.tag_unpaired_lines },
        { "refine.use_changed_kind",          ConfigVariableType::Bool,   &program_options.use_changed_kind },
    };
    // clang-format on

    config_apply_option_vector(config_file_table_value, options, logger);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(kConfigDocGeneral);
        config_file_table_value["refine"].key_comments.push_back(kConfigDocRefine);
        config_save(config_path, config_file_table_value, logger);
    }
    return true;
}

bool
patchy::config_apply_options(ProgramOptions& program_options, Logger& logger) {
    const std::string config_path = fmt::format("{}/{}", config_get_directory(), kConfigFileName);
    return config_apply_file(config_path, program_options, logger);
}

bool
patchy::config_settings(const ProgramOptions& program_options, EngineSettings& settings, Error& error) {
    settings.parse.valid_unified_empty_line = program_options.valid_unified_empty_line;
    settings.files.prefer_old = program_options.prefer_old_file;
    settings.files.strip = static_cast<int>(program_options.strip);

    auto policy = fixup_policy_from_string(program_options.fixup_policy);
    if (!policy) {
        return error.set(ErrorKind::IO, fmt::format("Unknown fixup policy '{}'", program_options.fixup_policy));
    }
    settings.fixup_policy = *policy;

    if (program_options.fuzzy_max_chars < 0) {
        return error.set(ErrorKind::IO, "fuzzy_max_chars can't be negative");
    }
    settings.fuzzy_max_chars = static_cast<std::size_t>(program_options.fuzzy_max_chars);

    auto level = log_level_from_string(program_options.log_level);
    if (!level) {
        return error.set(ErrorKind::IO, fmt::format("Unknown log level '{}'", program_options.log_level));
    }
    settings.log_level = *level;

    auto granularity = refine_granularity_from_string(program_options.granularity);
    if (!granularity) {
        return error.set(ErrorKind::IO, fmt::format("Unknown refine granularity '{}'", program_options.granularity));
    }
    settings.refine.granularity = *granularity;

    if (program_options.max_tokens < 0) {
        return error.set(ErrorKind::IO, "max_tokens can't be negative");
    }
    settings.refine.max_tokens = static_cast<std::size_t>(program_options.max_tokens);
    settings.refine.tag_unpaired_lines = program_options.tag_unpaired_lines;
    settings.refine.use_changed_kind = program_options.use_changed_kind;
    return true;
}
