#include "config_serializer.hpp"

#include <fmt/format.h>

using namespace patchy;

namespace {

std::string
quoted(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\'':
                out += "\\'";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
        }
    }
    return out + "'";
}

void
serialize_comments(const std::vector<std::string>& comments, const std::string& indent, std::string& output) {
    for (const auto& comment : comments) {
        output += indent + comment + "\n";
    }
}

void
serialize_key(const std::string& key, const Value& value, const std::string& indent, std::string& output) {
    serialize_comments(value.key_comments, indent, output);
    output += fmt::format("{}{} = {}", indent, key, cfg_serialize_obj(value));
    for (const auto& comment : value.value_comments) {
        output += "  " + comment;
    }
    output += "\n";
}

}  // namespace

std::string
patchy::cfg_serialize_obj(const Value& value) {
    if (value.is_int()) {
        return fmt::format("{}", std::get<Value::Int>(value.v));
    } else if (value.is_bool()) {
        return std::get<Value::Bool>(value.v) ? "true" : "false";
    } else if (value.is_string()) {
        return quoted(std::get<Value::String>(value.v));
    }
    return "";
}

std::string
patchy::cfg_serialize(const Value& root) {
    std::string output;
    if (!root.is_table()) {
        return output;
    }

    const auto& table = root.as_table();
    table.for_each([&](const std::string& key, const Value& value) {
        if (!value.is_table()) {
            serialize_key(key, value, "", output);
        }
    });

    table.for_each([&](const std::string& key, const Value& section) {
        if (!section.is_table()) {
            return;
        }
        if (!output.empty()) {
            output += "\n";
        }
        serialize_comments(section.key_comments, "", output);
        output += "[" + key + "]";
        for (const auto& comment : section.value_comments) {
            output += "  " + comment;
        }
        output += "\n";
        section.as_table().for_each([&](const std::string& k, const Value& v) {
            // Nested tables have no syntax of their own
            if (!v.is_table()) {
                serialize_key(k, v, "    ", output);
            }
        });
    });

    serialize_comments(root.value_comments, "", output);
    return output;
}
