#include "config_parser.hpp"
#include "config_serializer.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

TEST_CASE("config_tokenizer") {
    using namespace patchy::config_tokenizer;

    SUBCASE("values") {
        std::string text = "[general]\n  strip = -1 # count\n  name = 'a \\'b\\''\n  old = true\n";
        TokenizeResult result;
        REQUIRE(config_tokenizer::tokenize(text, result));
        REQUIRE(result.tokens.size() == 14);
        REQUIRE(result.tokens[0].is(TokenId_OpenBracket | TokenId_FirstOnLine));
        REQUIRE(result.tokens[1].is(TokenId_Identifier));
        REQUIRE(result.tokens[3].is(TokenId_Identifier));
        REQUIRE(result.tokens[3].is(TokenId_FirstOnLine));
        REQUIRE(result.tokens[5].is(TokenId_Integer));
        REQUIRE(result.tokens[5].int_arg == -1);
        REQUIRE(result.tokens[6].is(TokenId_Comment));
        REQUIRE(!result.tokens[6].is(TokenId_FirstOnLine));
        REQUIRE(result.tokens[6].str_from(text) == "# count");
        REQUIRE(result.tokens[9].is(TokenId_String));
        REQUIRE(result.tokens[9].string_arg == "a 'b'");
        REQUIRE(result.tokens[12].is(TokenId_Boolean));
        REQUIRE(result.tokens[12].boolean_arg);
        REQUIRE(result.tokens[13].is(TokenId_Terminator));
        REQUIRE(result.tokens[9].line == 3);
        REQUIRE(result.tokens[9].column == 10);
    }

    SUBCASE("unterminated_string") {
        TokenizeResult result;
        REQUIRE(!config_tokenizer::tokenize("key = 'abc\n", result));
        REQUIRE(result.error == "Unterminated string at line 1 column 7");
    }

    SUBCASE("unexpected_character") {
        TokenizeResult result;
        REQUIRE(!config_tokenizer::tokenize("key = @", result));
        REQUIRE(result.error == "Unexpected character '@' at line 1 column 7");
    }

    SUBCASE("repr") {
        REQUIRE(config_tokenizer::repr(TokenId_Integer) == "Integer");
        REQUIRE(config_tokenizer::repr(TokenId_Comment | TokenId_FirstOnLine) == "Comment|FirstOnLine");
    }
}

TEST_CASE("config_parser") {
    SUBCASE("instructions") {
        std::string cfg_text = R"foo(
            # leading
            [general]
                strip = 1
                fixup_policy = 'on-edit'  # or before-save
        )foo";

        std::vector<TbInstruction> instructions;
        ParseResult result;
        REQUIRE(cfg_parse_collect(cfg_text, result, instructions));
        REQUIRE(result.is_ok());

        // clang-format off
        REQUIRE(instructions.size() == 9);
        REQUIRE(instructions[0] == TbInstruction::Comment("# leading", true));
        REQUIRE(instructions[1] == TbInstruction::Key("general"));
        REQUIRE(instructions[2] == TbInstruction::TableStart());
        REQUIRE(instructions[3] ==   TbInstruction::Key("strip"));
        REQUIRE(instructions[4] ==   TbInstruction::Value(std::int64_t{1}));
        REQUIRE(instructions[5] ==   TbInstruction::Key("fixup_policy"));
        REQUIRE(instructions[6] ==   TbInstruction::Value("on-edit"));
        REQUIRE(instructions[7] == TbInstruction::Comment("# or before-save", false));
        REQUIRE(instructions[8] == TbInstruction::TableEnd());
        // clang-format on
        REQUIRE(!instructions[7].first_on_line);
    }

    SUBCASE("bare_section") {
        std::vector<TbInstruction> instructions;
        ParseResult result;
        REQUIRE(cfg_parse_collect("[section]", result, instructions));
        REQUIRE(instructions.size() == 3);
        REQUIRE(instructions[2] == TbInstruction::TableEnd());
    }

    SUBCASE("value_tree") {
        std::string cfg_text = R"foo(
            top = 3
            [general]
                strip = 2
                valid_unified_empty_line = false
            [refine]
                granularity = "char"
        )foo";

        Value root;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        REQUIRE(root.is_table());
        REQUIRE(root.as_table().keys() == std::vector<std::string>{"top", "general", "refine"});
        REQUIRE(root["top"].as_int() == 3);

        auto strip = root.lookup_value_by_path("general.strip");
        REQUIRE(strip);
        REQUIRE(strip->get().as_int() == 2);
        REQUIRE(root.lookup_value_by_path("general.valid_unified_empty_line")->get().is_bool());
        REQUIRE(root.lookup_value_by_path("refine.granularity")->get().as_string() == "char");
        REQUIRE(!root.lookup_value_by_path("refine.max_tokens"));
        REQUIRE(!root.lookup_value_by_path("general.strip.deeper"));
    }

    SUBCASE("set_value_at") {
        Value root{Value::Table{}};
        REQUIRE(root.set_value_at("general.strip", Value{Value::Int{1}}));
        REQUIRE(root.set_value_at("general.fixup_policy", Value{Value::String{"on-edit"}}));
        REQUIRE(root.lookup_value_by_path("general.strip")->get().as_int() == 1);
        REQUIRE(root["general"].as_table().keys() == std::vector<std::string>{"strip", "fixup_policy"});

        REQUIRE(root.set_value_at("general.strip", Value{Value::Int{3}}));
        REQUIRE(root.lookup_value_by_path("general.strip")->get().as_int() == 3);

        // Not a table on the way
        REQUIRE(!root.set_value_at("general.strip.x", Value{Value::Bool{true}}));
    }

    SUBCASE("errors") {
        Value root;
        ParseResult result;
        REQUIRE(!cfg_parse_value_tree("[general\nstrip = 1\n", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.error == "Expected CloseBracket, found Identifier|FirstOnLine at line 2 column 1");

        REQUIRE(!cfg_parse_value_tree("[general]\nstrip 1\n", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);

        REQUIRE(!cfg_parse_value_tree("[general]\nstrip = other\n", result, root));
        REQUIRE(result.error == "Expected Boolean|Integer|String, found Identifier at line 2 column 9");

        REQUIRE(!cfg_parse_value_tree("strip = 'x", result, root));
        REQUIRE(result.kind == ParseErrorKind::Tokenization);
    }

    SUBCASE("missing_file") {
        Value root;
        ParseResult result;
        REQUIRE(!cfg_load_file("/nonexistent/patchy.conf", result, root));
        REQUIRE(result.kind == ParseErrorKind::File);
    }
}

TEST_CASE("config_serializer") {
    SUBCASE("sections_and_comments") {
        std::string cfg_text =
            "# Header\n"
            "[general]\n"
            "    # Strip count\n"
            "    strip = -1\n"
            "    fixup_policy = 'on-edit'  # or before-save\n"
            "\n"
            "[refine]\n"
            "    tag_unpaired_lines = false\n";

        Value root;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        REQUIRE(cfg_serialize(root) == cfg_text);
    }

    SUBCASE("quoting") {
        REQUIRE(cfg_serialize_obj(Value{Value::String{"it's"}}) == "'it\\'s'");
        REQUIRE(cfg_serialize_obj(Value{Value::Bool{true}}) == "true");
        REQUIRE(cfg_serialize_obj(Value{Value::Int{8192}}) == "8192");
    }

    SUBCASE("reload") {
        Value root{Value::Table{}};
        root.set_value_at("general.log_level", Value{Value::String{"warning"}});
        root.set_value_at("refine.max_tokens", Value{Value::Int{20000}});

        Value reloaded;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree(cfg_serialize(root), result, reloaded));
        REQUIRE(reloaded.lookup_value_by_path("general.log_level")->get().as_string() == "warning");
        REQUIRE(reloaded.lookup_value_by_path("refine.max_tokens")->get().as_int() == 20000);
    }
}
