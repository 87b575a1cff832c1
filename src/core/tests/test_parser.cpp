/**
 * @file test_parser.cpp
 * @brief End-to-end application parsing tests
 */

#include <gtest/gtest.h>
#include "parser/Parser.hpp"
#include "syntax/Lexer.hpp"
#include "syntax/TokenPrinter.hpp"
#include "logging/Logger.hpp"
#include <filesystem>
#include <string>
#include <vector>

using namespace rtos_config::parser;
using namespace rtos_config::syntax;

namespace {

const char* const kMinimalApp =
    "{ device: stm32, idle: { path: idle_fn }, init: { path: init_fn } }";

const char* const kFullApp = R"({
    device: stm32f103xx,

    resources: {
        R: u8 = 0;
        BUFFER: [u8; 16] = [0; 16];
    },

    init: {
        path: app::init,
    },

    idle: {
        path: app::idle,
        locals: {
            COUNTER: u32 = 0;
        },
        resources: [R],
    },

    tasks: {
        exti0: {
            enabled: true,
            priority: 1,
            resources: [R, BUFFER],
        },
        sys_tick: {
            priority: 2,
        },
    },
})";

} // namespace

class ParserTest : public ::testing::Test {
protected:
    std::optional<App> parseSource(const std::string& source) {
        auto parser = Parser::fromSource(source);
        auto app = parser.parse();
        m_errors = parser.getErrors();
        return app;
    }

    std::vector<std::string> m_errors;
};

// ============================================================================
// Successful parses
// ============================================================================

TEST_F(ParserTest, MinimalApplication) {
    auto app = parseSource(kMinimalApp);
    ASSERT_TRUE(app.has_value());
    EXPECT_TRUE(m_errors.empty());

    EXPECT_EQ(toString(app->device), "stm32");
    EXPECT_EQ(toString(app->idle.path), "idle_fn");
    EXPECT_EQ(toString(app->init.path), "init_fn");
    EXPECT_TRUE(app->resources.empty());
    EXPECT_TRUE(app->tasks.empty());
    EXPECT_TRUE(app->idle.locals.empty());
    EXPECT_TRUE(app->idle.resources.empty());
}

TEST_F(ParserTest, EndToEndScenario) {
    auto app = parseSource(
        "{ device: stm32, idle: { path: idle_fn }, init: { path: init_fn }, "
        "resources: { R: u8 = 0; }, tasks: { t1: { priority: 1, resources: [R] } } }");
    ASSERT_TRUE(app.has_value());

    ASSERT_EQ(app->resources.size(), 1u);
    EXPECT_EQ(toString(app->resources.at("R").ty), "u8");
    EXPECT_EQ(toString(app->resources.at("R").expr), "0");

    ASSERT_EQ(app->tasks.size(), 1u);
    const Task& t1 = app->tasks.at("t1");
    EXPECT_FALSE(t1.enabled.has_value());
    ASSERT_TRUE(t1.priority.has_value());
    EXPECT_EQ(*t1.priority, 1);
    EXPECT_EQ(t1.resources, (Idents{"R"}));
}

TEST_F(ParserTest, FullApplication) {
    auto app = parseSource(kFullApp);
    ASSERT_TRUE(app.has_value()) << (m_errors.empty() ? "" : m_errors.back());

    EXPECT_EQ(toString(app->device), "stm32f103xx");
    EXPECT_EQ(toString(app->init.path), "app :: init");
    EXPECT_EQ(toString(app->idle.path), "app :: idle");
    EXPECT_EQ(app->idle.locals.size(), 1u);
    EXPECT_EQ(app->idle.resources, (Idents{"R"}));

    ASSERT_EQ(app->resources.size(), 2u);
    EXPECT_EQ(toString(app->resources.at("BUFFER").ty), "[u8 ; 16]");
    EXPECT_EQ(toString(app->resources.at("BUFFER").expr), "[0 ; 16]");

    ASSERT_EQ(app->tasks.size(), 2u);
    EXPECT_EQ(*app->tasks.at("exti0").enabled, true);
    EXPECT_EQ(app->tasks.at("exti0").resources, (Idents{"R", "BUFFER"}));
    EXPECT_EQ(*app->tasks.at("sys_tick").priority, 2);
    EXPECT_FALSE(app->tasks.at("sys_tick").enabled.has_value());
}

TEST_F(ParserTest, FieldOrderDoesNotMatter) {
    auto app = parseSource("{ init: { path: i }, tasks: {}, idle: { path: d }, device: x }");
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(toString(app->device), "x");
}

TEST_F(ParserTest, ParsesPreTokenizedInput) {
    Lexer lexer(kMinimalApp);
    Parser parser(lexer.tokenize());

    auto app = parser.parse();
    ASSERT_TRUE(app.has_value());
    EXPECT_FALSE(parser.hasErrors());
}

TEST_F(ParserTest, FragmentsRoundTrip) {
    auto app = parseSource(
        "{ device: ::hal::stm32<F1>, idle: { path: a::b }, init: { path: c }, "
        "resources: { X: Option<&'static mut [u8; 4]> = None; Y: Foo<Bar> = Foo::new(1, 2); } }");
    ASSERT_TRUE(app.has_value());

    auto reparse = [](const Fragment& fragment) {
        Lexer lexer(toString(fragment));
        return lexer.tokenize();
    };

    EXPECT_EQ(reparse(app->device), app->device);
    EXPECT_EQ(reparse(app->idle.path), app->idle.path);
    EXPECT_EQ(reparse(app->init.path), app->init.path);
    for (const auto& entry : app->resources) {
        EXPECT_EQ(reparse(entry.second.ty), entry.second.ty) << entry.first;
        EXPECT_EQ(reparse(entry.second.expr), entry.second.expr) << entry.first;
    }
}

// ============================================================================
// Validation errors
// ============================================================================

TEST_F(ParserTest, MissingMandatoryFields) {
    EXPECT_FALSE(parseSource("{ idle: { path: d }, init: { path: i } }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{"`device` field is missing"}));

    EXPECT_FALSE(parseSource("{ device: x, init: { path: i } }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{"`idle` field is missing"}));

    EXPECT_FALSE(parseSource("{ device: x, idle: { path: d } }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{"`init` field is missing"}));
}

TEST_F(ParserTest, DuplicatedTopLevelFields) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"device: y, ", "device"},
        {"idle: { path: e }, ", "idle"},
        {"init: { path: j }, ", "init"},
        {"resources: {}, resources: {}, ", "resources"},
        {"tasks: {}, tasks: {}, ", "tasks"},
    };

    for (const auto& [extra, field] : cases) {
        // Duplicate placed both before and after the first occurrence
        for (bool before : {true, false}) {
            std::string body = "device: x, idle: { path: d }, init: { path: i }";
            std::string source = before ? "{ " + extra + body + " }"
                                        : "{ " + body + ", " + extra + " }";

            EXPECT_FALSE(parseSource(source).has_value()) << source;
            EXPECT_EQ(m_errors, (std::vector<std::string>{"duplicated `" + field + "` field"}))
                << source;
        }
    }
}

TEST_F(ParserTest, UnknownTopLevelField) {
    EXPECT_FALSE(parseSource("{ device: x, peripherals: {} }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{"unknown field: `peripherals`"}));
}

TEST_F(ParserTest, ContextChainOutermostFirst) {
    EXPECT_FALSE(parseSource(
        "{ device: x, idle: { path: d }, init: { path: i }, "
        "tasks: { t1: { priority: 256 } } }").has_value());

    EXPECT_EQ(m_errors, (std::vector<std::string>{
        "parsing `tasks`",
        "parsing task `t1`",
        "parsing `priority`",
        "256 is out of the `u8` range",
    }));
}

TEST_F(ParserTest, ChainThroughResources) {
    EXPECT_FALSE(parseSource(
        "{ device: x, resources: { A: u8 = 0; A: u8 = 1; } }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{
        "parsing `resources`",
        "resource `A` listed more than once",
    }));
}

TEST_F(ParserTest, ChainThroughIdle) {
    EXPECT_FALSE(parseSource("{ device: x, idle: { path: d, resources: [a, b, a] } }").has_value());
    EXPECT_EQ(m_errors, (std::vector<std::string>{
        "parsing `idle`",
        "parsing `resources`",
        "ident `a` listed more than once",
    }));
}

TEST_F(ParserTest, PrioritySignAndRange) {
    const std::string prefix = "{ device: x, idle: { path: d }, init: { path: i }, tasks: { t: { priority: ";

    EXPECT_TRUE(parseSource(prefix + "255 } } }").has_value());
    EXPECT_FALSE(parseSource(prefix + "256 } } }").has_value());
    EXPECT_EQ(m_errors.back(), "256 is out of the `u8` range");
    EXPECT_FALSE(parseSource(prefix + "-1 } } }").has_value());
    EXPECT_NE(m_errors.back().find("expected integer"), std::string::npos);
}

// ============================================================================
// Structural errors
// ============================================================================

TEST_F(ParserTest, OuterGroupMustBeBraces) {
    EXPECT_FALSE(parseSource("[ device: x ]").has_value());
    ASSERT_EQ(m_errors.size(), 1u);
    EXPECT_NE(m_errors[0].find("expected Brace, found Bracket"), std::string::npos);

    EXPECT_FALSE(parseSource("device: x").has_value());
    EXPECT_NE(m_errors[0].find("expected a Brace group"), std::string::npos);

    EXPECT_FALSE(parseSource("").has_value());
    EXPECT_EQ(m_errors[0], "expected a Brace group, found end of input");
}

TEST_F(ParserTest, TokensAfterBlock) {
    EXPECT_FALSE(parseSource(std::string(kMinimalApp) + " extra").has_value());
    ASSERT_EQ(m_errors.size(), 1u);
    EXPECT_NE(m_errors[0].find("unexpected token after application block: `extra`"),
              std::string::npos);
}

TEST_F(ParserTest, TokenizerErrors) {
    EXPECT_FALSE(parseSource("{ device: x, idle: { path: d ) }").has_value());
    ASSERT_GE(m_errors.size(), 2u);
    EXPECT_EQ(m_errors[0], "tokenizing application block");
    EXPECT_NE(m_errors[1].find("Mismatched closing delimiter ')'"), std::string::npos);
}

TEST_F(ParserTest, NestingDepthFromOptions) {
    LexerOptions options;
    options.max_nesting_depth = 1;

    auto parser = Parser::fromSource(kMinimalApp, options);
    EXPECT_FALSE(parser.parse().has_value());
    ASSERT_GE(parser.getErrors().size(), 2u);
    EXPECT_NE(parser.getErrors()[1].find("Nesting depth exceeds limit of 1"), std::string::npos);
}

TEST_F(ParserTest, ParseIsRepeatable) {
    auto parser = Parser::fromSource("{ device: x }");

    EXPECT_FALSE(parser.parse().has_value());
    std::vector<std::string> first = parser.getErrors();
    EXPECT_FALSE(parser.parse().has_value());
    EXPECT_EQ(parser.getErrors(), first);

    auto good = Parser::fromSource(kMinimalApp);
    EXPECT_TRUE(good.parse().has_value());
    EXPECT_TRUE(good.parse().has_value());
    EXPECT_FALSE(good.hasErrors());
}

TEST_F(ParserTest, DeeplyNestedInputIsRejected) {
    EXPECT_FALSE(parseSource(std::string(2000000, '(')).has_value());
    ASSERT_EQ(m_errors.size(), 2u);
    EXPECT_EQ(m_errors[0], "tokenizing application block");
    EXPECT_EQ(m_errors[1], "Line 1: Nesting depth exceeds limit of 64");
}

TEST_F(ParserTest, UndecodedLiteralIsAParseError) {
    Lexer lexer("{ device: x, idle: { path: d }, init: { path: i }, "
                "tasks: { t: { priority: 1, enabled: true } } }");
    TokenStream tokens = lexer.tokenize();

    // tasks -> t -> `priority: 1, enabled: true`
    TokenStream& fields = tokens[0].children.back().children.back().children;
    ASSERT_EQ(fields[2].lexeme, "1");
    fields[2].literal = std::monostate{};

    Parser parser(tokens);
    std::optional<App> app;
    EXPECT_NO_THROW(app = parser.parse());
    EXPECT_FALSE(app.has_value());
    ASSERT_EQ(parser.getErrors().size(), 4u);
    EXPECT_EQ(parser.getErrors()[2], "parsing `priority`");
    EXPECT_EQ(parser.getErrors()[3], "expected integer, found `1` (Integer) at 1:76");
}

// ============================================================================
// Side effects
// ============================================================================

TEST(ParserSideEffects, ParsingLeavesLoggerAndFilesystemAlone) {
    namespace fs = std::filesystem;

    fs::path dir = fs::temp_directory_path() / "rtos_config_parser_cwd";
    fs::create_directories(dir);
    fs::path previous = fs::current_path();
    fs::current_path(dir);

    bool loggerWasInitialized = rtos_config::Logger::isInitialized();
    auto app = Parser::fromSource(kMinimalApp).parse();
    auto failed = Parser::fromSource("{ device: x }").parse();

    EXPECT_TRUE(app.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(rtos_config::Logger::isInitialized(), loggerWasInitialized);
    EXPECT_FALSE(fs::exists(dir / "logs"));

    fs::current_path(previous);
    std::error_code ec;
    fs::remove_all(dir, ec);
}
