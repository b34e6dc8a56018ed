#include <gem/compiler/compiler.h>
#include <gem/core/source_provider.h>
#include <gem/markup/parser.h>
#include <gtest/gtest.h>
#include <string>
#include <variant>

using namespace gem;
using namespace gem::compiler;
using core::ErrorKind;

class CompilerTest : public ::testing::Test {
protected:
    CompileResult compile(const std::string& text) {
        auto parsed = markup::parse_markup("doc.gxml", text);
        EXPECT_TRUE(parsed.ok()) << (parsed.error ? parsed.error->format() : "");
        Compiler compiler(sources);
        return compiler.compile(parsed.document);
    }

    CompileResult compile_ok(const std::string& text) {
        auto result = compile(text);
        EXPECT_TRUE(result.ok()) << (result.error ? result.error->format() : "");
        return result;
    }

    core::MemorySourceProvider sources;
};

// =============================================================================
// Window
// =============================================================================

TEST_F(CompilerTest, WindowDefaults) {
    auto result = compile_ok("<window></window>");
    ASSERT_TRUE(result.window.has_value());
    EXPECT_EQ(result.window->x, 45);
    EXPECT_EQ(result.window->y, 35);
    EXPECT_EQ(result.window->width, 30);
    EXPECT_EQ(result.window->height, 20);
    EXPECT_EQ(result.window->title, "Title");
    EXPECT_TRUE(result.window->contents.empty());
}

TEST_F(CompilerTest, WindowAttributes) {
    auto result = compile_ok(
        "<window x=\"1\" y=\"2\" width=\"80\" height=\"24\" title=\"Shell\"></window>");
    ASSERT_TRUE(result.window.has_value());
    EXPECT_EQ(result.window->x, 1);
    EXPECT_EQ(result.window->y, 2);
    EXPECT_EQ(result.window->width, 80);
    EXPECT_EQ(result.window->height, 24);
    EXPECT_EQ(result.window->title, "Shell");
}

TEST_F(CompilerTest, EmptyDocumentHasNoWindow) {
    auto result = compile("");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::WindowError);
    EXPECT_FALSE(result.window.has_value());
}

TEST_F(CompilerTest, TwoTopLevelWindows) {
    auto result = compile("<window></window><window></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::WindowError);
    EXPECT_EQ(result.error->message(), "A GemXML file can only support one window at a time.");
}

TEST_F(CompilerTest, RootMustBeWindow) {
    auto result = compile("<div></div>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::WindowError);
    EXPECT_EQ(result.error->message(), "Expected <window> tag at the start of the file.");
}

TEST_F(CompilerTest, NestedWindow) {
    auto result = compile("<window><div><window></window></div></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::WindowError);
    EXPECT_EQ(result.error->message(), "There can only be one.");
    EXPECT_FALSE(result.window.has_value());
}

TEST_F(CompilerTest, ValidateWithoutCompiling) {
    Compiler compiler(sources);
    auto ok = markup::parse_markup("doc.gxml", "<window></window>");
    auto bad = markup::parse_markup("doc.gxml", "hello");
    EXPECT_FALSE(compiler.validate(ok.document).has_value());
    auto error = compiler.validate(bad.document);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::WindowError);
}

// =============================================================================
// Shapes
// =============================================================================

TEST_F(CompilerTest, RectDefaultsCentreInWindow) {
    auto result = compile_ok("<window><rect></rect></window>");
    ASSERT_EQ(result.window->contents.size(), 1u);
    const auto* rect = std::get_if<scene::Rect>(&result.window->contents[0].content);
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(rect->x, 10);
    EXPECT_EQ(rect->y, 7);
    EXPECT_EQ(rect->width, 10);
    EXPECT_EQ(rect->height, 6);
}

TEST_F(CompilerTest, RectDefaultsFollowWindowSize) {
    auto result = compile_ok("<window width=\"41\" height=\"11\"><rect></rect></window>");
    const auto* rect = std::get_if<scene::Rect>(&result.window->contents[0].content);
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(rect->x, 15);
    EXPECT_EQ(rect->y, 2);
}

TEST_F(CompilerTest, RectExplicitAttributes) {
    auto result = compile_ok(
        "<window><rect x=\"1\" y=\"2\" width=\"3\" height=\"4\"></rect></window>");
    const auto* rect = std::get_if<scene::Rect>(&result.window->contents[0].content);
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(rect->x, 1);
    EXPECT_EQ(rect->y, 2);
    EXPECT_EQ(rect->width, 3);
    EXPECT_EQ(rect->height, 4);
}

TEST_F(CompilerTest, CircleDefaults) {
    auto result = compile_ok("<window><circle></circle></window>");
    const auto* circle = std::get_if<scene::Circle>(&result.window->contents[0].content);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->x, 15);
    EXPECT_EQ(circle->y, 10);
    EXPECT_EQ(circle->radius, 4);
}

TEST_F(CompilerTest, CentreRoundsDownForOddAndNegativeSizes) {
    auto result = compile_ok(
        "<window width=\"31\" height=\"-7\"><rect></rect><circle></circle></window>");
    const auto* rect = std::get_if<scene::Rect>(&result.window->contents[0].content);
    const auto* circle = std::get_if<scene::Circle>(&result.window->contents[1].content);
    ASSERT_NE(rect, nullptr);
    ASSERT_NE(circle, nullptr);

    // 1. 31 / 2 rounds down to 15.
    EXPECT_EQ(rect->x, 10);
    EXPECT_EQ(circle->x, 15);

    // 2. -7 / 2 rounds down to -4, not toward zero.
    EXPECT_EQ(rect->y, -7);
    EXPECT_EQ(circle->y, -4);
}

TEST_F(CompilerTest, CentreOfMostNegativeWidth) {
    auto result = compile_ok(
        "<window width=\"-2147483648\" height=\"-1\"><rect></rect><circle></circle></window>");
    const auto* rect = std::get_if<scene::Rect>(&result.window->contents[0].content);
    const auto* circle = std::get_if<scene::Circle>(&result.window->contents[1].content);
    ASSERT_NE(rect, nullptr);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(rect->x, -1073741829);
    EXPECT_EQ(circle->x, -1073741824);
    EXPECT_EQ(rect->y, -4);
    EXPECT_EQ(circle->y, -1);
}

TEST_F(CompilerTest, LineNeedsAllCoordinates) {
    auto result = compile("<window><line startx=\"0\" starty=\"0\" endx=\"5\"></line></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::MissingAttribute);
    EXPECT_EQ(result.error->message(), "Missing attribute: 'endy'");
}

TEST_F(CompilerTest, Line) {
    auto result = compile_ok(
        "<window><line startx=\"1\" starty=\"2\" endx=\"3\" endy=\"-4\"></line></window>");
    const auto* line = std::get_if<scene::Line>(&result.window->contents[0].content);
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->start_x, 1);
    EXPECT_EQ(line->start_y, 2);
    EXPECT_EQ(line->end_x, 3);
    EXPECT_EQ(line->end_y, -4);
}

TEST_F(CompilerTest, NonIntegerAttribute) {
    auto result = compile("<window><rect x=\"abc\"></rect></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::AttributeError);
    EXPECT_NE(result.error->message().find("'x'"), std::string::npos);
}

// =============================================================================
// Text and grouping
// =============================================================================

TEST_F(CompilerTest, TextTag) {
    auto result = compile_ok("<window><text>Hello</text></window>");
    const auto* text = std::get_if<scene::Text>(&result.window->contents[0].content);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "Hello");
}

TEST_F(CompilerTest, BareTextBecomesTextNode) {
    auto result = compile_ok("<window>loose words</window>");
    ASSERT_EQ(result.window->contents.size(), 1u);
    EXPECT_STREQ(scene::kind_name(result.window->contents[0]), "text");
}

TEST_F(CompilerTest, TextTagRejectsNestedTags) {
    auto result = compile("<window><text><b>x</b></text></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::InvalidSyntax);
}

TEST_F(CompilerTest, NestingIsPreserved) {
    auto result = compile_ok(
        "<window><div><text>a</text><div><rect></rect></div></div><circle></circle></window>");
    const auto& contents = result.window->contents;
    ASSERT_EQ(contents.size(), 2u);

    const auto* outer = std::get_if<scene::Div>(&contents[0].content);
    ASSERT_NE(outer, nullptr);
    ASSERT_EQ(outer->contents.size(), 2u);
    EXPECT_STREQ(scene::kind_name(outer->contents[0]), "text");

    const auto* inner = std::get_if<scene::Div>(&outer->contents[1].content);
    ASSERT_NE(inner, nullptr);
    ASSERT_EQ(inner->contents.size(), 1u);
    EXPECT_STREQ(scene::kind_name(inner->contents[0]), "rect");

    EXPECT_STREQ(scene::kind_name(contents[1]), "circle");
    EXPECT_EQ(scene::count_nodes(*result.window), 5u);
}

TEST_F(CompilerTest, ChildrenNumberedBeforeTheirGroup) {
    auto result = compile_ok("<window><div><text>a</text></div></window>");
    const auto& div = result.window->contents[0];
    const auto* group = scene::children(div);
    ASSERT_NE(group, nullptr);
    ASSERT_EQ(group->size(), 1u);
    EXPECT_EQ((*group)[0].id, 0u);
    EXPECT_EQ(div.id, 1u);
}

TEST_F(CompilerTest, ShorthandBecomesHeaderAndStyledContent) {
    auto result = compile_ok("<window># Title\n**bold**\n</window>");
    const auto& contents = result.window->contents;
    ASSERT_EQ(contents.size(), 2u);

    const auto* header = std::get_if<scene::Header>(&contents[0].content);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->level, 1);
    ASSERT_EQ(header->contents.size(), 1u);
    EXPECT_EQ(std::get<scene::Text>(header->contents[0].content).text, "Title");

    const auto* styled = std::get_if<scene::StyledContent>(&contents[1].content);
    ASSERT_NE(styled, nullptr);
    EXPECT_EQ(styled->style, scene::TextStyle::Bold);
    EXPECT_STREQ(scene::text_style_tag(styled->style), "b");
    EXPECT_STREQ(scene::kind_name(contents[1]), "styledcontent");
}

TEST_F(CompilerTest, UnderlineTag) {
    auto result = compile_ok("<window><u>under</u></window>");
    const auto* styled = std::get_if<scene::StyledContent>(&result.window->contents[0].content);
    ASSERT_NE(styled, nullptr);
    EXPECT_EQ(styled->style, scene::TextStyle::Underline);
}

TEST_F(CompilerTest, UnknownTagInHandBuiltTree) {
    markup::TagNode span;
    span.tag_name = "span";
    markup::TagNode window;
    window.tag_name = "window";
    window.content.body.push_back(markup::Node{std::move(span)});
    markup::NodeList document;
    document.body.push_back(markup::Node{std::move(window)});

    Compiler compiler(sources);
    auto result = compiler.compile(document);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::UnknownTag);
}

// =============================================================================
// Registries
// =============================================================================

TEST_F(CompilerTest, IdsAreRegistered) {
    auto result = compile_ok("<window><rect id=\"main\"></rect></window>");
    auto id = result.ids.find("main");
    ASSERT_TRUE(id.has_value());
    const auto* node = scene::find_node(*result.window, *id);
    ASSERT_NE(node, nullptr);
    EXPECT_STREQ(scene::kind_name(*node), "rect");
    EXPECT_EQ(result.ids.id_of(*id).value_or(""), "main");
}

TEST_F(CompilerTest, IdCollision) {
    auto result = compile("<window><rect id=\"a\"></rect><circle id=\"a\"></circle></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::IdCollision);
    EXPECT_EQ(result.error->message(), "ID 'a' is already used by another node.");
    EXPECT_FALSE(result.window.has_value());
}

TEST_F(CompilerTest, SharedClassListsEveryNode) {
    auto result = compile_ok(
        "<window><rect class=\"box\"></rect><div class=\"box\"></div>"
        "<circle class=\"other\"></circle></window>");
    const auto& members = result.classes.nodes("box");
    ASSERT_EQ(members.size(), 2u);
    EXPECT_STREQ(scene::kind_name(*scene::find_node(*result.window, members[0])), "rect");
    EXPECT_STREQ(scene::kind_name(*scene::find_node(*result.window, members[1])), "div");
    EXPECT_TRUE(result.classes.contains("other"));
    EXPECT_TRUE(result.classes.nodes("missing").empty());
    ASSERT_EQ(result.classes.names().size(), 2u);
    EXPECT_EQ(result.classes.names()[0], "box");
}

TEST_F(CompilerTest, ClassValueIsOneName) {
    auto result = compile_ok("<window><rect class=\"a b\"></rect></window>");
    EXPECT_TRUE(result.classes.contains("a b"));
    EXPECT_FALSE(result.classes.contains("a"));
}

TEST_F(CompilerTest, RegistriesResetBetweenCompiles) {
    auto parsed = markup::parse_markup("doc.gxml", "<window><rect id=\"a\"></rect></window>");
    ASSERT_TRUE(parsed.ok());
    Compiler compiler(sources);
    auto first = compiler.compile(parsed.document);
    auto second = compiler.compile(parsed.document);
    EXPECT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.ids.size(), 1u);
    EXPECT_EQ(second.ids.find("a").value_or(99), first.ids.find("a").value_or(98));
}

// =============================================================================
// Includes
// =============================================================================

TEST_F(CompilerTest, StyleIncludeIsRecorded) {
    sources.add("theme.gms", "rect { color: red; }");
    auto result = compile_ok("<window><include as=\"style\">theme.gms</include></window>");
    ASSERT_EQ(result.includes.size(), 1u);
    EXPECT_EQ(result.includes[0].kind, IncludeKind::Style);
    EXPECT_EQ(result.includes[0].path, "theme.gms");
    ASSERT_EQ(result.style_includes().size(), 1u);
    EXPECT_EQ(result.style_includes()[0], "theme.gms");
    EXPECT_TRUE(result.window->contents.empty());
}

TEST_F(CompilerTest, QuotedIncludePath) {
    sources.add("theme.gms", "");
    auto result = compile_ok("<window><include as=\"style\">\"theme.gms\"</include></window>");
    ASSERT_EQ(result.includes.size(), 1u);
    EXPECT_EQ(result.includes[0].path, "theme.gms");
}

TEST_F(CompilerTest, StyleIncludeWrongExtension) {
    sources.add("theme.css", "");
    auto result = compile("<window><include as=\"style\">theme.css</include></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::FileError);
    EXPECT_NE(result.error->message().find(".gms"), std::string::npos);
}

TEST_F(CompilerTest, StyleIncludeMissingFile) {
    auto result = compile("<window><include as=\"style\">theme.gms</include></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::FileError);
    EXPECT_EQ(result.error->message(), "Cannot find file 'theme.gms'.");
}

TEST_F(CompilerTest, MarkdownIncludeChecksExtensionOnly) {
    auto result = compile_ok("<window><include as=\"md\">notes.md</include></window>");
    ASSERT_EQ(result.includes.size(), 1u);
    EXPECT_EQ(result.includes[0].kind, IncludeKind::Markdown);
    EXPECT_TRUE(result.style_includes().empty());

    auto bad = compile("<window><include as=\"md\">notes.txt</include></window>");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error->kind(), ErrorKind::FileError);
}

TEST_F(CompilerTest, IncludeNeedsAs) {
    auto result = compile("<window><include>theme.gms</include></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::MissingAttribute);
}

TEST_F(CompilerTest, IncludeUnknownAs) {
    auto result = compile("<window><include as=\"script\">a.js</include></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::AttributeError);
}

TEST_F(CompilerTest, IncludeEmptyPath) {
    auto result = compile("<window><include as=\"style\"></include></window>");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::MissingAttribute);
    EXPECT_EQ(result.error->message(), "File path cannot be empty.");
}
