#include <gem/engine/pipeline.h>
#include <gem/markup/parser.h>
#include <gem/markup/tokenizer.h>
#include <gem/style/cascade.h>

namespace gem::engine {

const char* stage_module(Stage stage) {
    switch (stage) {
        case Stage::Lex:
        case Stage::Parse:      return "markup";
        case Stage::Validate:
        case Stage::Compile:    return "compiler";
        case Stage::ReadSheet:
        case Stage::ParseSheet: return "sheet";
        case Stage::Cascade:    return "style";
    }
    return "engine";
}

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Lex:        return "lex";
        case Stage::Parse:      return "parse";
        case Stage::Validate:   return "validate";
        case Stage::Compile:    return "compile";
        case Stage::ReadSheet:  return "read";
        case Stage::ParseSheet: return "parse";
        case Stage::Cascade:    return "cascade";
    }
    return "unknown";
}

Pipeline::Pipeline(const core::SourceProvider& sources) : sources_(sources) {}

void Pipeline::report(Stage stage, const std::string& message) {
    diagnostics_.emit(core::Severity::Info, stage_module(stage), stage_name(stage), message);
}

PipelineResult Pipeline::fail(PipelineResult result, Stage stage, const core::Error& error) {
    diagnostics_.emit_error(stage_module(stage), stage_name(stage), error);
    result.error = error;
    result.compiled.window.reset();
    result.stylesheets.clear();
    return result;
}

PipelineResult Pipeline::run(const std::string& file_name, const std::string& text) {
    PipelineResult result;
    diagnostics_.set_run_id(next_run_id_++);

    auto lexed = markup::Tokenizer::tokenize_all(file_name, text);
    if (!lexed.ok()) {
        return fail(std::move(result), Stage::Lex, *lexed.error);
    }
    report(Stage::Lex, std::to_string(lexed.tokens.size()) + " tokens from " + file_name);

    markup::Parser parser(std::move(lexed.tokens));
    auto parsed = parser.parse();
    if (!parsed.ok()) {
        return fail(std::move(result), Stage::Parse, *parsed.error);
    }
    report(Stage::Parse, std::to_string(parsed.document.body.size()) + " top-level nodes");

    compiler::Compiler compiler(sources_);
    if (auto invalid = compiler.validate(parsed.document)) {
        return fail(std::move(result), Stage::Validate, *invalid);
    }
    report(Stage::Validate, "document has one window");

    result.compiled = compiler.compile(parsed.document);
    if (!result.compiled.ok()) {
        const core::Error error = *result.compiled.error;
        return fail(std::move(result), Stage::Compile, error);
    }
    report(Stage::Compile,
           std::to_string(scene::count_nodes(*result.compiled.window)) + " content nodes, " +
           std::to_string(result.compiled.includes.size()) + " includes");

    style::CascadeResolver resolver(result.compiled.classes, result.compiled.ids);
    const auto includes = result.compiled.includes;
    for (const auto& include : includes) {
        if (include.kind != compiler::IncludeKind::Style) continue;

        auto contents = sources_.read(include.path);
        if (!contents) {
            const core::Error error(core::ErrorKind::FileError, include.span,
                                    "Cannot read file '" + include.path + "'.");
            return fail(std::move(result), Stage::ReadSheet, error);
        }

        auto sheet = sheet::parse_stylesheet(include.path, *contents);
        if (!sheet.ok()) {
            return fail(std::move(result), Stage::ParseSheet, *sheet.error);
        }
        report(Stage::ParseSheet,
               include.path + ": " + std::to_string(sheet.sheet.rules.size()) + " rules");

        resolver.apply(sheet.sheet, *result.compiled.window);
        report(Stage::Cascade, "applied " + include.path);
        result.stylesheets.push_back(std::move(sheet.sheet));
    }

    return result;
}

} // namespace gem::engine
