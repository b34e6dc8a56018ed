#pragma once
#include <gem/compiler/compiler.h>
#include <gem/core/diagnostics.h>
#include <gem/core/error.h>
#include <gem/core/source_provider.h>
#include <gem/sheet/stylesheet.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gem::engine {

// Each stage reports under a module/stage pair, e.g. "markup/lex".
enum class Stage {
    Lex,
    Parse,
    Validate,
    Compile,
    ReadSheet,
    ParseSheet,
    Cascade,
};

const char* stage_module(Stage stage);
const char* stage_name(Stage stage);

struct PipelineResult {
    compiler::CompileResult compiled;
    std::vector<sheet::StyleSheet> stylesheets;  // in include order
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
    const scene::Window* window() const {
        return compiled.window ? &*compiled.window : nullptr;
    }
};

// text -> tokens -> AST -> scene graph -> included stylesheets cascaded over
// it. Stops at the first error; every later stage is skipped.
class Pipeline {
public:
    explicit Pipeline(const core::SourceProvider& sources);

    PipelineResult run(const std::string& file_name, const std::string& text);

    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }
    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }

private:
    const core::SourceProvider& sources_;
    core::DiagnosticEmitter diagnostics_;
    std::uint64_t next_run_id_ = 1;

    void report(Stage stage, const std::string& message);
    PipelineResult fail(PipelineResult result, Stage stage, const core::Error& error);
};

} // namespace gem::engine
