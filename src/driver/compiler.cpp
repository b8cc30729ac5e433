#include "compiler.hpp"

#include "common/debug.hpp"
#include "frontend/parser/parser.hpp"

#include <fmt/format.h>

namespace errtree {

std::vector<CompiledTaxonomyPtr> Compiler::compile(
    const std::shared_ptr<const SourceFile>& source) const {
    debug::log(debug::Stage::Driver, debug::Level::Info, "Compiling: " + source->uri());

    ast::TaxonomyFile file = parse_source(source->text());

    std::vector<CompiledTaxonomyPtr> result;
    result.reserve(file.taxonomies.size());
    for (const auto& taxonomy : file.taxonomies) {
        Emitter emitter(options_);
        result.push_back(std::make_shared<const CompiledTaxonomy>(emitter.emit(taxonomy)));
    }

    debug::log(debug::Stage::Driver, debug::Level::Info,
               fmt::format("Compiled {} taxonomies", result.size()));
    return result;
}

std::vector<CompiledTaxonomyPtr> Compiler::compile_text(const std::string& text) const {
    return compile(std::make_shared<const SourceFile>("", text));
}

}  // namespace errtree
