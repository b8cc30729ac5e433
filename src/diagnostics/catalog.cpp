#include "catalog.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace errtree {
namespace diagnostics {

bool TaxonomyCatalog::add(CompiledTaxonomyPtr taxonomy) {
    if (!taxonomy) {
        throw std::invalid_argument("TaxonomyCatalog::add: taxonomy is null");
    }
    if (!by_name_.emplace(taxonomy->name, taxonomy).second)
        return false;
    order_.push_back(std::move(taxonomy));
    return true;
}

CompiledTaxonomyPtr TaxonomyCatalog::get(const std::string& name) const {
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : nullptr;
}

const VariantDescriptor* TaxonomyCatalog::find_code(const std::string& code) const {
    for (const auto& taxonomy : order_) {
        if (const auto* variant = taxonomy->find_by_code(code))
            return variant;
    }
    return nullptr;
}

ErrorValuePtr TaxonomyCatalog::make(const std::string& taxonomy, const std::string& identifier,
                                    FieldValues values) const {
    auto compiled = get(taxonomy);
    if (!compiled) {
        throw std::invalid_argument(fmt::format("unknown taxonomy `{}`", taxonomy));
    }
    return ErrorValue::make(std::move(compiled), identifier, std::move(values));
}

}  // namespace diagnostics
}  // namespace errtree
