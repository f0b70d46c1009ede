#include "specir/core/schema_store.hpp"

namespace specir::openapi {

ir_schema* schema_store::make() {
    storage_.emplace_back();
    return &storage_.back();
}

ir_schema* schema_store::find(std::string_view name) const noexcept {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

ir_schema* schema_store::insert_or_get(std::string_view name) {
    if (auto* existing = find(name)) {
        return existing;
    }
    ir_schema* s = make();
    s->name = std::string(name);
    index_.emplace(std::string(name), s);
    return s;
}

bool schema_store::insert(std::string_view name, ir_schema* s) {
    if (!s) {
        return false;
    }
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second == s;
    }
    index_.emplace(std::string(name), s);
    return true;
}

bool schema_store::erase(std::string_view name) noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return false;
    }
    index_.erase(it);
    return true;
}

void schema_store::clear() noexcept {
    index_.clear();
    storage_.clear();
}

} // namespace specir::openapi
