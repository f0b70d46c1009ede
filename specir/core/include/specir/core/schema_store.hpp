#pragma once

#include "ir.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace specir::openapi {

// Owns every ir_schema of one run. Addresses stay stable for the lifetime of the store,
// so schemas reference each other by raw pointer. The name index holds the canonical
// (registered) instances only.
class schema_store {
public:
    using index_type = std::map<std::string, ir_schema*, std::less<>>;
    using const_iterator = index_type::const_iterator;

    schema_store() = default;
    schema_store(const schema_store&) = delete;
    schema_store& operator=(const schema_store&) = delete;

    // Allocates an anonymous schema that is not registered under any name.
    ir_schema* make();

    [[nodiscard]] ir_schema* find(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return index_.contains(name);
    }

    // Returns the schema registered under name, creating and registering a fresh one
    // (with name set) if there is none.
    ir_schema* insert_or_get(std::string_view name);

    // Registers s under name. Fails if name already maps to a different instance.
    bool insert(std::string_view name, ir_schema* s);

    // Drops name from the index. Storage is kept, so outstanding pointers stay valid.
    bool erase(std::string_view name) noexcept;

    [[nodiscard]] size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] bool empty() const noexcept { return index_.empty(); }
    [[nodiscard]] size_t allocated() const noexcept { return storage_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return index_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return index_.end(); }
    [[nodiscard]] const index_type& index() const noexcept { return index_; }

    void clear() noexcept;

private:
    std::deque<ir_schema> storage_;
    index_type index_;
};

} // namespace specir::openapi
