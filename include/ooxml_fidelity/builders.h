// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Single-pass construction of map and list records.
///
/// Both builders write into an immer transient and hand out the persistent
/// container once, so a record with n fields costs O(n) instead of n copies.
///
/// @code
///   Value difference = MapBuilder()
///       .set("location", "/w:document[1]/w:body[1]/w:p[2]")
///       .set("category", "dropped")
///       .set("severity", "critical")
///       .set_optional("new_value", std::optional<std::string>{})   // null
///       .finish();
///
///   Value noise = VectorBuilder()
///       .push_back("//@w:rsid*")
///       .push_back("//w:proofErr")
///       .finish();
/// @endcode
///
/// A builder is single-use: after finish() it must not be touched again.

#pragma once

#include "value.h"

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

#include <optional>
#include <string>
#include <utility>

namespace ooxml_fidelity {

class MapBuilder {
public:
    MapBuilder() : fields_(ValueMap{}.transient()) {}

    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    /// `field` is anything a Value can be constructed from
    template <typename T>
    MapBuilder& set(const std::string& key, T&& field) {
        fields_.set(key, ValueBox{Value{std::forward<T>(field)}});
        return *this;
    }

    /// Writes null for an empty optional, so the key is always present
    template <typename T>
    MapBuilder& set_optional(const std::string& key, const std::optional<T>& field) {
        if (!field) {
            return set(key, Value{});
        }
        return set(key, *field);
    }

    [[nodiscard]] std::size_t size() const { return fields_.size(); }

    [[nodiscard]] Value finish() { return Value{fields_.persistent()}; }

private:
    ValueMap::transient_type fields_;
};

class VectorBuilder {
public:
    VectorBuilder() : items_(ValueList{}.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;
    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    template <typename T>
    VectorBuilder& push_back(T&& item) {
        items_.push_back(ValueBox{Value{std::forward<T>(item)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return items_.size(); }

    [[nodiscard]] Value finish() { return Value{items_.persistent()}; }

private:
    ValueList::transient_type items_;
};

} // namespace ooxml_fidelity
