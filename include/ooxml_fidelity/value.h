// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Structured record: the interchange form of every result and profile.
///
/// A record field is one of
///   null | bool | integer | real | text | map (text key -> record) | list
///
/// Diff summaries, carrier analyses, tolerance evaluations and compatibility
/// reports are turned into records by records.h, and tolerance profiles are
/// persisted as records (tolerance.h). serialization.h renders records as JSON.
///
/// Containers are immer persistent structures: copying a record is O(1), and
/// `set` / `push_back` return a new record sharing structure with the old one.
/// Use builders.h to assemble large records without intermediate copies.

#pragma once

#include "ooxml_fidelity_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ooxml_fidelity {

class Value;

/// Fields are boxed so a record can contain records
using ValueBox  = immer::box<Value>;
using ValueMap  = immer::map<std::string, ValueBox>;
using ValueList = immer::vector<ValueBox>;

class OOXML_FIDELITY_API Value {
public:
    using Data = std::variant<std::monostate, bool, int64_t, double, std::string, ValueMap, ValueList>;

    Value() noexcept = default;

    // Integers of every width used for counts share the int64 alternative
    Value(int number) noexcept : data_(static_cast<int64_t>(number)) {}
    Value(int64_t number) noexcept : data_(number) {}
    Value(std::size_t count) noexcept : data_(static_cast<int64_t>(count)) {}
    Value(double number) noexcept : data_(number) {}
    Value(bool flag) noexcept : data_(flag) {}

    Value(std::string text) noexcept : data_(std::move(text)) {}
    Value(std::string_view text) : data_(std::in_place_type<std::string>, text) {}
    Value(const char* text) : data_(std::in_place_type<std::string>, text) {}

    Value(ValueMap fields) noexcept : data_(std::move(fields)) {}
    Value(ValueList items) noexcept : data_(std::move(items)) {}

    static Value map(std::initializer_list<std::pair<std::string, Value>> fields);
    static Value vector(std::initializer_list<Value> items);

    // ------------------------------------------------------------
    // Type tests
    // ------------------------------------------------------------

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data_);
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<ValueMap>(data_); }
    [[nodiscard]] bool is_vector() const noexcept { return std::holds_alternative<ValueList>(data_); }
    [[nodiscard]] bool is_number() const noexcept {
        return std::holds_alternative<int64_t>(data_) || std::holds_alternative<double>(data_);
    }

    // ------------------------------------------------------------
    // Field access. A missing key, an index past the end or a
    // non-container all read as null.
    // ------------------------------------------------------------

    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value at(std::size_t index) const;
    [[nodiscard]] Value at_or(const std::string& key, Value fallback) const;
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Number of fields or items; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;

    // ------------------------------------------------------------
    // Scalar reads; `fallback` is returned on a type mismatch
    // ------------------------------------------------------------

    [[nodiscard]] int64_t as_int64(int64_t fallback = 0) const noexcept;
    [[nodiscard]] double as_double(double fallback = 0.0) const noexcept;
    [[nodiscard]] bool as_bool(bool fallback = false) const noexcept;
    [[nodiscard]] std::string as_string(std::string fallback = {}) const;
    [[nodiscard]] std::string_view as_string_view() const noexcept;

    /// Integer or real, as a double. JSON writes whole reals without a
    /// fraction, so they read back as integers; use this for rates.
    [[nodiscard]] double as_number(double fallback = 0.0) const noexcept;

    [[nodiscard]] ValueMap as_map() const;
    [[nodiscard]] ValueList as_vector() const;

    // ------------------------------------------------------------
    // Persistent updates
    // ------------------------------------------------------------

    /// Copy with `key` set; a non-map is returned unchanged
    [[nodiscard]] Value set(const std::string& key, Value field) const;

    /// Copy with `item` appended; a non-list is returned unchanged
    [[nodiscard]] Value push_back(Value item) const;

    [[nodiscard]] const Data& data() const noexcept { return data_; }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Data data_;
};

} // namespace ooxml_fidelity
