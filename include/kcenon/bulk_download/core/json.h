/**
 * @file json.h
 * @brief Minimal JSON document model used for snapshots and task lists
 *
 * Only what the interchange formats need: null, bool, number, string,
 * array and object. Objects keep insertion order so exported snapshots
 * stay diff-friendly.
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_JSON_H
#define KCENON_BULK_DOWNLOAD_CORE_JSON_H

#include "kcenon/bulk_download/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kcenon::bulk_download {

class json_value;

using json_array = std::vector<json_value>;
using json_object = std::vector<std::pair<std::string, json_value>>;

/**
 * @brief A parsed or constructed JSON value
 */
class json_value {
public:
    enum class kind { null, boolean, number, string, array, object };

    json_value() = default;
    json_value(std::nullptr_t) {}
    json_value(bool v) : data_(v) {}
    json_value(int v) : data_(static_cast<double>(v)) {}
    json_value(int64_t v) : data_(static_cast<double>(v)) {}
    json_value(uint64_t v) : data_(static_cast<double>(v)) {}
    json_value(double v) : data_(v) {}
    json_value(const char* v) : data_(std::string(v)) {}
    json_value(std::string v) : data_(std::move(v)) {}
    json_value(json_array v) : data_(std::move(v)) {}
    json_value(json_object v) : data_(std::move(v)) {}

    [[nodiscard]] auto type() const noexcept -> kind {
        return static_cast<kind>(data_.index());
    }

    [[nodiscard]] auto is_null() const noexcept -> bool { return type() == kind::null; }
    [[nodiscard]] auto is_bool() const noexcept -> bool { return type() == kind::boolean; }
    [[nodiscard]] auto is_number() const noexcept -> bool { return type() == kind::number; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return type() == kind::string; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return type() == kind::array; }
    [[nodiscard]] auto is_object() const noexcept -> bool { return type() == kind::object; }

    [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(data_); }
    [[nodiscard]] auto as_number() const -> double { return std::get<double>(data_); }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data_);
    }
    [[nodiscard]] auto as_array() const -> const json_array& {
        return std::get<json_array>(data_);
    }
    [[nodiscard]] auto as_object() const -> const json_object& {
        return std::get<json_object>(data_);
    }

    /**
     * @brief Look up an object member
     * @return Pointer to the member, or nullptr if absent or not an object
     */
    [[nodiscard]] auto find(std::string_view key) const -> const json_value*;

    /**
     * @brief Append or replace an object member
     *
     * Converts a null value into an empty object first.
     */
    auto set(std::string key, json_value value) -> json_value&;

    /**
     * @brief Append to an array, converting a null value into an array first
     */
    auto push_back(json_value value) -> json_value&;

    /**
     * @brief Member as string, if present and a string
     */
    [[nodiscard]] auto get_string(std::string_view key) const
        -> std::optional<std::string>;

    /**
     * @brief Member as integer, if present and an exactly representable
     *        whole number (|value| <= 2^53)
     */
    [[nodiscard]] auto get_int(std::string_view key) const
        -> std::optional<int64_t>;

    /**
     * @brief This value as an unsigned integer
     * @param max Largest accepted value
     * @return nullopt unless a whole number in [0, min(max, 2^53)]
     */
    [[nodiscard]] auto as_unsigned(uint64_t max) const -> std::optional<uint64_t>;

    /// Largest integer a JSON number holds without rounding
    static constexpr uint64_t max_exact_integer = uint64_t{1} << 53;

    /**
     * @brief Member as bool, if present and a bool
     */
    [[nodiscard]] auto get_bool(std::string_view key) const -> std::optional<bool>;

    /**
     * @brief Serialize
     * @param indent Spaces per level; 0 produces a compact single line
     */
    [[nodiscard]] auto dump(int indent = 0) const -> std::string;

    /**
     * @brief Parse a JSON text
     * @return Parsed value or snapshot_format_error with the failing offset
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<json_value>;

private:
    void dump_to(std::string& out, int indent, int depth) const;

    std::variant<std::nullptr_t, bool, double, std::string, json_array, json_object>
        data_{nullptr};
};

/**
 * @brief Escape a string for embedding between JSON quotes
 */
[[nodiscard]] auto escape_json_string(std::string_view input) -> std::string;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_JSON_H
