#pragma once

#include <boost/beast/http/fields.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace proxyconn::model {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs);
std::string toLower(std::string_view value);

/**
 * Ordered header list with case-insensitive lookup. Names keep the spelling
 * they were first added with.
 */
class Headers {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<Entry> entries);

    // Adapts any map-like or pair-sequence header bag; values may be strings or numbers.
    template <typename HeaderBag>
    static Headers from(const HeaderBag& bag) {
        Headers headers;
        for (const auto& [name, value] : bag) {
            headers.append(std::string(name), toValue(value));
        }
        return headers;
    }

    static Headers fromFields(const boost::beast::http::fields& fields);

    // Replaces every existing value for the name.
    void set(const std::string& name, std::string value);
    // Repeated names collapse into one comma-joined value.
    void append(const std::string& name, const std::string& value);
    bool erase(std::string_view name);

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    // Same entries with lower-cased names.
    [[nodiscard]] Headers normalized() const;

private:
    template <typename Value>
    static std::string toValue(const Value& value) {
        if constexpr (std::is_arithmetic_v<Value> && !std::is_same_v<Value, bool>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<Value, bool>) {
            return value ? "true" : "false";
        } else {
            return std::string(value);
        }
    }

    std::vector<Entry>::iterator find(std::string_view name);
    std::vector<Entry>::const_iterator find(std::string_view name) const;

    std::vector<Entry> entries_;
};

} // namespace proxyconn::model
