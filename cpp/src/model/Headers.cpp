#include "proxyconn/model/Headers.hpp"

#include <algorithm>
#include <cctype>

namespace proxyconn::model {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

Headers::Headers(std::initializer_list<Entry> entries) {
    for (const auto& [name, value] : entries) {
        append(name, value);
    }
}

Headers Headers::fromFields(const boost::beast::http::fields& fields) {
    Headers headers;
    for (const auto& field : fields) {
        headers.append(std::string(field.name_string()), std::string(field.value()));
    }
    return headers;
}

std::vector<Headers::Entry>::iterator Headers::find(std::string_view name) {
    return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return equalsIgnoreCase(entry.first, name);
    });
}

std::vector<Headers::Entry>::const_iterator Headers::find(std::string_view name) const {
    return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return equalsIgnoreCase(entry.first, name);
    });
}

void Headers::set(const std::string& name, std::string value) {
    auto it = find(name);
    if (it == entries_.end()) {
        entries_.emplace_back(name, std::move(value));
        return;
    }
    it->second = std::move(value);
}

void Headers::append(const std::string& name, const std::string& value) {
    auto it = find(name);
    if (it == entries_.end()) {
        entries_.emplace_back(name, value);
        return;
    }
    it->second += ", " + value;
}

bool Headers::erase(std::string_view name) {
    auto it = find(name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::optional<std::string> Headers::get(std::string_view name) const {
    auto it = find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Headers::has(std::string_view name) const {
    return find(name) != entries_.end();
}

Headers Headers::normalized() const {
    Headers lower;
    for (const auto& [name, value] : entries_) {
        lower.append(toLower(name), value);
    }
    return lower;
}

} // namespace proxyconn::model
