#include <webprobe/net/header_map.h>

#include <webprobe/core/text.h>

namespace webprobe::net {

HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string, std::string>> entries) {
    for (const auto& [name, value] : entries) {
        append(name, value);
    }
}

std::string HeaderMap::normalize_name(const std::string& name) {
    return core::to_lower_ascii(name);
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    headers_.emplace(normalize_name(name), value);
}

// First value in arrival order when the header repeats.
std::optional<std::string> HeaderMap::get(const std::string& name) const {
    const auto key = normalize_name(name);
    auto it = headers_.lower_bound(key);
    if (it == headers_.end() || it->first != key) {
        return std::nullopt;
    }
    return it->second;
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

HeaderMap::iterator HeaderMap::begin() const {
    return headers_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return headers_.end();
}

void to_json(nlohmann::json& j, const HeaderMap& headers) {
    j = nlohmann::json::object();
    for (const auto& [name, value] : headers) {
        if (j.contains(name)) {
            j[name] = j[name].get<std::string>() + ", " + value;
        } else {
            j[name] = value;
        }
    }
}

} // namespace webprobe::net
