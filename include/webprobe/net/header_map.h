#pragma once
#include <nlohmann/json.hpp>

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace webprobe::net {

// Case-insensitive, multi-valued header collection. Keys are stored
// lowercase and iterate in sorted order so exports are stable.
class HeaderMap {
public:
    HeaderMap() = default;
    HeaderMap(std::initializer_list<std::pair<std::string, std::string>> entries);

    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    size_t size() const;
    bool empty() const;

    using iterator = std::multimap<std::string, std::string>::const_iterator;
    iterator begin() const;
    iterator end() const;

private:
    std::multimap<std::string, std::string> headers_;
    static std::string normalize_name(const std::string& name);
};

// Repeated headers are joined with ", " as browsers report them.
void to_json(nlohmann::json& j, const HeaderMap& headers);

} // namespace webprobe::net
