#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

/*
        Paths are dot separated member names, e.g. "card_layout.width"
        Throws std::logic_error if the path runs through a non-object
*/
nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);

class JsonProvider
{
  public:
    virtual ~JsonProvider() = default;

    virtual std::vector<std::string> GetJsonPaths() const = 0;
    virtual nlohmann::json GetJsonValue(std::string_view path) const = 0;
};

void ApplyJsonOverrides(nlohmann::json& root, const JsonProvider& provider);
