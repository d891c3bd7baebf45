#include "dgt_base.hpp"
#include "gateway/error_item.hpp"

namespace docgate::gateway
{

namespace
{

// JSON values that are not strings are rendered with dump() (numbers, bools);
// null becomes the empty string.
std::string string_from_json(const nlohmann::json &v)
{
    if (v.is_null())
        return {};
    if (v.is_string())
        return v.get<std::string>();
    return v.dump();
}

} // namespace

const char *to_string(ErrorLevel level) noexcept
{
    switch (level)
    {
    case ErrorLevel::SystemInfo:
        return "systemInfo";
    case ErrorLevel::Warning:
        return "warning";
    case ErrorLevel::Severe:
        return "severe";
    case ErrorLevel::Danger:
        return "danger";
    }
    return "systemInfo";
}

ErrorLevel error_level_from_string(std::string_view name) noexcept
{
    if (name == "warning")
        return ErrorLevel::Warning;
    if (name == "severe")
        return ErrorLevel::Severe;
    if (name == "danger")
        return ErrorLevel::Danger;
    return ErrorLevel::SystemInfo;
}

ErrorItem ErrorItem::with_meta(const std::string &key, nlohmann::json value) const
{
    ErrorItem copy = *this;
    if (!copy.meta.is_object())
        copy.meta = nlohmann::json::object();
    copy.meta[key] = std::move(value);
    return copy;
}

std::string ErrorItem::to_string() const
{
    const bool has_meta = meta.is_object() && !meta.empty();
    if (has_meta)
    {
        return fmt::format("{} ({}): {} | Meta: {} | Level: {}", title, code, description,
                           meta.dump(), gateway::to_string(level));
    }
    return fmt::format("{} ({}): {} | Level: {}", title, code, description,
                       gateway::to_string(level));
}

void to_json(nlohmann::json &j, const ErrorItem &e)
{
    j = nlohmann::json{{"title", e.title},
                       {"code", e.code},
                       {"description", e.description},
                       {"meta", e.meta},
                       {"errorLevel", to_string(e.level)}};
}

void from_json(const nlohmann::json &j, ErrorItem &e)
{
    e.title = string_from_json(j.value("title", nlohmann::json{}));
    e.code = string_from_json(j.value("code", nlohmann::json{}));
    e.description = string_from_json(j.value("description", nlohmann::json{}));
    const auto meta = j.value("meta", nlohmann::json::object());
    e.meta = meta.is_object() ? meta : nlohmann::json::object();
    e.level = error_level_from_string(string_from_json(j.value("errorLevel", nlohmann::json{})));
}

} // namespace docgate::gateway
