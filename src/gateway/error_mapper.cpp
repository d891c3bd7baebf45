#include "dgt_base.hpp"
#include "gateway/error_mapper.hpp"

#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace docgate::gateway
{

namespace
{

std::string demangled_type_name(const std::type_info &ti)
{
#if defined(__GNUG__)
    int status = 0;
    char *dem = abi::__cxa_demangle(ti.name(), nullptr, nullptr, &status);
    auto free_dem = basics::make_scope_guard([dem]() { std::free(dem); });
    if (status == 0 && dem != nullptr)
        return std::string(dem);
#endif
    return std::string(ti.name());
}

std::string string_field(const nlohmann::json &obj, const std::string &key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

bool is_false_flag(const nlohmann::json &obj, const std::string &key)
{
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && !it->get<bool>();
}

} // namespace

DefaultErrorMapper::DefaultErrorMapper(ErrorMapperKeys keys) : m_keys(std::move(keys)) {}

ErrorItem DefaultErrorMapper::from_exception(std::exception_ptr error,
                                             std::string_view location) const noexcept
{
    std::string description = "unknown exception";
    std::string type = "unknown";
    try
    {
        if (error)
            std::rethrow_exception(error);
        description = "null exception";
    }
    catch (const std::exception &e)
    {
        description = e.what();
        type = demangled_type_name(typeid(e));
    }
    catch (...)
    {
        // Non-std exception: described as unknown, mapped like any other failure.
    }

    try
    {
        return ErrorItem{"Unexpected error", m_keys.unexpected_code, std::move(description),
                         ErrorLevel::Severe,
                         nlohmann::json{{"location", std::string(location)}, {"type", type}}};
    }
    catch (const std::exception &e)
    {
        // Allocation failure while building meta; return the bare record.
        DGT_DEBUG("DefaultErrorMapper: failed to build error meta: {}", e.what());
        ErrorItem bare;
        bare.title = "Unexpected error";
        bare.level = ErrorLevel::Severe;
        return bare;
    }
}

std::optional<ErrorItem> DefaultErrorMapper::from_payload(const nlohmann::json &payload,
                                                          std::string_view location) const noexcept
{
    if (!payload.is_object())
        return std::nullopt;

    try
    {
        const nlohmann::json *err = nullptr;

        // 1. nested {"error": {...}}
        auto nested = payload.find(m_keys.error_key);
        if (nested != payload.end() && nested->is_object())
            err = &*nested;

        // 2. top-level code + message/description
        if (err == nullptr && payload.contains(m_keys.code_key) &&
            (payload.contains(m_keys.message_key) || payload.contains(m_keys.description_key)))
            err = &payload;

        // 3. ok:false / success:false
        if (err == nullptr &&
            (is_false_flag(payload, m_keys.ok_key) || is_false_flag(payload, m_keys.success_key)))
            err = &payload;

        if (err == nullptr)
            return std::nullopt;

        ErrorItem item;
        item.title = string_field(*err, m_keys.title_key);
        if (item.title.empty())
            item.title = "Operation failed";
        item.code = string_field(*err, m_keys.code_key);
        if (item.code.empty())
            item.code = m_keys.payload_code;

        if (err->contains(m_keys.description_key) && !(*err)[m_keys.description_key].is_null())
            item.description = string_field(*err, m_keys.description_key);
        else if (err->contains(m_keys.message_key) && !(*err)[m_keys.message_key].is_null())
            item.description = string_field(*err, m_keys.message_key);
        else
            item.description = "Unknown error";

        auto meta = err->find(m_keys.meta_key);
        item.meta = (meta != err->end() && meta->is_object()) ? *meta : nlohmann::json::object();
        item.meta["location"] = std::string(location);
        item.level = error_level_from_string(string_field(*err, m_keys.error_level_key));
        return item;
    }
    catch (const std::exception &e)
    {
        return ErrorItem{"Operation failed", m_keys.payload_code,
                         fmt::format("Unreadable error payload: {}", e.what()), ErrorLevel::Severe,
                         nlohmann::json::object()};
    }
}

} // namespace docgate::gateway
