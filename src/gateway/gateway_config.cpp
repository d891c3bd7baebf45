#include "dgt_service.hpp"
#include "gateway/gateway_config.hpp"

#include <fstream>

namespace docgate::gateway
{

namespace fs = std::filesystem;

namespace
{

template <typename T> T config_field(const nlohmann::json &j, const char *name, T fallback)
{
    auto it = j.find(name);
    if (it == j.end() || it->is_null())
        return fallback;
    try
    {
        return it->get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("Gateway config: invalid '{}': {}", name, e.what()));
    }
}

void validate(const GatewayConfig &cfg)
{
    if (cfg.id_key.empty())
        throw std::runtime_error("Gateway config: invalid 'id_key': must not be empty");
    if (!utils::Logger::level_from_string(cfg.log_level))
        throw std::runtime_error(
            fmt::format("Gateway config: invalid 'log_level': unknown level '{}'", cfg.log_level));
}

void apply_env_overrides(GatewayConfig &cfg)
{
    if (auto v = platform::get_env("DOCGATE_COLLECTION"); !v.empty())
        cfg.collection = v;
    if (auto v = platform::get_env("DOCGATE_ID_KEY"); !v.empty())
        cfg.id_key = v;
    if (auto v = platform::get_env("DOCGATE_LOG_LEVEL"); !v.empty())
        cfg.log_level = v;
}

} // namespace

GatewayConfig gateway_config_from_json(const nlohmann::json &j)
{
    GatewayConfig cfg;
    if (j.is_null())
        return cfg;
    if (!j.is_object())
        throw std::runtime_error("Gateway config: top level must be an object");

    cfg.collection = config_field<std::string>(j, "collection", cfg.collection);
    cfg.id_key = config_field<std::string>(j, "id_key", cfg.id_key);
    cfg.read_after_write = config_field<bool>(j, "read_after_write", cfg.read_after_write);
    cfg.treat_empty_as_missing =
        config_field<bool>(j, "treat_empty_as_missing", cfg.treat_empty_as_missing);
    cfg.serialize_writes = config_field<bool>(j, "serialize_writes", cfg.serialize_writes);
    cfg.log_level = config_field<std::string>(j, "log_level", cfg.log_level);
    cfg.log_file = config_field<std::string>(j, "log_file", cfg.log_file);
    if (auto it = j.find("store"); it != j.end())
        cfg.store = store_config_from_json(*it);

    validate(cfg);
    return cfg;
}

GatewayConfig load_gateway_config(const fs::path &path)
{
    nlohmann::json doc;
    if (!path.empty())
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error(
                fmt::format("Gateway config: cannot open '{}'", path.string()));
        try
        {
            doc = nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error(
                fmt::format("Gateway config: '{}' is not valid JSON: {}", path.string(), e.what()));
        }
    }

    GatewayConfig cfg = gateway_config_from_json(doc);
    apply_env_overrides(cfg);
    validate(cfg);
    LOGGER_DEBUG("Gateway config loaded from '{}' (collection='{}', id_key='{}')",
                 path.empty() ? std::string("<defaults>") : path.string(), cfg.collection,
                 cfg.id_key);
    return cfg;
}

bool apply_logging_config(const GatewayConfig &cfg)
{
    auto &logger = utils::Logger::instance();
    if (auto level = utils::Logger::level_from_string(cfg.log_level))
        logger.set_level(*level);
    else
        LOGGER_WARN("Gateway config: unknown log level '{}', keeping the current one",
                    cfg.log_level);

    if (cfg.log_file.empty())
        return true;
    if (!logger.set_logfile(cfg.log_file))
    {
        LOGGER_ERROR("Gateway config: could not open log file '{}'", cfg.log_file);
        return false;
    }
    return true;
}

GatewayOptions to_gateway_options(const GatewayConfig &cfg)
{
    GatewayOptions options;
    options.collection = cfg.collection;
    options.id_key = cfg.id_key;
    options.read_after_write = cfg.read_after_write;
    options.treat_empty_as_missing = cfg.treat_empty_as_missing;
    return options;
}

} // namespace docgate::gateway
