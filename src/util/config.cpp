#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

void ConfigStore::set(const std::string &name, Value v)
{
    std::lock_guard<std::mutex> lk(mu_);
    values_[name] = std::move(v);
}

std::optional<Value> ConfigStore::get(const std::string &name) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = values_.find(name);
    if (it == values_.end())
    {
        LOG_ERROR("config '%s' does not exist and no default was given", name.c_str());
        return std::nullopt;
    }
    return it->second;
}

Value ConfigStore::get(const std::string &name, Value default_value) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = values_.find(name);
    if (it == values_.end())
        return default_value;
    return it->second;
}

bool ConfigStore::contains(const std::string &name) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return values_.count(name) != 0;
}

bool ConfigStore::get_bool(const std::string &name, bool default_value) const
{
    Value v = get(name, Value{default_value});
    if (const bool *b = std::get_if<bool>(&v))
        return *b;
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v))
        return *i != 0;
    LOG_WARN("config '%s' is not a bool, using default", name.c_str());
    return default_value;
}

std::int64_t ConfigStore::get_int(const std::string &name, std::int64_t default_value) const
{
    Value v = get(name, Value{default_value});
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v))
        return *i;
    if (const double *d = std::get_if<double>(&v))
        return static_cast<std::int64_t>(*d);
    if (const bool *b = std::get_if<bool>(&v))
        return *b ? 1 : 0;
    LOG_WARN("config '%s' is not numeric, using default", name.c_str());
    return default_value;
}

std::string ConfigStore::get_string(const std::string &name, const std::string &default_value) const
{
    Value v = get(name, Value{default_value});
    if (const std::string *s = std::get_if<std::string>(&v))
        return *s;
    return to_string(v);
}

std::string to_string(const Value &v)
{
    if (const bool *b = std::get_if<bool>(&v))
        return *b ? "true" : "false";
    if (const std::int64_t *i = std::get_if<std::int64_t>(&v))
        return std::to_string(*i);
    if (const double *d = std::get_if<double>(&v))
        return std::to_string(*d);
    return std::get<std::string>(v);
}

std::optional<unsigned long> env_ulong(const char *key, unsigned long lo, unsigned long hi)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return std::nullopt;

    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && v >= lo && v <= hi)
        return v;

    LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    return std::nullopt;
}

ManagerSettings ManagerSettings::from_env()
{
    ManagerSettings s{};
    s.sweep_interval    = constants::DEFAULT_SWEEP_INTERVAL;
    s.periodic_interval = constants::DEFAULT_PERIODIC_INTERVAL;
    s.default_timeout   = constants::DEFAULT_OP_TIMEOUT;
    s.queue_capacity    = constants::DEFAULT_QUEUE_CAPACITY;

    if (const char *lv = std::getenv("TILELINK_LOG_LEVEL"); lv && *lv)
    {
        s.log_level = lv;
        tilelink::set_log_level_by_name(lv);
    }
    if (auto v = env_ulong("TILELINK_SWEEP_INTERVAL_MS", 10, 600000))
        s.sweep_interval = std::chrono::milliseconds(*v);
    if (auto v = env_ulong("TILELINK_PERIODIC_MS", 10, 600000))
        s.periodic_interval = std::chrono::milliseconds(*v);
    if (auto v = env_ulong("TILELINK_DEFAULT_TIMEOUT_MS", 1, 3600000))
        s.default_timeout = std::chrono::milliseconds(*v);
    if (auto v = env_ulong("TILELINK_QUEUE_CAPACITY", 16, 1u << 20))
        s.queue_capacity = static_cast<std::size_t>(*v);

    LOG_DEBUG("Settings: sweep=%lldms periodic=%lldms timeout=%lldms queue=%zu level=%s",
              (long long)s.sweep_interval.count(), (long long)s.periodic_interval.count(),
              (long long)s.default_timeout.count(), s.queue_capacity, s.log_level.c_str());
    return s;
}

}  // namespace config
