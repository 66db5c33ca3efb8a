#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace config
{

using Value = std::variant<bool, std::int64_t, double, std::string>;

// Small typed key/value store used for per-adapter tunables.
// Safe to use from any thread.
class ConfigStore
{
  public:
    void set(const std::string &name, Value v);

    // Missing key without a default is a caller error: logged, returns nullopt.
    std::optional<Value> get(const std::string &name) const;
    Value                get(const std::string &name, Value default_value) const;
    bool                 contains(const std::string &name) const;

    bool         get_bool(const std::string &name, bool default_value) const;
    std::int64_t get_int(const std::string &name, std::int64_t default_value) const;
    std::string  get_string(const std::string &name, const std::string &default_value) const;

  private:
    mutable std::mutex           mu_;
    std::map<std::string, Value> values_;
};

std::string to_string(const Value &v);

// Process-wide settings, read from TILELINK_* environment variables.
struct ManagerSettings
{
    std::chrono::milliseconds sweep_interval{1000};
    std::chrono::milliseconds periodic_interval{1000};
    std::chrono::milliseconds default_timeout{5000};
    std::size_t               queue_capacity{1024};
    std::string               log_level{"info"};

    static ManagerSettings from_env();
};

// Parse an unsigned decimal env var within [lo, hi]; nullopt (with a warning) otherwise.
std::optional<unsigned long> env_ulong(const char *key, unsigned long lo, unsigned long hi);

}  // namespace config
