/**
 * @file lock_config.cpp
 * @brief LockConfig JSON parsing.
 */
#include "dlk_base.hpp"
#include "utils/lock_config.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace dirlock::utils
{

namespace
{

// Reads an optional positive millisecond field. Absent returns nullopt.
std::optional<std::chrono::milliseconds> parse_positive_ms(const nlohmann::json &j,
                                                           const char *key)
{
    if (!j.contains(key))
        return std::nullopt;
    const auto &v = j[key];
    if (!v.is_number_integer() || v.get<int64_t>() <= 0)
        throw std::runtime_error(std::string("Lock config: 'lock.") + key +
                                 "' must be a positive integer (milliseconds)");
    if (v.get<int64_t>() > kMaxLockInterval.count())
        throw std::runtime_error(std::string("Lock config: 'lock.") + key + "' must be at most " +
                                 std::to_string(kMaxLockInterval.count()) + " (milliseconds)");
    return std::chrono::milliseconds(v.get<int64_t>());
}

void parse_lock_section(const nlohmann::json &j, LockConfig &cfg)
{
    if (!j.is_object())
        throw std::runtime_error("Lock config: 'lock' must be an object");

    if (!j.contains("path") || !j["path"].is_string() || j["path"].get<std::string>().empty())
        throw std::runtime_error("Lock config: missing required field 'lock.path'");
    cfg.path = j["path"].get<std::string>();

    if (auto poll = parse_positive_ms(j, "poll_interval_ms"))
        cfg.options.poll_interval = *poll;
    cfg.options.update_interval = parse_positive_ms(j, "update_interval_ms");
    cfg.options.stale_duration = parse_positive_ms(j, "stale_duration_ms");

    if (j.contains("timeout_ms"))
    {
        const auto &v = j["timeout_ms"];
        if (!v.is_number_integer() || v.get<int64_t>() < 0)
            throw std::runtime_error(
                "Lock config: 'lock.timeout_ms' must be a non-negative integer (0 = no timeout)");
        if (v.get<int64_t>() > kMaxLockInterval.count())
            throw std::runtime_error("Lock config: 'lock.timeout_ms' must be at most " +
                                     std::to_string(kMaxLockInterval.count()) + " (milliseconds)");
        if (v.get<int64_t>() > 0)
            cfg.options.take_timeout = std::chrono::milliseconds(v.get<int64_t>());
    }

    const std::string on_stale = j.value("on_stale", std::string{"fail"});
    auto policy = stale_policy_from_string(on_stale);
    if (!policy)
        throw std::runtime_error("Lock config: invalid 'lock.on_stale' = '" + on_stale +
                                 "' (must be 'fail', 'break', or 'wait')");
    cfg.on_stale = *policy;
}

void parse_logging_section(const nlohmann::json &j, LockConfig &cfg)
{
    if (!j.is_object())
        throw std::runtime_error("Lock config: 'logging' must be an object");

    const std::string level = j.value("level", std::string{"info"});
    auto lvl = log_level_from_string(level);
    if (!lvl)
        throw std::runtime_error("Lock config: invalid 'logging.level' = '" + level +
                                 "' (must be 'trace', 'debug', 'info', 'warning', 'error', or "
                                 "'system')");
    cfg.log_level = *lvl;
    cfg.log_file = j.value("file", std::string{});
}

} // anonymous namespace

std::optional<Logger::Level> log_level_from_string(std::string_view name)
{
    if (name == "trace")
        return Logger::Level::L_TRACE;
    if (name == "debug")
        return Logger::Level::L_DEBUG;
    if (name == "info")
        return Logger::Level::L_INFO;
    if (name == "warning" || name == "warn")
        return Logger::Level::L_WARNING;
    if (name == "error")
        return Logger::Level::L_ERROR;
    if (name == "system")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

LockConfig parse_lock_config(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Lock config: top level must be a JSON object");
    if (!j.contains("lock"))
        throw std::runtime_error("Lock config: missing required section 'lock'");

    LockConfig cfg;
    try
    {
        parse_lock_section(j["lock"], cfg);
        if (j.contains("logging"))
            parse_logging_section(j["logging"], cfg);
    }
    catch (const nlohmann::json::type_error &e)
    {
        // j.value() on a field of the wrong JSON type.
        throw std::runtime_error(std::string("Lock config: wrong field type: ") + e.what());
    }

    // Reject impossible timing here, where the user can still see which file is wrong.
    try
    {
        (void)resolve_lock_timing(cfg.options);
    }
    catch (const std::invalid_argument &e)
    {
        throw std::runtime_error(std::string("Lock config: ") + e.what());
    }
    return cfg;
}

LockConfig load_lock_config(const std::filesystem::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Lock config: cannot open file: " + path.string());

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Lock config: JSON parse error in '" + path.string() +
                                 "': " + e.what());
    }
    return parse_lock_config(j);
}

} // namespace dirlock::utils
