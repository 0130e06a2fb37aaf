#include "b2h5/core/util/Config.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include "b2h5/core/util/Logging.hpp"

namespace b2h5
{

namespace
{

std::atomic<bool>& forceFlag()
{
    static std::atomic<bool> flag{parseForceFilter(std::getenv("BLOSC2_FILTER"))};
    return flag;
}

}  // namespace

bool parseForceFilter(const char* value) noexcept
{
    if (value == nullptr || *value == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0') {
        return false;
    }
    return v != 0;
}

bool forceGenericPath() noexcept
{
    return forceFlag().load(std::memory_order_relaxed);
}

void setForceGenericPath(bool force) noexcept
{
    forceFlag().store(force, std::memory_order_relaxed);
}

void reloadFromEnvironment()
{
    bool force = parseForceFilter(std::getenv("BLOSC2_FILTER"));
    setForceGenericPath(force);
    Logger()->debug("BLOSC2_FILTER reloaded, force generic path = {}", force);
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& config)
{
    EngineConfig c;
    if (config.contains("num_threads") && config["num_threads"].is_number_integer()) {
        c.numThreads = config["num_threads"].get<int>();
        if (c.numThreads < 1) {
            throw std::invalid_argument("EngineConfig: num_threads must be >= 1");
        }
    }
    if (config.contains("force_generic_path") &&
        config["force_generic_path"].is_boolean()) {
        setForceGenericPath(config["force_generic_path"].get<bool>());
    }
    return c;
}

nlohmann::json EngineConfig::toJson() const
{
    return {{"num_threads", numThreads}, {"force_generic_path", forceGenericPath()}};
}

}  // namespace b2h5
