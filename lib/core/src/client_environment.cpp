#include "oztransfer/client_environment.hpp"

#include "oztransfer/logger.hpp"

#include <fmt/format.h>

#include <utility>

#include <unistd.h>

namespace
{
    using log_env = oztransfer::log::environment;
} // anonymous namespace

namespace oztransfer
{
    auto default_ticket_cache() -> std::string
    {
        return fmt::format("FILE:/tmp/krb5cc_{}", getuid());
    } // default_ticket_cache

    auto assemble_environment(const run_config& _config, const execution_environment& _base) -> client_environment
    {
        auto libraries = locate_client_libraries(_config.library_directory);

        for (const auto& lib : libraries.paths()) {
            log_env::info("Using client library [{}].", lib.string());
        }

        const auto dir = prepare_config_directory(_config);
        auto site = build_site_config(_config);
        auto site_path = write_site_config(site, dir);

        auto env = _base;
        env.set(env_vars::config_directory, dir.string());
        env.set(env_vars::classpath, build_classpath(libraries, _base.get(env_vars::classpath)));
        env.set(env_vars::ticket_cache, default_ticket_cache());

        log_env::debug("{}={}", env_vars::config_directory, dir.string());
        log_env::debug("{}={}", env_vars::classpath, *env.get(env_vars::classpath));

        return {std::move(libraries), std::move(site), std::move(site_path), std::move(env)};
    } // assemble_environment
} // namespace oztransfer
