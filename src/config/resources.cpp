/**
 * @file resources.cpp
 * @brief setup_config() / cleanup_config() and the RAII owner of their result.
 */
#include "config/resources.hpp"

#include "config/render.hpp"
#include "utils/logger.hpp"
#include "utils/rollback_stack.hpp"

#include <exception>
#include <stdexcept>

namespace pgtemp::config
{

namespace
{
constexpr std::string_view kSocketDirPrefix = "tmp-postgres-socket";
constexpr std::string_view kDataDirPrefix = "tmp-postgres-data";

void enter(SetupStage &current, SetupStage next)
{
    PGTEMP_LOG_DEBUG("setup_config: {} -> {}", to_string(current), to_string(next));
    current = next;
}
} // namespace

const char *to_string(SetupStage stage) noexcept
{
    switch (stage)
    {
    case SetupStage::Start:
        return "Start";
    case SetupStage::PortResolved:
        return "PortResolved";
    case SetupStage::SocketDirAcquired:
        return "SocketDirAcquired";
    case SetupStage::DataDirAcquired:
        return "DataDirAcquired";
    case SetupStage::PlanCompleted:
        return "PlanCompleted";
    case SetupStage::RolledBack:
        return "RolledBack";
    }
    return "Unknown";
}

Collaborators default_collaborators()
{
    return Collaborators{platform::environment_snapshot, platform::get_free_port, create_temp_directory,
                         platform::home_directory};
}

Resources setup_config(const Config &config, const Collaborators &collaborators)
{
    SetupStage stage = SetupStage::Start;
    utils::RollbackStack rollback("setup_config");

    try
    {
        const EnvList envs = collaborators.environment();

        int port = 0;
        if (config.port.has_value() && config.port->has_value())
        {
            port = **config.port;
        }
        else
        {
            port = collaborators.free_port();
        }
        enter(stage, SetupStage::PortResolved);

        const std::filesystem::path temp_root =
            config.temporary_directory.value_or(platform::default_temporary_root());

        const CompleteDirectoryType socket_dir =
            setup_directory_type(temp_root, kSocketDirPrefix, config.socket_directory,
                                 collaborators.create_temp_directory, collaborators.home_directory);
        rollback.push("socket directory " + socket_dir.path().string(),
                      [socket_dir] { cleanup_directory_type(socket_dir); });
        enter(stage, SetupStage::SocketDirAcquired);

        const CompleteDirectoryType data_dir =
            setup_directory_type(temp_root, kDataDirPrefix, config.data_directory,
                                 collaborators.create_temp_directory, collaborators.home_directory);
        rollback.push("data directory " + data_dir.path().string(),
                      [data_dir] { cleanup_directory_type(data_dir); });
        enter(stage, SetupStage::DataDirAcquired);

        const Plan generated = generate_plan(has_init_db(config.plan), has_create_db(config.plan), port,
                                             socket_dir.path().string(), data_dir.path().string());
        const Plan final_plan = combine(generated, config.plan);

        auto completed = complete_plan(envs, final_plan);
        if (completed.is_error())
        {
            throw CompletePlanFailed(render_plan(final_plan), completed.errors());
        }
        enter(stage, SetupStage::PlanCompleted);

        Resources resources{std::move(completed).content(), socket_dir, data_dir, temp_root};
        rollback.commit();
        PGTEMP_LOG_DEBUG("setup_config: port {}, socket {}, data {}", port,
                         resources.socket_directory.path().string(),
                         resources.data_directory.path().string());
        return resources;
    }
    catch (const std::exception &ex)
    {
        PGTEMP_LOG_WARN("setup_config: failed at {}: {}", to_string(stage), ex.what());
        rollback.unwind();
        enter(stage, SetupStage::RolledBack);
        throw;
    }
}

void cleanup_config(const Resources &resources)
{
    std::exception_ptr first_error;
    for (const CompleteDirectoryType *dir : {&resources.socket_directory, &resources.data_directory})
    {
        try
        {
            cleanup_directory_type(*dir);
        }
        catch (const std::exception &ex)
        {
            PGTEMP_LOG_ERROR("cleanup_config: failed to remove {}: {}", dir->path().string(), ex.what());
            if (!first_error)
            {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error)
    {
        std::rethrow_exception(first_error);
    }
}

Resources make_resources_data_dir_permanent(Resources resources)
{
    resources.data_directory = make_permanent(resources.data_directory);
    return resources;
}

// ============================================================================
// ResourcesGuard
// ============================================================================

ResourcesGuard::ResourcesGuard(Resources resources) : m_resources(std::move(resources)) {}

ResourcesGuard::~ResourcesGuard()
{
    try
    {
        cleanup();
    }
    catch (const std::exception &ex)
    {
        PGTEMP_LOG_ERROR("ResourcesGuard: cleanup failed: {}", ex.what());
    }
}

ResourcesGuard::ResourcesGuard(ResourcesGuard &&other) noexcept
    : m_resources(std::move(other.m_resources))
{
    other.m_resources.reset();
}

const Resources &ResourcesGuard::get() const
{
    if (!m_resources.has_value())
    {
        throw std::logic_error("ResourcesGuard::get() on an empty guard");
    }
    return *m_resources;
}

Resources ResourcesGuard::release()
{
    if (!m_resources.has_value())
    {
        throw std::logic_error("ResourcesGuard::release() on an empty guard");
    }
    Resources out = std::move(*m_resources);
    m_resources.reset();
    return out;
}

void ResourcesGuard::cleanup()
{
    if (!m_resources.has_value())
    {
        return;
    }
    Resources resources = std::move(*m_resources);
    m_resources.reset();
    cleanup_config(resources);
}

} // namespace pgtemp::config
