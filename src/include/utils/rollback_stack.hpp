#pragma once
/**
 * @file rollback_stack.hpp
 * @brief An explicit stack of undo actions for all-or-nothing acquisition.
 *
 * Push one undo action after each successful acquisition. If the scope is left
 * before `commit()`, the actions run newest first. Undo actions may throw; the
 * failure is logged and the remaining actions still run, so one broken cleanup
 * never strands the resources acquired before it.
 *
 * @code
 * utils::RollbackStack rollback("setup_config");
 * auto socket_dir = acquire_socket_dir();
 * rollback.push("socket directory", [&] { release(socket_dir); });
 * auto data_dir = acquire_data_dir(); // throws: socket_dir is released
 * rollback.push("data directory", [&] { release(data_dir); });
 * rollback.commit();
 * @endcode
 */

#include "utils/logger.hpp"

#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace pgtemp::utils
{

class RollbackStack
{
  public:
    explicit RollbackStack(std::string owner) : m_owner(std::move(owner)) {}

    ~RollbackStack() noexcept { unwind(); }

    RollbackStack(const RollbackStack &) = delete;
    RollbackStack &operator=(const RollbackStack &) = delete;
    RollbackStack(RollbackStack &&) = delete;
    RollbackStack &operator=(RollbackStack &&) = delete;

    void push(std::string what, std::function<void()> undo)
    {
        m_actions.push_back(Action{std::move(what), std::move(undo)});
    }

    /// Keeps everything acquired so far; the destructor becomes a no-op.
    void commit() noexcept { m_actions.clear(); }

    [[nodiscard]] size_t size() const noexcept { return m_actions.size(); }

    /// Runs every pending undo action, newest first.
    void unwind() noexcept
    {
        if (m_actions.empty())
        {
            return;
        }
        PGTEMP_LOG_WARN("{}: rolling back {} acquisition(s)", m_owner, m_actions.size());
        while (!m_actions.empty())
        {
            Action action = std::move(m_actions.back());
            m_actions.pop_back();
            try
            {
                action.undo();
                PGTEMP_LOG_DEBUG("{}: released {}", m_owner, action.what);
            }
            catch (const std::exception &ex)
            {
                PGTEMP_LOG_ERROR("{}: failed to release {} during rollback: {}", m_owner,
                                 action.what, ex.what());
            }
        }
    }

  private:
    struct Action
    {
        std::string what;
        std::function<void()> undo;
    };

    std::string m_owner;
    std::vector<Action> m_actions;
};

} // namespace pgtemp::utils
