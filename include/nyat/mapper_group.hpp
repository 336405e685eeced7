#ifndef NYAT_MAPPER_GROUP_HEADER
#define NYAT_MAPPER_GROUP_HEADER

#include "mapper.hpp"
#include "mapping_handler.hpp"
#include "error.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/dispatch.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace nyat {

/**
 * @brief Runs several named mappers side by side on one io_context.
 *
 * A mapper whose run ends with a recoverable error (see
 * @ref is_recoverable) is run again after the restart delay. A mapper whose
 * run ends with any other error is logged and left stopped. The mappers share
 * nothing but the io_context.
 */
class mapper_group
{
    struct task
    {
        std::string name;
        std::unique_ptr<mapper> runner;
        std::shared_ptr<mapping_handler> handler;
        asio::steady_timer restart_timer;
        bool is_active = false;

        task(std::string n, std::unique_ptr<mapper> m,
                std::shared_ptr<mapping_handler> h, asio::io_context& io_context)
            : name(std::move(n))
            , runner(std::move(m))
            , handler(std::move(h))
            , restart_timer(io_context)
        {}
    };

    asio::io_context& io_context_;
    std::chrono::milliseconds restart_delay_;
    // Tasks are referenced from pending handlers, so their addresses must be
    // stable.
    std::vector<std::unique_ptr<task>> tasks_;
    std::function<void()> completion_;
    std::size_t num_active_ = 0;
    bool is_cancelled_ = false;

public:
    explicit mapper_group(asio::io_context& io_context,
            std::chrono::milliseconds restart_delay = std::chrono::seconds(5))
        : io_context_(io_context)
        , restart_delay_(restart_delay)
    {}

    mapper_group(const mapper_group&) = delete;
    mapper_group& operator=(const mapper_group&) = delete;

    /**
     * Adds a mapper under @p name, which prefixes its log lines. Mappers
     * added while the group runs are started right away.
     */
    void add(std::string name, std::unique_ptr<mapper> m,
            std::shared_ptr<mapping_handler> handler);

    /**
     * @brief Starts every mapper of the group.
     *
     * @param token The completion token for when every mapper has stopped,
     * either because of a fatal error or because the group was cancelled. The
     * function signature of the completion handler must be:
     * @code void handler(); @endcode
     */
    template<typename CompletionToken>
    auto async_run(CompletionToken&& token)
    {
        return asio::async_initiate<CompletionToken, void()>(
                [this](auto completion) {
                    using completion_type = std::decay_t<decltype(completion)>;
                    auto executor = asio::get_associated_executor(
                            completion, io_context_.get_executor());
                    using work_type = asio::executor_work_guard<decltype(executor)>;
                    auto shared = std::make_shared<completion_type>(std::move(completion));
                    auto work = std::make_shared<work_type>(executor);
                    run([shared, executor, work] {
                        asio::dispatch(executor, [shared] { std::move(*shared)(); });
                        work->reset();
                    });
                },
                token);
    }

    /** Stops every mapper and every pending restart. */
    void cancel();

    std::size_t size() const noexcept { return tasks_.size(); }

    /** The number of mappers that are running or waiting to be restarted. */
    std::size_t num_active() const noexcept { return num_active_; }

private:
    void run(std::function<void()> completion);
    void run_task(task& t);
    void on_task_done(task& t, const error_code& error);
    void stop_task(task& t);
};

} // nyat

#include "impl/mapper_group.ipp"

#endif // NYAT_MAPPER_GROUP_HEADER
