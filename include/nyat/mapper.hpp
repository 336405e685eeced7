#ifndef NYAT_MAPPER_HEADER
#define NYAT_MAPPER_HEADER

#include "error.hpp"
#include "mapping_info.hpp"
#include "mapping_handler.hpp"
#include "change_detector.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/dispatch.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <plog/Log.h>

namespace nyat {

/**
 * @brief Discovers a socket's public endpoint and keeps the NAT mapping alive.
 *
 * This is the common interface of @ref udp_mapper and @ref tcp_mapper. A
 * mapper does no I/O until @ref async_run is invoked, and then runs until it
 * is cancelled or hits an unrecoverable error. It never completes
 * successfully.
 *
 * A mapper must outlive its run: after @ref cancel, keep it alive until the
 * run's completion handler has been invoked.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Unsafe. All member functions must be called from the
 * thread running the io_context.
 */
class mapper
{
public:
    using executor_type = asio::io_context::executor_type;

private:
    asio::io_context& io_context_;
    std::shared_ptr<mapping_handler> handler_;
    std::function<void(error_code)> completion_;
    change_detector detector_;

protected:
    // Incremented whenever a run starts or ends. Handlers capture the value
    // at the time their operation was initiated and return if it changed.
    uint64_t generation_ = 0;

public:
    explicit mapper(asio::io_context& io_context)
        : io_context_(io_context)
    {}

    virtual ~mapper() = default;

    mapper(const mapper&) = delete;
    mapper& operator=(const mapper&) = delete;

    executor_type get_executor() noexcept
    {
        return io_context_.get_executor();
    }

    /**
     * @brief Starts the mapper.
     *
     * @param handler Notified every time the public endpoint changes, the
     * first time as soon as it is discovered.
     *
     * @param token The completion token for when the run ends. The function
     * signature of the completion handler must be:
     * @code void handler(nyat::error_code); @endcode
     * The error is `asio::error::operation_aborted` if the run was cancelled,
     * @ref error::mapper::already_running if the mapper was already running,
     * or the error that stopped the mapper. Use @ref is_recoverable to decide
     * whether to run it again. The handler is not invoked from within this
     * function.
     */
    template<typename CompletionToken>
    auto async_run(std::shared_ptr<mapping_handler> handler, CompletionToken&& token)
    {
        return asio::async_initiate<CompletionToken, void(error_code)>(
                [this](auto completion, std::shared_ptr<mapping_handler> handler) {
                    using completion_type = std::decay_t<decltype(completion)>;
                    auto executor = asio::get_associated_executor(completion, get_executor());
                    using work_type = asio::executor_work_guard<decltype(executor)>;
                    // std::function needs a copyable target.
                    auto shared = std::make_shared<completion_type>(std::move(completion));
                    // Keeps the completion's executor busy until the run ends.
                    auto work = std::make_shared<work_type>(executor);
                    initiate(std::move(handler),
                            [shared, executor, work](const error_code& error) {
                                asio::dispatch(executor, [shared, error] {
                                    std::move(*shared)(error);
                                });
                                work->reset();
                            });
                },
                token, std::move(handler));
    }

    /**
     * Stops the current run: every pending operation is cancelled and every
     * socket closed. The run completes with `asio::error::operation_aborted`
     * unless the mapper defines otherwise. The mapper may be run again right
     * away. Does nothing if the mapper is not running.
     */
    virtual void cancel() = 0;

    bool is_running() const noexcept { return completion_ != nullptr; }

    /** The last discovered mapping of the current or last run, if any. */
    const std::optional<mapping_info>& current_mapping() const noexcept
    {
        return detector_.current();
    }

protected:
    /** Invoked once a new run has been set up. */
    virtual void start() = 0;

    /**
     * Makes @p info the current mapping and notifies the handler if its public
     * endpoint changed. The handler may cancel the mapper, so callers must
     * check the generation afterwards.
     */
    void report(const mapping_info& info)
    {
        if(!detector_.update(info)) {
            PLOGD << "mapping unchanged: " << info;
            return;
        }
        PLOGI << "mapping changed: " << info;
        if(auto handler = handler_) {
            handler->on_change(info);
        }
    }

    /** Ends the current run with @p error. */
    void finish(const error_code& error)
    {
        if(!completion_) {
            return;
        }
        ++generation_;
        auto completion = std::move(completion_);
        completion_ = nullptr;
        handler_.reset();
        asio::post(io_context_, [completion = std::move(completion), error] {
            completion(error);
        });
    }

private:
    void initiate(std::shared_ptr<mapping_handler> handler,
            std::function<void(error_code)> completion)
    {
        if(completion_) {
            asio::post(io_context_, [completion = std::move(completion)] {
                completion(make_error_code(error::mapper::already_running));
            });
            return;
        }
        completion_ = std::move(completion);
        handler_ = std::move(handler);
        detector_.reset();
        ++generation_;
        start();
    }
};

} // nyat

#endif // NYAT_MAPPER_HEADER
