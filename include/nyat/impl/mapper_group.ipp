#ifndef NYAT_MAPPER_GROUP_IMPL
#define NYAT_MAPPER_GROUP_IMPL

#include "../mapper_group.hpp"

#include <utility>

#include <asio/post.hpp>
#include <plog/Log.h>

namespace nyat {

inline void mapper_group::add(std::string name, std::unique_ptr<mapper> m,
        std::shared_ptr<mapping_handler> handler)
{
    tasks_.push_back(std::make_unique<task>(std::move(name), std::move(m),
            std::move(handler), io_context_));
    if(completion_ && !is_cancelled_) {
        run_task(*tasks_.back());
    }
}

inline void mapper_group::run(std::function<void()> completion)
{
    completion_ = std::move(completion);
    is_cancelled_ = false;
    if(tasks_.empty()) {
        auto done = std::move(completion_);
        completion_ = nullptr;
        asio::post(io_context_, std::move(done));
        return;
    }
    for(auto& t : tasks_) {
        run_task(*t);
    }
}

inline void mapper_group::run_task(task& t)
{
    if(!t.is_active) {
        t.is_active = true;
        ++num_active_;
    }
    PLOGD << '[' << t.name << "] starting";
    t.runner->async_run(t.handler, [this, &t](const error_code& error) {
        on_task_done(t, error);
    });
}

inline void mapper_group::on_task_done(task& t, const error_code& error)
{
    if(is_cancelled_ || error == asio::error::operation_aborted) {
        stop_task(t);
        return;
    }
    if(!is_recoverable(error)) {
        PLOGE << '[' << t.name << "] fatal: " << error.message();
        stop_task(t);
        return;
    }

    PLOGW << '[' << t.name << "] " << error.message() << ", restarting in "
          << restart_delay_.count() << " ms";
    t.restart_timer.expires_after(restart_delay_);
    t.restart_timer.async_wait([this, &t](const error_code& error) {
        if(error || is_cancelled_) {
            stop_task(t);
            return;
        }
        run_task(t);
    });
}

inline void mapper_group::cancel()
{
    if(!completion_) {
        return;
    }
    is_cancelled_ = true;
    for(auto& t : tasks_) {
        t->runner->cancel();
        t->restart_timer.cancel();
    }
}

inline void mapper_group::stop_task(task& t)
{
    if(!t.is_active) {
        return;
    }
    t.is_active = false;
    if(--num_active_ == 0 && completion_) {
        auto completion = std::move(completion_);
        completion_ = nullptr;
        completion();
    }
}

} // nyat

#endif // NYAT_MAPPER_GROUP_IMPL
