#ifndef NYAT_MAPPING_HANDLER_HEADER
#define NYAT_MAPPING_HANDLER_HEADER

#include "mapping_info.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace nyat {

/**
 * Receives a mapper's public address changes.
 *
 * `on_change` is invoked from within the io_context that runs the mapper,
 * once per distinct public endpoint, in the order the endpoints were
 * observed.
 */
struct mapping_handler
{
    virtual ~mapping_handler() = default;
    virtual void on_change(const mapping_info& info) = 0;
};

namespace detail {

template<typename Function>
class function_mapping_handler : public mapping_handler
{
    Function function_;

public:
    explicit function_mapping_handler(Function function)
        : function_(std::move(function))
    {}

    void on_change(const mapping_info& info) override
    {
        function_(info);
    }
};

} // detail

/**
 * Adapts any callable with the signature `void(const nyat::mapping_info&)`
 * to a @ref mapping_handler.
 */
template<typename Function>
std::shared_ptr<mapping_handler> make_handler(Function&& function)
{
    using function_type = typename std::decay<Function>::type;
    return std::make_shared<detail::function_mapping_handler<function_type>>(
            std::forward<Function>(function));
}

} // nyat

#endif // NYAT_MAPPING_HANDLER_HEADER
