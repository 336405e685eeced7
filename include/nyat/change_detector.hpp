#ifndef NYAT_CHANGE_DETECTOR_HEADER
#define NYAT_CHANGE_DETECTOR_HEADER

#include "mapping_info.hpp"

#include <optional>

namespace nyat {

/**
 * Keeps a mapper's current mapping and tells whether a newly observed mapping
 * is a change worth reporting.
 *
 * Only the public endpoint is compared: a mapping whose local side differs
 * but whose public side is the same replaces the current one silently.
 */
class change_detector
{
    std::optional<mapping_info> current_;

public:
    /**
     * Makes @p info the current mapping.
     *
     * @return True if there was no current mapping or its public endpoint
     * differs from @p info's.
     */
    bool update(const mapping_info& info)
    {
        const bool changed = !current_ || !same_public_endpoint(*current_, info);
        current_ = info;
        return changed;
    }

    const std::optional<mapping_info>& current() const noexcept
    {
        return current_;
    }

    void reset() noexcept
    {
        current_.reset();
    }
};

} // nyat

#endif // NYAT_CHANGE_DETECTOR_HEADER
