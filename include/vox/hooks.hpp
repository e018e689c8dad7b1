#ifndef VOX_HOOKS_HPP
#define VOX_HOOKS_HPP

#include "types.hpp"

namespace vox {

// =============================================================================
// Hook Interface (Pool callbacks)
//
// The pool manager calls these around each swap. Return errors::OK to let the
// swap settle; any other code aborts it.
// =============================================================================

class IHooks {
public:
    virtual ~IHooks() = default;

    virtual int32_t before_swap(const Address& sender, const PoolKey& key,
                                const SwapParams& params) {
        return errors::OK;
    }

    virtual int32_t after_swap(const Address& sender, const PoolKey& key,
                               const SwapParams& params, const BalanceDelta& delta) {
        return errors::OK;
    }
};

} // namespace vox

#endif // VOX_HOOKS_HPP
