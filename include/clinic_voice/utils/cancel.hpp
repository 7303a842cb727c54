#pragma once

#include <atomic>
#include <memory>

namespace clinic_voice::utils {

// Shared cooperative cancellation flag; the owner sets it, workers poll it.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag make_cancel_flag() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_cancelled(const CancelFlag& flag) {
    return flag && flag->load();
}

inline void cancel(const CancelFlag& flag) {
    if (flag) {
        flag->store(true);
    }
}

}
