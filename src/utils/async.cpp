#include "clinic_voice/utils/async.hpp"

#include <exception>
#include <thread>

#include "clinic_voice/logging.hpp"

namespace clinic_voice::utils {

void run_async(std::function<void()> task, std::string name) {
    std::thread worker([task = std::move(task), name = std::move(name)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed", {kv("task", name), kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
