#pragma once

#include <functional>
#include <string>

namespace clinic_voice {
namespace utils {

// Runs the task on a detached thread. Exceptions escaping the task are logged
// under the given name and dropped.
void run_async(std::function<void()> task, std::string name = "async");

}
}
