#include "clinic_voice/app.hpp"
#include "clinic_voice/config.hpp"
#include "clinic_voice/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

}

int main() {
    try {
        const auto config = clinic_voice::Config::load();
        config.validate();
        clinic_voice::logging::init(config);
        clinic_voice::info(
            "Starting clinic voice agent",
            {clinic_voice::kv("llm_provider", config.llm_provider),
             clinic_voice::kv("llm_model", config.llm_model),
             clinic_voice::kv("carrier_port", config.carrier_port),
             clinic_voice::kv("rest_port", config.rest_api_port),
             clinic_voice::kv("public_stream_url", config.public_stream_url),
             clinic_voice::kv("interruptions_allowed", config.interruptions_are_allowed)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        clinic_voice::App app(config);
        app.init();
        app.run(stop_requested);
    } catch (const std::exception& ex) {
        clinic_voice::error(
            "Startup failed",
            {clinic_voice::kv("error", ex.what())});
        clinic_voice::logging::shutdown();
        return 1;
    }
    clinic_voice::info("Clinic voice agent stopped");
    clinic_voice::logging::shutdown();
    return 0;
}
