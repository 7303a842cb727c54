#include "clinic_voice/interrupt/controller.hpp"

#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"

namespace clinic_voice::interrupt {

InterruptionController::InterruptionController(bool interruptions_allowed,
                                               InterruptHandler on_interrupt)
    : interruptions_allowed_(interruptions_allowed),
      on_interrupt_(std::move(on_interrupt)) {}

bool InterruptionController::handle(session::Session& session,
                                    const bus::TranscriptEvent& event,
                                    Clock::time_point now) {
    auto& detector = session.barge_in();
    if (event.is_final || event.speech_final) {
        detector.on_final();
        return false;
    }
    // Only speech heard over playback counts toward a trigger or its cooldown.
    if (!session.is_speaking()) {
        detector.reset();
        return false;
    }
    if (!detector.on_interim(event.text, now)) {
        return false;
    }
    if (!interruptions_allowed_) {
        logging::debug("Barge-in ignored, interruptions disabled",
                       {kv("session_id", session.id())});
        return false;
    }

    const auto turn_id = session.interrupt();
    Metrics::instance().increment_interruption();
    logging::info("Caller interrupted playback",
                  {kv("session_id", session.id()), kv("turn_id", turn_id),
                   kv("text", event.text)});
    if (on_interrupt_) {
        on_interrupt_(session, turn_id);
    }
    return true;
}

}
