#pragma once

#include <cstdint>
#include <functional>

#include "clinic_voice/bus/messages.hpp"
#include "clinic_voice/interrupt/barge_in.hpp"
#include "clinic_voice/session/session.hpp"

namespace clinic_voice {
namespace interrupt {

// Feeds every transcript to the session's barge-in detector and, when the
// caller talks over the agent, cuts the agent off.
class InterruptionController {
public:
    using InterruptHandler =
        std::function<void(session::Session& session, uint64_t interrupted_turn)>;

    InterruptionController(bool interruptions_allowed, InterruptHandler on_interrupt);

    // Returns true when the transcript interrupted the agent.
    bool handle(session::Session& session,
                const bus::TranscriptEvent& event,
                Clock::time_point now);

private:
    bool interruptions_allowed_;
    InterruptHandler on_interrupt_;
};

}
}
