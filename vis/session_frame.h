#pragma once

#include <vector>

#include "Session.h"

namespace chroma::vis {

// Per-frame view of the dashboard's session. Taken once, before any window is drawn,
// so every window in a frame sees the same state even if a button mutates the session
// part-way through the frame. No UI dependencies.
struct SessionFrame {
    SessionState state = SessionState::AwaitingPrior;
    bool started = false;
    int completed = 0;
    int trial_count = 0;
    // Filled only when started.
    std::vector<double> trajectory;
    SessionReport report{};
};

// Applies a reset requested during the previous frame, clears the request, then
// snapshots the session. Never raises for a session in any state.
SessionFrame beginSessionFrame(ScreeningSession& session, bool& pending_reset);

} // namespace chroma::vis
