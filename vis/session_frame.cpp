#include "session_frame.h"

namespace chroma::vis {

SessionFrame beginSessionFrame(ScreeningSession& session, bool& pending_reset) {
    if (pending_reset) {
        session.reset();
        pending_reset = false;
    }

    SessionFrame f;
    f.state = session.state();
    f.started = (f.state != SessionState::AwaitingPrior);
    f.completed = session.completedTrials();
    f.trial_count = session.trialCount();
    if (f.started) {
        f.trajectory = session.trajectory();
        f.report = session.report();
    }
    return f;
}

} // namespace chroma::vis
