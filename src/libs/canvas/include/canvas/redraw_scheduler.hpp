#pragma once

#include <functional>
#include <utility>

namespace canvas {

// Coalesces redraw requests: at most one is pending until the host renders a frame.
class RedrawScheduler {
public:
    explicit RedrawScheduler(std::function<void()> on_request = {})
        : on_request_(std::move(on_request))
    {
    }

    void set_callback(std::function<void()> on_request) { on_request_ = std::move(on_request); }

    // Returns true when this call scheduled a new frame.
    bool request() {
        if (pending_) return false;
        pending_ = true;
        if (on_request_) on_request_();
        return true;
    }

    bool pending() const { return pending_; }
    void frame_rendered() { pending_ = false; }

private:
    std::function<void()> on_request_;
    bool pending_ = false;
};

} // namespace canvas
