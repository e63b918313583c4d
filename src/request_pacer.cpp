#include "fits/request_pacer.hpp"
#include <thread>

namespace fits {

RequestPacer::RequestPacer(std::chrono::milliseconds delay, SleepFn sleep)
    : delay_(delay), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void RequestPacer::pause() {
    if (delay_.count() <= 0) return;
    ++pauses_;
    sleep_(delay_);
}

} // namespace fits
