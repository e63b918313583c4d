#pragma once

#include <chrono>
#include <functional>

namespace fits {

// Fixed courtesy delay between consecutive upstream requests.
class RequestPacer {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    explicit RequestPacer(std::chrono::milliseconds delay = std::chrono::milliseconds(100),
                          SleepFn sleep = nullptr);

    void pause();

    std::chrono::milliseconds delay() const { return delay_; }
    int pauses() const { return pauses_; }

private:
    std::chrono::milliseconds delay_;
    SleepFn sleep_;
    int pauses_ = 0;
};

} // namespace fits
