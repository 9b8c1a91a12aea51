//
// NLytics Preemption Timer
//
// Sets a flag once the deadline passes. The flag is polled by the virtual
// machine between instructions. Destruction disarms the timer and joins
// its thread, so no timer outlives the scope that armed it.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace nlytics::sandbox
{
    class PreemptionTimer
    {
    public:
        explicit PreemptionTimer(std::chrono::milliseconds timeout);
        ~PreemptionTimer();

        PreemptionTimer(const PreemptionTimer&) = delete;
        PreemptionTimer& operator=(const PreemptionTimer&) = delete;

        const std::atomic<bool>& Token() const { return m_fired; }
        bool Fired() const { return m_fired.load(); }

        // Stops the countdown; safe to call more than once
        void Disarm();

    private:
        std::atomic<bool> m_fired{false};
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_disarmed{false};
        std::thread m_thread;
    };

} // namespace nlytics::sandbox
