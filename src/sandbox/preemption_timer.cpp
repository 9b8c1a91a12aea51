//
// NLytics Preemption Timer Implementation
//

#include "preemption_timer.h"
#include <spdlog/spdlog.h>

namespace nlytics::sandbox
{
    PreemptionTimer::PreemptionTimer(std::chrono::milliseconds timeout)
    {
        m_thread = std::thread(
            [this, timeout]
            {
                std::unique_lock lock(m_mutex);
                if (!m_cv.wait_for(lock, timeout, [this] { return m_disarmed; }))
                {
                    m_fired.store(true);
                    SPDLOG_DEBUG("Preemption timer fired after {} ms", timeout.count());
                }
            });
    }

    PreemptionTimer::~PreemptionTimer()
    {
        Disarm();
    }

    void PreemptionTimer::Disarm()
    {
        {
            std::lock_guard lock(m_mutex);
            m_disarmed = true;
        }
        m_cv.notify_all();
        if (m_thread.joinable())
        {
            m_thread.join();
        }
    }

} // namespace nlytics::sandbox
