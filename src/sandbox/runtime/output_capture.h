//
// NLytics Output Capture
//
// Per-call stdout/stderr buffers. Programs never reach the process streams;
// print() writes here and the executor copies the buffers into the outcome.
//

#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace nlytics::sandbox
{
    enum class OutputStream
    {
        Stdout,
        Stderr
    };

    class OutputCapture
    {
    public:
        explicit OutputCapture(std::size_t maxBytes) : m_maxBytes(maxBytes) {}

        void Write(OutputStream stream, std::string_view text)
        {
            std::string& buffer = stream == OutputStream::Stdout ? m_stdout : m_stderr;
            const std::size_t used = m_stdout.size() + m_stderr.size();
            if (used + text.size() > m_maxBytes)
            {
                buffer.append(text.substr(0, m_maxBytes > used ? m_maxBytes - used : 0));
                m_truncated = true;
                return;
            }
            buffer.append(text);
        }

        // Appends the truncation notice once, outside the byte budget
        void Finish()
        {
            if (m_truncated && !m_finished)
            {
                m_stderr += std::format("[output truncated at {} bytes]\n", m_maxBytes);
            }
            m_finished = true;
        }

        const std::string& Stdout() const { return m_stdout; }
        const std::string& Stderr() const { return m_stderr; }
        bool Truncated() const { return m_truncated; }

    private:
        std::size_t m_maxBytes;
        std::string m_stdout;
        std::string m_stderr;
        bool m_truncated{false};
        bool m_finished{false};
    };

} // namespace nlytics::sandbox
