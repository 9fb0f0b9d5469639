#include "TrimRange.h"

namespace playback {
void TrimRange::setIn(double seconds)
{
    m_in = seconds;
    if (m_out && *m_out <= seconds) {
        m_out.reset();
    }
}
void TrimRange::setOut(double seconds)
{
    m_out = seconds;
    if (m_in && *m_in >= seconds) {
        m_in.reset();
    }
}
void TrimRange::clearAll()
{
    m_in.reset();
    m_out.reset();
}
bool TrimRange::isExportable() const
{
    return m_in && m_out && *m_out > *m_in;
}
std::optional<double> TrimRange::length() const
{
    if (!isExportable()) {
        return std::nullopt;
    }
    return *m_out - *m_in;
}
} // namespace playback
