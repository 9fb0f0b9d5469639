#pragma once
#include <optional>

namespace playback {

// 入点/出点，两者都存在时保证 in < out
class TrimRange {
public:
    void setIn(double seconds);
    void setOut(double seconds);
    void clearIn() { m_in.reset(); }
    void clearOut() { m_out.reset(); }
    void clearAll();

    std::optional<double> in() const { return m_in; }
    std::optional<double> out() const { return m_out; }

    bool isExportable() const;
    std::optional<double> length() const;

    bool operator==(const TrimRange& other) const = default;

private:
    std::optional<double> m_in;
    std::optional<double> m_out;
};

} // namespace playback
