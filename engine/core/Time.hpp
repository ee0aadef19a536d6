#pragma once

#include <cstdint>

namespace engine::core
{
// Absolute simulation time in milliseconds.
using TimeMs = std::int64_t;

class Time
{
public:
    explicit Time(double fixedDeltaSeconds = 1.0 / 60.0);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    void BeginFrame(double nowSeconds);
    bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    // Time the frame loop should block before the next tick boundary.
    [[nodiscard]] double SecondsUntilNextTick(double nowSeconds) const;

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] TimeMs SimulationMilliseconds() const;
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }
    [[nodiscard]] unsigned long long FixedStepIndex() const { return m_fixedStepIndex; }

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds;
    double m_totalSeconds;
    double m_simulationSeconds;
    double m_lastFrameSeconds;
    double m_accumulator;
    unsigned long long m_frameIndex;
    unsigned long long m_fixedStepIndex;
    bool m_firstFrame;
};
} // namespace engine::core
