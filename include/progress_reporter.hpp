#pragma once

#include "sync_types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

/**
 * Byte position of a transfer at a point in time.
 */
struct ProgressSample
{
    std::int64_t bytesTransferred = 0; // Absolute position in the file, resumed bytes included
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * Receives progress events from the transfer loop.
 * Implementations must return quickly: they run between chunk writes.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    virtual void onStart(const std::string &name, std::int64_t startOffset,
                         std::optional<std::int64_t> expectedTotal) = 0;
    virtual void onSample(const ProgressSample &sample) = 0;
    virtual void onFinish(TransferState state) = 0;
};

class NullProgressSink : public ProgressSink
{
public:
    void onStart(const std::string &, std::int64_t, std::optional<std::int64_t>) override {}
    void onSample(const ProgressSample &) override {}
    void onFinish(TransferState) override {}
};

/**
 * Transfer rate and ETA over a sliding time window.
 * Uses only the timestamps carried by the samples.
 */
class ProgressEstimator
{
public:
    explicit ProgressEstimator(std::chrono::duration<double> window);

    void reset(std::int64_t startBytes, std::optional<std::int64_t> total,
               std::chrono::steady_clock::time_point start);
    void addSample(const ProgressSample &sample);

    std::int64_t current() const;
    std::optional<std::int64_t> total() const { return total_; }

    /**
     * Bytes per second between the oldest and newest sample in the window.
     */
    double bytesPerSecond() const;

    std::optional<double> percent() const;

    /**
     * Seconds until completion; nullopt when the total is unknown or
     * nothing moved within the window.
     */
    std::optional<long> etaSeconds() const;

private:
    std::chrono::duration<double> window_;
    std::deque<ProgressSample> samples_;
    std::optional<std::int64_t> total_;
};

/**
 * Render one progress line, e.g.
 * "[=====>    ] 45.2% | 1.20 MB / 2.65 MB | 512.00 KB/s | ETA: 3s"
 */
std::string formatProgressLine(const std::string &name, const ProgressEstimator &estimator,
                               int barWidth = 50, bool color = false);

/**
 * Terminal progress bar. Redraws at most once per update interval, so it
 * can be fed every chunk without slowing the transfer.
 */
class ProgressReporter : public ProgressSink
{
public:
    ProgressReporter(std::chrono::duration<double> updateInterval, bool isTerminal, bool color);

    void onStart(const std::string &name, std::int64_t startOffset,
                 std::optional<std::int64_t> expectedTotal) override;
    void onSample(const ProgressSample &sample) override;
    void onFinish(TransferState state) override;

private:
    void render();

    std::chrono::duration<double> updateInterval_;
    bool isTerminal_;
    bool color_;
    ProgressEstimator estimator_;
    std::string name_;
    std::chrono::steady_clock::time_point lastRender_;
    bool active_ = false;
};
