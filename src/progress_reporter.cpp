#include "progress_reporter.hpp"

#include "format_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <fmt/color.h>
#include <fmt/core.h>

ProgressEstimator::ProgressEstimator(std::chrono::duration<double> window) : window_(window)
{
}

void ProgressEstimator::reset(std::int64_t startBytes, std::optional<std::int64_t> total,
                              std::chrono::steady_clock::time_point start)
{
    samples_.clear();
    samples_.push_back(ProgressSample{startBytes, start});
    total_ = total;
}

void ProgressEstimator::addSample(const ProgressSample &sample)
{
    samples_.push_back(sample);

    // Keep one sample at or before the window start as the baseline
    const auto windowStart = sample.timestamp - std::chrono::duration_cast<std::chrono::steady_clock::duration>(window_);
    while (samples_.size() > 2 && samples_[1].timestamp <= windowStart)
    {
        samples_.pop_front();
    }
}

std::int64_t ProgressEstimator::current() const
{
    return samples_.empty() ? 0 : samples_.back().bytesTransferred;
}

double ProgressEstimator::bytesPerSecond() const
{
    if (samples_.size() < 2)
    {
        return 0.0;
    }
    const auto &first = samples_.front();
    const auto &last = samples_.back();
    double seconds = std::chrono::duration<double>(last.timestamp - first.timestamp).count();
    if (seconds <= 0.0)
    {
        return 0.0;
    }
    return static_cast<double>(last.bytesTransferred - first.bytesTransferred) / seconds;
}

std::optional<double> ProgressEstimator::percent() const
{
    if (!total_ || *total_ <= 0)
    {
        return std::nullopt;
    }
    return std::min(100.0, static_cast<double>(current()) * 100.0 / static_cast<double>(*total_));
}

std::optional<long> ProgressEstimator::etaSeconds() const
{
    if (!total_)
    {
        return std::nullopt;
    }
    double rate = bytesPerSecond();
    if (rate <= 0.0)
    {
        return std::nullopt;
    }
    auto remaining = std::max<std::int64_t>(0, *total_ - current());
    return static_cast<long>(std::ceil(static_cast<double>(remaining) / rate));
}

std::string formatProgressLine(const std::string &name, const ProgressEstimator &estimator,
                               int barWidth, bool color)
{
    std::string rate = formatRate(estimator.bytesPerSecond());
    auto eta = estimator.etaSeconds();
    std::string etaText = eta ? formatDuration(*eta) : "unknown";

    auto percent = estimator.percent();
    if (!percent)
    {
        // Unknown size: no bar, no ETA
        return fmt::format("{}: {} | {} | ETA: {}", name, formatBytes(static_cast<double>(estimator.current())),
                           rate, etaText);
    }

    int filled = static_cast<int>((*percent / 100.0) * barWidth);
    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    std::string percentText = fmt::format("{:.1f}%", *percent);
    if (color)
    {
        auto shade = *percent < 30 ? fmt::color::red : *percent < 60 ? fmt::color::yellow : fmt::color::green;
        percentText = fmt::format(fmt::fg(shade), "{}", percentText);
    }

    return fmt::format("{} {} {} | {} / {} | {} | ETA: {}", name, bar, percentText,
                       formatBytes(static_cast<double>(estimator.current())),
                       formatBytes(static_cast<double>(*estimator.total())), rate, etaText);
}

ProgressReporter::ProgressReporter(std::chrono::duration<double> updateInterval, bool isTerminal, bool color)
    : updateInterval_(updateInterval), isTerminal_(isTerminal), color_(color), estimator_(updateInterval)
{
}

void ProgressReporter::onStart(const std::string &name, std::int64_t startOffset,
                               std::optional<std::int64_t> expectedTotal)
{
    name_ = name;
    lastRender_ = std::chrono::steady_clock::now();
    estimator_.reset(startOffset, expectedTotal, lastRender_);
    active_ = true;
}

void ProgressReporter::onSample(const ProgressSample &sample)
{
    estimator_.addSample(sample);
    if (sample.timestamp - lastRender_ < updateInterval_)
    {
        return;
    }
    lastRender_ = sample.timestamp;
    render();
}

void ProgressReporter::onFinish(TransferState state)
{
    if (active_)
    {
        render();
        if (isTerminal_)
        {
            fmt::print("\n");
        }
        active_ = false;
    }

    switch (state)
    {
    case TransferState::Completed:
        fmt::print("Download completed successfully\n\n");
        break;
    case TransferState::Paused:
        fmt::print("Download interrupted\n\n");
        break;
    case TransferState::Failed:
        fmt::print("Download failed\n\n");
        break;
    default:
        break;
    }
    std::fflush(stdout);
}

void ProgressReporter::render()
{
    std::string line = formatProgressLine(name_, estimator_, 50, color_);
    if (isTerminal_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        // For non-terminal output (e.g., piped to file), one line per update
        fmt::print("{}\n", line);
    }
}
