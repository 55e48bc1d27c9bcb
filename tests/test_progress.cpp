#include "format_utils.hpp"
#include "progress_reporter.hpp"

#include "test_support.hpp"

#include <chrono>

#include <fmt/core.h>

namespace
{

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;
using std::chrono::seconds;

void testRateAndEta()
{
    fmt::print("\n-- rate and ETA --\n");
    const auto t0 = Clock::time_point{} + seconds(100);
    ProgressEstimator estimator(seconds(2));
    estimator.reset(1000, 11000, t0);

    estimator.addSample(ProgressSample{2000, t0 + seconds(1)});
    estimator.addSample(ProgressSample{3000, t0 + seconds(2)});
    test::expect(estimator.bytesPerSecond() == 1000.0, "1000 B/s over the window");
    test::expect(estimator.current() == 3000, "current position includes resumed bytes");
    test::expect(estimator.percent() && *estimator.percent() > 27.2 && *estimator.percent() < 27.3,
                 "percent of the full size");
    test::expect(estimator.etaSeconds() && *estimator.etaSeconds() == 8, "8s left at 1000 B/s");

    // Older samples leave the window: the rate follows the recent speed
    estimator.addSample(ProgressSample{7000, t0 + seconds(3)});
    estimator.addSample(ProgressSample{11000, t0 + seconds(4)});
    test::expect(estimator.bytesPerSecond() == 4000.0, "rate uses only the last 2 seconds");
    test::expect(estimator.etaSeconds() && *estimator.etaSeconds() == 0, "nothing left");
}

void testIndeterminate()
{
    fmt::print("\n-- unknown total --\n");
    const auto t0 = Clock::time_point{} + seconds(100);
    ProgressEstimator estimator(seconds(1));
    estimator.reset(0, std::nullopt, t0);
    estimator.addSample(ProgressSample{5000, t0 + milliseconds(500)});

    test::expect(!estimator.percent(), "no percentage");
    test::expect(!estimator.etaSeconds(), "no ETA");
    test::expect(estimator.bytesPerSecond() == 10000.0, "rate still measured");

    std::string line = formatProgressLine("scan.laz", estimator);
    test::expect(line.find("ETA: unknown") != std::string::npos, "line says ETA unknown");
    test::expect(line.find('[') == std::string::npos, "no bar without a total");
}

void testStalled()
{
    fmt::print("\n-- stalled --\n");
    const auto t0 = Clock::time_point{} + seconds(100);
    ProgressEstimator estimator(seconds(1));
    estimator.reset(500, 1000, t0);
    test::expect(!estimator.etaSeconds(), "no ETA before any progress");
    test::expect(estimator.bytesPerSecond() == 0.0, "zero rate with a single sample");
}

void testFormatting()
{
    fmt::print("\n-- formatting --\n");
    test::expect(formatBytes(512) == "512 B", "bytes");
    test::expect(formatBytes(1536) == "1.50 KB", "kilobytes");
    test::expect(formatBytes(52.3 * 1024 * 1024) == "52.30 MB", "megabytes");
    test::expect(formatRate(2048) == "2.00 KB/s", "rate");
    test::expect(formatDuration(42) == "42s", "seconds");
    test::expect(formatDuration(150) == "2m 30s", "minutes");
    test::expect(formatDuration(3723) == "1h 2m", "hours");
    test::expect(formatDuration(-1) == "unknown", "negative duration");

    const auto t0 = Clock::time_point{} + seconds(100);
    ProgressEstimator estimator(seconds(1));
    estimator.reset(0, 1000, t0);
    estimator.addSample(ProgressSample{500, t0 + seconds(1)});
    std::string line = formatProgressLine("scan.laz", estimator, 10);
    test::expect(line.find("[=====>    ]") != std::string::npos, "half-full bar");
    test::expect(line.find("50.0%") != std::string::npos, "percentage");
    test::expect(line.find("ETA: 1s") != std::string::npos, "ETA");
}

} // namespace

int main()
{
    try
    {
        testRateAndEta();
        testIndeterminate();
        testStalled();
        testFormatting();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
    return test::finish();
}
