#include "downloader.hpp"

#include "fake_http_source.hpp"
#include "test_support.hpp"

#include <vector>

#include <fmt/core.h>

namespace
{

const std::string kUrl = "https://files.example.org/data/scan.laz";

class RecordingSink : public ProgressSink
{
public:
    void onStart(const std::string &, std::int64_t, std::optional<std::int64_t>) override { ++starts; }
    void onSample(const ProgressSample &) override {}
    void onFinish(TransferState state) override { finishes.push_back(state); }

    int starts = 0;
    std::vector<TransferState> finishes;
};

DownloadOptions options()
{
    DownloadOptions result;
    result.chunkSize = 1024;
    result.retry.maxAttempts = 3;
    result.retry.delay = std::chrono::milliseconds(0);
    return result;
}

RemoteFile remoteFile(std::optional<std::int64_t> size, bool exact = true)
{
    RemoteFile file;
    file.name = "scan.laz";
    file.url = kUrl;
    file.size = size;
    file.sizeExact = exact;
    return file;
}

void testCancelledBeforeFirstAttempt()
{
    fmt::print("\n-- cancelled before the first attempt --\n");
    test::ScratchDir dir("dl_cancelled");
    FakeHttpSource source;
    source.add(kUrl, test::makeBody(4000));

    CancellationToken token;
    token.requestCancel();
    RecordingSink sink;
    Downloader downloader(source, options(), token, sink);
    FileOutcome outcome = downloader.download(remoteFile(4000), dir / "scan.laz");

    test::expect(outcome.state == TransferState::Paused && outcome.attempts == 0, "paused without an attempt");
    test::expect(source.requests().empty(), "no request made");
    test::expect(sink.starts == 0 && sink.finishes.empty(), "no progress events for a transfer never started");
}

void testCompleteFileConfirmedByServer()
{
    fmt::print("\n-- complete file confirmed by 416 --\n");
    test::ScratchDir dir("dl_confirmed");
    FakeHttpSource source;
    source.add(kUrl, test::makeBody(10000, 3));
    test::writeFile(dir / "scan.laz", test::makeBody(10000, 3));

    CancellationToken token;
    RecordingSink sink;
    Downloader downloader(source, options(), token, sink);
    FileOutcome outcome = downloader.download(remoteFile(10240, false), dir / "scan.laz");

    test::expect(outcome.state == TransferState::Completed && outcome.alreadyPresent, "reported as already present");
    test::expect(outcome.bytesDownloaded == 0 && outcome.offset == 10000, "nothing written");
    test::expect(test::readFile(dir / "scan.laz") == test::makeBody(10000, 3), "local file untouched");
}

void testPermanentFailure()
{
    fmt::print("\n-- permanent failure --\n");
    test::ScratchDir dir("dl_failed");
    FakeHttpSource source;
    source.add(kUrl, test::makeBody(4000)).failStatuses = {404};

    CancellationToken token;
    RecordingSink sink;
    Downloader downloader(source, options(), token, sink);
    FileOutcome outcome = downloader.download(remoteFile(4000), dir / "scan.laz");

    test::expect(outcome.state == TransferState::Failed && !outcome.reason.empty(), "failed with a reason");
    test::expect(outcome.attempts == 1, "404 is not retried");
    test::expect(sink.finishes.size() == 1 && sink.finishes[0] == TransferState::Failed, "failure reported once");
}

} // namespace

int main()
{
    test::quietLogging();

    try
    {
        testCancelledBeforeFirstAttempt();
        testCompleteFileConfirmedByServer();
        testPermanentFailure();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
    return test::finish();
}
