#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

#include "application/ArchiveMerger.hpp"
#include "application/AssetDownloader.hpp"
#include "application/CancellationToken.hpp"
#include "application/ChannelSyncService.hpp"
#include "infrastructure/ArchiveStore.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/FakeRemote.hpp"

namespace fs = std::filesystem;
using namespace chatvault;
using application::CancellationToken;
using application::ChannelJob;
using application::ChannelSyncService;
using application::SyncSettings;
using domain::CompatibilityAction;
using domain::OrderDirection;
using domain::PostOrdering;
using domain::StopReason;

namespace {

const fs::path kRoot = "test_channel_sync";

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

domain::Timestamp TimeOf(int index) {
    return 10000 + index * 1000;
}

SyncSettings Settings() {
    SyncSettings settings;
    settings.outputDirectory = kRoot;
    settings.planner.batchSize = 30;
    settings.planner.retryDelay = std::chrono::milliseconds(0);
    return settings;
}

ChannelJob MakeJob(const std::string& archiveName, const std::string& channelId) {
    ChannelJob job;
    job.archiveName = archiveName;
    job.channel.id = channelId;
    job.channel.internalName = channelId;
    job.channel.name = "Channel " + channelId;
    domain::Team team;
    team.id = "t-1";
    team.internalName = "team";
    team.name = "Team";
    job.team = team;
    job.seedUsers.push_back(test::MakeUser("u-me", "me"));
    return job;
}

domain::ChannelSummary Run(test::FakeRemote& remote, const ChannelJob& job,
                           application::AssetDownloader* assets = nullptr) {
    infrastructure::PersistenceService persistence;
    CancellationToken cancel;
    ChannelSyncService service(remote, persistence, Settings(), cancel, assets,
                               [](std::chrono::milliseconds) {});
    return service.run(job);
}

/** Runs with a pacing delay so that @p afterFetch observes every fetch. */
domain::ChannelSummary RunPaced(test::FakeRemote& remote, const ChannelJob& job, CancellationToken& cancel,
                                application::FetchPlanner::Sleeper afterFetch) {
    infrastructure::PersistenceService persistence;
    SyncSettings settings = Settings();
    settings.planner.loopDelay = std::chrono::milliseconds(1);
    ChannelSyncService service(remote, persistence, settings, cancel, nullptr, std::move(afterFetch));
    return service.run(job);
}

/** Reads the archive back and checks the header against the files on disk. */
domain::ArchiveHeader Inspect(const std::string& archiveName, std::vector<domain::Post>* posts = nullptr) {
    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, archiveName, persistence);
    auto header = store.open();
    assert(header);
    assert(header->storage.byteSize == fs::file_size(store.dataPath()));
    auto stored = store.readPosts();
    assert(static_cast<std::int64_t>(stored.size()) == header->storage.count);

    std::set<std::string> ids;
    for (const auto& post : stored) ids.insert(post.id);
    assert(ids.size() == stored.size());

    if (posts) *posts = std::move(stored);
    return *header;
}

std::vector<fs::path> Backups(const std::string& archiveName) {
    std::vector<fs::path> result;
    for (const auto& entry : fs::directory_iterator(kRoot)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind(archiveName + ".backup-", 0) == 0) result.push_back(entry.path());
    }
    return result;
}

void TestFullDownloadAndIdempotentRerun() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 100);
    ChannelJob job = MakeJob("o.team--main", "ch");
    job.channel.lastPostTime = TimeOf(99);

    auto summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.action == CompatibilityAction::Fresh);
    assert(summary.stopReason == StopReason::NoMorePosts);
    assert(summary.postsWritten == 100);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 100);
    assert(header.storage.organization == PostOrdering::AscendingContinuous);
    assert(posts.front().id == "p0" && posts.back().id == "p99");
    assert(!header.storage.postIdBeforeFirst && !header.storage.postIdAfterLast);
    assert(header.findUser("u-me") && header.findUser("u-alice"));
    assert(header.team && header.team->internalName == "team");

    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, job.archiveName, persistence);
    const std::string headerBefore = ReadFile(store.headerPath());
    const std::string dataBefore = ReadFile(store.dataPath());

    summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::Skip);
    assert(ReadFile(store.headerPath()) == headerBefore);
    assert(ReadFile(store.dataPath()) == dataBefore);

    // Without lastPostTime the remote is asked, and finds nothing new.
    job.channel.lastPostTime.reset();
    summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::Append);
    assert(summary.postsWritten == 0);
    assert(ReadFile(store.headerPath()) == headerBefore);
    assert(ReadFile(store.dataPath()) == dataBefore);
    std::cout << "[PASS] Full download, then re-runs leave the archive byte-identical." << std::endl;
}

void TestContinuationAddsNoDuplicates() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 40);
    ChannelJob job = MakeJob("o.team--continued", "ch");
    Run(remote, job);

    remote.addSeries("ch", "p", 20);
    job.channel.lastPostTime = TimeOf(59);
    job.options.bounds.afterTime = TimeOf(39) - 1;
    auto summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::Append);
    assert(summary.postsWritten == 20);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 60);
    assert(header.storage.organization == PostOrdering::AscendingContinuous);
    for (int i = 0; i < 60; ++i) assert(posts[i].id == "p" + std::to_string(i));
    std::cout << "[PASS] Continuation appends only posts that were not stored yet." << std::endl;
}

void TestGapClearsContinuity() {
    test::FakeRemote remote;
    remote.addSeries("gap", "g", 10);
    ChannelJob job = MakeJob("o.team--gap", "gap");
    Run(remote, job);
    assert(Inspect(job.archiveName).storage.organization == PostOrdering::AscendingContinuous);

    remote.addSeries("gap", "g", 5);
    remote.malformed.insert("g11");
    auto summary = Run(remote, job);
    assert(summary.postsMalformed == 1);
    auto header = Inspect(job.archiveName);
    assert(header.storage.count == 14);
    assert(header.storage.organization == PostOrdering::Ascending);

    // A batch that does not touch the stored range.
    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, "o.team--detached", persistence);
    store.lock();
    domain::ArchiveHeader fresh;
    application::MergeSettings settings;
    application::ArchiveMerger merger(store, remote, fresh, infrastructure::RebuildMode::None, false, settings);

    domain::PostBatch first;
    first.posts = {test::MakePost("d1", 1000), test::MakePost("d2", 2000)};
    first.followingPostId = "d3";
    merger.consume(first);
    assert(merger.header().storage.organization == PostOrdering::AscendingContinuous);

    domain::PostBatch detached;
    detached.posts = {test::MakePost("d7", 7000)};
    detached.anchorPostId = "d6";
    merger.consume(detached);
    merger.finish(StopReason::NoMorePosts);
    assert(merger.header().storage.organization == PostOrdering::Ascending);
    assert(merger.header().storage.count == 3);
    store.close();
    std::cout << "[PASS] Lost or detached posts clear the continuous flag." << std::endl;
}

void TestTotalLimit() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 100);
    ChannelJob job = MakeJob("o.team--limited", "ch");
    job.options.maximumPostCount = 5;

    auto summary = Run(remote, job);
    assert(summary.stopReason == StopReason::TotalLimitHit);
    auto header = Inspect(job.archiveName);
    assert(header.storage.count == 5);
    assert(header.storage.lastPostId == std::optional<std::string>("p4"));
    assert(header.storage.postIdAfterLast == std::optional<std::string>("p5"));

    // The limit covers the archive, not the session.
    job.channel.lastPostTime = TimeOf(99);
    summary = Run(remote, job);
    assert(summary.stopReason == StopReason::TotalLimitHit);
    assert(Inspect(job.archiveName).storage.count == 5);
    std::cout << "[PASS] maximumPostCount of 5 stores exactly 5 posts." << std::endl;
}

void TestDesynchronizedArchiveIsRebuilt() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 12);
    ChannelJob job = MakeJob("o.team--desync", "ch");
    Run(remote, job);

    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, job.archiveName, persistence);
    fs::resize_file(store.dataPath(), fs::file_size(store.dataPath()) - 1);
    const std::string truncated = ReadFile(store.dataPath());

    auto summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::RebuildWithBackup);
    assert(Inspect(job.archiveName).storage.count == 12);

    auto backups = Backups(job.archiveName);
    assert(backups.size() == 2);
    bool foundData = false;
    for (const auto& path : backups) {
        if (path.string().size() > 10 && path.string().compare(path.string().size() - 10, 10, ".data.json") == 0) {
            assert(ReadFile(path) == truncated);
            foundData = true;
        }
    }
    assert(foundData);
    std::cout << "[PASS] Desynchronized archive is replaced, the damaged pair is kept." << std::endl;
}

void TestRepairUncommittedTail() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 8);
    ChannelJob job = MakeJob("o.team--repair", "ch");
    Run(remote, job);

    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, job.archiveName, persistence);
    const auto committed = fs::file_size(store.dataPath());
    {
        std::ofstream out(store.dataPath(), std::ios::binary | std::ios::app);
        out << "{\"id\":\"p8\",\"cr";
    }

    remote.addSeries("ch", "p", 2);
    job.options.repairUncommitted = true;
    auto summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.action == CompatibilityAction::Append);
    assert(summary.postsWritten == 2);
    auto header = Inspect(job.archiveName);
    assert(header.storage.count == 10);
    assert(header.storage.byteSize > committed);
    assert(Backups(job.archiveName).empty());
    std::cout << "[PASS] Uncommitted tail is cut and the archive continues." << std::endl;
}

void TestEmptyChannel() {
    test::FakeRemote remote;
    ChannelJob job = MakeJob("o.team--empty", "quiet");

    auto summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.stopReason == StopReason::NoMorePosts);
    auto header = Inspect(job.archiveName);
    assert(header.storage.count == 0);
    assert(header.storage.byteSize == 0);
    assert(header.storage.organization == PostOrdering::AscendingContinuous);
    std::cout << "[PASS] Empty channel creates an empty continuous archive." << std::endl;
}

void TestIncompatibleRequestBacksUp() {
    test::FakeRemote remote;
    remote.addSeries("ch", "p", 50);
    ChannelJob job = MakeJob("o.team--reversed", "ch");
    job.options.maximumPostCount = 5;
    Run(remote, job);

    infrastructure::PersistenceService persistence;
    infrastructure::ArchiveStore store(kRoot, job.archiveName, persistence);
    const std::string oldHeader = ReadFile(store.headerPath());
    const std::string oldData = ReadFile(store.dataPath());

    job.options.bounds.direction = OrderDirection::Desc;
    job.options.maximumPostCount = 10;
    auto summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::RebuildWithBackup);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.organization == PostOrdering::DescendingContinuous);
    assert(header.storage.count == 10);
    assert(posts.front().id == "p49" && posts.back().id == "p40");

    std::size_t matched = 0;
    for (const auto& path : Backups(job.archiveName)) {
        const std::string content = ReadFile(path);
        if (content == oldHeader || content == oldData) ++matched;
    }
    assert(matched == 2);

    job.options.onExistingIncompatible = domain::ArchiveAction::Skip;
    job.options.bounds.direction = OrderDirection::Asc;
    const std::string current = ReadFile(store.dataPath());
    summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::Skip);
    assert(ReadFile(store.dataPath()) == current);
    std::cout << "[PASS] Incompatible request backs up the old pair unchanged." << std::endl;
}

void TestAssets() {
    test::FakeRemote remote;
    domain::Post post = test::MakePost("a1", 1000, "u-bob");
    domain::FileAttachment report;
    report.id = "f-report";
    report.name = "report.pdf";
    report.byteSize = 50;
    report.mimeType = "application/pdf";
    domain::FileAttachment huge = report;
    huge.id = "f-huge";
    huge.byteSize = 5000;
    post.attachments = {report, huge};
    remote.addPosts("files", {post, test::MakePost("a2", 2000)});

    ChannelJob job = MakeJob("o.team--files", "files");
    job.options.attachments.download = true;
    job.options.attachments.maxSize = 100;
    job.options.downloadAvatars = true;

    infrastructure::PersistenceService persistence;
    CancellationToken cancel;
    application::AssetDownloader assets(remote, persistence, kRoot, cancel);
    auto summary = Run(remote, job, &assets);
    assert(!summary.error);

    assert(ReadFile(kRoot / "o.team--files--files" / "f-report.pdf") == "file:f-report");
    assert(!fs::exists(kRoot / "o.team--files--files" / "f-huge.pdf"));
    assert(ReadFile(kRoot / "avatars" / "bob.jpg") == "avatar:u-bob");

    auto header = Inspect(job.archiveName);
    const domain::User* bob = header.findUser("u-bob");
    assert(bob && bob->avatarFileName == std::optional<std::string>("bob.jpg"));
    assert(header.findUser("u-me")->avatarFileName == std::optional<std::string>("me.jpg"));

    // Stored files are not downloaded a second time.
    const std::size_t written = assets.filesWritten();
    remote.addPosts("files", {test::MakePost("a3", 3000, "u-bob")});
    Run(remote, job, &assets);
    assert(assets.filesWritten() == written);
    std::cout << "[PASS] Attachments and avatars are stored next to the archive." << std::endl;
}

void TestMalformedPageBreaksContinuity() {
    test::FakeRemote remote;
    remote.addSeries("lost", "p", 90);
    for (int i = 30; i < 60; ++i) remote.malformed.insert("p" + std::to_string(i));
    ChannelJob job = MakeJob("o.team--lost-page", "lost");

    auto summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.postsMalformed == 30);
    assert(summary.postsWritten == 60);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 60);
    assert(header.storage.organization == PostOrdering::Ascending);
    assert(posts[29].id == "p29" && posts[30].id == "p60");
    std::cout << "[PASS] A page of malformed records leaves the archive without continuity." << std::endl;
}

void TestMalformedOldestPage() {
    test::FakeRemote remote;
    remote.addSeries("start", "p", 60);
    for (int i = 0; i < 30; ++i) remote.malformed.insert("p" + std::to_string(i));
    ChannelJob job = MakeJob("o.team--bad-start", "start");

    auto summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.stopReason == StopReason::NoMorePosts);
    assert(summary.postsMalformed == 30);
    assert(summary.postsWritten == 30);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 30);
    assert(header.storage.organization == PostOrdering::Ascending);
    assert(posts.front().id == "p30" && posts.back().id == "p59");
    std::cout << "[PASS] Malformed oldest records do not hide the newer history." << std::endl;
}

void TestInterruptedRunResumes() {
    test::FakeRemote remote;
    remote.reverseCursor = true;
    remote.addSeries("stop", "p", 100);
    ChannelJob job = MakeJob("o.team--interrupted", "stop");

    CancellationToken cancel;
    int fetches = 0;
    auto summary = RunPaced(remote, job, cancel, [&](std::chrono::milliseconds) {
        if (++fetches == 2) cancel.requestStop();
    });
    assert(!summary.error);
    assert(summary.stopReason == StopReason::Interrupted);
    assert(summary.postsWritten == 60);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 60);
    assert(header.storage.lastPostId == std::optional<std::string>(posts.back().id));
    assert(header.storage.organization == PostOrdering::AscendingContinuous);

    summary = Run(remote, job);
    assert(summary.action == CompatibilityAction::Append);
    assert(summary.postsWritten == 40);
    header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 100);
    assert(header.storage.organization == PostOrdering::AscendingContinuous);
    for (int i = 0; i < 100; ++i) assert(posts[i].id == "p" + std::to_string(i));
    std::cout << "[PASS] An interrupted run keeps whole batches and the next run resumes." << std::endl;
}

void TestConnectionTimeoutResumes() {
    test::FakeRemote remote;
    remote.addSeries("slow", "p", 40);
    ChannelJob job = MakeJob("o.team--timeout", "slow");
    Run(remote, job);
    remote.addSeries("slow", "p", 50);

    CancellationToken cancel;
    int pauses = 0;
    auto summary = RunPaced(remote, job, cancel, [&](std::chrono::milliseconds) {
        if (++pauses == 1) remote.failingFetches = 100;
    });
    assert(summary.action == CompatibilityAction::Append);
    assert(summary.stopReason == StopReason::ConnectionTimeout);
    assert(summary.error);
    assert(summary.postsWritten == 30);

    std::vector<domain::Post> posts;
    auto header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 70);
    assert(posts.back().id == "p69");
    assert(header.storage.organization == PostOrdering::AscendingContinuous);

    remote.failingFetches = 0;
    summary = Run(remote, job);
    assert(!summary.error);
    assert(summary.postsWritten == 20);
    header = Inspect(job.archiveName, &posts);
    assert(header.storage.count == 90);
    for (int i = 0; i < 90; ++i) assert(posts[i].id == "p" + std::to_string(i));
    std::cout << "[PASS] Exhausted retries end the channel with a consistent, resumable archive." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChannelSync Test..." << std::endl;

    fs::remove_all(kRoot);
    fs::create_directories(kRoot);

    TestFullDownloadAndIdempotentRerun();
    TestContinuationAddsNoDuplicates();
    TestGapClearsContinuity();
    TestMalformedPageBreaksContinuity();
    TestMalformedOldestPage();
    TestTotalLimit();
    TestDesynchronizedArchiveIsRebuilt();
    TestRepairUncommittedTail();
    TestEmptyChannel();
    TestIncompatibleRequestBacksUp();
    TestAssets();
    TestInterruptedRunResumes();
    TestConnectionTimeoutResumes();

    fs::remove_all(kRoot);
    std::cout << "[PASS] ChannelSync Test." << std::endl;
    return 0;
}
