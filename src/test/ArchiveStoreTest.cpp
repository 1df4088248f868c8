#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "domain/Errors.hpp"
#include "infrastructure/ArchiveCodec.hpp"
#include "infrastructure/ArchiveStore.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/FakeRemote.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace chatvault;
using infrastructure::ArchiveStore;
using infrastructure::RebuildMode;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

domain::ArchiveHeader MakeHeader() {
    domain::ArchiveHeader header;
    header.channel.id = "ch-1";
    header.channel.internalName = "town-square";
    header.channel.name = "Town Square";
    header.channel.createTime = 500;
    header.storage.organization = domain::PostOrdering::AscendingContinuous;
    return header;
}

void Describe(domain::ArchiveHeader& header, const std::vector<domain::Post>& posts) {
    if (!header.storage.firstPostId) {
        header.storage.firstPostId = posts.front().id;
        header.storage.beginTime = posts.front().createTime;
    }
    header.storage.lastPostId = posts.back().id;
    header.storage.endTime = posts.back().createTime;
}

void TestAppendKeepsHeaderInSync(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "o.team--town-square", persistence);
    store.lock();
    assert(!store.exists());
    assert(!store.open());

    domain::ArchiveHeader header = MakeHeader();
    store.create(header);
    assert(store.exists());
    assert(header.storage.count == 0 && header.storage.byteSize == 0);

    std::vector<domain::Post> first = {test::MakePost("p1", 1000), test::MakePost("p2", 2000)};
    Describe(header, first);
    store.append(first, header);
    std::vector<domain::Post> second = {test::MakePost("p3", 3000)};
    Describe(header, second);
    store.append(second, header);

    assert(header.storage.count == 3);
    assert(header.storage.byteSize == fs::file_size(store.dataPath()));

    auto reopened = store.open();
    assert(reopened);
    assert(reopened->storage.count == 3);
    assert(reopened->storage.byteSize == fs::file_size(store.dataPath()));
    assert(reopened->storage.firstPostId == std::optional<std::string>("p1"));
    assert(reopened->storage.lastPostId == std::optional<std::string>("p3"));
    assert(reopened->channel.internalName == "town-square");

    auto posts = store.readPosts();
    assert(posts.size() == 3);
    assert(posts[0].id == "p1" && posts[2].id == "p3");
    assert(posts[1].message == "message p2");

    store.close();
    std::cout << "[PASS] Header byteSize and count match the data file after appends." << std::endl;
}

void TestTruncatedDataIsDesynchronized(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "o.team--town-square", persistence);
    store.lock();
    auto header = store.open();
    assert(header);

    const auto size = fs::file_size(store.dataPath());
    fs::resize_file(store.dataPath(), size - 1);

    bool thrown = false;
    try {
        store.open();
    } catch (const domain::DesynchronizedError& e) {
        thrown = true;
        assert(e.expectedSize() == size);
        assert(e.actualSize() == std::optional<std::uint64_t>(size - 1));
    }
    assert(thrown);

    // Appending to a desynchronized pair is refused as well.
    thrown = false;
    try {
        store.append({test::MakePost("p4", 4000)}, *header);
    } catch (const domain::DesynchronizedError&) {
        thrown = true;
    }
    assert(thrown);
    assert(fs::file_size(store.dataPath()) == size - 1);

    store.close();
    std::cout << "[PASS] Data file one byte short is reported as desynchronized." << std::endl;
}

void TestTruncateUncommittedTail(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "d.me--alice", persistence);
    store.lock();
    domain::ArchiveHeader header = MakeHeader();
    std::vector<domain::Post> posts = {test::MakePost("p1", 1000)};
    Describe(header, posts);
    store.rebuild(RebuildMode::None, header, posts);
    const auto committed = header.storage.byteSize;

    {
        std::ofstream out(store.dataPath(), std::ios::binary | std::ios::app);
        out << "{\"id\":\"half";
    }
    bool thrown = false;
    try {
        store.open();
    } catch (const domain::DesynchronizedError& e) {
        thrown = true;
        assert(*e.actualSize() > e.expectedSize());
    }
    assert(thrown);

    store.truncateUncommitted(committed);
    auto reopened = store.open();
    assert(reopened && reopened->storage.count == 1);
    assert(fs::file_size(store.dataPath()) == committed);

    store.close();
    std::cout << "[PASS] Uncommitted tail can be cut back to the committed size." << std::endl;
}

void TestBackupKeepsOldPair(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "g.alice-bob", persistence);
    store.lock();

    domain::ArchiveHeader header = MakeHeader();
    std::vector<domain::Post> posts = {test::MakePost("p1", 1000), test::MakePost("p2", 2000)};
    Describe(header, posts);
    store.rebuild(RebuildMode::None, header, posts);
    const std::string oldHeader = ReadFile(store.headerPath());
    const std::string oldData = ReadFile(store.dataPath());

    domain::ArchiveHeader fresh = MakeHeader();
    std::vector<domain::Post> newPosts = {test::MakePost("p9", 9000)};
    Describe(fresh, newPosts);
    auto backup = store.rebuild(RebuildMode::Backup, fresh, newPosts);
    assert(backup);

    fs::path backupHeader = *backup;
    backupHeader += ".meta.json";
    fs::path backupData = *backup;
    backupData += ".data.json";
    assert(backup->filename().string().rfind("g.alice-bob.backup-", 0) == 0);
    assert(ReadFile(backupHeader) == oldHeader);
    assert(ReadFile(backupData) == oldData);

    // A second backup within the same second never overwrites the first one.
    domain::ArchiveHeader again = MakeHeader();
    auto secondBackup = store.rebuild(RebuildMode::Backup, again, {});
    assert(secondBackup && *secondBackup != *backup);
    assert(ReadFile(backupData) == oldData);

    auto current = store.open();
    assert(current && current->storage.count == 0);

    store.rebuild(RebuildMode::Discard, again, {});
    assert(store.open()->storage.count == 0);

    store.close();
    std::cout << "[PASS] Rebuild with backup keeps the previous pair untouched." << std::endl;
}

void TestLockIsExclusive(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore first(root, "o.team--locked", persistence);
    ArchiveStore second(root, "o.team--locked", persistence);
    first.lock();

    bool thrown = false;
    try {
        second.lock();
    } catch (const domain::ArchiveLockedError&) {
        thrown = true;
    }
    assert(thrown);

    first.close();
    second.lock();
    second.close();
    std::cout << "[PASS] Archive lock admits a single writer." << std::endl;
}

void TestCorruptHeader(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "o.team--corrupt", persistence);
    persistence.writeAtomically(store.headerPath(), "{ not json");

    bool thrown = false;
    try {
        store.open();
    } catch (const domain::CorruptHeaderError&) {
        thrown = true;
    }
    assert(thrown);

    fs::remove(store.headerPath());
    persistence.createEmpty(store.dataPath());
    thrown = false;
    try {
        store.open();
    } catch (const domain::CorruptHeaderError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Unloadable header is reported as corrupt." << std::endl;
}

void TestCreateWritesEmptyDescription(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore store(root, "o.team--rebuilt", persistence);
    store.lock();

    domain::ArchiveHeader header = MakeHeader();
    std::vector<domain::Post> batch = {test::MakePost("p1", 1000), test::MakePost("p2", 2000)};
    Describe(header, batch);
    header.storage.postIdAfterLast = "p3";
    store.create(header);
    assert(header.storage.lastPostId == std::optional<std::string>("p2"));

    // Nothing is on disk yet, so the written header names no posts.
    auto empty = store.open();
    assert(empty && empty->storage.count == 0 && empty->storage.byteSize == 0);
    assert(!empty->storage.firstPostId && !empty->storage.lastPostId);
    assert(!empty->storage.beginTime && !empty->storage.endTime);
    assert(!empty->storage.postIdBeforeFirst && !empty->storage.postIdAfterLast);
    assert(empty->storage.organization == domain::PostOrdering::AscendingContinuous);

    store.append(batch, header);
    auto filled = store.open();
    assert(filled && filled->storage.count == 2);
    assert(filled->storage.lastPostId == std::optional<std::string>("p2"));
    assert(filled->storage.postIdAfterLast == std::optional<std::string>("p3"));
    store.close();
    std::cout << "[PASS] A freshly created pair describes no posts until they are written." << std::endl;
}

void TestLockFileOutlivesHolder(const fs::path& root) {
    infrastructure::PersistenceService persistence;
    ArchiveStore first(root, "o.team--handover", persistence);
    first.lock();
    const fs::path lockPath = root / "o.team--handover.lock";

    // Opened while the lock is held, locked right after it is released.
    int waiting = ::open(lockPath.c_str(), O_RDWR | O_CLOEXEC);
    assert(waiting >= 0);
    first.close();
    assert(fs::exists(lockPath));
    assert(::flock(waiting, LOCK_EX | LOCK_NB) == 0);

    ArchiveStore latecomer(root, "o.team--handover", persistence);
    bool thrown = false;
    try {
        latecomer.lock();
    } catch (const domain::ArchiveLockedError&) {
        thrown = true;
    }
    assert(thrown);

    ::flock(waiting, LOCK_UN);
    ::close(waiting);
    latecomer.lock();
    latecomer.close();
    std::cout << "[PASS] A released lock hands over to exactly one waiting writer." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveStore Test..." << std::endl;

    fs::path root = "test_archive_store";
    fs::remove_all(root);
    fs::create_directories(root);

    TestAppendKeepsHeaderInSync(root);
    TestTruncatedDataIsDesynchronized(root);
    TestTruncateUncommittedTail(root);
    TestBackupKeepsOldPair(root);
    TestCreateWritesEmptyDescription(root);
    TestLockIsExclusive(root);
    TestLockFileOutlivesHolder(root);
    TestCorruptHeader(root);

    fs::remove_all(root);
    std::cout << "[PASS] ArchiveStore Test." << std::endl;
    return 0;
}
