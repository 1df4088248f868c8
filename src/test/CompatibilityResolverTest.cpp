#include <cassert>
#include <iostream>
#include <map>

#include "application/CompatibilityResolver.hpp"

using namespace chatvault;
using application::CompatibilityResolver;
using domain::CompatibilityAction;
using domain::OrderDirection;
using domain::PostOrdering;

namespace {

std::map<std::string, domain::Timestamp> g_postTimes = {
    {"p-old", 500}, {"p1", 1000}, {"p3", 3000}, {"p-mid", 2000}, {"p-new", 9000}};

CompatibilityResolver MakeResolver() {
    return CompatibilityResolver([](const std::string& id) -> std::optional<domain::Timestamp> {
        auto it = g_postTimes.find(id);
        if (it == g_postTimes.end()) return std::nullopt;
        return it->second;
    });
}

/** Ascending continuous archive holding p1..p3 (times 1000..3000). */
domain::ArchiveHeader AscendingArchive() {
    domain::ArchiveHeader header;
    header.channel.id = "ch";
    header.storage.count = 3;
    header.storage.byteSize = 300;
    header.storage.organization = PostOrdering::AscendingContinuous;
    header.storage.firstPostId = "p1";
    header.storage.lastPostId = "p3";
    header.storage.beginTime = 1000;
    header.storage.endTime = 3000;
    header.storage.postIdAfterLast = "p4";
    return header;
}

/** Descending continuous archive holding p3..p1 (newest first). */
domain::ArchiveHeader DescendingArchive() {
    domain::ArchiveHeader header = AscendingArchive();
    header.storage.organization = PostOrdering::DescendingContinuous;
    header.storage.firstPostId = "p3";
    header.storage.lastPostId = "p1";
    header.storage.beginTime = 3000;
    header.storage.endTime = 1000;
    header.storage.postIdAfterLast = "p-old";
    return header;
}

domain::ChannelOptions Options(OrderDirection direction) {
    domain::ChannelOptions options;
    options.bounds.direction = direction;
    return options;
}

domain::Channel ChannelWithLastPost(domain::Timestamp lastPostTime) {
    domain::Channel channel;
    channel.id = "ch";
    channel.lastPostTime = lastPostTime;
    return channel;
}

void TestNoArchiveAndZeroLimits() {
    auto resolver = MakeResolver();
    auto options = Options(OrderDirection::Asc);
    assert(resolver.resolve(std::nullopt, options, ChannelWithLastPost(5000)).action == CompatibilityAction::Fresh);

    options.maximumPostCount = 0;
    assert(resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(5000)).action == CompatibilityAction::Skip);
    options.maximumPostCount = domain::kUnlimited;
    options.sessionPostLimit = 0;
    assert(resolver.resolve(std::nullopt, options, ChannelWithLastPost(5000)).action == CompatibilityAction::Skip);
    std::cout << "[PASS] Missing archive starts fresh, zero limits skip." << std::endl;
}

void TestAscendingAppend() {
    auto resolver = MakeResolver();
    auto result = resolver.resolve(AscendingArchive(), Options(OrderDirection::Asc), ChannelWithLastPost(5000));
    assert(result.action == CompatibilityAction::Append);
    assert(result.bounds.afterPost == std::optional<std::string>("p3"));

    // Nothing newer than the archive end.
    result = resolver.resolve(AscendingArchive(), Options(OrderDirection::Asc), ChannelWithLastPost(3000));
    assert(result.action == CompatibilityAction::Skip);

    // beforeTime already covered.
    auto options = Options(OrderDirection::Asc);
    options.bounds.beforeTime = 2500;
    assert(resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(5000)).action == CompatibilityAction::Skip);

    // afterPost inside the archived range keeps the archive extendable.
    options = Options(OrderDirection::Asc);
    options.bounds.afterPost = "p-mid";
    result = resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(5000));
    assert(result.action == CompatibilityAction::Append);
    assert(result.bounds.afterPost == std::optional<std::string>("p3"));
    std::cout << "[PASS] Ascending archive continues after its last post." << std::endl;
}

void TestAscendingIncompatible() {
    auto resolver = MakeResolver();

    // Request starts after the archive ends: a hole would appear.
    auto options = Options(OrderDirection::Asc);
    options.bounds.afterPost = "p-new";
    auto result = resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(10000));
    assert(result.action == CompatibilityAction::RebuildWithBackup);

    options.onExistingIncompatible = domain::ArchiveAction::Delete;
    assert(resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithDelete);
    options.onExistingIncompatible = domain::ArchiveAction::Skip;
    assert(resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(10000)).action == CompatibilityAction::Skip);

    // Unknown post id.
    options = Options(OrderDirection::Asc);
    options.bounds.afterPost = "missing";
    assert(resolver.resolve(AscendingArchive(), options, ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithBackup);

    // Request reaches further back than an archive that does not start at the channel start.
    auto header = AscendingArchive();
    header.storage.postIdBeforeFirst = "p-old";
    options = Options(OrderDirection::Asc);
    options.bounds.afterTime = 600;
    assert(resolver.resolve(header, options, ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithBackup);

    // Wrong direction and lost continuity.
    assert(resolver.resolve(AscendingArchive(), Options(OrderDirection::Desc), ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithBackup);
    header = AscendingArchive();
    header.storage.organization = PostOrdering::Ascending;
    assert(resolver.resolve(header, Options(OrderDirection::Asc), ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithBackup);
    std::cout << "[PASS] Ascending archive rebuilds when a gap would appear." << std::endl;
}

void TestDescending() {
    auto resolver = MakeResolver();
    auto result = resolver.resolve(DescendingArchive(), Options(OrderDirection::Desc), ChannelWithLastPost(10000));
    assert(result.action == CompatibilityAction::Append);
    assert(result.bounds.beforePost == std::optional<std::string>("p1"));

    // Already reaches the channel start.
    auto header = DescendingArchive();
    header.storage.postIdAfterLast.reset();
    assert(resolver.resolve(header, Options(OrderDirection::Desc), ChannelWithLastPost(10000)).action ==
           CompatibilityAction::Skip);

    // afterTime already covered.
    auto options = Options(OrderDirection::Desc);
    options.bounds.afterTime = 1500;
    assert(resolver.resolve(DescendingArchive(), options, ChannelWithLastPost(10000)).action == CompatibilityAction::Skip);

    // beforePost older than the archive end.
    options = Options(OrderDirection::Desc);
    options.bounds.beforePost = "p-old";
    assert(resolver.resolve(DescendingArchive(), options, ChannelWithLastPost(10000)).action ==
           CompatibilityAction::RebuildWithBackup);
    std::cout << "[PASS] Descending archive continues before its oldest post." << std::endl;
}

void TestEmptyAndUnusableArchives() {
    auto resolver = MakeResolver();
    domain::ArchiveHeader empty;
    empty.storage.organization = PostOrdering::AscendingContinuous;
    assert(resolver.resolve(empty, Options(OrderDirection::Asc), ChannelWithLastPost(10000)).action ==
           CompatibilityAction::Append);

    auto options = Options(OrderDirection::Asc);
    assert(resolver.resolveUnusable(options, "broken").action == CompatibilityAction::RebuildWithBackup);
    options.onExistingIncompatible = domain::ArchiveAction::Skip;
    assert(resolver.resolveUnusable(options, "broken").action == CompatibilityAction::Skip);
    std::cout << "[PASS] Empty archives append, unusable ones follow onExistingIncompatible." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CompatibilityResolver Test..." << std::endl;
    TestNoArchiveAndZeroLimits();
    TestAscendingAppend();
    TestAscendingIncompatible();
    TestDescending();
    TestEmptyAndUnusableArchives();
    std::cout << "[PASS] CompatibilityResolver Test." << std::endl;
    return 0;
}
