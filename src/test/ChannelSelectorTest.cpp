#include <cassert>
#include <iostream>

#include "application/ChannelSelector.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "test/FakeRemote.hpp"

using namespace chatvault;
using application::ChannelJob;
using application::ChannelSelector;
using infrastructure::ConfigLoader;
using json = nlohmann::json;

namespace {

domain::Channel MakeChannel(const std::string& id, const std::string& internalName, domain::ChannelType type) {
    domain::Channel channel;
    channel.id = id;
    channel.internalName = internalName;
    channel.name = internalName;
    channel.type = type;
    return channel;
}

domain::Team MakeTeam(const std::string& id, const std::string& internalName) {
    domain::Team team;
    team.id = id;
    team.internalName = internalName;
    team.name = internalName;
    return team;
}

/** Two teams; direct and group channels are listed under both, as the server does. */
void Populate(test::FakeRemote& remote) {
    using domain::ChannelType;
    remote.teams = {MakeTeam("t1", "core"), MakeTeam("t2", "other")};
    const domain::Channel dmAlice = MakeChannel("c-dm-alice", "u-alice__u-me", ChannelType::Direct);
    const domain::Channel dmBob = MakeChannel("c-dm-bob", "u-bob__u-me", ChannelType::Direct);
    const domain::Channel group = MakeChannel("c-group", "f00d", ChannelType::Group);
    remote.channelsByTeam["t1"] = {
        MakeChannel("c-town", "town-square", ChannelType::Open),
        MakeChannel("c-secret", "secret", ChannelType::Private),
        dmAlice, dmBob, group
    };
    remote.channelsByTeam["t2"] = {
        MakeChannel("c-lobby", "lobby", ChannelType::Open),
        MakeChannel("c-plans", "plans", ChannelType::Private),
        dmAlice, group
    };
    remote.members["c-group"] = {remote.me, test::MakeUser("u-alice", "alice"), test::MakeUser("u-bob", "bob")};
}

const ChannelJob* Find(const std::vector<ChannelJob>& jobs, const std::string& archiveName) {
    for (const auto& job : jobs) {
        if (job.archiveName == archiveName) return &job;
    }
    return nullptr;
}

void TestSelectsEveryKind() {
    test::FakeRemote remote;
    Populate(remote);
    auto config = ConfigLoader::FromJson({
        {"version", "1"},
        {"userChannelOptions", {{"maximumPostCount", 7}}},
        {"users", json::array({{{"name", "alice"}, {"sessionPostLimit", 2}}, {{"name", "nobody"}}})},
        {"groups", json::array({{{"group", json::array({{{"name", "alice"}}, {{"id", "u-bob"}}})},
                                 {"downloadFromOldest", false}}})},
        {"teams", json::array({
            {{"team", {{"internalName", "core"}}},
             {"downloadPrivateChannels", false},
             {"publicChannels", json::array({{{"internalName", "town-square"}, {"maximumPostCount", 3}}})}},
            {{"team", {{"name", "Missing"}}}}
        })}
    });

    ChannelSelector selector(remote, config);
    auto jobs = selector.select(remote.me);

    assert(jobs.size() == 6);
    assert(jobs[0].archiveName == "d.me--alice");
    assert(jobs[1].archiveName == "d.me--bob");
    assert(jobs[2].archiveName == "g.alice-bob-me");
    assert(jobs[3].archiveName == "o.core--town-square");
    assert(jobs[4].archiveName == "o.other--lobby");
    assert(jobs[5].archiveName == "p.other--plans");
    assert(!Find(jobs, "p.core--secret"));

    assert(jobs[0].options.sessionPostLimit == 2);
    assert(jobs[0].options.maximumPostCount == domain::kUnlimited);
    assert(jobs[0].seedUsers.size() == 2);
    assert(!jobs[0].team);
    assert(jobs[1].options.maximumPostCount == 7);
    assert(jobs[2].options.bounds.direction == domain::OrderDirection::Desc);
    assert(jobs[2].seedUsers.size() == 3);
    assert(jobs[3].options.maximumPostCount == 3);
    assert(jobs[3].team && jobs[3].team->id == "t1");
    assert(jobs[4].team && jobs[4].team->id == "t2");
    std::cout << "[PASS] Direct, group and team channels are selected once each." << std::endl;
}

void TestOnlyExplicitEntries() {
    test::FakeRemote remote;
    Populate(remote);
    auto config = ConfigLoader::FromJson({
        {"version", "1"},
        {"downloadUserChannels", false},
        {"downloadGroupChannels", false},
        {"downloadTeamChannels", false},
        {"users", json::array({"u-alice"})},
        {"groups", json::array({{{"group", "c-group"}}})}
    });

    ChannelSelector selector(remote, config);
    auto jobs = selector.select(remote.me);
    assert(jobs.size() == 2);
    assert(jobs[0].archiveName == "d.me--alice");
    assert(jobs[1].archiveName == "g.alice-bob-me");
    std::cout << "[PASS] Disabled categories keep only explicitly listed channels." << std::endl;
}

void TestNoTeams() {
    test::FakeRemote remote;
    auto config = ConfigLoader::FromJson({{"version", "1"}});
    ChannelSelector selector(remote, config);
    assert(selector.select(remote.me).empty());

    // A group without members is named after its channel id.
    Populate(remote);
    remote.members.clear();
    auto jobs = selector.select(remote.me);
    assert(Find(jobs, "g.c-group"));
    std::cout << "[PASS] Missing teams and memberless groups are handled." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChannelSelector Test..." << std::endl;
    TestSelectsEveryKind();
    TestOnlyExplicitEntries();
    TestNoTeams();
    std::cout << "[PASS] ChannelSelector Test." << std::endl;
    return 0;
}
