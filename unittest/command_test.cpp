// ============================================================================
// METADATA COMMAND UNIT TESTS
// ============================================================================
// Binary encoding of consensus log payloads and their classification
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/consensus/command.hpp>
#include <stdexcept>

using namespace VectorCluster;

TEST(CommandTest, CreateCollectionKeepsDistribution) {
    CreateCollection create;
    create.name = "vectors";
    create.shard_count = 2;
    create.replication_factor = 2;
    create.write_consistency_factor = 1;
    create.distribution = {{0, {1, 2}}, {1, {2, 3}}};

    MetadataCommand decoded = decodeCommand(encodeCommand(create));
    ASSERT_TRUE(std::holds_alternative<CreateCollection>(decoded));
    const auto& c = std::get<CreateCollection>(decoded);
    EXPECT_EQ(c.name, "vectors");
    EXPECT_EQ(c.shard_count, 2u);
    EXPECT_EQ(c.replication_factor, 2u);
    EXPECT_EQ(c.distribution, create.distribution);
}

TEST(CommandTest, UpdateCollectionKeepsUnsetFields) {
    UpdateCollection update;
    update.name = "vectors";
    update.write_consistency_factor = 2;
    update.remove_replicas = {{0, 3}};

    MetadataCommand decoded = decodeCommand(encodeCommand(update));
    const auto& u = std::get<UpdateCollection>(decoded);
    EXPECT_FALSE(u.replication_factor.has_value());
    EXPECT_EQ(u.write_consistency_factor, std::optional<uint32_t>(2));
    ASSERT_EQ(u.remove_replicas.size(), 1u);
    EXPECT_EQ(u.remove_replicas[0].second, 3u);
}

TEST(CommandTest, SplitTransferKeepsParent) {
    ShardTransfer transfer;
    transfer.collection = "vectors";
    transfer.shard_id = 4;
    transfer.from = 2;
    transfer.to = 2;
    transfer.split_from = 1;

    AbortTransfer abort{transfer, "source gone"};
    MetadataCommand decoded = decodeCommand(encodeCommand(abort));
    const auto& a = std::get<AbortTransfer>(decoded);
    EXPECT_TRUE(a.transfer.sameKey(transfer));
    EXPECT_EQ(a.transfer.split_from, std::optional<ShardId>(1));
    EXPECT_EQ(a.reason, "source gone");
    EXPECT_EQ(transfer.toString(), "vectors/4 2->2 (split of 1)");
}

TEST(CommandTest, AliasActionsKeepOrder) {
    ChangeAliases change;
    change.actions.push_back({AliasAction::Kind::CREATE, "vectors", "v", ""});
    change.actions.push_back({AliasAction::Kind::RENAME, "", "v", "w"});

    MetadataCommand decoded = decodeCommand(encodeCommand(change));
    const auto& c = std::get<ChangeAliases>(decoded);
    ASSERT_EQ(c.actions.size(), 2u);
    EXPECT_EQ(c.actions[0].kind, AliasAction::Kind::CREATE);
    EXPECT_EQ(c.actions[1].new_alias, "w");
}

TEST(CommandTest, MembershipClassification) {
    EXPECT_TRUE(isMembershipCommand(MetadataCommand{AddPeer{2, "127.0.0.1:7102", PeerRole::LEARNER}}));
    EXPECT_TRUE(isMembershipCommand(encodeCommand(RemovePeer{2, false})));
    EXPECT_TRUE(isMembershipCommand(encodeCommand(PromotePeer{2})));
    EXPECT_FALSE(isMembershipCommand(encodeCommand(Nop{1})));
    EXPECT_FALSE(isMembershipCommand(std::vector<uint8_t>{}));
}

TEST(CommandTest, Names) {
    EXPECT_STREQ(commandName(SplitShard{"vectors", 0, 1}), "SplitShard");
    EXPECT_STREQ(commandName(Nop{}), "Nop");
}

// ============================================================================
// MALFORMED INPUT
// ============================================================================

TEST(CommandTest, RejectsUnknownTag) {
    EXPECT_THROW(decodeCommand({0xEE}), std::runtime_error);
}

TEST(CommandTest, RejectsTrailingBytes) {
    auto data = encodeCommand(Nop{5});
    data.push_back(0);
    EXPECT_THROW(decodeCommand(data), std::runtime_error);
}

TEST(CommandTest, RejectsTruncatedPayload) {
    auto data = encodeCommand(DeleteCollection{"vectors"});
    data.pop_back();
    EXPECT_THROW(decodeCommand(data), std::runtime_error);
}
