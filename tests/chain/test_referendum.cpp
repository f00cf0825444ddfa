// REFINDEX - ReferendumInfo Decoder Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/chain/referendum.h"
#include "refindex/core/serialize.h"
#include "refindex/crypto/blake2b.h"

#include "common/payloads.h"

using namespace refindex;
using namespace refindex::chain;
using namespace refindex::test;

// ============================================================================
// Ongoing
// ============================================================================

TEST(ReferendumDecodeTest, OngoingFull) {
    OngoingFields fields;
    fields.track = 33;
    fields.origin = {22, 11};                       // Origins::MediumSpender
    fields.enactmentKind = 0;
    fields.enactmentBlock = 5000;
    fields.submitted = 1200;
    fields.submitter = AliceAccount();
    fields.decisionDeposit = std::make_pair(MakeAccount(0x22), U128(20000000000));
    fields.deciding = std::make_pair(1300u, std::optional<uint32_t>(1400u));
    fields.ayes = 300;
    fields.nays = 100;
    fields.support = 250;
    fields.inQueue = true;
    fields.alarm = 2000;

    ReferendumInfo info = DecodeReferendumInfo(7, EncodeOngoing(fields));

    EXPECT_TRUE(info.complete);
    EXPECT_TRUE(info.stoppedAt.empty());
    EXPECT_EQ(info.id, 7u);
    EXPECT_EQ(info.variant, ReferendumVariant::Ongoing);
    EXPECT_EQ(info.track, std::optional<uint16_t>(33));
    EXPECT_EQ(info.origin, std::optional<std::string>("MediumSpender"));
    ASSERT_TRUE(info.proposal.has_value());
    EXPECT_EQ(info.proposal->kind, Proposal::Kind::Lookup);
    EXPECT_EQ(info.proposal->len, 42u);
    EXPECT_EQ(info.proposal->hash, MakeAccount(0xab));
    EXPECT_EQ(info.enactment, std::optional<std::string>("At(5000)"));
    EXPECT_EQ(info.submitted, std::optional<BlockNumber>(1200));

    ASSERT_TRUE(info.submissionDeposit.has_value());
    EXPECT_EQ(info.submissionDeposit->who, AliceAccount());
    EXPECT_TRUE(info.submissionDeposit->amount == U128(10000000000));
    ASSERT_TRUE(info.decisionDeposit.has_value());
    EXPECT_EQ(info.decisionDeposit->who, MakeAccount(0x22));

    ASSERT_TRUE(info.deciding.has_value());
    EXPECT_EQ(info.deciding->since, 1300u);
    EXPECT_EQ(info.deciding->confirming, std::optional<BlockNumber>(1400));

    ASSERT_TRUE(info.tally.has_value());
    EXPECT_EQ(U128ToString(info.tally->ayes), "300");
    EXPECT_EQ(U128ToString(info.tally->nays), "100");
    EXPECT_EQ(U128ToString(info.tally->support), "250");
    EXPECT_EQ(info.inQueue, std::optional<bool>(true));
    EXPECT_EQ(info.alarm, std::optional<BlockNumber>(2000));
    EXPECT_FALSE(info.since.has_value());
}

TEST(ReferendumDecodeTest, OngoingMinimal) {
    ReferendumInfo info = DecodeReferendumInfo(1, EncodeOngoing(OngoingFields()));
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.origin, std::optional<std::string>("Root"));
    EXPECT_EQ(info.enactment, std::optional<std::string>("After(100)"));
    EXPECT_FALSE(info.decisionDeposit.has_value());
    EXPECT_FALSE(info.deciding.has_value());
    EXPECT_FALSE(info.alarm.has_value());
    EXPECT_EQ(info.inQueue, std::optional<bool>(false));
}

TEST(ReferendumDecodeTest, SignedOriginSkipsAccount) {
    OngoingFields fields;
    fields.origin = {0, 1};
    fields.origin.insert(fields.origin.end(), 32, 0x77);
    ReferendumInfo info = DecodeReferendumInfo(1, EncodeOngoing(fields));
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.origin, std::optional<std::string>("Signed"));
}

TEST(ReferendumDecodeTest, InlineProposalIsHashed) {
    Bytes call = {0x00, 0x01, 0x02, 0x03};
    DataStream s;
    ser_writedata8(s, 1);
    Serialize(s, call);

    OngoingFields fields;
    fields.proposal = s.Data();
    ReferendumInfo info = DecodeReferendumInfo(3, EncodeOngoing(fields));

    ASSERT_TRUE(info.complete);
    ASSERT_TRUE(info.proposal.has_value());
    EXPECT_EQ(info.proposal->kind, Proposal::Kind::Inline);
    EXPECT_EQ(info.proposal->hash, Blake2b256(call));
    EXPECT_EQ(info.proposal->len, 4u);
}

TEST(ReferendumDecodeTest, ConfiguredOriginsPallet) {
    OngoingFields fields;
    fields.origin = {43, 1};
    DecodeOptions options;
    options.originsPalletIndex = 43;

    ReferendumInfo info = DecodeReferendumInfo(1, EncodeOngoing(fields), options);
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.origin, std::optional<std::string>("Treasurer"));
}

// ============================================================================
// Partial Payloads
// ============================================================================

TEST(ReferendumDecodeTest, UnknownOriginPalletKeepsLeadingFields) {
    OngoingFields fields;
    fields.track = 11;
    fields.origin = {99, 0};

    ReferendumInfo info = DecodeReferendumInfo(9, EncodeOngoing(fields));
    EXPECT_FALSE(info.complete);
    EXPECT_EQ(info.stoppedAt, "origin");
    EXPECT_EQ(info.track, std::optional<uint16_t>(11));
    EXPECT_FALSE(info.origin.has_value());
    EXPECT_FALSE(info.submitted.has_value());
    EXPECT_FALSE(info.tally.has_value());
}

TEST(ReferendumDecodeTest, TruncatedPayloadStopsAtField) {
    Bytes raw = EncodeOngoing(OngoingFields());
    // variant + track + origin + lookup proposal + enactment + submitted
    size_t upToSubmitted = 1 + 2 + 2 + 37 + 5 + 4;
    raw.resize(upToSubmitted + 10);

    ReferendumInfo info = DecodeReferendumInfo(2, raw);
    EXPECT_FALSE(info.complete);
    EXPECT_EQ(info.stoppedAt, "submission_deposit");
    EXPECT_EQ(info.submitted, std::optional<BlockNumber>(1000));
    EXPECT_FALSE(info.submissionDeposit.has_value());
}

TEST(ReferendumDecodeTest, EmptyPayloadThrows) {
    EXPECT_THROW(DecodeReferendumInfo(1, Bytes()), DecodeError);
}

TEST(ReferendumDecodeTest, UnknownVariantThrows) {
    EXPECT_THROW(DecodeReferendumInfo(1, Bytes{6, 0, 0, 0, 0}), DecodeError);
}

// ============================================================================
// Terminal Variants
// ============================================================================

TEST(ReferendumDecodeTest, Approved) {
    ReferendumInfo info = DecodeReferendumInfo(
        4, EncodeTerminal(ReferendumVariant::Approved, 8000,
                          std::make_pair(AliceAccount(), U128(5)),
                          std::make_pair(MakeAccount(0x22), U128(6))));
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.variant, ReferendumVariant::Approved);
    EXPECT_EQ(info.since, std::optional<BlockNumber>(8000));
    ASSERT_TRUE(info.submissionDeposit.has_value());
    EXPECT_EQ(info.submissionDeposit->who, AliceAccount());
    ASSERT_TRUE(info.decisionDeposit.has_value());
    EXPECT_TRUE(info.decisionDeposit->amount == U128(6));
    EXPECT_FALSE(info.tally.has_value());
    EXPECT_FALSE(info.track.has_value());
}

TEST(ReferendumDecodeTest, RejectedWithRefundedDeposits) {
    ReferendumInfo info = DecodeReferendumInfo(
        5, EncodeTerminal(ReferendumVariant::Rejected, 9000, std::nullopt, std::nullopt));
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.variant, ReferendumVariant::Rejected);
    EXPECT_FALSE(info.submissionDeposit.has_value());
    EXPECT_FALSE(info.decisionDeposit.has_value());
}

TEST(ReferendumDecodeTest, KilledCarriesOnlySince) {
    ReferendumInfo info = DecodeReferendumInfo(6, EncodeKilled(123));
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.variant, ReferendumVariant::Killed);
    EXPECT_EQ(info.since, std::optional<BlockNumber>(123));
}

TEST(ReferendumDecodeTest, TerminalWithoutSince) {
    Bytes raw = {static_cast<Byte>(ReferendumVariant::TimedOut)};
    ReferendumInfo info = DecodeReferendumInfo(6, raw);
    EXPECT_FALSE(info.complete);
    EXPECT_EQ(info.stoppedAt, "since");
    EXPECT_EQ(info.variant, ReferendumVariant::TimedOut);
}

// ============================================================================
// ReferendumCount and Names
// ============================================================================

TEST(ReferendumDecodeTest, Count) {
    EXPECT_EQ(DecodeReferendumCount(EncodeCount(1523)), 1523u);
    EXPECT_THROW(DecodeReferendumCount(Bytes{1, 2, 3}), DecodeError);
}

TEST(ReferendumNamesTest, TracksAndOrigins) {
    EXPECT_EQ(TrackName(0), "Root");
    EXPECT_EQ(TrackName(33), "MediumSpender");
    EXPECT_EQ(TrackName(777), "Track<777>");
    EXPECT_EQ(OriginsVariantName(0), "StakingAdmin");
    EXPECT_EQ(OriginsVariantName(200), "Origin(200)");
    EXPECT_STREQ(VariantName(ReferendumVariant::TimedOut), "TimedOut");
}
