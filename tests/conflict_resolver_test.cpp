#include <gtest/gtest.h>
#include "conflict_resolver.hpp"

namespace {

std::expected<ProbeResult, std::string> found(bool usernameFound, const std::string& records) {
    return ProbeResult{usernameFound, records};
}

} // namespace

TEST(ConflictResolverTest, SameOwnerAllowsOverwrite) {
    EXPECT_EQ(resolveConflict(found(true, "user1: example.com"), "user1"), ConflictOutcome::OverwriteAllowed);
}

TEST(ConflictResolverTest, DifferentOwnerIsUsernameConflict) {
    EXPECT_EQ(resolveConflict(found(true, "user2: example.com"), "user1"), ConflictOutcome::UsernameConflict);
}

TEST(ConflictResolverTest, DomainOnlyIsDomainConflict) {
    EXPECT_EQ(resolveConflict(found(false, "user2: example.com"), "user1"), ConflictOutcome::DomainConflict);
}

TEST(ConflictResolverTest, DomainOnlyIsDomainConflictEvenWhenRecordNamesUser) {
    EXPECT_EQ(resolveConflict(found(false, "user1: example.com"), "user1"), ConflictOutcome::DomainConflict);
}

TEST(ConflictResolverTest, NothingFoundIsNoConflict) {
    EXPECT_EQ(resolveConflict(found(false, ""), "user1"), ConflictOutcome::NoConflict);
}

TEST(ConflictResolverTest, UsernameWithoutDomainIsNoConflict) {
    EXPECT_EQ(resolveConflict(found(true, ""), "user1"), ConflictOutcome::NoConflict);
}

TEST(ConflictResolverTest, FailedProbeIsConnectionError) {
    std::expected<ProbeResult, std::string> failed = std::unexpected("connection refused");
    EXPECT_EQ(resolveConflict(failed, "user1"), ConflictOutcome::ConnectionError);
}

TEST(ConflictResolverTest, SubstringModeMatchesIncidentalOverlap) {
    // "user1" is contained in "user10", so the text test treats the record as owned.
    EXPECT_EQ(resolveConflict(found(true, "/var/cpanel/users/user10:DNS=example.com"), "user1"),
              ConflictOutcome::OverwriteAllowed);
}

TEST(ConflictResolverTest, ExactModeComparesRecordOwner) {
    auto probe = found(true, "/var/cpanel/users/user10:DNS=example.com");
    EXPECT_EQ(resolveConflict(probe, "user1", ConflictMatchMode::Exact), ConflictOutcome::UsernameConflict);
    EXPECT_EQ(resolveConflict(probe, "user10", ConflictMatchMode::Exact), ConflictOutcome::OverwriteAllowed);
}

TEST(ConflictResolverTest, ExactModeAcceptsAnyMatchingLine) {
    auto probe = found(true, "/var/cpanel/users/other:DNS=example.com\n/var/cpanel/users/user1:DNS1=example.com");
    EXPECT_EQ(resolveConflict(probe, "user1", ConflictMatchMode::Exact), ConflictOutcome::OverwriteAllowed);
}

TEST(ConflictResolverTest, ExactModeReadsBareOwnerPrefix) {
    EXPECT_EQ(resolveConflict(found(true, "user1: example.com"), "user1", ConflictMatchMode::Exact),
              ConflictOutcome::OverwriteAllowed);
    EXPECT_FALSE(recordOwnedBy("no separator here", "user1", ConflictMatchMode::Exact));
}

TEST(ConflictResolverTest, OnlyNoConflictOrConsentedOverwriteAllowTransfer) {
    EXPECT_TRUE(allowsTransfer(ConflictOutcome::NoConflict, false));
    EXPECT_TRUE(allowsTransfer(ConflictOutcome::OverwriteAllowed, true));
    EXPECT_FALSE(allowsTransfer(ConflictOutcome::OverwriteAllowed, false));
    EXPECT_FALSE(allowsTransfer(ConflictOutcome::UsernameConflict, true));
    EXPECT_FALSE(allowsTransfer(ConflictOutcome::DomainConflict, true));
    EXPECT_FALSE(allowsTransfer(ConflictOutcome::ConnectionError, true));
}
