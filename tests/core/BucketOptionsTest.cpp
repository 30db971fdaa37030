#include "rkv/BucketOptions.hpp"
#include <gtest/gtest.h>

using namespace rkv;

TEST(BucketOptionsTest, DefaultsAreValid) {
    BucketOptions opts;
    EXPECT_EQ(opts.table.kind, TableKind::Set);
    EXPECT_EQ(opts.table.access, Access::Public);
    EXPECT_TRUE(opts.table.readConcurrency);
    EXPECT_TRUE(opts.table.writeConcurrency);
    EXPECT_FALSE(validate(opts.table).has_value());
}

TEST(BucketOptionsTest, ValidateRejectsBagKinds) {
    TableOptions t;
    t.kind = TableKind::Bag;
    auto issue = validate(t);
    ASSERT_TRUE(issue.has_value());
    EXPECT_EQ(issue->path, "type");

    t.kind = TableKind::DuplicateBag;
    EXPECT_TRUE(validate(t).has_value());

    t.kind = TableKind::OrderedSet;
    EXPECT_FALSE(validate(t).has_value());
}

TEST(BucketOptionsTest, ValidateRejectsNonPublicAccess) {
    TableOptions t;
    t.access = Access::Protected;
    auto issue = validate(t);
    ASSERT_TRUE(issue.has_value());
    EXPECT_EQ(issue->path, "access");

    t.access = Access::Private;
    EXPECT_TRUE(validate(t).has_value());
}

TEST(BucketOptionsTest, ParseFullObject) {
    auto r = BucketOptions::fromJson(
        R"({"type":"ordered_set","access":"public","shards":4,)"
        R"("read_concurrency":false,"write_concurrency":true})");
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(r->table.kind, TableKind::OrderedSet);
    EXPECT_EQ(r->table.access, Access::Public);
    EXPECT_EQ(r->table.shards, 4u);
    EXPECT_FALSE(r->table.readConcurrency);
    EXPECT_TRUE(r->table.writeConcurrency);
}

TEST(BucketOptionsTest, MissingMembersKeepBase) {
    BucketOptions base;
    base.table.shards = 32;
    auto r = BucketOptions::fromJson("{}", base);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->table.shards, 32u);
    EXPECT_EQ(r->table.kind, TableKind::Set);
}

TEST(BucketOptionsTest, ParseKeepsBagSoValidationCanRejectIt) {
    auto r = BucketOptions::fromJson(R"({"type":"BAG"})");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->table.kind, TableKind::Bag);
    EXPECT_TRUE(validate(r->table).has_value());
}

TEST(BucketOptionsTest, RejectsMalformedJson) {
    auto r = BucketOptions::fromJson("{\"type\":");
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("invalid JSON"), std::string::npos);
}

TEST(BucketOptionsTest, RejectsNonObject) {
    auto r = BucketOptions::fromJson("[1,2]");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().path, "$");
}

TEST(BucketOptionsTest, RejectsUnknownType) {
    auto r = BucketOptions::fromJson(R"({"type":"heap"})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().path, "$.type");
}

TEST(BucketOptionsTest, RejectsBadMemberTypes) {
    EXPECT_EQ(BucketOptions::fromJson(R"({"shards":0})").error().path, "$.shards");
    EXPECT_EQ(BucketOptions::fromJson(R"({"shards":"8"})").error().path, "$.shards");
    EXPECT_EQ(BucketOptions::fromJson(R"({"access":1})").error().path, "$.access");
    EXPECT_EQ(BucketOptions::fromJson(R"({"read_concurrency":"yes"})").error().path, "$.read_concurrency");
}

TEST(BucketOptionsTest, EnumNamesRoundTrip) {
    for (auto k : {TableKind::Set, TableKind::OrderedSet, TableKind::Bag, TableKind::DuplicateBag}) {
        EXPECT_EQ(parseTableKind(toString(k)), k);
    }
    for (auto a : {Access::Public, Access::Protected, Access::Private}) {
        EXPECT_EQ(parseAccess(toString(a)), a);
    }
    EXPECT_FALSE(parseAccess("world").has_value());
}
