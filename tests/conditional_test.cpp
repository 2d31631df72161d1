#include <gtest/gtest.h>
#include "cirrus/retrieval/conditional.h"

namespace cirrus::retrieval::test {

namespace {

// Tue, 14 Nov 2023 22:13:20 GMT
constexpr Timestamp kModified = 1700000000;
const std::string kEtag = "5eb63bbbe01eeed093cb22bb8f5acdc3";

metadata::ObjectMeta Meta(uint64_t size = 11) {
    metadata::ObjectMeta meta;
    meta.bucket = "test-bucket";
    meta.key = "test-object.txt";
    meta.size = size;
    meta.etag = kEtag;
    meta.last_modified = kModified;
    return meta;
}

Decision Eval(std::initializer_list<std::pair<const std::string, std::string>> headers,
              uint64_t size = 11) {
    return EvaluateRequest(Meta(size), HeaderMap(headers));
}

} // namespace

// ================================
// 日期
// ================================

TEST(HttpDateTest, FormatsImfFixdate) {
    EXPECT_EQ(FormatHttpDate(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(FormatHttpDate(kModified), "Tue, 14 Nov 2023 22:13:20 GMT");
}

TEST(HttpDateTest, ParsesAllForms) {
    EXPECT_EQ(ParseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT"), Timestamp{784111777});
    EXPECT_EQ(ParseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT"), Timestamp{784111777});
    EXPECT_EQ(ParseHttpDate("Sun Nov  6 08:49:37 1994"), Timestamp{784111777});
    EXPECT_EQ(ParseHttpDate("1994-11-06T08:49:37Z"), Timestamp{784111777});
    EXPECT_FALSE(ParseHttpDate("yesterday").has_value());
    EXPECT_FALSE(ParseHttpDate("").has_value());
}

// ================================
// ETags
// ================================

TEST(EtagTest, WeakComparison) {
    EXPECT_TRUE(EtagListMatches("\"" + kEtag + "\"", kEtag));
    EXPECT_TRUE(EtagListMatches("W/\"" + kEtag + "\"", kEtag));
    EXPECT_TRUE(EtagListMatches(kEtag, kEtag));
    EXPECT_TRUE(EtagListMatches("\"other\", \"" + kEtag + "\"", kEtag));
    EXPECT_TRUE(EtagListMatches("*", kEtag));
    EXPECT_FALSE(EtagListMatches("\"other\"", kEtag));
    EXPECT_FALSE(EtagListMatches("", kEtag));
}

// ================================
// Range
// ================================

TEST(RangeTest, ClosedRange) {
    auto r = ResolveRange("bytes=0-4", 11);
    EXPECT_EQ(r.kind, RangeResolution::Kind::kPartial);
    EXPECT_EQ(r.first, 0u);
    EXPECT_EQ(r.last, 4u);
}

TEST(RangeTest, EndIsClamped) {
    auto r = ResolveRange("bytes=6-100", 11);
    EXPECT_EQ(r.kind, RangeResolution::Kind::kPartial);
    EXPECT_EQ(r.first, 6u);
    EXPECT_EQ(r.last, 10u);
}

TEST(RangeTest, OpenEnded) {
    auto r = ResolveRange("bytes=6-", 11);
    EXPECT_EQ(r.kind, RangeResolution::Kind::kPartial);
    EXPECT_EQ(r.first, 6u);
    EXPECT_EQ(r.last, 10u);
}

TEST(RangeTest, Suffix) {
    auto r = ResolveRange("bytes=-5", 11);
    EXPECT_EQ(r.kind, RangeResolution::Kind::kPartial);
    EXPECT_EQ(r.first, 6u);
    EXPECT_EQ(r.last, 10u);

    // 超过对象长度: 返回整个对象
    r = ResolveRange("bytes=-50", 11);
    EXPECT_EQ(r.kind, RangeResolution::Kind::kPartial);
    EXPECT_EQ(r.first, 0u);
    EXPECT_EQ(r.last, 10u);
}

TEST(RangeTest, Unsatisfiable) {
    EXPECT_EQ(ResolveRange("bytes=11-", 11).kind, RangeResolution::Kind::kUnsatisfiable);
    EXPECT_EQ(ResolveRange("bytes=20-30", 11).kind, RangeResolution::Kind::kUnsatisfiable);
    EXPECT_EQ(ResolveRange("bytes=-0", 11).kind, RangeResolution::Kind::kUnsatisfiable);
    EXPECT_EQ(ResolveRange("bytes=0-", 0).kind, RangeResolution::Kind::kUnsatisfiable);
}

TEST(RangeTest, InvalidIsIgnored) {
    for (const char* header : {"bytes=5-2", "items=0-4", "bytes=abc", "bytes=0-1,4-5",
                               "bytes=", "0-4", "bytes=-", "bytes=99999999999999999999-"}) {
        EXPECT_EQ(ResolveRange(header, 11).kind, RangeResolution::Kind::kWhole) << header;
    }
}

// ================================
// EvaluateRequest
// ================================

TEST(EvaluateRequestTest, NoHeadersIsFullContent) {
    EXPECT_TRUE(std::holds_alternative<FullContent>(Eval({})));
}

TEST(EvaluateRequestTest, IfNoneMatchCurrentEtagIsNotModified) {
    EXPECT_TRUE(std::holds_alternative<NotModified>(Eval({{"If-None-Match", "\"" + kEtag + "\""}})));
    EXPECT_TRUE(std::holds_alternative<FullContent>(Eval({{"If-None-Match", "\"stale\""}})));
}

TEST(EvaluateRequestTest, IfMatchStaleEtagFails) {
    auto d = Eval({{"If-Match", "\"stale\""}});
    ASSERT_TRUE(std::holds_alternative<PreconditionFailed>(d));
    EXPECT_EQ(std::get<PreconditionFailed>(d).condition, "If-Match");
    EXPECT_TRUE(std::holds_alternative<FullContent>(Eval({{"If-Match", "\"" + kEtag + "\""}})));
}

TEST(EvaluateRequestTest, IfMatchOverridesIfUnmodifiedSince) {
    // If-Match 匹配时忽略 If-Unmodified-Since
    auto d = Eval({{"If-Match", "*"},
                   {"If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:37 GMT"}});
    EXPECT_TRUE(std::holds_alternative<FullContent>(d));

    d = Eval({{"If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:37 GMT"}});
    ASSERT_TRUE(std::holds_alternative<PreconditionFailed>(d));
    EXPECT_EQ(std::get<PreconditionFailed>(d).condition, "If-Unmodified-Since");

    EXPECT_TRUE(std::holds_alternative<FullContent>(
        Eval({{"If-Unmodified-Since", FormatHttpDate(kModified)}})));
}

TEST(EvaluateRequestTest, IfModifiedSince) {
    EXPECT_TRUE(std::holds_alternative<NotModified>(
        Eval({{"If-Modified-Since", FormatHttpDate(kModified)}})));
    EXPECT_TRUE(std::holds_alternative<FullContent>(
        Eval({{"If-Modified-Since", FormatHttpDate(kModified - 1)}})));
    EXPECT_TRUE(std::holds_alternative<FullContent>(
        Eval({{"If-Modified-Since", "not a date"}})));
}

TEST(EvaluateRequestTest, NonMatchingIfNoneMatchIgnoresIfModifiedSince) {
    auto d = Eval({{"If-None-Match", "\"stale\""},
                   {"If-Modified-Since", FormatHttpDate(kModified + 100)}});
    EXPECT_TRUE(std::holds_alternative<FullContent>(d));
}

TEST(EvaluateRequestTest, PreconditionFailureBeatsNotModified) {
    auto d = Eval({{"If-Match", "\"stale\""}, {"If-None-Match", "\"" + kEtag + "\""}});
    EXPECT_TRUE(std::holds_alternative<PreconditionFailed>(d));
}

TEST(EvaluateRequestTest, ConditionalsBeforeRange) {
    auto d = Eval({{"If-None-Match", "\"" + kEtag + "\""}, {"Range", "bytes=50-"}});
    EXPECT_TRUE(std::holds_alternative<NotModified>(d));
}

TEST(EvaluateRequestTest, RangeOutcomes) {
    auto d = Eval({{"Range", "bytes=0-4"}});
    ASSERT_TRUE(std::holds_alternative<PartialContent>(d));
    EXPECT_EQ(std::get<PartialContent>(d).first, 0u);
    EXPECT_EQ(std::get<PartialContent>(d).last, 4u);

    d = Eval({{"range", "bytes=11-"}});
    ASSERT_TRUE(std::holds_alternative<RangeNotSatisfiable>(d));
    EXPECT_EQ(std::get<RangeNotSatisfiable>(d).total, 11u);

    EXPECT_TRUE(std::holds_alternative<FullContent>(Eval({{"Range", "bytes=0-1,3-4"}})));
}

} // namespace cirrus::retrieval::test
