#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <vector>
#include "cirrus/common/digest.h"
#include "cirrus/retrieval/retrieval_engine.h"

namespace cirrus::retrieval::test {

namespace {

Result<std::string> Drain(storage::ByteStream& stream, size_t chunk = 4) {
    std::string out;
    while (true) {
        auto part = stream.Read(chunk);
        if (part.hasError()) return part;
        if (part.value().empty()) return out;
        out += part.value();
    }
}

// 固定分块，用于驱动 VerifyingStream
class ScriptedStream : public storage::ByteStream {
public:
    explicit ScriptedStream(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

    Result<std::string> Read(size_t) override {
        if (next_ >= chunks_.size()) return std::string();
        return chunks_[next_++];
    }
    uint64_t Remaining() const override { return 0; }

private:
    std::vector<std::string> chunks_;
    size_t next_ = 0;
};

// 某位置第一次调用 Size() 时执行钩子
class HookedStore : public storage::ObjectStore {
public:
    explicit HookedStore(std::shared_ptr<storage::MemoryObjectStore> inner)
        : inner_(std::move(inner)) {}

    void OnFirstSize(StorageLocation location, std::function<void()> hook) {
        trigger_ = std::move(location);
        hook_ = std::move(hook);
    }

    Result<StorageLocation> Write(const std::string& data) override { return inner_->Write(data); }
    Result<uint64_t> Size(const StorageLocation& location) override {
        if (hook_ && location == trigger_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
        return inner_->Size(location);
    }
    Result<std::unique_ptr<storage::ByteStream>> Read(const StorageLocation& location,
                                                      const ByteRange& range) override {
        return inner_->Read(location, range);
    }
    Result<Void> Remove(const StorageLocation& location) override {
        return inner_->Remove(location);
    }

private:
    std::shared_ptr<storage::MemoryObjectStore> inner_;
    StorageLocation trigger_;
    std::function<void()> hook_;
};

} // namespace

class RetrievalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = std::make_shared<metadata::MetadataIndex>(
            std::make_unique<metadata::MemoryMetadataBackend>());
        store_ = std::make_shared<storage::MemoryObjectStore>();
        hooked_ = std::make_shared<HookedStore>(store_);
        engine_ = std::make_unique<RetrievalEngine>(index_, hooked_);
        ASSERT_TRUE(index_->CreateBucket("test-bucket").hasValue());
    }

    // PUT: 写 blob，切换索引指针，再回收旧 blob
    metadata::ObjectMeta Put(const std::string& key, const std::string& data) {
        auto loc = store_->Write(data);
        EXPECT_TRUE(loc.hasValue());
        metadata::ObjectMeta meta;
        meta.bucket = "test-bucket";
        meta.key = key;
        meta.size = data.size();
        meta.etag = Md5Hex(data);
        meta.content_type = "text/plain";
        meta.last_modified = NowInSeconds();
        meta.location = loc.value();
        auto committed = index_->Commit(meta);
        EXPECT_TRUE(committed.hasValue());
        if (committed.value().orphaned) {
            EXPECT_TRUE(store_->Remove(*committed.value().orphaned).hasValue());
        }
        return committed.value().meta;
    }

    GetObjectRequest Request(const std::string& key, HeaderMap headers = {}) {
        GetObjectRequest req;
        req.bucket = "test-bucket";
        req.key = key;
        req.headers = std::move(headers);
        return req;
    }

    std::shared_ptr<metadata::MetadataIndex> index_;
    std::shared_ptr<storage::MemoryObjectStore> store_;
    std::shared_ptr<HookedStore> hooked_;
    std::unique_ptr<RetrievalEngine> engine_;
};

// ================================
// 基本读取
// ================================

TEST_F(RetrievalEngineTest, GetWholeObject) {
    Put("test-object.txt", "hello world");

    auto resp = engine_->Get(Request("test-object.txt"));
    ASSERT_TRUE(resp.hasValue()) << resp.error().ToString();
    EXPECT_TRUE(std::holds_alternative<FullContent>(resp.value().decision));
    EXPECT_EQ(resp.value().range.first, 0u);
    EXPECT_EQ(resp.value().range.length, 11u);
    EXPECT_EQ(resp.value().meta.etag, Md5Hex("hello world"));
    ASSERT_NE(resp.value().body, nullptr);

    auto body = Drain(*resp.value().body);
    ASSERT_TRUE(body.hasValue()) << body.error().ToString();
    EXPECT_EQ(body.value(), "hello world");
    EXPECT_EQ(Md5Hex(body.value()), resp.value().meta.etag);
}

TEST_F(RetrievalEngineTest, GetRange) {
    Put("test-object.txt", "hello world");

    auto resp = engine_->Get(Request("test-object.txt", {{"Range", "bytes=0-4"}}));
    ASSERT_TRUE(resp.hasValue());
    auto* partial = std::get_if<PartialContent>(&resp.value().decision);
    ASSERT_NE(partial, nullptr);
    EXPECT_EQ(partial->first, 0u);
    EXPECT_EQ(partial->last, 4u);
    EXPECT_EQ(resp.value().range.length, 5u);
    EXPECT_EQ(Drain(*resp.value().body).value(), "hello");
}

TEST_F(RetrievalEngineTest, SuffixRangeReturnsSlice) {
    std::string data = "0123456789abcdefghij";
    Put("obj", data);
    for (uint64_t n : {1u, 5u, 20u, 50u}) {
        auto resp = engine_->Get(Request("obj", {{"Range", "bytes=-" + std::to_string(n)}}));
        ASSERT_TRUE(resp.hasValue());
        uint64_t want = std::min<uint64_t>(n, data.size());
        EXPECT_EQ(Drain(*resp.value().body).value(), data.substr(data.size() - want)) << n;
    }
}

TEST_F(RetrievalEngineTest, MissingKeyAndBucket) {
    EXPECT_EQ(engine_->Get(Request("nope")).code(), ErrorCode::kNoSuchKey);
    auto req = Request("k");
    req.bucket = "no-bucket";
    EXPECT_EQ(engine_->Get(req).code(), ErrorCode::kNoSuchBucket);
}

// ================================
// 条件请求
// ================================

TEST_F(RetrievalEngineTest, NotModifiedHasNoBody) {
    auto meta = Put("k", "hello world");
    auto resp = engine_->Get(Request("k", {{"If-None-Match", "\"" + meta.etag + "\""}}));
    ASSERT_TRUE(resp.hasValue());
    EXPECT_TRUE(std::holds_alternative<NotModified>(resp.value().decision));
    EXPECT_EQ(resp.value().body, nullptr);
    EXPECT_EQ(resp.value().meta.etag, meta.etag);
}

TEST_F(RetrievalEngineTest, StaleIfMatchFails) {
    Put("k", "hello world");
    auto resp = engine_->Get(Request("k", {{"If-Match", "\"0123\""}}));
    ASSERT_TRUE(resp.hasValue());
    EXPECT_TRUE(std::holds_alternative<PreconditionFailed>(resp.value().decision));
    EXPECT_EQ(resp.value().body, nullptr);
}

TEST_F(RetrievalEngineTest, RangeBeyondEnd) {
    Put("k", "hello world");
    auto resp = engine_->Get(Request("k", {{"Range", "bytes=11-"}}));
    ASSERT_TRUE(resp.hasValue());
    auto* r = std::get_if<RangeNotSatisfiable>(&resp.value().decision);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->total, 11u);
    EXPECT_EQ(resp.value().body, nullptr);
}

TEST_F(RetrievalEngineTest, HeadOpensNoBody) {
    Put("k", "hello world");
    auto req = Request("k");
    req.head_only = true;
    auto resp = engine_->Get(req);
    ASSERT_TRUE(resp.hasValue());
    EXPECT_TRUE(std::holds_alternative<FullContent>(resp.value().decision));
    EXPECT_EQ(resp.value().range.length, 11u);
    EXPECT_EQ(resp.value().body, nullptr);
}

// ================================
// 完整性校验
// ================================

TEST_F(RetrievalEngineTest, CorruptContentFailsBeforeLastChunk) {
    auto meta = Put("k", "hello world");
    store_->OverwriteForTesting(meta.location, "hellO world");

    auto resp = engine_->Get(Request("k"));
    ASSERT_TRUE(resp.hasValue());
    auto& body = *resp.value().body;

    std::string delivered;
    Result<std::string> part = std::string();
    while (true) {
        part = body.Read(4);
        if (part.hasError() || part.value().empty()) break;
        delivered += part.value();
    }
    EXPECT_EQ(part.code(), ErrorCode::kIntegrityError);
    EXPECT_LT(delivered.size(), 11u);
    // 出错后流保持失败状态
    EXPECT_EQ(body.Read(4).code(), ErrorCode::kIntegrityError);
}

TEST_F(RetrievalEngineTest, SizeMismatchIsIntegrityError) {
    auto meta = Put("k", "hello world");
    store_->OverwriteForTesting(meta.location, "hello");
    EXPECT_EQ(engine_->Get(Request("k")).code(), ErrorCode::kIntegrityError);
}

TEST_F(RetrievalEngineTest, MissingBlobIsIntegrityError) {
    auto meta = Put("k", "hello world");
    ASSERT_TRUE(store_->Remove(meta.location).hasValue());
    EXPECT_EQ(engine_->Get(Request("k")).code(), ErrorCode::kIntegrityError);
}

TEST_F(RetrievalEngineTest, NonMd5EtagSkipsDigestCheck) {
    auto loc = store_->Write("abc");
    ASSERT_TRUE(loc.hasValue());
    metadata::ObjectMeta meta;
    meta.bucket = "test-bucket";
    meta.key = "multipart";
    meta.size = 3;
    meta.etag = "d41d8cd98f00b204e9800998ecf8427e-2";
    meta.location = loc.value();
    ASSERT_TRUE(index_->Commit(meta).hasValue());

    auto resp = engine_->Get(Request("multipart"));
    ASSERT_TRUE(resp.hasValue());
    EXPECT_EQ(Drain(*resp.value().body).value(), "abc");
    EXPECT_FALSE(RetrievalEngine::IsMd5Etag(meta.etag));
    EXPECT_TRUE(RetrievalEngine::IsMd5Etag(Md5Hex("abc")));
}

TEST(VerifyingStreamTest, ShortAndLongStreams) {
    VerifyingStream shorter(std::make_unique<ScriptedStream>(std::vector<std::string>{"ab"}),
                            4, "", "short");
    EXPECT_EQ(shorter.Read(10).value(), "ab");
    EXPECT_EQ(shorter.Read(10).code(), ErrorCode::kIntegrityError);

    VerifyingStream longer(std::make_unique<ScriptedStream>(std::vector<std::string>{"abcdef"}),
                           4, "", "long");
    EXPECT_EQ(longer.Read(10).code(), ErrorCode::kIntegrityError);

    VerifyingStream exact(std::make_unique<ScriptedStream>(std::vector<std::string>{"ab", "cd"}),
                          4, Md5Hex("abcd"), "exact");
    EXPECT_EQ(exact.Read(2).value(), "ab");
    EXPECT_EQ(exact.Remaining(), 2u);
    EXPECT_EQ(exact.Read(2).value(), "cd");
    EXPECT_EQ(exact.Read(2).value(), "");
}

// ================================
// 与写入并发
// ================================

TEST_F(RetrievalEngineTest, OpenStreamKeepsOldBytesAcrossOverwrite) {
    Put("k", "old content");
    auto resp = engine_->Get(Request("k"));
    ASSERT_TRUE(resp.hasValue());

    // 流打开期间覆盖写并回收旧 blob
    Put("k", "new content!");

    EXPECT_EQ(Drain(*resp.value().body).value(), "old content");
    auto fresh = engine_->Get(Request("k"));
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_EQ(Drain(*fresh.value().body).value(), "new content!");
}

TEST_F(RetrievalEngineTest, OverwriteBetweenLookupAndOpenIsRetried) {
    auto old_meta = Put("k", "old content");
    hooked_->OnFirstSize(old_meta.location, [this]() { Put("k", "newer content"); });

    auto resp = engine_->Get(Request("k"));
    ASSERT_TRUE(resp.hasValue()) << resp.error().ToString();
    EXPECT_NE(resp.value().meta.location, old_meta.location);
    EXPECT_EQ(resp.value().range.length, 13u);
    EXPECT_EQ(Drain(*resp.value().body).value(), "newer content");
}

// ================================
// 版本
// ================================

TEST_F(RetrievalEngineTest, GetByVersionId) {
    ASSERT_TRUE(index_->SetBucketVersioning("test-bucket",
                                            metadata::VersioningState::kEnabled).hasValue());
    auto v1 = Put("k", "first");
    auto v2 = Put("k", "second");
    ASSERT_NE(v1.version_id, v2.version_id);

    auto req = Request("k");
    req.version_id = v1.version_id;
    auto resp = engine_->Get(req);
    ASSERT_TRUE(resp.hasValue());
    EXPECT_EQ(resp.value().meta.version_id, v1.version_id);
    EXPECT_EQ(Drain(*resp.value().body).value(), "first");

    EXPECT_EQ(Drain(*engine_->Get(Request("k")).value().body).value(), "second");

    req.version_id = "does-not-exist";
    EXPECT_EQ(engine_->Get(req).code(), ErrorCode::kNoSuchVersion);
}

} // namespace cirrus::retrieval::test
