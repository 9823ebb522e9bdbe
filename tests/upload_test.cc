#include "cardpack/upload.h"

#include "cardpack/base64.h"
#include "cardpack/digest.h"
#include "cardpack/file_storage.h"
#include "cardpack/memory_storage.h"
#include "cardpack/post_process.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace cardpack {
namespace {

    using testing::bytes_of;
    using testing::make_png;
    using testing::text_chunk;

    static std::vector<std::byte> png_card(std::string_view json)
    {
        return make_png(16, 16, text_chunk("chara", base64_encode(json)));
    }


    static std::vector<std::byte> charx_card()
    {
        testing::ZipBuilder zb;
        zb.add("card.json", R"json({
            "spec": "chara_card_v3",
            "data": {
                "name": "Ada",
                "first_mes": "![smile](embeded://assets/emotion/smile.png)",
                "extensions": {"avatar": "embeded://assets/icon/main.png"},
                "assets": [
                    {"type": "icon", "uri": "embeded://assets/icon/main.png",
                     "name": "main", "ext": "png"},
                    {"type": "emotion",
                     "uri": "embeded://assets/emotion/smile.png",
                     "name": "smile", "ext": "png"},
                    {"type": "x-voice", "uri": "embeded://assets/voice.ogg",
                     "name": "voice", "ext": "ogg"}
                ]
            }
        })json", true);
        zb.add("assets/icon/main.png", make_png(64, 64));
        zb.add("assets/emotion/smile.png", make_png(32, 32));
        zb.add("assets/voice.ogg", std::string_view("OggS-not-really"));
        return zb.finish();
    }


    // Serves one PNG for every URL.
    class PngFetcher final : public ResourceFetcher {
    public:
        FetchStatus fetch(std::string_view, uint64_t,
                          FetchedResource* out) override
        {
            out->bytes        = make_png(2, 2);
            out->content_type = "image/png";
            return FetchStatus::Ok;
        }
    };


    class UploadTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            ASSERT_EQ(VersionStore::open(":memory:", &store_), StoreStatus::Ok);
            auto driver = std::make_unique<MemoryStorageDriver>();
            mem_        = driver.get();
            ASSERT_EQ(registry_.add(std::move(driver)), StorageStatus::Ok);
            policy_.part_size = 256;
        }

        std::unique_ptr<UploadCoordinator> coordinator(
            PostProcessor* post = nullptr, ImageTranscoder* codec = nullptr)
        {
            return std::make_unique<UploadCoordinator>(
                storage_, *store_, policy_, post, [this] { return now_; },
                codec);
        }

        static FileDescriptor describe(std::string key,
                                       const std::vector<std::byte>& bytes,
                                       std::string type = "image/png")
        {
            FileDescriptor f;
            f.key          = std::move(key);
            f.filename     = "My Card.png";
            f.size         = bytes.size();
            f.content_type = std::move(type);
            return f;
        }

        // Plays the client side of the grants and returns the receipts.
        std::vector<PartReceipt> upload(const std::vector<Grant>& grants,
                                        std::string_view key,
                                        const std::vector<std::byte>& bytes)
        {
            std::vector<PartReceipt> receipts;
            const std::span<const std::byte> all(bytes);
            for (const Grant& g : grants) {
                if (g.key != key) {
                    continue;
                }
                std::string etag;
                if (g.upload_id.empty()) {
                    EXPECT_EQ(mem_->store(all, g.backend_key, StoreOptions()),
                              StorageStatus::Ok);
                    etag = crc32_etag(all);
                } else {
                    const size_t off = (g.part_number - 1) * policy_.part_size;
                    const size_t len = std::min<size_t>(policy_.part_size,
                                                        all.size() - off);
                    EXPECT_EQ(mem_->upload_part(g.backend_key, g.upload_id,
                                                g.part_number,
                                                all.subspan(off, len), &etag),
                              StorageStatus::Ok);
                }
                receipts.push_back({ g.part_number, etag });
            }
            return receipts;
        }

        SessionState state(const UploadCoordinator& up, const std::string& id)
        {
            SessionState s = SessionState::Requested;
            EXPECT_EQ(up.session_state(id, &s), UploadStatus::Ok);
            return s;
        }

        std::unique_ptr<VersionStore> store_;
        DriverRegistry registry_;
        MemoryStorageDriver* mem_ = nullptr;
        Storage storage_ { registry_, "mem" };
        UploadPolicy policy_;
        int64_t now_ = 1000;
    };


    TEST(UploadParts, PartCount)
    {
        EXPECT_EQ(part_count_for(1, 10), 1U);
        EXPECT_EQ(part_count_for(10, 10), 1U);
        EXPECT_EQ(part_count_for(11, 10), 2U);
        EXPECT_EQ(part_count_for(30, 10), 3U);
        EXPECT_EQ(part_count_for(30, 0), 1U);
    }


    TEST_F(UploadTest, BeginSessionValidatesCardId)
    {
        auto up = coordinator();
        std::string id;
        EXPECT_EQ(up->begin_session("", &id), UploadStatus::InvalidRequest);
        EXPECT_EQ(up->begin_session("bad/id", &id),
                  UploadStatus::InvalidRequest);
        EXPECT_EQ(up->begin_session(std::string(65, 'a'), &id),
                  UploadStatus::InvalidRequest);
        ASSERT_EQ(up->begin_session("card_1-A", &id), UploadStatus::Ok);
        EXPECT_EQ(id.size(), 32U);
        EXPECT_EQ(state(*up, id), SessionState::Requested);
        SessionState s;
        EXPECT_EQ(up->session_state("nope", &s), UploadStatus::UnknownSession);
    }


    TEST_F(UploadTest, GrantValidation)
    {
        auto up = coordinator();
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        const std::vector<std::byte> bytes(10);
        std::vector<Grant> grants;

        EXPECT_EQ(up->request_grants(id, {}, &grants),
                  UploadStatus::InvalidRequest);

        std::vector<FileDescriptor> files = { describe("a", bytes),
                                              describe("a", bytes) };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::InvalidRequest);

        files = { describe("bad key", bytes) };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::InvalidRequest);

        files = { describe("a", bytes, "text/html") };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::UnsupportedContentType);

        files = { describe("a", {}) };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::InvalidRequest);

        for (const char* name : { ".", "..", "" }) {
            files             = { describe("a", bytes) };
            files[0].filename = name;
            EXPECT_EQ(up->request_grants(id, files, &grants),
                      UploadStatus::InvalidRequest)
                << "filename '" << name << "'";
        }
        files             = { describe("a", bytes) };
        files[0].filename = "...";
        EXPECT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        EXPECT_EQ(grants.back().backend_key.substr(
                      grants.back().backend_key.rfind('/')),
                  "/...");
        ASSERT_EQ(up->abandon(id), UploadStatus::Ok);
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);

        files = { describe("a", bytes) };
        files[0].size = policy_.max_file_bytes + 1;
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::FileTooLarge);

        EXPECT_EQ(up->request_grants("unknown", files, &grants),
                  UploadStatus::UnknownSession);
        EXPECT_EQ(state(*up, id), SessionState::Requested);
        EXPECT_EQ(mem_->object_count(), 0U);
    }


    TEST_F(UploadTest, SessionByteLimitSpansRequests)
    {
        policy_.max_session_bytes = 25;
        auto up                   = coordinator();
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<std::byte> bytes(10);
        std::vector<FileDescriptor> files = { describe("a", bytes),
                                              describe("b", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        EXPECT_EQ(state(*up, id), SessionState::PartsGranted);

        files = { describe("c", bytes) };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::FileTooLarge);
        files = { describe("a", std::vector<std::byte>(1)) };
        EXPECT_EQ(up->request_grants(id, files, &grants),
                  UploadStatus::InvalidRequest);
    }


    TEST_F(UploadTest, SinglePngCommit)
    {
        auto up                    = coordinator();
        const auto bytes           = png_card(R"({"name":"Ada","data":{}})");
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("card", bytes, "Image/PNG; charset=binary")
        };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        ASSERT_EQ(grants.size(), 1U);
        EXPECT_EQ(grants[0].backend_key,
                  "uploads/pending/" + id + "/card/My_Card.png");
        EXPECT_EQ(grants[0].upload_url, "mem://" + grants[0].backend_key);
        EXPECT_TRUE(grants[0].upload_id.empty());
        EXPECT_EQ(grants[0].part_number, 1U);
        EXPECT_EQ(grants[0].expires_at, 1000 + policy_.grant_ttl_seconds);
        ASSERT_EQ(grants[0].headers.size(), 1U);
        EXPECT_EQ(grants[0].headers[0].second, "image/png");

        const auto receipts = upload(grants, "card", bytes);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "card", receipts, &result),
                  UploadStatus::Ok);
        EXPECT_EQ(state(*up, id), SessionState::Committed);
        EXPECT_EQ(result.card_id, "ada");
        EXPECT_EQ(result.storage_url,
                  "mem://cards/ada/" + result.version_id + ".png");
        EXPECT_EQ(result.image_url,
                  "/api/uploads/images/ada/" + result.version_id + ".png");
        EXPECT_EQ(result.content_hash, sha256_hex(bytes));
        EXPECT_EQ(result.extracted_count, 0U);
        EXPECT_EQ(result.external_refs, 0U);

        CardVersion v;
        ASSERT_EQ(store_->get_version(result.version_id, &v), StoreStatus::Ok);
        EXPECT_EQ(v.source_format, "png");
        EXPECT_EQ(v.spec_version, "v2");
        EXPECT_EQ(v.card_data["name"], "Ada");
        EXPECT_EQ(v.created_at, 1000);

        std::vector<std::byte> stored;
        ASSERT_EQ(storage_.retrieve(result.storage_url, &stored),
                  StorageStatus::Ok);
        EXPECT_EQ(stored, bytes);
        ASSERT_EQ(storage_.retrieve("mem://images/ada/" + result.version_id
                                        + ".png",
                                    &stored),
                  StorageStatus::Ok);
        EXPECT_EQ(stored, make_png(16, 16));
        bool pending = true;
        ASSERT_EQ(storage_.exists("mem://" + grants[0].backend_key, &pending),
                  StorageStatus::Ok);
        EXPECT_FALSE(pending);

        // Repeating the completion returns the same version.
        CommitResult again;
        ASSERT_EQ(up->complete(id, "card", receipts, &again),
                  UploadStatus::Ok);
        EXPECT_EQ(again.version_id, result.version_id);
        std::vector<CardVersion> versions;
        ASSERT_EQ(store_->list_versions("ada", &versions), StoreStatus::Ok);
        EXPECT_EQ(versions.size(), 1U);

        std::vector<Grant> more;
        EXPECT_EQ(up->request_grants(id, files, &more),
                  UploadStatus::InvalidState);
        EXPECT_EQ(up->abandon(id), UploadStatus::InvalidState);
    }


    TEST_F(UploadTest, MultipartCharxCommit)
    {
        auto up          = coordinator();
        const auto bytes = charx_card();
        ASSERT_GT(bytes.size(), policy_.part_size);
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("bundle", bytes, "application/zip")
        };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        const uint32_t parts = part_count_for(bytes.size(), policy_.part_size);
        ASSERT_EQ(grants.size(), parts);
        for (uint32_t i = 0; i < parts; ++i) {
            EXPECT_EQ(grants[i].part_number, i + 1);
            EXPECT_EQ(grants[i].upload_id, grants[0].upload_id);
            EXPECT_FALSE(grants[i].upload_id.empty());
        }

        const auto receipts = upload(grants, "bundle", bytes);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "bundle", receipts, &result),
                  UploadStatus::Ok);
        EXPECT_EQ(result.extracted_count, 2U);
        EXPECT_EQ(result.referenced_count, 2U);
        EXPECT_TRUE(result.unresolved_refs.empty());
        EXPECT_EQ(result.storage_url,
                  "mem://cards/ada/" + result.version_id + ".charx");

        CardVersion v;
        ASSERT_EQ(store_->get_version(result.version_id, &v), StoreStatus::Ok);
        EXPECT_EQ(v.source_format, "charx");
        EXPECT_EQ(v.spec_version, "v3");
        EXPECT_EQ(v.card_data["data"]["first_mes"],
                  "![smile](/api/uploads/assets/ada/0_smile.png)");
        EXPECT_EQ(v.card_data["data"]["extensions"]["avatar"],
                  result.image_url);
        ASSERT_EQ(v.saved_assets.size(), 2U);
        EXPECT_EQ(v.saved_assets[0].storage_url,
                  "mem://assets/ada/0_smile.png");
        ASSERT_TRUE(v.saved_assets[0].width.has_value());
        EXPECT_EQ(*v.saved_assets[0].width, 32U);
        EXPECT_EQ(v.saved_assets[1].storage_url, "mem://assets/ada/1_voice.ogg");
        EXPECT_FALSE(v.saved_assets[1].width.has_value());
    }


    TEST_F(UploadTest, CommitStoresWebpThumbnails)
    {
        testing::FakeTranscoder codec;
        auto up          = coordinator(nullptr, &codec);
        const auto bytes = charx_card();
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("bundle", bytes, "application/zip")
        };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "bundle", upload(grants, "bundle", bytes),
                               &result),
                  UploadStatus::Ok);

        const std::string thumb_path = portrait_thumbnail_path(
            "ada", result.version_id);
        EXPECT_EQ(thumb_path,
                  "images/ada/thumbnails/" + result.version_id + ".webp");
        EXPECT_EQ(result.thumbnail_url, "/api/uploads/" + thumb_path);
        std::vector<std::byte> stored;
        ASSERT_EQ(storage_.retrieve("mem://" + thumb_path, &stored),
                  StorageStatus::Ok);
        EXPECT_EQ(testing::string_of(stored), "webp 500x500");

        CardVersion v;
        ASSERT_EQ(store_->get_version(result.version_id, &v), StoreStatus::Ok);
        EXPECT_EQ(v.thumbnail_url, result.thumbnail_url);
        ASSERT_EQ(v.saved_assets.size(), 2U);
        EXPECT_EQ(v.saved_assets[0].thumbnail_path,
                  "/api/uploads/assets/ada/thumbnails/0_smile.webp");
        EXPECT_TRUE(v.saved_assets[1].thumbnail_path.empty());
        EXPECT_EQ(codec.calls.load(), 2);
    }


    TEST_F(UploadTest, CommitWithoutCodecHasNoThumbnails)
    {
        auto up          = coordinator();
        const auto bytes = png_card(R"({"name":"Ada","data":{}})");
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("card", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "card", upload(grants, "card", bytes),
                               &result),
                  UploadStatus::Ok);
        EXPECT_TRUE(result.thumbnail_url.empty());
        bool exists = true;
        ASSERT_EQ(storage_.exists("mem://" + portrait_thumbnail_path(
                                                 "ada", result.version_id),
                                  &exists),
                  StorageStatus::Ok);
        EXPECT_FALSE(exists);
    }


    TEST_F(UploadTest, IncompletePartsCanBeRetried)
    {
        auto up          = coordinator();
        const auto bytes = charx_card();
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("bundle", bytes, "application/zip")
        };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        auto receipts = upload(grants, "bundle", bytes);
        ASSERT_GE(receipts.size(), 2U);

        CommitResult result;
        const std::vector<PartReceipt> short_list(receipts.begin(),
                                                  receipts.end() - 1);
        EXPECT_EQ(up->complete(id, "bundle", short_list, &result),
                  UploadStatus::IncompleteParts);
        EXPECT_EQ(state(*up, id), SessionState::PartsGranted);

        auto swapped = receipts;
        std::swap(swapped[0], swapped[1]);
        EXPECT_EQ(up->complete(id, "bundle", swapped, &result),
                  UploadStatus::IncompleteParts);

        auto bad_etag    = receipts;
        bad_etag[0].etag = "deadbeef";
        EXPECT_EQ(up->complete(id, "bundle", bad_etag, &result),
                  UploadStatus::IncompleteParts);

        EXPECT_EQ(up->complete(id, "other", receipts, &result),
                  UploadStatus::NotFound);
        ASSERT_EQ(up->complete(id, "bundle", receipts, &result),
                  UploadStatus::Ok);
    }


    TEST_F(UploadTest, ReportedUploadIsFinalizedBeforeCommit)
    {
        auto up          = coordinator();
        const auto bytes = charx_card();
        std::string id;
        ASSERT_EQ(up->begin_session("ada", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("bundle", bytes, "application/zip")
        };
        EXPECT_EQ(up->report_uploaded(id, "bundle", {}),
                  UploadStatus::NotFound);
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        const auto receipts = upload(grants, "bundle", bytes);
        ASSERT_GE(receipts.size(), 2U);

        const std::vector<PartReceipt> short_list(receipts.begin(),
                                                  receipts.end() - 1);
        EXPECT_EQ(up->report_uploaded(id, "bundle", short_list),
                  UploadStatus::IncompleteParts);
        EXPECT_EQ(state(*up, id), SessionState::PartsGranted);

        ASSERT_EQ(up->report_uploaded(id, "bundle", receipts),
                  UploadStatus::Ok);
        EXPECT_EQ(state(*up, id), SessionState::PartsUploaded);
        EXPECT_EQ(up->report_uploaded(id, "bundle", receipts),
                  UploadStatus::Ok);
        EXPECT_EQ(state(*up, id), SessionState::PartsUploaded);

        // The multipart upload is already complete at the backend.
        CommitResult result;
        ASSERT_EQ(up->complete(id, "bundle", receipts, &result),
                  UploadStatus::Ok);
        EXPECT_EQ(state(*up, id), SessionState::Committed);
        EXPECT_EQ(up->report_uploaded(id, "bundle", receipts),
                  UploadStatus::InvalidState);
        EXPECT_EQ(up->report_uploaded("nope", "bundle", receipts),
                  UploadStatus::UnknownSession);
    }


    TEST_F(UploadTest, SinglePutNeedsObjectAndMatchingEtag)
    {
        auto up          = coordinator();
        const auto bytes = png_card("{}");
        const auto short_bytes = bytes_of("short");
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        const std::vector<PartReceipt> good = { { 1, crc32_etag(bytes) } };
        const std::vector<PartReceipt> stale
            = { { 1, crc32_etag(short_bytes) } };
        CommitResult result;

        // Nothing uploaded yet.
        EXPECT_EQ(up->complete(id, "f", good, &result),
                  UploadStatus::IncompleteParts);

        ASSERT_EQ(mem_->store(bytes, grants[0].backend_key, StoreOptions()),
                  StorageStatus::Ok);
        const std::vector<PartReceipt> invented = { { 1, "00000000" } };
        EXPECT_EQ(up->complete(id, "f", invented, &result),
                  UploadStatus::IncompleteParts);
        EXPECT_EQ(state(*up, id), SessionState::PartsGranted);

        // Uploaded bytes differ in size from what was declared.
        ASSERT_EQ(mem_->store(short_bytes, grants[0].backend_key,
                              StoreOptions()),
                  StorageStatus::Ok);
        EXPECT_EQ(up->complete(id, "f", stale, &result),
                  UploadStatus::IncompleteParts);
        EXPECT_EQ(state(*up, id), SessionState::PartsUploaded);

        // A re-upload is verified again against the new receipt.
        ASSERT_EQ(mem_->store(bytes, grants[0].backend_key, StoreOptions()),
                  StorageStatus::Ok);
        EXPECT_EQ(up->complete(id, "f", stale, &result),
                  UploadStatus::IncompleteParts);
        const std::vector<PartReceipt> quoted
            = { { 1, "\"" + crc32_etag(bytes) + "\"" } };
        EXPECT_EQ(up->complete(id, "f", quoted, &result), UploadStatus::Ok);
    }


    TEST_F(UploadTest, UnreadableBundleAbandonsSession)
    {
        auto up          = coordinator();
        const auto bytes = make_png(4, 4);
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        const auto receipts = upload(grants, "f", bytes);
        CommitResult result;
        EXPECT_EQ(up->complete(id, "f", receipts, &result),
                  UploadStatus::BundleRejected);
        EXPECT_EQ(state(*up, id), SessionState::Abandoned);
        EXPECT_EQ(mem_->object_count(), 0U);
        EXPECT_EQ(up->complete(id, "f", receipts, &result),
                  UploadStatus::InvalidState);
    }


    TEST_F(UploadTest, StorageFailureDuringCommitIsRetryable)
    {
        auto up          = coordinator();
        const auto bytes = png_card(R"({"name":"Ada"})");
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        const auto receipts = upload(grants, "f", bytes);

        mem_->fail_next_stores(1);
        CommitResult result;
        EXPECT_EQ(up->complete(id, "f", receipts, &result),
                  UploadStatus::StorageFailed);
        EXPECT_EQ(state(*up, id), SessionState::PartsUploaded);
        std::vector<CardVersion> versions;
        ASSERT_EQ(store_->list_versions("c", &versions), StoreStatus::Ok);
        EXPECT_TRUE(versions.empty());

        ASSERT_EQ(up->complete(id, "f", receipts, &result), UploadStatus::Ok);
        ASSERT_EQ(store_->list_versions("c", &versions), StoreStatus::Ok);
        EXPECT_EQ(versions.size(), 1U);
    }


    TEST_F(UploadTest, AbandonDiscardsPendingObjects)
    {
        auto up = coordinator();
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        const auto small = png_card("{}");
        const auto big   = charx_card();
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = {
            describe("small", small), describe("big", big, "application/zip")
        };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        upload(grants, "small", small);
        upload(grants, "big", big);
        EXPECT_EQ(mem_->object_count(), 1U);

        ASSERT_EQ(up->abandon(id), UploadStatus::Ok);
        EXPECT_EQ(mem_->object_count(), 0U);
        EXPECT_EQ(state(*up, id), SessionState::Abandoned);
        EXPECT_EQ(up->abandon(id), UploadStatus::Ok);

        // The multipart upload was aborted.
        std::string etag;
        EXPECT_EQ(mem_->upload_part(grants.back().backend_key,
                                    grants.back().upload_id, 1,
                                    bytes_of("x"), &etag),
                  StorageStatus::NotFound);
        CommitResult result;
        EXPECT_EQ(up->complete(id, "small", {}, &result),
                  UploadStatus::InvalidState);
    }


    TEST_F(UploadTest, ExpiredSessionsAreSwept)
    {
        auto up = coordinator();
        std::string old_id;
        ASSERT_EQ(up->begin_session("c", &old_id), UploadStatus::Ok);
        now_ += policy_.session_ttl_seconds / 2;
        std::string young_id;
        ASSERT_EQ(up->begin_session("c", &young_id), UploadStatus::Ok);

        now_ = 1000 + policy_.session_ttl_seconds;
        std::vector<Grant> grants;
        const auto bytes                        = png_card("{}");
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        EXPECT_EQ(up->request_grants(old_id, files, &grants),
                  UploadStatus::InvalidState);

        EXPECT_EQ(up->expire_sessions(now_), 1U);
        EXPECT_EQ(state(*up, old_id), SessionState::Abandoned);
        EXPECT_EQ(state(*up, young_id), SessionState::Requested);
        EXPECT_EQ(up->expire_sessions(now_), 0U);
    }


    TEST_F(UploadTest, ExternalImagesArePostProcessed)
    {
        PngFetcher fetcher;
        PostProcessOptions opts;
        opts.worker_threads = 1;
        PostProcessor post(*store_, storage_, fetcher, opts);
        auto up = coordinator(&post);

        const auto bytes = png_card(
            R"json({"data":{"first_mes":"![x](https://img.example/x.png)"}})json");
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "f", upload(grants, "f", bytes), &result),
                  UploadStatus::Ok);
        EXPECT_EQ(result.external_refs, 1U);

        post.wait_idle();
        PostProcessTask task;
        ASSERT_EQ(store_->get_task(result.version_id, &task), StoreStatus::Ok);
        EXPECT_TRUE(task.retired);
        CardVersion v;
        ASSERT_EQ(store_->get_version(result.version_id, &v), StoreStatus::Ok);
        EXPECT_EQ(v.card_data["data"]["first_mes"],
                  "![x](/api/uploads/"
                      + embedded_image_path("images", "c",
                                            "https://img.example/x.png", "png")
                      + ")");
    }


    TEST_F(UploadTest, ExternalImagesWithoutProcessorStayQueued)
    {
        auto up          = coordinator();
        const auto bytes = png_card(
            R"({"data":{"first_mes":"<img src='https://img.example/y.gif'>"}})");
        std::string id;
        ASSERT_EQ(up->begin_session("c", &id), UploadStatus::Ok);
        std::vector<Grant> grants;
        const std::vector<FileDescriptor> files = { describe("f", bytes) };
        ASSERT_EQ(up->request_grants(id, files, &grants), UploadStatus::Ok);
        CommitResult result;
        ASSERT_EQ(up->complete(id, "f", upload(grants, "f", bytes), &result),
                  UploadStatus::Ok);

        std::vector<PostProcessTask> open;
        ASSERT_EQ(store_->list_open_tasks(&open), StoreStatus::Ok);
        ASSERT_EQ(open.size(), 1U);
        EXPECT_EQ(open[0].version_id, result.version_id);
        EXPECT_EQ(open[0].units[0].reference, "https://img.example/y.gif");
    }

}  // namespace
}  // namespace cardpack
