#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "storage/gcs_storage.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace codeexec::storage {
namespace {

namespace fs = std::filesystem;

constexpr const char* kBucket = "test-bucket";
constexpr const char* kToken = "test-token";

// In-process stand-in for the GCS JSON API: objects live in a map, list pages
// hold two items, and a number of upcoming requests can be made to fail.
class FakeGcs {
public:
    FakeGcs() {
        server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
            ++requests_;
            if (req.get_header_value("Authorization") != std::string("Bearer ") + kToken) {
                res.status = 401;
                return httplib::Server::HandlerResponse::Handled;
            }
            if (fail_next_ > 0) {
                --fail_next_;
                res.status = fail_status_;
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });
        server_.Post(R"(/upload/storage/v1/b/([^/]+)/o)", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            objects_[req.get_param_value("name")] = req.body;
            res.set_content(nlohmann::json{{"name", req.get_param_value("name")}}.dump(), "application/json");
        });
        server_.Get(R"(/storage/v1/b/([^/]+)/o)", [this](const httplib::Request& req, httplib::Response& res) {
            HandleList(req, res);
        });
        server_.Get(R"(/storage/v1/b/([^/]+)/o/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = objects_.find(req.matches[2]);
            if (it == objects_.end()) {
                res.status = 404;
                return;
            }
            if (req.get_param_value("alt") == "media") {
                res.set_content(it->second, "application/octet-stream");
            } else {
                res.set_content(nlohmann::json{{"name", it->first},
                                               {"size", std::to_string(it->second.size())}}.dump(),
                                "application/json");
            }
        });
        server_.Delete(R"(/storage/v1/b/([^/]+)/o/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            res.status = objects_.erase(req.matches[2]) > 0 ? 204 : 404;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeGcs() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    config::GcsConfig Config() const {
        config::GcsConfig config{};
        config.bucket = kBucket;
        config.endpoint = "http://127.0.0.1:" + std::to_string(port_);
        config.access_token = kToken;
        config.timeout_s = 5;
        return config;
    }

    void FailNext(int count, int status) {
        fail_status_ = status;
        fail_next_ = count;
    }

    std::map<std::string, std::string> Objects() {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_;
    }

    void SetObject(const std::string& name, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[name] = data;
    }

    int Requests() const { return requests_.load(); }

    // Replaces the size reported for every listed object.
    void ReportSize(const std::string& size) {
        std::lock_guard<std::mutex> lock(mutex_);
        reported_size_ = size;
    }

private:
    void HandleList(const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto prefix = req.get_param_value("prefix");
        const auto token = req.get_param_value("pageToken");
        nlohmann::json items = nlohmann::json::array();
        std::string next;
        for (auto it = objects_.lower_bound(token.empty() ? prefix : token); it != objects_.end(); ++it) {
            if (it->first.rfind(prefix, 0) != 0) {
                break;
            }
            if (items.size() == 2) {
                next = it->first;
                break;
            }
            const auto size = reported_size_.empty() ? std::to_string(it->second.size()) : reported_size_;
            items.push_back({{"name", it->first}, {"size", size}});
        }
        nlohmann::json body = {{"kind", "storage#objects"}, {"items", items}};
        if (!next.empty()) {
            body["nextPageToken"] = next;
        }
        res.set_content(body.dump(), "application/json");
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
    std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::string reported_size_;
    std::atomic<int> fail_next_{0};
    std::atomic<int> fail_status_{503};
    std::atomic<int> requests_{0};
};

class GcsStorageTest : public ::testing::Test {
protected:
    GcsStorageTest()
        : storage_(fake_.Config()) {}

    FakeGcs fake_;
    GcsStorage storage_;
};

TEST_F(GcsStorageTest, PutGetUsesPrefixedObjectNames) {
    storage_.Put("s1", "dir/file name.txt", "hello");
    const auto objects = fake_.Objects();
    ASSERT_EQ(objects.count("s1/dir/file name.txt"), 1u);
    EXPECT_EQ(*storage_.Get("s1", "dir/file name.txt"), "hello");
    EXPECT_TRUE(storage_.Exists("s1", "dir/file name.txt"));
    EXPECT_FALSE(storage_.Get("s1", "missing").has_value());
    EXPECT_FALSE(storage_.Exists("s1", "missing"));
}

TEST_F(GcsStorageTest, ListPagesThroughResultsAndStaysInPrefix) {
    for (const auto* name : {"a.txt", "b.txt", "c/d.txt", "e.txt", "f.txt"}) {
        storage_.Put("s1", name, name);
    }
    storage_.Put("s10", "other.txt", "x");
    const auto entries = storage_.List("s1");
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[0].path, "a.txt");
    EXPECT_EQ(entries[2].path, "c/d.txt");
    EXPECT_EQ(entries[2].size, 7u);
    EXPECT_EQ(entries[4].path, "f.txt");
}

TEST_F(GcsStorageTest, RemoveAndRemovePrefix) {
    storage_.Put("s1", "a.txt", "a");
    storage_.Put("s1", "b.txt", "b");
    storage_.Put("s2", "keep.txt", "k");
    EXPECT_TRUE(storage_.Remove("s1", "a.txt"));
    EXPECT_FALSE(storage_.Remove("s1", "a.txt"));
    EXPECT_TRUE(storage_.RemovePrefix("s1"));
    const auto objects = fake_.Objects();
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects.begin()->first, "s2/keep.txt");
}

TEST_F(GcsStorageTest, TransientFailureIsRetriedOnce) {
    fake_.FailNext(1, 503);
    storage_.Put("s1", "a.txt", "a");
    EXPECT_EQ(fake_.Objects().count("s1/a.txt"), 1u);
}

TEST_F(GcsStorageTest, PersistentFailureBecomesStorageFailure) {
    fake_.FailNext(2, 500);
    try {
        storage_.Get("s1", "a.txt");
        FAIL() << "expected ServiceError";
    } catch (const utils::ServiceError& ex) {
        EXPECT_EQ(ex.Code(), utils::ErrorCode::kStorageFailure);
    }
}

TEST_F(GcsStorageTest, ClientErrorsAreNotRetried) {
    fake_.FailNext(1, 403);
    const auto before = fake_.Requests();
    EXPECT_THROW(storage_.Put("s1", "a.txt", "a"), utils::ServiceError);
    EXPECT_EQ(fake_.Requests() - before, 1);
}

TEST_F(GcsStorageTest, MalformedListedSizeIsStorageFailure) {
    storage_.Put("s1", "a.txt", "a");
    for (const auto* size : {"12abc", "-1", "99999999999999999999999"}) {
        fake_.ReportSize(size);
        try {
            storage_.List("s1");
            FAIL() << "expected ServiceError for size '" << size << "'";
        } catch (const utils::ServiceError& ex) {
            EXPECT_EQ(ex.Code(), utils::ErrorCode::kStorageFailure);
        }
    }
}

TEST_F(GcsStorageTest, CheckoutMirrorsPrefixAndCommitSyncsChanges) {
    storage_.Put("s1", ".meta.json", "{}");
    storage_.Put("s1", "keep.txt", "same");
    storage_.Put("s1", "edit.txt", "old");
    storage_.Put("s1", "drop.txt", "bye");
    fs::path directory;
    {
        auto workspace = storage_.Checkout("s1");
        directory = workspace->Directory();
        EXPECT_EQ(codeexec::testing::ReadFile(directory / "keep.txt"), "same");
        codeexec::testing::WriteFile(directory / "edit.txt", "new");
        codeexec::testing::WriteFile(directory / "sub/added.txt", "added");
        fs::remove(directory / "drop.txt");
        workspace->Commit();
    }
    EXPECT_FALSE(fs::exists(directory));
    const auto objects = fake_.Objects();
    EXPECT_EQ(objects.at("s1/edit.txt"), "new");
    EXPECT_EQ(objects.at("s1/sub/added.txt"), "added");
    EXPECT_EQ(objects.at("s1/keep.txt"), "same");
    EXPECT_EQ(objects.count("s1/drop.txt"), 0u);
    EXPECT_EQ(objects.at("s1/.meta.json"), "{}");
}

TEST_F(GcsStorageTest, CheckoutSkipsUnsafeObjectNames) {
    fake_.SetObject("s1/../escape.txt", "nope");
    storage_.Put("s1", "ok.txt", "ok");
    auto workspace = storage_.Checkout("s1");
    EXPECT_TRUE(fs::exists(workspace->Directory() / "ok.txt"));
    EXPECT_FALSE(fs::exists(workspace->Directory().parent_path() / "escape.txt"));
}

}  // namespace
}  // namespace codeexec::storage
