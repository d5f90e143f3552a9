#pragma once

#include "nexus/auth/owner_directory.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/storage/database.hpp"
#include "nexus/storage/dedup.hpp"
#include "nexus/storage/file_index.hpp"
#include "nexus/upload/chunk_writer.hpp"
#include "nexus/upload/finalizer.hpp"
#include "nexus/upload/service.hpp"
#include "nexus/upload/session_store.hpp"
#include "nexus/upload/storage_strategy.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace nexus::testing {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<int> counter{0};
    auto dir = fs::temp_directory_path() / (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

/**
 * Wires the upload pipeline against a temp directory: real SQLite, real
 * files, one owner "alice" (credential "alice-secret", folder "alice").
 *
 * Completion jobs run inline unless defer_jobs is set, in which case they
 * queue in pending_jobs (from any thread) until run_pending_jobs().
 */
class UploadFixture : public ::testing::Test {
protected:
    static constexpr const char* kCredential = "alice-secret";

    void SetUp() override {
        dir_ = create_temp_dir("nexus_upload_test");
        db_ = std::make_unique<storage::Database>(dir_ / "nexus.db");
        index_ = std::make_unique<storage::FileIndex>(*db_);
        dedup_ = std::make_unique<storage::Deduplicator>(*db_, bus_);
        sessions_ = std::make_unique<upload::SessionStore>(*db_);

        owners_ = std::make_unique<auth::JsonOwnerDirectory>(dir_ / "owners.json");
        owners_->add(auth::Owner{"alice", "alice"}, kCredential);
        owners_->add(auth::Owner{"bob", "bob"}, "bob-secret");
        layout_ = std::make_unique<auth::StorageLayout>(dir_ / "uploads");
        notifier_ = std::make_unique<auth::EventBusNotifier>(bus_);

        writer_ = std::make_unique<upload::ChunkWriter>(dir_ / "tus_temp");
        backends_ = std::make_unique<upload::StorageBackends>(*writer_, bus_);
        finalizer_ = std::make_unique<upload::Finalizer>(*sessions_, *writer_, *index_, *dedup_,
                                                         *owners_, *layout_, *notifier_, bus_);
        make_service(0);
    }

    void TearDown() override {
        service_.reset();
        finalizer_.reset();
        backends_.reset();
        writer_.reset();
        sessions_.reset();
        dedup_.reset();
        index_.reset();
        db_.reset();
        fs::remove_all(dir_);
    }

    void make_service(std::uint64_t max_upload_bytes) {
        service_ = std::make_unique<upload::UploadService>(
            *sessions_, *backends_, *finalizer_, *owners_, bus_,
            [this](std::function<void()> job) {
                if (defer_jobs) {
                    std::lock_guard lock(jobs_mutex_);
                    pending_jobs.push_back(std::move(job));
                } else {
                    job();
                }
            },
            max_upload_bytes);
    }

    void run_pending_jobs() {
        std::vector<std::function<void()>> jobs;
        {
            std::lock_guard lock(jobs_mutex_);
            jobs = std::move(pending_jobs);
            pending_jobs.clear();
        }
        for (auto& job : jobs) {
            job();
        }
    }

    upload::CreateRequest request_for(const std::string& filename, std::uint64_t length,
                                      const std::string& credential = kCredential) {
        upload::CreateRequest request;
        request.length = length;
        request.metadata["filename"] = filename;
        request.metadata["password"] = credential;
        return request;
    }

    upload::UploadSession create_upload(const std::string& filename, std::uint64_t length) {
        auto created = service_->create(request_for(filename, length));
        EXPECT_TRUE(created.is_ok());
        return created.value().session;
    }

    Result<upload::AppendResult, Error> append(const std::string& id, std::uint64_t offset, const std::string& bytes) {
        return service_->append(id, offset, upload::kOffsetContentType, bytes.data(), bytes.size());
    }

    fs::path owner_path(const std::string& name) const {
        return dir_ / "uploads" / "alice" / name;
    }

    fs::path dir_;
    events::EventBus bus_;
    std::unique_ptr<storage::Database> db_;
    std::unique_ptr<storage::FileIndex> index_;
    std::unique_ptr<storage::Deduplicator> dedup_;
    std::unique_ptr<upload::SessionStore> sessions_;
    std::unique_ptr<auth::JsonOwnerDirectory> owners_;
    std::unique_ptr<auth::StorageLayout> layout_;
    std::unique_ptr<auth::EventBusNotifier> notifier_;
    std::unique_ptr<upload::ChunkWriter> writer_;
    std::unique_ptr<upload::StorageBackends> backends_;
    std::unique_ptr<upload::Finalizer> finalizer_;
    std::unique_ptr<upload::UploadService> service_;

    bool defer_jobs = false;
    std::mutex jobs_mutex_;
    std::vector<std::function<void()>> pending_jobs;
};

} // namespace nexus::testing
