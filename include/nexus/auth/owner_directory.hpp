/**
 * @file owner_directory.hpp
 * @brief Owners, credential lookup and where an owner's files live
 *
 * The upload pipeline only needs three things from the surrounding
 * application: turn a credential into an Owner, map an Owner to its
 * storage root, and tell someone when that storage changed. Each is an
 * interface so tests can swap them out.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/events/event_bus.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nexus::auth {

struct Owner {
    std::string name;     // stable identifier, stored on sessions
    std::string folder;   // directory below the upload root
};

class OwnerDirectory {
public:
    virtual ~OwnerDirectory() = default;

    virtual std::optional<Owner> authenticate(const std::string& credential) const = 0;
    virtual std::optional<Owner> find(const std::string& name) const = 0;
    virtual std::vector<Owner> list_owners() const = 0;
};

/**
 * @brief OwnerDirectory backed by a JSON file
 *
 * Format: [{"name": "alice", "folder": "alice", "credential_sha256": "<hex>"}]
 * Only the SHA-256 of each credential is stored. reload() re-reads the
 * file; on a parse error the previous owner list stays in effect.
 */
class JsonOwnerDirectory : public OwnerDirectory {
public:
    explicit JsonOwnerDirectory(std::filesystem::path file);

    Result<std::size_t, Error> reload();

    // Replace the owner list directly (used when no file is configured).
    void add(Owner owner, const std::string& credential);

    std::optional<Owner> authenticate(const std::string& credential) const override;
    std::optional<Owner> find(const std::string& name) const override;
    std::vector<Owner> list_owners() const override;

private:
    struct Record {
        Owner owner;
        std::string credential_sha256;
    };

    std::filesystem::path file_;
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

class StorageLayout {
public:
    explicit StorageLayout(std::filesystem::path upload_root) : upload_root_(std::move(upload_root)) {}
    virtual ~StorageLayout() = default;

    virtual std::filesystem::path resolve_owner_root(const Owner& owner) const {
        return upload_root_ / owner.folder;
    }

    const std::filesystem::path& upload_root() const { return upload_root_; }

private:
    std::filesystem::path upload_root_;
};

class OwnerNotifier {
public:
    virtual ~OwnerNotifier() = default;
    virtual void owner_changed(const std::string& owner) = 0;
};

// Publishes OwnerChangedEvent. Handler failures are logged, never propagated.
class EventBusNotifier : public OwnerNotifier {
public:
    explicit EventBusNotifier(events::EventBus& bus) : bus_(bus) {}
    void owner_changed(const std::string& owner) override;

private:
    events::EventBus& bus_;
};

} // namespace nexus::auth
