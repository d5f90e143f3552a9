#include "nexus/auth/owner_directory.hpp"

#include "nexus/core/digest.hpp"
#include "nexus/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace nexus::auth {

JsonOwnerDirectory::JsonOwnerDirectory(std::filesystem::path file) : file_(std::move(file)) {}

Result<std::size_t, Error> JsonOwnerDirectory::reload() {
    std::ifstream in(file_);
    if (!in) {
        return Fail<std::size_t>(ErrorCode::NotFound, "owners file not found: " + file_.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::vector<Record> loaded;
    try {
        const auto j = nlohmann::json::parse(buffer.str());
        if (!j.is_array()) {
            return Fail<std::size_t>(ErrorCode::Validation, "owners file must contain a JSON array");
        }
        for (const auto& item : j) {
            Record record;
            record.owner.name = item.at("name").get<std::string>();
            record.owner.folder = item.value("folder", record.owner.name);
            record.credential_sha256 = item.at("credential_sha256").get<std::string>();
            if (record.owner.name.empty() || record.owner.folder.empty() ||
                record.owner.folder.find("..") != std::string::npos ||
                record.owner.folder.front() == '/') {
                return Fail<std::size_t>(ErrorCode::Validation, "invalid owner entry: " + item.dump());
            }
            loaded.push_back(std::move(record));
        }
    } catch (const nlohmann::json::exception& e) {
        return Fail<std::size_t>(ErrorCode::Validation, std::string("owners file: ") + e.what());
    }

    std::lock_guard lock(mutex_);
    records_ = std::move(loaded);
    spdlog::info("Loaded {} owners from {}", records_.size(), file_.string());
    return Ok<std::size_t, Error>(records_.size());
}

void JsonOwnerDirectory::add(Owner owner, const std::string& credential) {
    std::lock_guard lock(mutex_);
    records_.push_back(Record{std::move(owner), core::sha256_hex(credential)});
}

std::optional<Owner> JsonOwnerDirectory::authenticate(const std::string& credential) const {
    if (credential.empty()) {
        return std::nullopt;
    }
    const auto digest = core::sha256_hex(credential);

    std::lock_guard lock(mutex_);
    for (const auto& record : records_) {
        if (core::digest_equals(record.credential_sha256, digest)) {
            return record.owner;
        }
    }
    return std::nullopt;
}

std::optional<Owner> JsonOwnerDirectory::find(const std::string& name) const {
    std::lock_guard lock(mutex_);
    for (const auto& record : records_) {
        if (record.owner.name == name) {
            return record.owner;
        }
    }
    return std::nullopt;
}

std::vector<Owner> JsonOwnerDirectory::list_owners() const {
    std::lock_guard lock(mutex_);
    std::vector<Owner> owners;
    owners.reserve(records_.size());
    for (const auto& record : records_) {
        owners.push_back(record.owner);
    }
    return owners;
}

void EventBusNotifier::owner_changed(const std::string& owner) {
    try {
        events::OwnerChangedEvent event;
        event.owner = owner;
        bus_.emit(event);
    } catch (const std::exception& e) {
        spdlog::warn("Owner change notification for {} failed: {}", owner, e.what());
    }
}

} // namespace nexus::auth
