#include "model_catalog.hpp"

#include "jobs/job.hpp"
#include "storage/atomic_file.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

FileModelCatalog::FileModelCatalog(std::string models_dir)
    : models_dir_(std::move(models_dir)) {}

void FileModelCatalog::load() {
    entries_.clear();
    auto manifest = fs::path(models_dir_) / "manifest.json";
    std::ifstream f(manifest);
    if (!f.is_open()) return;

    try {
        auto j = json::parse(f);
        for (auto& e : j.value("entries", json::array())) {
            ManifestEntry entry;
            entry.model_id = e.at("model_id").get<std::string>();
            if (e.contains("checksum") && !e["checksum"].is_null()) {
                entry.checksum = e["checksum"].get<std::string>();
            }
            entry.format = e.value("format", "ggml");
            entry.last_updated = e.value("last_updated", "");
            entries_.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        std::println(stderr, "models: failed to decode manifest: {}", e.what());
        entries_.clear();
    }
}

std::string FileModelCatalog::model_path(const std::string& model_id) const {
    auto dir = fs::path(models_dir_) / model_id;
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return dir.string();
    return (fs::path(models_dir_) / (model_id + ".bin")).string();
}

bool FileModelCatalog::is_available(const std::string& model_id) const {
    if (model_id.empty()) return false;
    std::error_code ec;
    auto p = fs::path(model_path(model_id));
    if (fs::is_directory(p, ec)) return true;
    return fs::is_regular_file(p, ec) && fs::file_size(p, ec) > 0;
}

std::optional<std::string> FileModelCatalog::checksum(const std::string& model_id) const {
    auto it = std::ranges::find_if(entries_, [&](const ManifestEntry& e) {
        return e.model_id == model_id;
    });
    if (it == entries_.end()) return std::nullopt;
    return it->checksum;
}

std::expected<void, std::string> FileModelCatalog::upsert(ManifestEntry entry) {
    if (entry.last_updated.empty()) entry.last_updated = utc_timestamp();
    auto it = std::ranges::find_if(entries_, [&](const ManifestEntry& e) {
        return e.model_id == entry.model_id;
    });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
    return persist();
}

std::expected<void, std::string> FileModelCatalog::remove(const std::string& model_id) {
    std::erase_if(entries_, [&](const ManifestEntry& e) { return e.model_id == model_id; });
    return persist();
}

std::expected<void, std::string> FileModelCatalog::persist() const {
    json j = {{"version", kManifestVersion}, {"entries", json::array()}};
    for (auto& e : entries_) {
        json entry = {
            {"model_id", e.model_id},
            {"format", e.format},
            {"last_updated", e.last_updated},
        };
        entry["checksum"] = e.checksum ? json(*e.checksum) : json(nullptr);
        j["entries"].push_back(std::move(entry));
    }
    return atomic_write((fs::path(models_dir_) / "manifest.json").string(), j.dump(2));
}
