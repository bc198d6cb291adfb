#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

class ModelCatalog {
public:
    virtual ~ModelCatalog() = default;
    virtual bool is_available(const std::string& model_id) const = 0;
    virtual std::optional<std::string> checksum(const std::string& model_id) const = 0;
};

struct ManifestEntry {
    std::string model_id;
    std::optional<std::string> checksum;
    std::string format = "ggml";
    std::string last_updated;
};

// Models stored as `<models_dir>/<id>.bin` (or a directory `<models_dir>/<id>`), with the
// checksum recorded at install time kept in `<models_dir>/manifest.json`.
class FileModelCatalog : public ModelCatalog {
public:
    static constexpr int kManifestVersion = 1;

    explicit FileModelCatalog(std::string models_dir);

    // Reads the manifest. Missing or unreadable manifests leave the catalog empty.
    void load();

    bool is_available(const std::string& model_id) const override;
    std::optional<std::string> checksum(const std::string& model_id) const override;

    std::string model_path(const std::string& model_id) const;
    const std::vector<ManifestEntry>& entries() const { return entries_; }

    std::expected<void, std::string> upsert(ManifestEntry entry);
    std::expected<void, std::string> remove(const std::string& model_id);

private:
    std::expected<void, std::string> persist() const;

    std::string models_dir_;
    std::vector<ManifestEntry> entries_;
};
