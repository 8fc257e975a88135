#include "pack/pack_metadata.hpp"

#include "crypto/digest.hpp"
#include "io/file_reader.hpp"
#include "pack/archive_handle.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace packsmith {

std::string ComputeContentHash(std::vector<std::pair<std::string, std::string>> id_versions) {
    std::sort(id_versions.begin(), id_versions.end());

    DigestHasher hasher(DigestAlgorithm::Sha1);
    for (const auto& [id, version] : id_versions) {
        const std::string item = id + ":" + (version.empty() ? std::string("N/A") : version);
        hasher.Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(item.data()), item.size()));
    }
    return hasher.FinalHex().substr(0, 7);
}

std::string PackBaseName(const std::string& prefix, const std::string& date, const std::string& content_hash) {
    return prefix + "-" + date + "-" + content_hash;
}

std::string SerializePackManifest(const PackManifest& m) {
    nlohmann::ordered_json comps = nlohmann::ordered_json::object();
    for (const auto& c : m.components) {
        nlohmann::ordered_json entry{
            {"name", c.name},
            {"version", c.version},
            {"category", c.category},
            {"source", c.source},
            {"asset_sha256", c.asset_sha256},
        };
        if (c.assets.size() > 1) {
            nlohmann::ordered_json assets = nlohmann::ordered_json::array();
            for (const auto& a : c.assets) assets.push_back({{"filename", a.filename}, {"sha256", a.sha256}});
            entry["assets"] = std::move(assets);
        }
        entry["files"] = c.files;
        comps[c.id] = std::move(entry);
    }

    nlohmann::ordered_json j{
        {"pack_name", m.pack_name},
        {"build_date", m.build_date},
        {"builder_version", m.builder_version},
        {"supported_firmware", m.supported_firmware},
        {"content_hash", m.content_hash},
        {"components", std::move(comps)},
    };
    return j.dump(2) + "\n";
}

std::expected<PackManifest, std::string> ParsePackManifest(std::string_view text) {
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string(e.what()));
    }
    if (!j.is_object()) return std::unexpected(std::string("pack manifest must be an object"));

    PackManifest m;
    try {
        m.pack_name = j.value("pack_name", std::string());
        m.build_date = j.value("build_date", std::string());
        m.builder_version = j.value("builder_version", std::string());
        m.supported_firmware = j.value("supported_firmware", std::string(kUnknownFirmware));
        m.content_hash = j.value("content_hash", std::string());

        auto comps = j.find("components");
        if (comps == j.end() || !comps->is_object()) {
            return std::unexpected(std::string("pack manifest has no components object"));
        }
        for (auto it = comps->begin(); it != comps->end(); ++it) {
            const auto& c = it.value();
            PackComponentInfo info;
            info.id = it.key();
            info.name = c.value("name", info.id);
            info.version = c.value("version", std::string());
            info.category = c.value("category", std::string());
            info.source = c.value("source", c.value("repo", std::string()));
            info.asset_sha256 = c.value("asset_sha256", std::string());
            if (auto assets = c.find("assets"); assets != c.end() && assets->is_array()) {
                for (const auto& a : *assets) {
                    info.assets.push_back(PackAssetInfo{a.value("filename", std::string()),
                                                        a.value("sha256", std::string())});
                }
            }
            info.files = c.value("files", std::vector<std::string>{});
            m.components.push_back(std::move(info));
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return m;
}

Result LoadPackManifest(const std::string& path, PackManifest& out) {
    std::string text;
    Result res;

    if (HasArchiveExtension(path)) {
        ArchiveHandle pack;
        res = ArchiveHandle::OpenFile(path, "", pack);
        if (res.is_ok()) res = pack.ReadEntry(kPackManifestName, text);
    } else {
        res = ReadFileToString(path, text);
    }
    if (!res.is_ok()) return res;

    auto parsed = ParsePackManifest(text);
    if (!parsed) return Result::Fail(ErrorKind::ManifestCorrupt, path + ": " + parsed.error());
    out = std::move(*parsed);
    return Result::Ok();
}

std::string RenderPackSummary(const PackManifest& m,
                              const PackManifest* previous,
                              const std::string& comment,
                              const std::string& generated_at) {
    std::ostringstream os;
    os << "# Pack Summary\n\n";
    os << "**Generated on:** " << generated_at << "  \n";
    os << "**Builder Version:** " << m.builder_version << "  \n";
    if (!m.content_hash.empty()) os << "**Content Hash:** " << m.content_hash << "  \n";
    if (!m.supported_firmware.empty() && m.supported_firmware != kUnknownFirmware) {
        os << "**Supported Firmware:** Up to " << m.supported_firmware << "  \n";
    }
    os << "\n---\n\n";

    std::vector<std::string> changes;
    if (previous) {
        for (const auto& c : m.components) {
            auto it = std::find_if(previous->components.begin(), previous->components.end(),
                                   [&](const PackComponentInfo& p) { return p.id == c.id; });
            if (it != previous->components.end() && it->version != c.version) {
                changes.push_back("- **" + c.name + ":** " + it->version + " -> **" + c.version + "**");
            }
        }
    }

    if (!changes.empty() || !comment.empty()) {
        os << "## CHANGELOG (What's New Since Last Build)\n\n";
        if (!comment.empty()) os << "### Build Notes:\n" << comment << "\n\n";
        if (!changes.empty()) {
            os << "### Version Updates:\n";
            for (const auto& line : changes) os << line << "\n";
        }
        os << "\n---\n\n";
    }

    os << "## INCLUDED COMPONENTS\n";

    std::map<std::string, std::vector<const PackComponentInfo*>> by_category;
    for (const auto& c : m.components) {
        by_category[c.category.empty() ? std::string("Uncategorized") : c.category].push_back(&c);
    }
    for (auto& [category, comps] : by_category) {
        std::string upper = category;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        os << "\n### " << upper << "\n";

        std::sort(comps.begin(), comps.end(),
                  [](const PackComponentInfo* a, const PackComponentInfo* b) { return a->name < b->name; });
        for (const auto* c : comps) {
            os << "- **" << c->name << "**";
            if (!c->version.empty()) os << " (" << c->version << ")";
            if (!c->source.empty()) os << " - " << c->source;
            os << "\n";
        }
    }

    os << "\n---\n\n<sub>Generated with packsmith</sub>\n";
    return os.str();
}

} // namespace packsmith
