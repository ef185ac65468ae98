#include "skydome/io/manifest.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace skydome::io {

using json = nlohmann::json;

namespace {

const json& require_field(const json& obj, const char* key, size_t pos) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw InputMissingError("manifest record #" + std::to_string(pos) +
                                " has no '" + key + "'");
    }
    return *it;
}

double require_angle(const json& obj, const char* key, size_t pos) {
    const json& v = require_field(obj, key, pos);
    if (!v.is_number()) {
        throw InputMissingError("manifest record #" + std::to_string(pos) + " field '" +
                                key + "' is not a number");
    }
    const double d = v.get<double>();
    if (!std::isfinite(d)) {
        throw InputMissingError("manifest record #" + std::to_string(pos) + " field '" +
                                key + "' is not finite");
    }
    return d;
}

} // namespace

std::vector<PhotoRecord> parse_manifest(const json& doc) {
    if (!doc.is_array()) {
        throw DecodeError("manifest must be a JSON array of photo records");
    }

    std::vector<PhotoRecord> records;
    records.reserve(doc.size());
    std::set<int> seen;

    for (size_t pos = 0; pos < doc.size(); ++pos) {
        const json& item = doc[pos];
        if (!item.is_object()) {
            throw InputMissingError("manifest record #" + std::to_string(pos) +
                                    " is not an object");
        }

        PhotoRecord rec;
        const json& idx = require_field(item, "index", pos);
        if (!idx.is_number_integer()) {
            throw InputMissingError("manifest record #" + std::to_string(pos) +
                                    " field 'index' is not an integer");
        }
        rec.index = idx.get<int>();

        const json& ts = require_field(item, "timestamp", pos);
        if (!ts.is_number()) {
            throw InputMissingError("manifest record #" + std::to_string(pos) +
                                    " field 'timestamp' is not a number");
        }
        rec.timestamp = ts.is_number_integer() ? ts.get<int64_t>()
                                               : static_cast<int64_t>(ts.get<double>());

        rec.alpha = require_angle(item, "alpha", pos);
        rec.beta = require_angle(item, "beta", pos);
        rec.gamma = require_angle(item, "gamma", pos);

        const json& uri = require_field(item, "photoUri", pos);
        if (!uri.is_string() || uri.get<std::string>().empty()) {
            throw InputMissingError("manifest record #" + std::to_string(pos) +
                                    " field 'photoUri' is not a non-empty string");
        }
        rec.photo_uri = uri.get<std::string>();

        if (!seen.insert(rec.index).second) {
            throw ValidationError("duplicate photo index " + std::to_string(rec.index) +
                                  " in manifest");
        }
        records.push_back(std::move(rec));
    }

    std::sort(records.begin(), records.end(),
              [](const PhotoRecord& a, const PhotoRecord& b) { return a.index < b.index; });
    return records;
}

Manifest load_manifest(const fs::path& path) {
    if (!fs::exists(path)) {
        throw InputMissingError("manifest not found: " + path.string());
    }

    const auto bytes = core::read_bytes(path);
    json doc = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded()) {
        throw DecodeError("manifest is not valid JSON: " + path.string());
    }

    Manifest m;
    m.records = parse_manifest(doc);
    m.sha256 = core::sha256_bytes(bytes);

    std::cout << "[MANIFEST] " << path.string() << ": " << m.records.size()
              << " photo records" << std::endl;
    return m;
}

fs::path resolve_photo_path(const fs::path& photos_dir, const PhotoRecord& record) {
    std::string uri = record.photo_uri;
    const auto slash = uri.find_last_of("/\\");
    if (slash != std::string::npos) {
        uri = uri.substr(slash + 1);
    }
    return photos_dir / uri;
}

} // namespace skydome::io
