// EN: Implementation of SessionArchive - JSON documents on disk with zlib deflate.
// FR: Implémentation de SessionArchive - documents JSON sur disque avec deflate zlib.

#include "infrastructure/storage/session_archive.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

namespace OBF {

namespace fs = std::filesystem;

SessionArchive::SessionArchive(ArchiveOptions options) : options_(std::move(options)) {
    if (options_.directory.empty()) {
        throw std::invalid_argument("Archive directory must not be empty");
    }
    options_.compression_level = std::clamp(options_.compression_level, 1, 9);
}

bool SessionArchive::isSafeId(const std::string& session_id) {
    if (session_id.empty() || session_id == "." || session_id == "..") {
        return false;
    }
    return std::all_of(session_id.begin(), session_id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

std::string SessionArchive::pathFor(const std::string& session_id, bool compressed) const {
    return (fs::path(options_.directory) / (session_id + (compressed ? kCompressedExtension : kPlainExtension))).string();
}

bool SessionArchive::store(const std::string& session_id, const nlohmann::json& document) {
    if (!isSafeId(session_id)) {
        LOG_ERROR("archive", "Refusing to archive unsafe session id: " + session_id);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        fs::create_directories(options_.directory);

        const std::string payload = options_.compress
            ? compress(document.dump(), options_.compression_level)
            : document.dump(2);
        const std::string target = pathFor(session_id, options_.compress);
        const std::string temp = target + ".tmp";

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                LOG_ERROR("archive", "Failed to open archive file for writing: " + temp);
                return false;
            }
            file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            if (!file) {
                LOG_ERROR("archive", "Failed to write archive file: " + temp);
                return false;
            }
        }
        fs::rename(temp, target);

        // EN: A session is kept in one format only.
        // FR: Une session n'est conservée que dans un seul format.
        std::error_code ignored;
        fs::remove(pathFor(session_id, !options_.compress), ignored);

        LOG_DEBUG("archive", "Session archived: " + target + " (" + std::to_string(payload.size()) + " bytes)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("archive", "Error archiving session " + session_id + ": " + std::string(e.what()));
        return false;
    }
}

std::optional<nlohmann::json> SessionArchive::load(const std::string& session_id) const {
    if (!isSafeId(session_id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (bool compressed : {true, false}) {
        const std::string path = pathFor(session_id, compressed);
        if (!fs::exists(path)) {
            continue;
        }
        try {
            std::ifstream file(path, std::ios::binary);
            std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            return nlohmann::json::parse(compressed ? decompress(raw) : raw);
        } catch (const std::exception& e) {
            LOG_ERROR("archive", "Error loading archived session " + path + ": " + std::string(e.what()));
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool SessionArchive::contains(const std::string& session_id) const {
    if (!isSafeId(session_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::exists(pathFor(session_id, true)) || fs::exists(pathFor(session_id, false));
}

bool SessionArchive::remove(const std::string& session_id) {
    if (!isSafeId(session_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const bool removed_compressed = fs::remove(pathFor(session_id, true), ec);
    const bool removed_plain = fs::remove(pathFor(session_id, false), ec);
    return removed_compressed || removed_plain;
}

std::vector<std::string> SessionArchive::list() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(options_.directory, ec)) {
        return ids;
    }
    const std::string compressed_ext = kCompressedExtension;
    const std::string plain_ext = kPlainExtension;
    for (const auto& entry : fs::directory_iterator(options_.directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        for (const std::string& ext : {compressed_ext, plain_ext}) {
            if (name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
                ids.push_back(name.substr(0, name.size() - ext.size()));
                break;
            }
        }
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

std::string SessionArchive::compress(const std::string& data, int level) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, level) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[32768];
    std::string compressed;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
        zs.avail_out = sizeof(outbuffer);

        ret = deflate(&zs, Z_FINISH);

        if (compressed.size() < zs.total_out) {
            compressed.append(outbuffer, zs.total_out - compressed.size());
        }
    } while (ret == Z_OK);

    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Failed to compress data");
    }
    return compressed;
}

std::string SessionArchive::decompress(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (inflateInit(&zs) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[32768];
    std::string inflated;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
        zs.avail_out = sizeof(outbuffer);

        ret = inflate(&zs, Z_NO_FLUSH);

        if (inflated.size() < zs.total_out) {
            inflated.append(outbuffer, zs.total_out - inflated.size());
        }
    } while (ret == Z_OK);

    inflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Failed to decompress data: corrupted or truncated input");
    }
    return inflated;
}

} // namespace OBF
