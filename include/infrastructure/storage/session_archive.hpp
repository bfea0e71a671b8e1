// EN: On-disk archive of finished sessions as JSON documents, optionally zlib-compressed.
// FR: Archive sur disque des sessions terminées en documents JSON, éventuellement compressés zlib.

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace OBF {

struct ArchiveOptions {
    std::string directory = "./archive";
    bool compress = true;
    int compression_level = 6;                   // EN: zlib level 1..9 / FR: Niveau zlib 1..9
};

class SessionArchive {
public:
    static constexpr const char* kPlainExtension = ".json";
    static constexpr const char* kCompressedExtension = ".json.z";

    explicit SessionArchive(ArchiveOptions options);

    // EN: Writes the document atomically (temp file then rename). Returns false on I/O error.
    // FR: Écrit le document de façon atomique (fichier temporaire puis renommage). Retourne false en cas d'erreur d'E/S.
    bool store(const std::string& session_id, const nlohmann::json& document);

    // EN: Reads back a stored document, whichever format it was written in.
    // FR: Relit un document stocké, quel que soit son format d'écriture.
    std::optional<nlohmann::json> load(const std::string& session_id) const;

    bool contains(const std::string& session_id) const;
    bool remove(const std::string& session_id);

    // EN: Archived session ids, sorted.
    // FR: Ids des sessions archivées, triés.
    std::vector<std::string> list() const;

    const ArchiveOptions& options() const { return options_; }

    // EN: zlib deflate/inflate helpers; throw std::runtime_error on corrupted input.
    // FR: Utilitaires deflate/inflate zlib ; lèvent std::runtime_error sur une entrée corrompue.
    static std::string compress(const std::string& data, int level);
    static std::string decompress(const std::string& data);

    // EN: Rejects ids that could escape the archive directory.
    // FR: Rejette les ids qui pourraient sortir du répertoire d'archive.
    static bool isSafeId(const std::string& session_id);

private:
    std::string pathFor(const std::string& session_id, bool compressed) const;

    ArchiveOptions options_;
    mutable std::mutex mutex_;
};

} // namespace OBF
