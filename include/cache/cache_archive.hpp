#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace CIP {
namespace Cache {

// EN: Raised when an archive blob cannot be decoded
// FR: Levée quand un blob d'archive ne peut être décodé
class ArchiveFormatError : public std::runtime_error {
public:
    explicit ArchiveFormatError(const std::string& message) : std::runtime_error(message) {}
};

struct ArchiveSummary {
    size_t files = 0;
    size_t directories = 0;
    size_t symlinks = 0;
    size_t bytes = 0;
};

// EN: Flat record archive of workspace-relative paths (directories, regular files, symlinks).
// FR: Archive plate d'enregistrements de chemins relatifs au workspace (répertoires, fichiers, liens).
class CacheArchive {
public:
    // EN: Paths that do not exist are skipped; paths escaping the base directory are rejected
    // FR: Les chemins inexistants sont ignorés ; ceux sortant du répertoire de base sont rejetés
    static std::string pack(const std::filesystem::path& base, const std::vector<std::string>& paths,
                            ArchiveSummary* summary = nullptr);

    // EN: Throws ArchiveFormatError on truncated data or unsafe entry paths
    // FR: Lance ArchiveFormatError sur données tronquées ou chemins d'entrée dangereux
    static ArchiveSummary unpack(const std::string& data, const std::filesystem::path& base);

    // EN: True for a non-empty relative path without ".." components
    // FR: Vrai pour un chemin relatif non vide sans composant ".."
    static bool isSafeRelative(const std::filesystem::path& path);

private:
    static bool crossesSymlink(const std::filesystem::path& base, const std::filesystem::path& relative);
};

} // namespace Cache
} // namespace CIP
