#include "cache/cache_archive.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace CIP {
namespace Cache {

namespace {

const std::string ARCHIVE_MAGIC = "CIPA1\n";

enum RecordType : char {
    RECORD_DIRECTORY = 'D',
    RECORD_FILE = 'F',
    RECORD_SYMLINK = 'L'
};

void appendU64(std::string& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void appendRecord(std::string& out, RecordType type, const std::string& path, uint32_t mode,
                  const std::string& payload) {
    out.push_back(static_cast<char>(type));
    appendU64(out, path.size());
    out += path;
    appendU64(out, mode);
    appendU64(out, payload.size());
    out += payload;
}

class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    bool atEnd() const { return offset_ == data_.size(); }

    char byte() {
        need(1);
        return data_[offset_++];
    }

    uint64_t u64() {
        need(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(static_cast<unsigned char>(data_[offset_ + i])) << (8 * i);
        }
        offset_ += 8;
        return value;
    }

    std::string bytes(uint64_t count) {
        need(count);
        std::string out = data_.substr(offset_, static_cast<size_t>(count));
        offset_ += static_cast<size_t>(count);
        return out;
    }

private:
    void need(uint64_t count) const {
        if (count > data_.size() - offset_) {
            throw ArchiveFormatError("Truncated cache archive");
        }
    }

    const std::string& data_;
    size_t offset_ = 0;
};

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

bool CacheArchive::isSafeRelative(const fs::path& path) {
    if (path.empty() || path.is_absolute()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

bool CacheArchive::crossesSymlink(const fs::path& base, const fs::path& relative) {
    fs::path current = base;
    const fs::path parent = relative.parent_path();
    for (const auto& part : parent) {
        current /= part;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

std::string CacheArchive::pack(const fs::path& base, const std::vector<std::string>& paths, ArchiveSummary* summary) {
    std::string out = ARCHIVE_MAGIC;
    ArchiveSummary local;

    auto addEntry = [&](const fs::path& absolute) {
        const std::string relative = absolute.lexically_relative(base).generic_string();
        const fs::file_status status = fs::symlink_status(absolute);
        const uint32_t mode = static_cast<uint32_t>(status.permissions()) & 07777;

        if (fs::is_symlink(status)) {
            appendRecord(out, RECORD_SYMLINK, relative, mode, fs::read_symlink(absolute).string());
            local.symlinks++;
        } else if (fs::is_directory(status)) {
            appendRecord(out, RECORD_DIRECTORY, relative, mode, "");
            local.directories++;
        } else if (fs::is_regular_file(status)) {
            std::string content = readFile(absolute);
            local.bytes += content.size();
            appendRecord(out, RECORD_FILE, relative, mode, content);
            local.files++;
        }
    };

    for (const auto& entry : paths) {
        fs::path relative = fs::path(entry).lexically_normal();
        if (!isSafeRelative(relative)) {
            throw std::invalid_argument("Cache path must stay inside the workspace: " + entry);
        }

        fs::path absolute = base / relative;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(absolute, ec))) {
            LOG_DEBUG("cache_archive", "Skipping missing cache path " + absolute.string());
            continue;
        }

        addEntry(absolute);
        if (fs::is_directory(fs::symlink_status(absolute))) {
            for (auto it = fs::recursive_directory_iterator(absolute); it != fs::recursive_directory_iterator(); ++it) {
                addEntry(it->path());
            }
        }
    }

    if (summary) {
        *summary = local;
    }
    return out;
}

ArchiveSummary CacheArchive::unpack(const std::string& data, const fs::path& base) {
    if (data.compare(0, ARCHIVE_MAGIC.size(), ARCHIVE_MAGIC) != 0) {
        throw ArchiveFormatError("Not a cache archive");
    }

    Reader reader(data);
    reader.bytes(ARCHIVE_MAGIC.size());
    ArchiveSummary summary;

    while (!reader.atEnd()) {
        const char type = reader.byte();
        const fs::path relative = fs::path(reader.bytes(reader.u64())).lexically_normal();
        const auto mode = static_cast<fs::perms>(reader.u64() & 07777);
        const std::string payload = reader.bytes(reader.u64());

        if (!isSafeRelative(relative)) {
            throw ArchiveFormatError("Unsafe path in cache archive: " + relative.string());
        }
        if (crossesSymlink(base, relative)) {
            throw ArchiveFormatError("Cache archive path crosses a symlink: " + relative.string());
        }
        const fs::path target = base / relative;
        fs::create_directories(target.parent_path());

        // EN: An entry restored earlier as a symlink must not redirect a file or directory record
        // FR: Une entrée restaurée plus tôt en symlink ne doit pas rediriger un fichier ou un répertoire
        std::error_code link_ec;
        if (type != RECORD_SYMLINK && fs::is_symlink(fs::symlink_status(target, link_ec))) {
            fs::remove(target);
        }

        switch (type) {
            case RECORD_DIRECTORY:
                fs::create_directories(target);
                fs::permissions(target, mode);
                summary.directories++;
                break;
            case RECORD_FILE: {
                std::ofstream out(target, std::ios::binary | std::ios::trunc);
                if (!out.is_open()) {
                    throw std::runtime_error("Cannot write " + target.string());
                }
                out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
                out.close();
                fs::permissions(target, mode);
                summary.files++;
                summary.bytes += payload.size();
                break;
            }
            case RECORD_SYMLINK: {
                std::error_code ec;
                fs::remove(target, ec);
                fs::create_symlink(payload, target);
                summary.symlinks++;
                break;
            }
            default:
                throw ArchiveFormatError("Unknown record type in cache archive");
        }
    }

    return summary;
}

} // namespace Cache
} // namespace CIP
