#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

/// A file removed from the outbox, ready to be sent.
struct StagedFile {
    std::string name;
    std::string bytes;
};

/**
 * The two transfer directories under the base directory:
 *
 *   <base>/from_<peer>   inbox, filled by uploads
 *   <base>/to_<peer>     outbox, holds at most one staged file
 *
 * Outbox mutation (stage / take_staged) is serialised; the inbox is not locked,
 * so concurrent same-name uploads are last-writer-wins.
 */
class StorageLayout {
public:
    StorageLayout(std::filesystem::path base_dir, std::string peer_name);

    [[nodiscard]] const std::filesystem::path& base_dir()   const { return base_dir_; }
    [[nodiscard]] const std::filesystem::path& inbox_dir()  const { return inbox_dir_; }
    [[nodiscard]] const std::filesystem::path& outbox_dir() const { return outbox_dir_; }
    [[nodiscard]] const std::string& peer_name() const { return peer_name_; }

    /// Create the inbox if missing. Throws std::filesystem::filesystem_error.
    void ensure_inbox() const;

    /// Replace the outbox contents with a copy of `source`. Logs and returns false on failure.
    bool stage(const std::filesystem::path& source);

    /// "No files received" or "Received: <first inbox entry>".
    [[nodiscard]] std::string inspect() const;

    /// Remove the staged file from the outbox and return its contents.
    /// nullopt when nothing is staged; throws on I/O failure.
    std::optional<StagedFile> take_staged();

    [[nodiscard]] std::size_t inbox_count() const;
    [[nodiscard]] std::optional<std::string> staged_name() const;

private:
    std::optional<std::filesystem::path> find_staged_locked() const;

    std::filesystem::path base_dir_;
    std::string peer_name_;
    std::filesystem::path inbox_dir_;
    std::filesystem::path outbox_dir_;

    mutable std::mutex outbox_mutex_;
    std::optional<std::filesystem::path> staged_;  // set by stage(), cleared by take_staged()
};

/// Final path component of a client-supplied filename; nullopt for "", "." or "..".
std::optional<std::string> sanitize_filename(const std::string& filename);
