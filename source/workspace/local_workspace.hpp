#ifndef CTXBRIDGE_LOCAL_WORKSPACE_HPP
#define CTXBRIDGE_LOCAL_WORKSPACE_HPP

// Filesystem-backed workspace for one window: root folders, a trust flag and a list of open files.
// Traversal skips hidden entries (names starting with '.') and is bounded by Limits.
// Folder and file URIs are "file://" followed by the absolute path.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "workspace/workspace_abi.hpp"

namespace local_workspace {

struct WorkspaceFolder {
    std::string path;
    std::string uri;
    std::string name;
};

struct FileData {
    std::string full_path;
    std::string content;
    std::string language_id;
};

struct SearchResult {
    std::string path;
    std::string name;
    std::string type; // "file" or "folder"
    std::string uri;
    std::string workspace_folder_uri;
    std::string workspace_folder_name;
    std::string relative_path;
};

struct DirectoryEntry {
    std::string name;
    std::string type; // "file" or "folder"
    std::string uri;
};

// Result of reading one file.
struct FileReadResult {
    bool success = false;
    FileData file_data;
    std::string error_code;
    std::string error_detail;
};

// Result of collecting every readable text file below a folder.
struct FileCollectionResult {
    bool success = false;
    std::vector<FileData> files;
    std::string error_code;
    std::string error_detail;
};

// Result of listing one folder.
struct ListingResult {
    bool success = false;
    std::vector<DirectoryEntry> entries;
    std::string parent_folder_uri;
    std::string error_code;
    std::string error_detail;
};

// Error kinds specific to workspace access.
constexpr const char *FILE_NOT_FOUND = "FILE_NOT_FOUND";
constexpr const char *FOLDER_NOT_FOUND = "FOLDER_NOT_FOUND";
constexpr const char *WORKSPACE_FOLDER_NOT_FOUND = "WORKSPACE_FOLDER_NOT_FOUND";
constexpr const char *PATH_OUTSIDE_WORKSPACE = "PATH_OUTSIDE_WORKSPACE";
constexpr const char *BINARY_FILE = "BINARY_FILE";
constexpr const char *FILE_TOO_LARGE = "FILE_TOO_LARGE";
constexpr const char *NO_ACTIVE_FILE = "NO_ACTIVE_FILE";

struct Limits {
    int max_depth = 12;
    size_t max_files = 500;
    size_t max_file_bytes = 1024 * 1024;
    size_t max_search_results = 200;
};

// "file://" + path.
std::string path_to_uri(const std::string &path);

// Strip a leading "file://"; anything else is returned unchanged.
std::string uri_to_path(const std::string &uri);

// Editor language id guessed from the file name ("cpp", "python", ... or "plaintext").
std::string language_id_for(const std::string &path);

class LocalWorkspace : public workspace::WorkspaceContext {
public:
    LocalWorkspace(const std::vector<std::string> &folder_paths, const std::vector<std::string> &open_file_paths,
                   bool trusted, const Limits &limits = Limits());

    bool is_trusted() const override;
    bool has_open_folder() const override;

    const std::vector<WorkspaceFolder> &folders() const { return folders_; }

    // Open files as absolute paths; the first is the active file.
    const std::vector<std::string> &open_files() const { return open_files_; }

    // The single folder's name, or the folder names joined with ", ".
    std::string workspace_name() const;

    std::optional<WorkspaceFolder> find_folder_by_uri(const std::string &folder_uri) const;

    // Workspace folder that contains path.
    std::optional<WorkspaceFolder> folder_containing(const std::string &path) const;

    // True when path lies inside a workspace folder or is one of the open files.
    bool is_accessible(const std::string &path) const;

    // Case-insensitive substring match on entry names below scope (every folder when empty).
    std::vector<SearchResult> search(const std::string &query, const std::optional<WorkspaceFolder> &scope) const;

    // Indented tree of folder, one entry per line.
    std::string file_tree(const WorkspaceFolder &folder) const;

    FileReadResult read_file(const std::string &path) const;
    FileCollectionResult collect_files(const std::string &directory_path) const;
    ListingResult list_directory(const std::string &directory_path) const;

    const Limits &limits() const { return limits_; }

private:
    std::vector<WorkspaceFolder> folders_;
    std::vector<std::string> open_files_;
    bool trusted_;
    Limits limits_;
};

} // namespace local_workspace

#endif // CTXBRIDGE_LOCAL_WORKSPACE_HPP
