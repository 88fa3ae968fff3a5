#include "workspace/local_workspace.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>

namespace local_workspace {

namespace fs = std::filesystem;

static const std::string FILE_URI_PREFIX = "file://";

std::string path_to_uri(const std::string &path) {
    return FILE_URI_PREFIX + path;
}

std::string uri_to_path(const std::string &uri) {
    if (uri.compare(0, FILE_URI_PREFIX.size(), FILE_URI_PREFIX) == 0) {
        return uri.substr(FILE_URI_PREFIX.size());
    }
    return uri;
}

std::string language_id_for(const std::string &path) {
    static const std::map<std::string, std::string> language_by_extension = {
        {".c", "c"},          {".h", "cpp"},           {".cc", "cpp"},         {".cpp", "cpp"},
        {".cxx", "cpp"},      {".hpp", "cpp"},         {".hh", "cpp"},         {".py", "python"},
        {".js", "javascript"}, {".jsx", "javascriptreact"}, {".ts", "typescript"}, {".tsx", "typescriptreact"},
        {".json", "json"},    {".md", "markdown"},     {".java", "java"},      {".go", "go"},
        {".rs", "rust"},      {".rb", "ruby"},         {".sh", "shellscript"}, {".html", "html"},
        {".css", "css"},      {".yml", "yaml"},        {".yaml", "yaml"},      {".xml", "xml"},
        {".cmake", "cmake"},  {".txt", "plaintext"},
    };

    fs::path file_path(path);
    if (file_path.filename() == "CMakeLists.txt") {
        return "cmake";
    }
    std::string extension = file_path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    auto language_iterator = language_by_extension.find(extension);
    return language_iterator == language_by_extension.end() ? "plaintext" : language_iterator->second;
}

// Absolute, normalized, without a trailing separator.
static std::string normalize_path(const std::string &path) {
    std::error_code error;
    fs::path absolute_path = fs::absolute(fs::path(path), error);
    if (error) {
        absolute_path = fs::path(path);
    }
    std::string normalized = absolute_path.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

static bool is_hidden(const fs::path &path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

// Visible children of directory: folders first, then files, each sorted by name.
static std::vector<fs::directory_entry> sorted_children(const fs::path &directory) {
    std::vector<fs::directory_entry> children;
    std::error_code error;
    fs::directory_iterator iterator(directory, fs::directory_options::skip_permission_denied, error);
    if (error) {
        return children;
    }
    for (fs::directory_iterator end; iterator != end; iterator.increment(error)) {
        if (error) {
            break;
        }
        if (!is_hidden(iterator->path())) {
            children.push_back(*iterator);
        }
    }
    std::sort(children.begin(), children.end(), [](const fs::directory_entry &left, const fs::directory_entry &right) {
        std::error_code ignored;
        bool left_is_directory = left.is_directory(ignored);
        bool right_is_directory = right.is_directory(ignored);
        if (left_is_directory != right_is_directory) {
            return left_is_directory;
        }
        return left.path().filename().string() < right.path().filename().string();
    });
    return children;
}

static bool looks_binary(const std::string &content) {
    const size_t probe_length = std::min<size_t>(content.size(), 8000);
    return content.find('\0') < probe_length;
}

static bool path_is_within(const std::string &path, const std::string &folder) {
    if (path == folder) {
        return true;
    }
    std::string prefix = folder == "/" ? folder : folder + "/";
    return path.compare(0, prefix.size(), prefix) == 0;
}

LocalWorkspace::LocalWorkspace(const std::vector<std::string> &folder_paths,
                               const std::vector<std::string> &open_file_paths, bool trusted, const Limits &limits)
    : trusted_(trusted), limits_(limits) {
    for (const auto &folder_path : folder_paths) {
        WorkspaceFolder folder;
        folder.path = normalize_path(folder_path);
        folder.uri = path_to_uri(folder.path);
        folder.name = fs::path(folder.path).filename().string();
        if (folder.name.empty()) {
            folder.name = folder.path;
        }
        std::error_code error;
        if (!fs::is_directory(folder.path, error)) {
            debug_log::log_message("Warning: Workspace folder " + folder.path + " does not exist or is not a directory.");
        }
        folders_.push_back(folder);
    }
    for (const auto &open_file_path : open_file_paths) {
        open_files_.push_back(normalize_path(open_file_path));
    }
}

bool LocalWorkspace::is_trusted() const {
    return trusted_;
}

bool LocalWorkspace::has_open_folder() const {
    return !folders_.empty();
}

std::string LocalWorkspace::workspace_name() const {
    std::string name;
    for (const auto &folder : folders_) {
        if (!name.empty()) {
            name += ", ";
        }
        name += folder.name;
    }
    return name;
}

std::optional<WorkspaceFolder> LocalWorkspace::find_folder_by_uri(const std::string &folder_uri) const {
    std::string wanted_path = normalize_path(uri_to_path(folder_uri));
    for (const auto &folder : folders_) {
        if (folder.path == wanted_path) {
            return folder;
        }
    }
    return std::nullopt;
}

std::optional<WorkspaceFolder> LocalWorkspace::folder_containing(const std::string &path) const {
    std::string normalized = normalize_path(path);
    const WorkspaceFolder *best_folder = nullptr;
    for (const auto &folder : folders_) {
        // Nested roots: the deepest folder wins.
        if (path_is_within(normalized, folder.path) &&
            (best_folder == nullptr || folder.path.size() > best_folder->path.size())) {
            best_folder = &folder;
        }
    }
    if (best_folder == nullptr) {
        return std::nullopt;
    }
    return *best_folder;
}

bool LocalWorkspace::is_accessible(const std::string &path) const {
    std::string normalized = normalize_path(path);
    if (folder_containing(normalized)) {
        return true;
    }
    return std::find(open_files_.begin(), open_files_.end(), normalized) != open_files_.end();
}

std::vector<SearchResult> LocalWorkspace::search(const std::string &query,
                                                 const std::optional<WorkspaceFolder> &scope) const {
    std::vector<SearchResult> results;
    const std::string needle = to_lower(query);
    if (needle.empty()) {
        return results;
    }

    std::vector<WorkspaceFolder> search_folders;
    if (scope) {
        search_folders.push_back(*scope);
    } else {
        search_folders = folders_;
    }

    for (const auto &folder : search_folders) {
        // Depth-first walk with an explicit stack of (directory, depth).
        std::vector<std::pair<fs::path, int>> pending_directories = {{fs::path(folder.path), 0}};
        while (!pending_directories.empty() && results.size() < limits_.max_search_results) {
            auto current = pending_directories.back();
            pending_directories.pop_back();

            std::vector<fs::directory_entry> children = sorted_children(current.first);
            for (auto child_iterator = children.rbegin(); child_iterator != children.rend(); ++child_iterator) {
                std::error_code error;
                bool is_directory = child_iterator->is_directory(error);
                if (is_directory && current.second + 1 < limits_.max_depth) {
                    pending_directories.push_back({child_iterator->path(), current.second + 1});
                }
            }

            for (const auto &child : children) {
                if (results.size() >= limits_.max_search_results) {
                    break;
                }
                std::string name = child.path().filename().string();
                if (to_lower(name).find(needle) == std::string::npos) {
                    continue;
                }
                std::error_code error;
                SearchResult result;
                result.path = child.path().string();
                result.name = name;
                result.type = child.is_directory(error) ? "folder" : "file";
                result.uri = path_to_uri(result.path);
                result.workspace_folder_uri = folder.uri;
                result.workspace_folder_name = folder.name;
                result.relative_path = child.path().lexically_relative(folder.path).string();
                results.push_back(result);
            }
        }
    }
    return results;
}

static void append_tree(const fs::path &directory, const std::string &prefix, int depth, const Limits &limits,
                        size_t &line_count, bool &truncated, std::string &output) {
    std::vector<fs::directory_entry> children = sorted_children(directory);
    for (size_t index = 0; index < children.size(); index++) {
        if (line_count >= limits.max_files) {
            truncated = true;
            return;
        }
        const bool is_last = index + 1 == children.size();
        std::error_code error;
        const bool is_directory = children[index].is_directory(error);
        output += prefix + (is_last ? "└── " : "├── ") + children[index].path().filename().string() +
                  (is_directory ? "/" : "") + "\n";
        line_count++;
        if (is_directory) {
            if (depth + 1 >= limits.max_depth) {
                truncated = true;
                continue;
            }
            append_tree(children[index].path(), prefix + (is_last ? "    " : "│   "), depth + 1, limits, line_count,
                        truncated, output);
        }
    }
}

std::string LocalWorkspace::file_tree(const WorkspaceFolder &folder) const {
    std::string output = folder.name + "/\n";
    size_t line_count = 0;
    bool truncated = false;
    append_tree(fs::path(folder.path), "", 0, limits_, line_count, truncated, output);
    if (truncated) {
        output += "... (truncated)\n";
    }
    return output;
}

FileReadResult LocalWorkspace::read_file(const std::string &path) const {
    FileReadResult result;
    const std::string full_path = normalize_path(uri_to_path(path));
    if (!is_accessible(full_path)) {
        result.error_code = PATH_OUTSIDE_WORKSPACE;
        result.error_detail = "File is outside the workspace: " + full_path;
        return result;
    }

    std::error_code error;
    if (!fs::is_regular_file(full_path, error)) {
        result.error_code = FILE_NOT_FOUND;
        result.error_detail = "File not found: " + full_path;
        return result;
    }
    uintmax_t file_size = fs::file_size(full_path, error);
    if (!error && file_size > limits_.max_file_bytes) {
        result.error_code = FILE_TOO_LARGE;
        result.error_detail = "File exceeds " + std::to_string(limits_.max_file_bytes) + " bytes: " + full_path;
        return result;
    }

    std::string content;
    if (!platform::read_file_contents(full_path, content)) {
        result.error_code = FILE_NOT_FOUND;
        result.error_detail = "File could not be read: " + full_path;
        return result;
    }
    if (looks_binary(content)) {
        result.error_code = BINARY_FILE;
        result.error_detail = "File appears to be binary: " + full_path;
        return result;
    }

    result.success = true;
    result.file_data.full_path = full_path;
    result.file_data.content = content;
    result.file_data.language_id = language_id_for(full_path);
    return result;
}

FileCollectionResult LocalWorkspace::collect_files(const std::string &directory_path) const {
    FileCollectionResult result;
    const std::string root = normalize_path(uri_to_path(directory_path));
    std::error_code error;
    if (!fs::is_directory(root, error)) {
        result.error_code = FOLDER_NOT_FOUND;
        result.error_detail = "Folder not found: " + root;
        return result;
    }
    if (!folder_containing(root)) {
        result.error_code = PATH_OUTSIDE_WORKSPACE;
        result.error_detail = "Folder is outside the workspace: " + root;
        return result;
    }

    std::vector<std::pair<fs::path, int>> pending_directories = {{fs::path(root), 0}};
    while (!pending_directories.empty() && result.files.size() < limits_.max_files) {
        auto current = pending_directories.back();
        pending_directories.pop_back();

        std::vector<fs::directory_entry> children = sorted_children(current.first);
        for (auto child_iterator = children.rbegin(); child_iterator != children.rend(); ++child_iterator) {
            if (child_iterator->is_directory(error) && current.second + 1 < limits_.max_depth) {
                pending_directories.push_back({child_iterator->path(), current.second + 1});
            }
        }
        for (const auto &child : children) {
            if (result.files.size() >= limits_.max_files) {
                debug_log::log("Workspace: file limit reached while collecting " + root + ".");
                break;
            }
            if (!child.is_regular_file(error)) {
                continue;
            }
            FileReadResult file = read_file(child.path().string());
            if (file.success) {
                result.files.push_back(file.file_data);
            } else {
                debug_log::log("Workspace: skipped " + child.path().string() + " (" + file.error_code + ").");
            }
        }
    }

    result.success = true;
    return result;
}

ListingResult LocalWorkspace::list_directory(const std::string &directory_path) const {
    ListingResult result;
    const std::string directory = normalize_path(uri_to_path(directory_path));
    std::error_code error;
    if (!fs::is_directory(directory, error)) {
        result.error_code = FOLDER_NOT_FOUND;
        result.error_detail = "Folder not found: " + directory;
        return result;
    }
    if (!folder_containing(directory)) {
        result.error_code = PATH_OUTSIDE_WORKSPACE;
        result.error_detail = "Folder is outside the workspace: " + directory;
        return result;
    }

    for (const auto &child : sorted_children(directory)) {
        DirectoryEntry entry;
        entry.name = child.path().filename().string();
        entry.type = child.is_directory(error) ? "folder" : "file";
        entry.uri = path_to_uri(child.path().string());
        result.entries.push_back(entry);
    }
    result.parent_folder_uri = path_to_uri(fs::path(directory).parent_path().string());
    result.success = true;
    return result;
}

} // namespace local_workspace
