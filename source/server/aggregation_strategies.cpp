#include "server/aggregation_strategies.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"

#include <functional>
#include <map>
#include <set>

namespace aggregation_strategies {

using MergeFunction = std::function<json(const std::vector<Contribution> &ordered, const std::string &primary_window_id,
                                         const json &original_payload)>;

void tag_with_window(json &items, const std::string &window_id) {
    if (!items.is_array()) {
        return;
    }
    for (auto &item : items) {
        if (item.is_object() && !item.contains("windowId")) {
            item["windowId"] = window_id;
        }
    }
}

static json no_responses_payload() {
    return wire_protocol::build_error_payload(wire_protocol::NO_RESPONSES, "No responses received");
}

static bool contribution_failed(const Contribution &contribution) {
    return !contribution.payload.is_object() || wire_protocol::payload_indicates_failure(contribution.payload);
}

static json error_entry(const Contribution &contribution) {
    json entry;
    entry["windowId"] = contribution.window_id;
    entry["error"] = wire_protocol::get_string(contribution.payload, "error", "Command failed.");
    entry["errorCode"] = wire_protocol::get_string(contribution.payload, "errorCode",
                                                   wire_protocol::COMMAND_EXECUTION_ERROR);
    return entry;
}

// Array at payload.data.<key>, or an empty array.
static json data_array(const json &payload, const std::string &key) {
    if (payload.contains("data") && payload["data"].is_object() && payload["data"].contains(key) &&
        payload["data"][key].is_array()) {
        return payload["data"][key];
    }
    return json::array();
}

// Adds success (true when any contribution succeeded) and, when every contribution failed,
// the first failure's error and errorCode.
static void finish_success_flag(json &merged, bool any_success, const json &errors) {
    merged["success"] = any_success;
    if (!any_success) {
        if (!errors.empty()) {
            merged["error"] = errors[0]["error"];
            merged["errorCode"] = errors[0]["errorCode"];
        } else {
            merged["error"] = "No responses received";
            merged["errorCode"] = wire_protocol::NO_RESPONSES;
        }
    }
}

static json merge_search(const std::vector<Contribution> &ordered, const std::string &primary_window_id,
                         const json &original_payload) {
    json results = json::array();
    json errors = json::array();
    bool any_success = false;

    for (const auto &contribution : ordered) {
        if (contribution_failed(contribution)) {
            errors.push_back(error_entry(contribution));
            continue;
        }
        any_success = true;
        json window_results = data_array(contribution.payload, "results");
        tag_with_window(window_results, contribution.window_id);
        for (auto &item : window_results) {
            results.push_back(item);
        }
    }

    json merged;
    merged["data"] = {{"results", results}, {"windowId", primary_window_id}};
    if (!errors.empty()) {
        merged["errors"] = errors;
    }
    merged["query"] = wire_protocol::get_string(original_payload, "query");
    finish_success_flag(merged, any_success, errors);
    return merged;
}

// Concatenate payload.data.<list_key> across windows; metadata comes from the first successful
// contribution (the primary's when it succeeded).
static json merge_data_list(const std::vector<Contribution> &ordered, const std::string &primary_window_id,
                            const std::string &list_key) {
    json items = json::array();
    json errors = json::array();
    json metadata;
    bool any_success = false;

    for (const auto &contribution : ordered) {
        if (contribution_failed(contribution)) {
            errors.push_back(error_entry(contribution));
            continue;
        }
        any_success = true;
        json window_items = data_array(contribution.payload, list_key);
        tag_with_window(window_items, contribution.window_id);
        for (auto &item : window_items) {
            items.push_back(item);
        }
        const json &payload = contribution.payload;
        if (metadata.is_null() && payload.contains("data") && payload["data"].is_object() &&
            payload["data"].contains("metadata")) {
            metadata = payload["data"]["metadata"];
        }
    }

    json merged;
    merged["data"] = {{list_key, items}, {"windowId", primary_window_id}};
    if (!metadata.is_null()) {
        merged["data"]["metadata"] = metadata;
    }
    if (!errors.empty()) {
        merged["errors"] = errors;
    }
    finish_success_flag(merged, any_success, errors);
    return merged;
}

// Problems concatenate like any data list; the count is summed and the text blocks of windows
// that reported something are joined.
static json merge_workspace_problems(const std::vector<Contribution> &ordered, const std::string &primary_window_id,
                                     const json &) {
    json merged = merge_data_list(ordered, primary_window_id, "problems");

    size_t problem_count = 0;
    std::string problems_string;
    for (const auto &contribution : ordered) {
        if (contribution_failed(contribution) || !contribution.payload.contains("data") ||
            !contribution.payload["data"].is_object()) {
            continue;
        }
        const json &data = contribution.payload["data"];
        if (!data.contains("problemCount") || !data["problemCount"].is_number_integer() ||
            data["problemCount"].get<long long>() <= 0) {
            continue;
        }
        problem_count += data["problemCount"].get<size_t>();
        if (!problems_string.empty()) {
            problems_string += "\n";
        }
        problems_string += wire_protocol::get_string(data, "problemsString");
    }

    merged["data"]["problemCount"] = problem_count;
    merged["data"]["problemsString"] =
        problem_count == 0 ? std::string("No problems found in this workspace.") : problems_string;
    return merged;
}

static json merge_contents_for_files(const std::vector<Contribution> &ordered, const std::string &, const json &) {
    json data = json::array();
    json errors = json::array();
    bool any_success = false;

    for (const auto &contribution : ordered) {
        if (contribution_failed(contribution)) {
            errors.push_back(error_entry(contribution));
            continue;
        }
        any_success = true;
        const json &payload = contribution.payload;
        if (payload.contains("data") && payload["data"].is_array()) {
            json window_data = payload["data"];
            tag_with_window(window_data, contribution.window_id);
            for (auto &item : window_data) {
                data.push_back(item);
            }
        }
        if (payload.contains("errors") && payload["errors"].is_array()) {
            json window_errors = payload["errors"];
            tag_with_window(window_errors, contribution.window_id);
            for (auto &item : window_errors) {
                errors.push_back(item);
            }
        }
    }

    json merged;
    merged["data"] = data;
    merged["errors"] = errors;
    finish_success_flag(merged, any_success, errors);
    return merged;
}

static json merge_workspace_details(const std::vector<Contribution> &ordered, const std::string &primary_window_id,
                                    const json &) {
    json folders = json::array();
    json errors = json::array();
    std::set<std::string> seen_uris;
    bool any_success = false;
    bool all_trusted = true;
    std::string workspace_name;
    bool have_name = false;

    for (const auto &contribution : ordered) {
        if (contribution_failed(contribution)) {
            errors.push_back(error_entry(contribution));
            continue;
        }
        any_success = true;
        const json &data = contribution.payload.contains("data") ? contribution.payload["data"] : json::object();
        if (data.contains("isTrusted") && data["isTrusted"].is_boolean() && !data["isTrusted"].get<bool>()) {
            all_trusted = false;
        }
        if (!have_name && data.contains("workspaceName") && data["workspaceName"].is_string()) {
            workspace_name = data["workspaceName"].get<std::string>();
            have_name = true;
        }
        json window_folders = data_array(contribution.payload, "workspaceFolders");
        tag_with_window(window_folders, contribution.window_id);
        for (auto &folder : window_folders) {
            std::string uri = wire_protocol::get_string(folder, "uri");
            if (!seen_uris.insert(uri).second) {
                continue;
            }
            folders.push_back(folder);
        }
    }

    json merged;
    merged["data"] = {
        {"isTrusted", any_success && all_trusted},
        {"workspaceName", workspace_name},
        {"workspaceFolders", folders},
        {"windowId", primary_window_id}
    };
    if (!errors.empty()) {
        merged["errors"] = errors;
    }
    finish_success_flag(merged, any_success, errors);
    return merged;
}

static json merge_primary_first(const std::vector<Contribution> &ordered, const std::string &, const json &) {
    for (const auto &contribution : ordered) {
        if (contribution.is_local) {
            return contribution.payload;
        }
    }
    return ordered.front().payload;
}

static const std::map<std::string, MergeFunction> &merge_policies() {
    static const std::map<std::string, MergeFunction> policies = {
        {command_names::SEARCH_WORKSPACE, merge_search},
        {command_names::GET_OPEN_FILES,
         [](const std::vector<Contribution> &ordered, const std::string &primary_window_id, const json &) {
             return merge_data_list(ordered, primary_window_id, "openFiles");
         }},
        {command_names::GET_ENTIRE_CODEBASE,
         [](const std::vector<Contribution> &ordered, const std::string &primary_window_id, const json &) {
             return merge_data_list(ordered, primary_window_id, "filesData");
         }},
        {command_names::GET_WORKSPACE_PROBLEMS, merge_workspace_problems},
        {command_names::GET_CONTENTS_FOR_FILES, merge_contents_for_files},
        {command_names::GET_WORKSPACE_DETAILS, merge_workspace_details},
    };
    return policies;
}

json merge(const std::string &command, const std::vector<Contribution> &contributions,
           const std::string &primary_window_id, const json &original_payload) {
    if (contributions.empty()) {
        return no_responses_payload();
    }

    // The primary's own answer always leads.
    std::vector<Contribution> ordered;
    for (const auto &contribution : contributions) {
        if (contribution.is_local) {
            ordered.push_back(contribution);
        }
    }
    for (const auto &contribution : contributions) {
        if (!contribution.is_local) {
            ordered.push_back(contribution);
        }
    }

    const auto &policies = merge_policies();
    auto policy_iterator = policies.find(command);
    if (policy_iterator == policies.end()) {
        return merge_primary_first(ordered, primary_window_id, original_payload);
    }
    return policy_iterator->second(ordered, primary_window_id, original_payload);
}

} // namespace aggregation_strategies
