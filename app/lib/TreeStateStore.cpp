#include "TreeStateStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <json/json.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
Json::Value to_json_list(const std::vector<std::string>& values)
{
    Json::Value list(Json::arrayValue);
    for (const auto& value : values) {
        list.append(value);
    }
    return list;
}

std::vector<std::string> from_json_list(const Json::Value& list)
{
    std::vector<std::string> values;
    if (!list.isArray()) {
        return values;
    }
    for (const auto& item : list) {
        if (item.isString()) {
            values.push_back(item.asString());
        }
    }
    return values;
}

Json::Value optional_path(const std::optional<std::string>& path)
{
    return path ? Json::Value(*path) : Json::Value(Json::nullValue);
}

std::optional<std::string> read_optional_path(const Json::Value& value)
{
    if (value.isString() && !value.asString().empty()) {
        return value.asString();
    }
    return std::nullopt;
}

Json::Value history_to_json(const std::deque<FocusHistoryEntry>& history)
{
    Json::Value list(Json::arrayValue);
    for (const auto& entry : history) {
        Json::Value obj(Json::objectValue);
        obj["path"] = optional_path(entry.path);
        std::vector<std::string> expanded(entry.expanded.begin(), entry.expanded.end());
        std::sort(expanded.begin(), expanded.end());
        obj["expanded"] = to_json_list(expanded);
        obj["timestamp"] = Json::Int64(entry.timestamp);
        list.append(obj);
    }
    return list;
}

std::deque<FocusHistoryEntry> history_from_json(const Json::Value& list)
{
    std::deque<FocusHistoryEntry> history;
    if (!list.isArray()) {
        return history;
    }
    for (const auto& item : list) {
        if (!item.isObject()) {
            continue;
        }
        FocusHistoryEntry entry;
        entry.path = read_optional_path(item["path"]);
        for (auto& path : from_json_list(item["expanded"])) {
            entry.expanded.insert(std::move(path));
        }
        if (item["timestamp"].isIntegral()) {
            entry.timestamp = item["timestamp"].asInt64();
        }
        history.push_back(std::move(entry));
    }
    return history;
}

void warn(const std::string& message)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("{}", message);
    }
}
}

TreeStateStore::TreeStateStore(std::string config_dir, PaneId pane)
    : file_path_((std::filesystem::path(std::move(config_dir)) /
                  ("tree-state-" + to_string(pane) + ".json")).string())
{
}

PaneState TreeStateStore::load() const
{
    PaneState state;
    std::ifstream in(file_path_);
    if (!in.is_open()) {
        return state;
    }

    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(reader, in, &root, &errors) || !root.isObject()) {
        warn(fmt::format("Ignoring unreadable tree state {}: {}", file_path_, errors));
        return state;
    }

    const Json::Value& version = root["schema_version"];
    if (!version.isInt() || version.asInt() != kSchemaVersion) {
        warn(fmt::format("Ignoring tree state {} with unsupported schema version", file_path_));
        return state;
    }

    state.expanded_folders = from_json_list(root["expanded_folders"]);
    state.focused_folder = read_optional_path(root["focused_folder"]);
    state.selected_folder = read_optional_path(root["selected_folder"]);
    if (root["sort_by"].isString()) {
        state.sort_by = sort_criterion_from_string(root["sort_by"].asString());
    }
    if (root["show_files_in_tree"].isBool()) {
        state.show_files_in_tree = root["show_files_in_tree"].asBool();
    }
    if (root["search_query"].isString()) {
        state.search_query = root["search_query"].asString();
    }
    if (root["max_render_depth"].isInt() && root["max_render_depth"].asInt() > 0) {
        state.max_render_depth = root["max_render_depth"].asInt();
    }
    state.focus_history = history_from_json(root["focus_history"]);
    if (root["last_updated"].isIntegral()) {
        state.last_updated = root["last_updated"].asInt64();
    }
    return state;
}

bool TreeStateStore::save(const PaneState& state) const
{
    Json::Value root(Json::objectValue);
    root["schema_version"] = kSchemaVersion;
    root["expanded_folders"] = to_json_list(state.expanded_folders);
    root["focused_folder"] = optional_path(state.focused_folder);
    root["selected_folder"] = optional_path(state.selected_folder);
    root["sort_by"] = to_string(state.sort_by);
    root["show_files_in_tree"] = state.show_files_in_tree;
    root["search_query"] = state.search_query;
    root["max_render_depth"] = state.max_render_depth;
    root["focus_history"] = history_to_json(state.focus_history);
    root["last_updated"] = Json::Int64(state.last_updated != 0 ? state.last_updated : Utils::now_ms());

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(file_path_).parent_path(), ec);

    std::ofstream out(file_path_, std::ios::trunc);
    if (!out.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to open tree state for writing: {}", file_path_);
        }
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, root) << "\n";
    return static_cast<bool>(out);
}
