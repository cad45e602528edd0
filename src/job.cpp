#include "job.hpp"
#include "logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

static std::string id_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer() || v.is_number_unsigned()) return v.dump();
    throw std::invalid_argument("job _id must be a string or an integer");
}

// Display and scope fields may be missing or null; only _id and app._id are required.
static std::string text_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

static json object_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return json::object();
    return *it;
}

template <typename T>
static std::vector<T> list_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::vector<T>>();
}

void from_json(const json& j, InputDescriptor& in) {
    in.url = j.at("url").get<std::string>();
    in.payload = object_or_empty(j, "payload");
}

void from_json(const json& j, OutputExpectation& out) {
    out.url = j.at("url").get<std::string>();
    const auto payload = object_or_empty(j, "payload");
    if (!payload.is_object()) return;
    out.fext = text_or_empty(payload, "fext");
    out.kinds = payload.value("kinds", json());
    out.state = payload.value("state", json());
    out.type = payload.value("type", json());
}

void from_json(const json& j, Job& job) {
    job.id = id_string(j.at("_id"));
    job.group = text_or_empty(j, "group");

    const auto project = object_or_empty(j, "project");
    if (project.is_object()) {
        if (project.contains("_id") && !project["_id"].is_null()) job.project_id = id_string(project["_id"]);
        job.project_name = text_or_empty(project, "name");
    } else if (project.is_string()) {
        job.project_name = project.get<std::string>();
    }

    job.app_id = j.at("app").at("_id").get<std::string>();
    job.inputs = list_or_empty<InputDescriptor>(j, "inputs");
    job.outputs = list_or_empty<OutputExpectation>(j, "outputs");
}

std::optional<Job> parse_job(const std::string& body) {
    json j = json::parse(body, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    try {
        return j.get<Job>();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("[job] malformed job description: ") + e.what());
        return std::nullopt;
    }
}

std::pair<std::string, std::string> split_app_id(const std::string& app_id) {
    auto colon = app_id.rfind(':');
    // a colon before the last '/' belongs to a registry host:port
    if (colon == std::string::npos ||
        (app_id.find('/') != std::string::npos && colon < app_id.rfind('/'))) {
        return {app_id, "latest"};
    }
    return {app_id.substr(0, colon), app_id.substr(colon + 1)};
}
