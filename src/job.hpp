#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct InputDescriptor {
    std::string url;           // route relative to the API base
    nlohmann::json payload;    // passed through to the coordinator untouched
};

struct OutputExpectation {
    std::string url;           // upload route
    std::string fext;          // ".nii.gz", ".txt", ...
    nlohmann::json kinds;
    nlohmann::json state;
    nlohmann::json type;
};

struct Job {
    std::string id;            // numeric ids are kept in decimal form
    std::string group;
    std::string project_id;
    std::string project_name;
    std::string app_id;        // "name:tag"
    std::vector<InputDescriptor> inputs;
    std::vector<OutputExpectation> outputs;
};

enum class JobStatus { Done, Failed };

inline const char* to_string(JobStatus s) {
    return s == JobStatus::Done ? "Done" : "Failed";
}

void from_json(const nlohmann::json& j, InputDescriptor& in);
void from_json(const nlohmann::json& j, OutputExpectation& out);
void from_json(const nlohmann::json& j, Job& job);

// Returns nullopt when the body is not JSON or lacks the job structure.
std::optional<Job> parse_job(const std::string& body);

// "repo/name:tag" -> {"repo/name", "tag"}; a missing tag means "latest".
std::pair<std::string, std::string> split_app_id(const std::string& app_id);
