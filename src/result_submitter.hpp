#pragma once
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "job.hpp"
#include "transport.hpp"

struct OutputArtifactRecord {
    std::string name;             // stem
    std::string ext;              // ".nii.gz", ".txt", "" ...
    nlohmann::json kinds;         // null when no expectation matched
    nlohmann::json state;
    nlohmann::json type;
    std::string sha1;
    std::uintmax_t size{0};
    std::string flavor{"file"};
};

void to_json(nlohmann::json& j, const OutputArtifactRecord& r);

struct SplitName {
    std::string stem;
    std::string ext;
};

// "scan.nii.gz" -> {"scan", ".nii.gz"}; anything else splits at the last
// dot, ignoring leading dots (".hidden" has no extension).
SplitName split_output_name(const std::string& filename);

// Extension -> expectation, first declaration wins on duplicates.
class ExtensionTable {
public:
    explicit ExtensionTable(const std::vector<OutputExpectation>& outputs);
    const OutputExpectation* find(const std::string& ext) const;

private:
    std::unordered_map<std::string, const OutputExpectation*> by_ext_;
};

// What a submission says about its files, before anything is uploaded.
struct SubmissionManifest {
    std::vector<OutputArtifactRecord> records;
    nlohmann::json metadata;      // array of records
    std::string metadata_json;    // exact text sent as the "metadata" field
    nlohmann::json sha;           // [{name, sha1}..., {metadata: sha1(metadata_json)}]
    std::string sha_json;
};

SubmissionManifest describe_outputs(const Job& job, const std::vector<std::filesystem::path>& files);

// Regular, non-hidden files directly inside dir, sorted by name.
std::vector<std::filesystem::path> collect_outputs(const std::filesystem::path& dir);

class ResultSubmitter {
public:
    explicit ResultSubmitter(ITransport& transport);

    // One multipart PUT to the first expectation's route. The body is
    // spooled under spool_dir. Throws EngineError on a non-success answer.
    HttpResponse submit(const Job& job, const std::vector<std::filesystem::path>& files,
                        const std::filesystem::path& spool_dir);

private:
    ITransport& transport_;
};
