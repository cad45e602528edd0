#include "result_submitter.hpp"
#include "digest.hpp"
#include "engine_error.hpp"
#include "logger.hpp"
#include "multipart.hpp"
#include <algorithm>

using json = nlohmann::json;

static const std::string kDoubleExt = ".nii.gz";

void to_json(json& j, const OutputArtifactRecord& r) {
    j = json{
        {"name", r.name},
        {"ext", r.ext},
        {"kinds", r.kinds},
        {"state", r.state},
        {"type", r.type},
        {"sha1", r.sha1},
        {"size", r.size},
        {"flavor", r.flavor},
    };
}

SplitName split_output_name(const std::string& filename) {
    if (filename.size() > kDoubleExt.size() &&
        filename.compare(filename.size() - kDoubleExt.size(), kDoubleExt.size(), kDoubleExt) == 0) {
        return {filename.substr(0, filename.size() - kDoubleExt.size()), kDoubleExt};
    }
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || filename.find_first_not_of('.') >= dot) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

ExtensionTable::ExtensionTable(const std::vector<OutputExpectation>& outputs) {
    for (const auto& o : outputs) {
        by_ext_.emplace(o.fext, &o);   // emplace keeps the first
    }
}

const OutputExpectation* ExtensionTable::find(const std::string& ext) const {
    auto it = by_ext_.find(ext);
    return it == by_ext_.end() ? nullptr : it->second;
}

SubmissionManifest describe_outputs(const Job& job, const std::vector<std::filesystem::path>& files) {
    SubmissionManifest m;
    m.metadata = json::array();
    m.sha = json::array();
    const ExtensionTable table(job.outputs);

    for (const auto& f : files) {
        const auto fn = f.filename().string();
        const auto parts = split_output_name(fn);

        OutputArtifactRecord rec;
        rec.name = parts.stem;
        rec.ext = parts.ext;
        rec.sha1 = sha1_file(f);
        rec.size = std::filesystem::file_size(f);

        if (const auto* spec = table.find(parts.ext)) {
            rec.kinds = spec->kinds;
            rec.state = spec->state;
            rec.type = spec->type;
            LOG_DEBUG("[submit] " + fn + " is type: " + spec->type.dump() + ", kinds: " + spec->kinds.dump());
        } else {
            LOG_WARN("[submit] " + fn + " extension did not match an expected output");
        }

        m.metadata.push_back(json(rec));
        m.sha.push_back({{"name", rec.name + rec.ext}, {"sha1", rec.sha1}});
        m.records.push_back(std::move(rec));
    }

    m.metadata_json = m.metadata.dump();
    m.sha.push_back({{"metadata", sha1_hex(m.metadata_json)}});
    m.sha_json = m.sha.dump();
    return m;
}

std::vector<std::filesystem::path> collect_outputs(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!entry.is_regular_file()) {
            LOG_WARN("[submit] skipping non-regular output " + name);
            continue;
        }
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

ResultSubmitter::ResultSubmitter(ITransport& transport) : transport_(transport) {}

HttpResponse ResultSubmitter::submit(const Job& job, const std::vector<std::filesystem::path>& files,
                                     const std::filesystem::path& spool_dir) {
    if (job.outputs.empty()) {
        throw EngineError("job " + job.id + " declares no output route");
    }
    LOG_DEBUG("[submit] constructing multipart/form-encoded upload.");

    const auto manifest = describe_outputs(job, files);
    LOG_INFO("[submit] metadata " + manifest.metadata_json);
    LOG_INFO("[submit] sha " + manifest.sha_json);

    const auto spool = spool_dir / ("upload-" + job.id + ".multipart");
    MultipartWriter body(spool);
    for (const auto& f : files) {
        const auto fn = f.filename().string();
        body.add_file(fn, fn, f);
    }
    body.add_field("metadata", manifest.metadata_json);
    body.add_field("sha", manifest.sha_json);
    body.finish();

    auto res = transport_.send_file(ITransport::verb::put, job.outputs.front().url, body.path(), body.content_type());

    std::error_code ec;
    std::filesystem::remove(spool, ec);
    if (ec) LOG_DEBUG("[submit] could not remove spool " + spool.string() + ": " + ec.message());

    if (!res.ok()) {
        throw EngineError(res.status, res.reason);
    }
    return res;
}
