#include "input_stager.hpp"
#include "engine_error.hpp"
#include "logger.hpp"
#include <algorithm>
#include <fstream>

InputStager::InputStager(ITransport& transport) : transport_(transport) {}

std::string InputStager::attachment_filename(const std::string& content_disposition) {
    const std::string key = "filename=";
    auto pos = content_disposition.find(key);
    if (pos == std::string::npos) {
        throw EngineError("no filename in Content-Disposition '" + content_disposition + "'");
    }
    std::string name = content_disposition.substr(pos + key.size());
    auto semi = name.find(';');
    if (semi != std::string::npos) name = name.substr(0, semi);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\r' || name.back() == '\n')) name.pop_back();
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') name = name.substr(1, name.size() - 2);

    // never let the coordinator place files outside input/
    name = std::filesystem::path(name).filename().string();
    if (name.empty() || name == "." || name == "..") {
        throw EngineError("unusable filename in Content-Disposition '" + content_disposition + "'");
    }
    return name;
}

StagedInputs InputStager::stage(const Job& job, const StagingArea& area) {
    LOG_DEBUG("[inputs] fetching " + std::to_string(job.inputs.size()) + " inputs...");
    StagedInputs staged;

    for (const auto& input : job.inputs) {
        auto res = transport_.send(ITransport::verb::get, input.url, input.payload.dump());
        if (!res.ok()) {
            throw EngineError(res.status, res.reason, res.body);
        }

        auto fname = attachment_filename(res.header("content-disposition"));
        auto fpath = area.input() / fname;
        if (std::find(staged.args.begin(), staged.args.end(), fname) != staged.args.end()) {
            throw EngineError("input " + input.url + " would overwrite staged file " + fname);
        }
        {
            std::ofstream out(fpath, std::ios::binary | std::ios::trunc);
            out.write(res.body.data(), static_cast<std::streamsize>(res.body.size()));
            if (!out) {
                throw EngineError("failed to write " + fpath.string());
            }
        }
        LOG_DEBUG("[inputs] " + fpath.string() + " downloaded (" + std::to_string(res.body.size()) + " bytes)");

        staged.files.push_back(fpath);
        staged.args.push_back(fname);
    }

    for (size_t i = 0; i < staged.args.size(); ++i) {
        if (i) staged.command_line += ' ';
        staged.command_line += staged.args[i];
    }
    return staged;
}
