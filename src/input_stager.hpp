#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "job.hpp"
#include "staging_area.hpp"
#include "transport.hpp"

struct StagedInputs {
    std::vector<std::filesystem::path> files;   // declaration order
    std::vector<std::string> args;              // base names, same order
    std::string command_line;                   // args joined by ' '
};

// Downloads every declared input into the staging area's input directory.
class InputStager {
public:
    explicit InputStager(ITransport& transport);

    // Throws EngineError on the first failed download; a job never runs
    // with partial inputs.
    StagedInputs stage(const Job& job, const StagingArea& area);

    // "attachment; filename=<name>" -> "<name>", reduced to a base name.
    static std::string attachment_filename(const std::string& content_disposition);

private:
    ITransport& transport_;
};
