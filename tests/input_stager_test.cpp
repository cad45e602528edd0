#include "input_stager.hpp"
#include "engine_error.hpp"

#include "fakes/FakeTransport.hpp"
#include "fakes/TempDir.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using verb = ITransport::verb;
using json = nlohmann::json;

namespace {

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Job job_with_inputs(std::initializer_list<std::string> urls) {
    Job j;
    j.id = "9";
    j.app_id = "app:1";
    int n = 0;
    for (const auto& u : urls) j.inputs.push_back({u, json{{"n", n++}}});
    return j;
}

TEST(InputStager, DownloadsInDeclarationOrderAndBuildsCommandLine) {
    TempDir parent;
    StagingArea area(parent.path());
    FakeTransport transport;
    transport.on(verb::get, "files/b", FakeTransport::attachment("zeta.nii.gz", "BBBB"));
    transport.on(verb::get, "files/a", FakeTransport::attachment("alpha.dcm", "AA"));
    InputStager stager(transport);

    auto staged = stager.stage(job_with_inputs({"files/b", "files/a"}), area);

    ASSERT_EQ(staged.files.size(), 2u);
    EXPECT_EQ(staged.files[0], area.input() / "zeta.nii.gz");
    EXPECT_EQ(staged.files[1], area.input() / "alpha.dcm");
    EXPECT_EQ(staged.args, (std::vector<std::string>{"zeta.nii.gz", "alpha.dcm"}));
    EXPECT_EQ(staged.command_line, "zeta.nii.gz alpha.dcm");
    EXPECT_EQ(slurp(staged.files[0]), "BBBB");
    EXPECT_EQ(slurp(staged.files[1]), "AA");
    // no directory leaks into the command line
    EXPECT_EQ(staged.command_line.find('/'), std::string::npos);
}

TEST(InputStager, PayloadIsPassedThroughUnmodified) {
    TempDir parent;
    StagingArea area(parent.path());
    FakeTransport transport;
    transport.on(verb::get, "files/a", FakeTransport::attachment("a.txt", "a"));
    Job job;
    job.id = "1";
    job.inputs.push_back({"files/a", json{{"filter", {{"type", "dicom"}, {"limit", 3}}}}});

    InputStager(transport).stage(job, area);

    const auto* req = transport.last(verb::get, "files/a");
    ASSERT_NE(req, nullptr);
    EXPECT_EQ(json::parse(req->body), job.inputs[0].payload);
}

TEST(InputStager, FailedDownloadRaisesWithStatus) {
    TempDir parent;
    StagingArea area(parent.path());
    FakeTransport transport;
    transport.on(verb::get, "files/a", FakeTransport::attachment("a.txt", "a"));
    transport.on(verb::get, "files/b", FakeTransport::status(403, "Forbidden", "no access"));
    InputStager stager(transport);

    try {
        stager.stage(job_with_inputs({"files/a", "files/b"}), area);
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.status(), 403u);
        EXPECT_NE(std::string(e.what()).find("Forbidden"), std::string::npos);
    }
}

TEST(InputStager, MissingContentDispositionRaises) {
    TempDir parent;
    StagingArea area(parent.path());
    FakeTransport transport;
    transport.on(verb::get, "files/a", FakeTransport::ok("bytes"));
    EXPECT_THROW(InputStager(transport).stage(job_with_inputs({"files/a"}), area), EngineError);
}

TEST(InputStager, DuplicateFilenameRaisesInsteadOfOverwriting) {
    TempDir parent;
    StagingArea area(parent.path());
    FakeTransport transport;
    transport.on(verb::get, "files/a", FakeTransport::attachment("scan.dcm", "FIRST"));
    transport.on(verb::get, "files/b", FakeTransport::attachment("scan.dcm", "SECOND"));

    EXPECT_THROW(InputStager(transport).stage(job_with_inputs({"files/a", "files/b"}), area), EngineError);
    EXPECT_EQ(slurp(area.input() / "scan.dcm"), "FIRST");
}

TEST(AttachmentFilename, Forms) {
    EXPECT_EQ(InputStager::attachment_filename("attachment; filename=t1.nii.gz"), "t1.nii.gz");
    EXPECT_EQ(InputStager::attachment_filename("attachment; filename=\"t1 copy.nii.gz\""), "t1 copy.nii.gz");
    EXPECT_EQ(InputStager::attachment_filename("attachment; filename=a.txt; size=3"), "a.txt");
    EXPECT_EQ(InputStager::attachment_filename("attachment; filename=../../etc/passwd"), "passwd");
    EXPECT_THROW(InputStager::attachment_filename("attachment"), EngineError);
    EXPECT_THROW(InputStager::attachment_filename("attachment; filename=.."), EngineError);
}

} // namespace
