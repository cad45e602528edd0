#include "engine.hpp"
#include "digest.hpp"
#include "engine_error.hpp"

#include "fakes/FakeContainerRuntime.hpp"
#include "fakes/FakeTransport.hpp"
#include "fakes/TempDir.hpp"

#include <gtest/gtest.h>

#include <atomic>

using verb = ITransport::verb;
using json = nlohmann::json;

namespace {

const char* kAnatomyJob = R"({
  "_id": 42,
  "group": "scitran",
  "project": {"name": "Brains"},
  "app": {"_id": "dcm2nii:v1"},
  "inputs": [{"url": "acquisitions/a1/file", "payload": {"name": "t1"}}],
  "outputs": [{"url": "acquisitions/a1/file", "payload": {"fext": ".nii.gz", "kinds": "anatomy", "state": "derived", "type": "nifti"}}]
})";

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.api_url = "https://coordinator.example/api";
        config.engine_id = "test-engine";
        config.tempdir = staging_parent.path();
        config.scratch_path = "/scratch";

        runtime.images = {{"sha256:dcm", {"dcm2nii:v1"}}};
        transport.on(verb::get, "jobs/next", FakeTransport::ok(kAnatomyJob));
        transport.on(verb::get, "acquisitions/a1/file", FakeTransport::attachment("t1.nii.gz", "T1-DICOM"));
        transport.on(verb::put, "acquisitions/a1/file", FakeTransport::ok("{}"));
        transport.on(verb::put, "jobs/42", FakeTransport::ok("{}"));
    }

    Engine make_engine() {
        return Engine(config, transport, runtime, [this](std::chrono::seconds d) { sleeps.push_back(d); });
    }

    json reported() const {
        const auto* req = transport.last(verb::put, "jobs/42");
        return req ? json::parse(req->body) : json();
    }

    bool staging_is_clean() const { return std::filesystem::is_empty(staging_parent.path()); }

    TempDir staging_parent;
    EngineConfig config;
    FakeTransport transport;
    FakeContainerRuntime runtime;
    std::vector<std::chrono::seconds> sleeps;
};

TEST_F(EngineTest, NoJobSleepsIdleDelayWithoutResolving) {
    FakeTransport idle;
    idle.on(verb::get, "jobs/next", FakeTransport::ok(""));
    Engine engine(config, idle, runtime, [this](std::chrono::seconds d) { sleeps.push_back(d); });

    EXPECT_FALSE(engine.run_once().has_value());

    EXPECT_EQ(sleeps, std::vector<std::chrono::seconds>{std::chrono::seconds(10)});
    EXPECT_TRUE(runtime.listed.empty());
    EXPECT_TRUE(runtime.created.empty());
    EXPECT_EQ(idle.requests.size(), 1u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, AnatomyScenarioIsDone) {
    runtime.outputs = {{"result.nii.gz", "RESULT-NIFTI"}};
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->job_id, "42");
    EXPECT_EQ(outcome->status, JobStatus::Done);
    EXPECT_EQ(outcome->activity, "generated result.nii.gz");
    EXPECT_TRUE(sleeps.empty());

    // container ran the resolved image on the staged input
    ASSERT_EQ(runtime.created.size(), 1u);
    EXPECT_EQ(runtime.created[0].image, "sha256:dcm");
    EXPECT_EQ(runtime.created[0].cmd, std::vector<std::string>{"t1.nii.gz"});
    EXPECT_EQ(runtime.seen_inputs, std::vector<std::string>{"t1.nii.gz"});

    // one upload with the anatomy record
    const auto* upload = transport.last(verb::put, "acquisitions/a1/file");
    ASSERT_NE(upload, nullptr);
    auto at = upload->body.find("name=\"metadata\"\r\n\r\n");
    ASSERT_NE(at, std::string::npos);
    auto metadata = json::parse(upload->body.substr(at + 19, upload->body.find("\r\n--", at) - at - 19));
    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0]["kinds"], "anatomy");
    EXPECT_EQ(metadata[0]["sha1"], sha1_hex("RESULT-NIFTI"));
    EXPECT_EQ(metadata[0]["flavor"], "file");

    EXPECT_EQ(reported(), json({{"status", "Done"}, {"activity", "generated result.nii.gz"}}));
    EXPECT_EQ(runtime.removed, std::vector<std::string>{"container-1"});
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, NonZeroExitFailsEvenWithOutputs) {
    runtime.exit_code = 2;
    runtime.outputs = {{"result.nii.gz", "partial"}};
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Failed);
    EXPECT_EQ(transport.count(verb::put, "acquisitions/a1/file"), 0u);
    EXPECT_EQ(reported()["status"], "Failed");
    EXPECT_EQ(runtime.removed.size(), 1u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, NoOutputsFails) {
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Failed);
    EXPECT_EQ(outcome->activity, "no files were generated");
    EXPECT_EQ(reported(), json({{"status", "Failed"}, {"activity", "no files were generated"}}));
    EXPECT_EQ(transport.count(verb::put, "acquisitions/a1/file"), 0u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, UnresolvedImageFailsWithAppId) {
    runtime.images.clear();
    transport.on(verb::get, "apps", FakeTransport::status(404, "Not Found"));
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Failed);
    EXPECT_NE(outcome->activity.find("dcm2nii:v1"), std::string::npos);
    EXPECT_EQ(reported()["status"], "Failed");
    EXPECT_EQ(transport.count(verb::get, "acquisitions/a1/file"), 0u);
    EXPECT_TRUE(runtime.created.empty());
    EXPECT_TRUE(sleeps.empty());
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, JobWithNullScopeFieldsIsStillReported) {
    FakeTransport coordinator;
    coordinator.on(verb::get, "jobs/next", FakeTransport::ok(R"({
      "_id": 42, "group": null, "project": {"name": null},
      "app": {"_id": "dcm2nii:v1"},
      "inputs": [{"url": "acquisitions/a1/file", "payload": null}],
      "outputs": [{"url": "acquisitions/a1/file", "payload": null}]
    })"));
    coordinator.on(verb::get, "acquisitions/a1/file", FakeTransport::attachment("t1.nii.gz", "T1-DICOM"));
    coordinator.on(verb::put, "jobs/42", FakeTransport::ok("{}"));
    Engine engine(config, coordinator, runtime, [this](std::chrono::seconds d) { sleeps.push_back(d); });

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->job_id, "42");
    EXPECT_EQ(coordinator.count(verb::put, "jobs/42"), 1u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, InputFetchFailureIsReportedAndCleansUp) {
    FakeTransport broken;
    broken.on(verb::get, "jobs/next", FakeTransport::ok(kAnatomyJob));
    broken.on(verb::get, "acquisitions/a1/file", FakeTransport::status(403, "Forbidden"));
    broken.on(verb::put, "jobs/42", FakeTransport::ok("{}"));
    Engine engine(config, broken, runtime, [](std::chrono::seconds) {});

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Failed);
    EXPECT_NE(outcome->activity.find("403"), std::string::npos);
    EXPECT_TRUE(runtime.created.empty());
    EXPECT_EQ(broken.count(verb::put, "jobs/42"), 1u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, SubmissionFailureIsReportedAndContainerRemoved) {
    FakeTransport rejecting;
    rejecting.on(verb::get, "jobs/next", FakeTransport::ok(kAnatomyJob));
    rejecting.on(verb::get, "acquisitions/a1/file", FakeTransport::attachment("t1.nii.gz", "T1"));
    rejecting.on(verb::put, "acquisitions/a1/file", FakeTransport::status(500, "Internal Server Error"));
    rejecting.on(verb::put, "jobs/42", FakeTransport::ok("{}"));
    runtime.outputs = {{"result.nii.gz", "R"}};
    Engine engine(config, rejecting, runtime, [](std::chrono::seconds) {});

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Failed);
    EXPECT_EQ(runtime.removed, std::vector<std::string>{"container-1"});
    EXPECT_EQ(rejecting.count(verb::put, "jobs/42"), 1u);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, NoRemoveKeepsContainer) {
    config.no_remove = true;
    runtime.outputs = {{"result.nii.gz", "R"}};
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Done);
    EXPECT_TRUE(runtime.removed.empty());
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, ContainerRemovalFailureDoesNotChangeOutcome) {
    runtime.fail_remove = true;
    runtime.outputs = {{"result.nii.gz", "R"}};
    auto engine = make_engine();

    auto outcome = engine.run_once();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, JobStatus::Done);
    EXPECT_EQ(reported()["status"], "Done");
}

TEST_F(EngineTest, ReportFailureEscapesIteration) {
    FakeTransport transport2;
    transport2.on(verb::get, "jobs/next", FakeTransport::ok(kAnatomyJob));
    transport2.on(verb::get, "acquisitions/a1/file", FakeTransport::attachment("t1.nii.gz", "T1"));
    transport2.on(verb::put, "jobs/42", FakeTransport::status(502, "Bad Gateway"));
    Engine engine(config, transport2, runtime, [](std::chrono::seconds) {});

    EXPECT_THROW(engine.run_once(), EngineError);
    EXPECT_TRUE(staging_is_clean());
}

TEST_F(EngineTest, HaltIsSampledBetweenIterations) {
    std::atomic<bool> halt{false};
    FakeTransport idle;
    idle.on(verb::get, "jobs/next", FakeTransport::ok(""));
    int slept = 0;
    Engine engine(config, idle, runtime, [&](std::chrono::seconds) {
        if (++slept == 2) halt = true;
    });

    engine.run(halt);

    EXPECT_EQ(slept, 2);
    EXPECT_EQ(idle.count(verb::get, "jobs/next"), 2u);
}

TEST_F(EngineTest, AlreadyHaltedDoesNothing) {
    std::atomic<bool> halt{true};
    auto engine = make_engine();
    engine.run(halt);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(EngineTest, RunKeepsGoingAfterFailedReport) {
    std::atomic<bool> halt{false};
    FakeTransport flaky;
    flaky.on(verb::get, "jobs/next", FakeTransport::ok(kAnatomyJob));
    flaky.on(verb::get, "jobs/next", FakeTransport::ok(""));
    flaky.on(verb::get, "acquisitions/a1/file", FakeTransport::attachment("t1.nii.gz", "T1"));
    flaky.on(verb::put, "jobs/42", FakeTransport::status(503, "Service Unavailable"));
    int slept = 0;
    Engine engine(config, flaky, runtime, [&](std::chrono::seconds) {
        if (++slept == 2) halt = true;
    });

    engine.run(halt);

    // one failed report, then one idle poll
    EXPECT_EQ(flaky.count(verb::put, "jobs/42"), 1u);
    EXPECT_EQ(flaky.count(verb::get, "jobs/next"), 2u);
    EXPECT_TRUE(staging_is_clean());
}

} // namespace
