#include <gtest/gtest.h>
#include <agent-worker/job/job.hpp>
#include <vector>

using namespace agentworker;

TEST(JobJson, RoundTripsRunningJob) {
    RunningJobInfo info;
    info.job.id = "AJ_1";
    info.job.type = JobType::Publisher;
    info.job.room = {"RM_1", "lobby"};
    info.job.participant = ParticipantInfo{"PA_1", "alice", "Alice"};
    info.job.metadata = "echo hi";
    info.job.agent_name = "greeter";
    info.accept_arguments.identity = "agent-1";
    info.accept_arguments.attributes["lang"] = "it";
    info.url = "wss://example.test";
    info.token = "tok";

    auto back = running_job_from_json(to_json(info));
    ASSERT_TRUE(back);
    EXPECT_EQ(back->job.id, "AJ_1");
    EXPECT_EQ(back->job.type, JobType::Publisher);
    EXPECT_EQ(back->job.room.name, "lobby");
    ASSERT_TRUE(back->job.participant);
    EXPECT_EQ(back->job.participant->identity, "alice");
    EXPECT_EQ(back->job.metadata, "echo hi");
    EXPECT_EQ(back->job.agent_name, "greeter");
    EXPECT_EQ(back->accept_arguments.identity, "agent-1");
    EXPECT_EQ(back->accept_arguments.attributes.at("lang"), "it");
    EXPECT_EQ(back->url, "wss://example.test");
    EXPECT_EQ(back->token, "tok");
}

TEST(JobJson, RequiresId) {
    auto j = Json::parse(R"({"type":"JT_ROOM","room":{"name":"r"}})");
    ASSERT_TRUE(j);
    EXPECT_FALSE(job_from_json(*j));
    EXPECT_FALSE(job_from_json(Json("not an object")));
}

TEST(JobJson, UnknownTypeDefaultsToRoom) {
    auto j = Json::parse(R"({"id":"AJ_2","type":"JT_SOMETHING"})");
    ASSERT_TRUE(j);
    auto job = job_from_json(*j);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->type, JobType::Room);
    EXPECT_FALSE(job->participant);
}

TEST(JobType, Names) {
    EXPECT_STREQ(job_type_name(JobType::Room), "JT_ROOM");
    EXPECT_STREQ(job_type_name(JobType::Publisher), "JT_PUBLISHER");
    EXPECT_EQ(parse_job_type("publisher"), JobType::Publisher);
    EXPECT_FALSE(parse_job_type("bogus"));
}

TEST(JobRequest, FirstAnswerWins) {
    std::vector<bool> answers;
    Job job;
    job.id = "AJ_3";
    JobRequest req(job, false, [&](bool available, const JobAcceptArguments&) { answers.push_back(available); });
    EXPECT_FALSE(req.answered());
    EXPECT_TRUE(req.accept({"id", "name", "", {}}));
    EXPECT_FALSE(req.reject());
    EXPECT_FALSE(req.accept());
    EXPECT_TRUE(req.answered());
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_TRUE(answers[0]);
}

TEST(JobRequest, ExposesJob) {
    Job job;
    job.id = "AJ_4";
    job.room.name = "r";
    job.participant = ParticipantInfo{"PA", "bob", ""};
    JobRequest req(job, true, nullptr);
    EXPECT_EQ(req.id(), "AJ_4");
    EXPECT_EQ(req.room().name, "r");
    ASSERT_TRUE(req.publisher());
    EXPECT_EQ(req.publisher()->identity, "bob");
    EXPECT_TRUE(req.resuming());
    EXPECT_TRUE(req.reject());
}
