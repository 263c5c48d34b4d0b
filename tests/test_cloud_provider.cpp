/**
 * @file test_cloud_provider.cpp
 * @brief Terraform workspace handling with a scripted terraform binary
 */

#include <gtest/gtest.h>

#include "cerberus/providers/cloud_provider.hpp"
#include "test_helpers.hpp"

#include <fstream>

namespace fs = std::filesystem;
using namespace cerberus;
using test::ScriptedRunner;
using json = nlohmann::json;

namespace {

const char* kOutputs = R"({
    "instance_id": {"sensitive": false, "type": "string", "value": "i-0abc123"},
    "public_ip": {"sensitive": false, "type": "string", "value": "54.12.3.4"},
    "private_ip": {"sensitive": false, "type": "string", "value": "10.20.0.5"},
    "access_url": {"sensitive": false, "type": "string", "value": "http://54.12.3.4"}
})";

/// init handler that leaves the .terraform marker a real init would
utils::CommandResult FakeInit(const utils::CommandSpec& spec) {
    fs::create_directories(fs::path(*spec.working_directory) / ".terraform");
    return ScriptedRunner::Ok("Terraform has been successfully initialized!");
}

class CloudProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.modules_dir = (dir_.Path() / "modules").string();
        config_.state_dir = (dir_.Path() / "state").string();
        config_.gcp_project = "ctf-prod";
        fs::create_directories(dir_.Path() / "modules" / "aws" / "ec2");
        fs::create_directories(dir_.Path() / "modules" / "gcp" / "compute");
        runner_ = std::make_shared<ScriptedRunner>();
    }

    providers::CloudProvider Aws() { return providers::CloudProvider(providers::CloudKind::AWS, config_, runner_); }

    core::ChallengeInstance MakeInstance() const {
        core::ChallengeInstance instance;
        instance.id = "7be1";
        instance.challenge_id = "cloud-300";
        instance.user_id = "carol";
        instance.sandbox_type = core::SandboxType::CLOUD_AWS;
        instance.canary_token = "feedfacefeedfacefeedfacefeedface";
        return instance;
    }

    providers::Deadline Soon() const {
        return std::chrono::steady_clock::now() + std::chrono::minutes(5);
    }

    test::TempDir dir_;
    core::CloudProviderConfig config_;
    std::shared_ptr<ScriptedRunner> runner_;
};

} // anonymous namespace

TEST_F(CloudProviderTest, SpawnAppliesOutputs) {
    runner_->On({"init"}, FakeInit);
    runner_->On({"output", "-json"}, ScriptedRunner::Ok(kOutputs));
    auto provider = Aws();
    auto instance = MakeInstance();

    auto result = provider.Spawn(instance, Soon());

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(instance.provider_instance_id, "i-0abc123");
    EXPECT_EQ(instance.network.external_ip, "54.12.3.4");
    EXPECT_EQ(instance.network.internal_ip, "10.20.0.5");
    EXPECT_EQ(instance.access_url, "http://54.12.3.4");
    EXPECT_EQ(instance.provider_metadata["terraform_outputs"]["instance_id"], "i-0abc123");

    auto calls = runner_->Calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].argv[1], "init");
    EXPECT_EQ(calls[1].argv[1], "apply");
    EXPECT_EQ(calls[2].argv[1], "output");
    EXPECT_EQ(calls[1].env.at("TF_IN_AUTOMATION"), "1");

    const auto workspace = provider.WorkspaceDir(instance.id);
    EXPECT_EQ(workspace.filename(), "aws-7be1");
    std::ifstream main_file(workspace / "main.tf.json");
    ASSERT_TRUE(main_file.good());
    auto main_config = json::parse(main_file);
    EXPECT_EQ(main_config["module"]["challenge"]["canary_token"], *instance.canary_token);
    EXPECT_EQ(main_config["provider"]["aws"]["region"], "us-east-1");
    EXPECT_TRUE(fs::exists(workspace / "apply.log"));
}

TEST_F(CloudProviderTest, MissingModuleFailsWithoutTerraform) {
    auto provider = Aws();
    auto instance = MakeInstance();
    instance.provider_metadata = {{"terraform_module", "does_not_exist"}};

    auto result = provider.Spawn(instance, Soon());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, core::ErrorKind::PROVIDER);
    EXPECT_FALSE(result.retryable);
    EXPECT_TRUE(runner_->Calls().empty());
}

TEST_F(CloudProviderTest, CapacityErrorDestroysPartialApply) {
    runner_->On({"init"}, FakeInit);
    runner_->On({"apply"}, ScriptedRunner::Fail(
        "Error: creating EC2 Instance: InsufficientInstanceCapacity: We currently do not have sufficient capacity"));
    auto provider = Aws();
    auto instance = MakeInstance();

    EXPECT_THROW(provider.Spawn(instance, Soon()), core::ResourceExhaustedError);
    EXPECT_EQ(runner_->CountCalls({"destroy", "-auto-approve"}), 1u);
    EXPECT_FALSE(fs::exists(provider.WorkspaceDir(instance.id)));
    EXPECT_FALSE(instance.provider_instance_id.has_value());
}

TEST_F(CloudProviderTest, ThrottlingIsRetryable) {
    runner_->On({"init"}, FakeInit);
    runner_->On({"apply"}, ScriptedRunner::Fail("Error: RequestLimitExceeded: Request limit exceeded."));
    auto provider = Aws();
    auto instance = MakeInstance();

    auto result = provider.Spawn(instance, Soon());
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.retryable);
    EXPECT_EQ(result.error_kind, core::ErrorKind::PROVIDER);
}

TEST_F(CloudProviderTest, ExistsReadsStateList) {
    auto provider = Aws();
    auto instance = MakeInstance();
    EXPECT_FALSE(provider.Exists(instance));

    const auto workspace = provider.WorkspaceDir(instance.id);
    fs::create_directories(workspace);
    std::ofstream(workspace / "terraform.tfstate") << "{}";

    runner_->On({"state", "list"}, ScriptedRunner::Ok("module.challenge.aws_instance.this\n"));
    EXPECT_TRUE(provider.Exists(instance));

    auto empty = std::make_shared<ScriptedRunner>();
    empty->On({"state", "list"}, ScriptedRunner::Ok("\n"));
    EXPECT_FALSE(providers::CloudProvider(providers::CloudKind::AWS, config_, empty).Exists(instance));

    auto broken = std::make_shared<ScriptedRunner>();
    broken->On({"state", "list"}, ScriptedRunner::Fail("Error loading state: permission denied"));
    EXPECT_THROW(providers::CloudProvider(providers::CloudKind::AWS, config_, broken).Exists(instance),
                 core::ProviderError);
}

TEST_F(CloudProviderTest, DestroyRunsTerraformOnlyWhenStateExists) {
    auto provider = Aws();
    auto instance = MakeInstance();
    EXPECT_TRUE(provider.Destroy(instance));

    const auto workspace = provider.WorkspaceDir(instance.id);
    fs::create_directories(workspace);
    EXPECT_TRUE(provider.Destroy(instance));
    EXPECT_EQ(runner_->CountCalls({"destroy"}), 0u);
    EXPECT_FALSE(fs::exists(workspace));

    fs::create_directories(workspace);
    std::ofstream(workspace / "terraform.tfstate") << "{}";
    runner_->On({"destroy"}, ScriptedRunner::Fail("Error: deleting EC2 Instance: UnauthorizedOperation"));
    EXPECT_FALSE(provider.Destroy(instance));
    EXPECT_TRUE(fs::exists(workspace));
}

TEST_F(CloudProviderTest, GcpConfigCarriesProject) {
    providers::CloudProvider gcp(providers::CloudKind::GCP, config_, runner_);
    EXPECT_EQ(gcp.Name(), "cloud_gcp");

    auto instance = MakeInstance();
    providers::CloudSpec spec;
    spec.module = "compute";
    spec.module_vars = {{"machine_type", "e2-small"}};

    auto main_config = gcp.BuildMainConfig(instance, spec);
    EXPECT_EQ(main_config["provider"]["google"]["project"], "ctf-prod");
    EXPECT_EQ(main_config["module"]["challenge"]["machine_type"], "e2-small");
    EXPECT_EQ(main_config["module"]["challenge"]["team_id"], "");
}

TEST(CloudOutputsTest, FlattenUnwrapsValues) {
    auto flat = providers::CloudProvider::FlattenOutputs(json::parse(kOutputs));
    EXPECT_EQ(flat["public_ip"], "54.12.3.4");
    EXPECT_TRUE(providers::CloudProvider::FlattenOutputs(json::array()).empty());
}
