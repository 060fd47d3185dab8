/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/scenario/ScenarioRunner.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::scenario;
using namespace stablecore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const fs::path kReferenceConfig = fs::path{STABLECORE_TEST_DATA_DIR} / "reference.xml";

}  // namespace

//-------------------------------------------------------------------------

struct ReferenceScenarioTest : Test
{
    void SetUp() override
    {
        runner = ScenarioRunner::fromConfig(kReferenceConfig, doc);
        runner->run(doc.child("Issuer").child("Script"));
    }

    Balance balanceOf(const AccountId& account, const AssetId& assetId)
    {
        return runner->host().ledger().balanceOf(account, assetId);
    }

    pugi::xml_document doc;
    std::unique_ptr<ScenarioRunner> runner;
};

//-------------------------------------------------------------------------

TEST_F(ReferenceScenarioTest, StepOutcomes)
{
    const auto& outcomes = runner->outcomes();
    ASSERT_EQ(outcomes.size(), 28u);

    std::vector<size_t> failed;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) failed.push_back(outcome.index);
    }
    EXPECT_THAT(failed, ElementsAre(21, 24, 27));

    EXPECT_EQ(outcomes[21].error, ErrorCode::InvalidArgument);
    EXPECT_EQ(outcomes[24].error, ErrorCode::Unauthorized);
    EXPECT_EQ(outcomes[27].error, ErrorCode::InvalidConfiguration);
    EXPECT_EQ(outcomes[27].op, "Teleport");

    EXPECT_EQ(outcomes[0].sagaId, SagaId{1});
    EXPECT_EQ(outcomes[0].timestamp, 1'000u);
    EXPECT_EQ(outcomes[6].sagaId, SagaId{3});
    EXPECT_EQ(outcomes[3].sagaId, std::nullopt);
    EXPECT_EQ(outcomes[19].timestamp, 21'000u);
    EXPECT_EQ(outcomes[23].timestamp, 51'001u);
}

//-------------------------------------------------------------------------

TEST_F(ReferenceScenarioTest, SagaResolutions)
{
    using saga::SagaOutcome;

    ASSERT_EQ(runner->resolutions().size(), 8u);
    EXPECT_TRUE(runner->issuer().sagas().empty());

    const auto outcomeOf = [&](SagaId sagaId) {
        const saga::SagaResolution* resolution = runner->resolution(sagaId);
        return resolution != nullptr ? std::make_optional(resolution->outcome) : std::nullopt;
    };
    EXPECT_EQ(outcomeOf(1), SagaOutcome::Committed);
    EXPECT_EQ(outcomeOf(2), SagaOutcome::Committed);
    EXPECT_EQ(outcomeOf(3), SagaOutcome::Committed);
    EXPECT_EQ(outcomeOf(4), SagaOutcome::Committed);
    EXPECT_EQ(outcomeOf(5), SagaOutcome::Compensated);
    EXPECT_EQ(outcomeOf(6), SagaOutcome::Compensated);
    EXPECT_EQ(outcomeOf(7), SagaOutcome::Committed);
    EXPECT_EQ(outcomeOf(8), SagaOutcome::Compensated);

    EXPECT_EQ(runner->resolution(5)->error, ErrorCode::ExternalCallFailed);
    EXPECT_EQ(runner->resolution(6)->error, ErrorCode::StalePrice);
    EXPECT_EQ(runner->resolution(8)->error, ErrorCode::ExternalCallFailed);
    EXPECT_EQ(runner->resolution(8)->kind, "Buy");
    EXPECT_EQ(runner->resolution(9), nullptr);
}

//-------------------------------------------------------------------------

TEST_F(ReferenceScenarioTest, FinalBalances)
{
    EXPECT_EQ(balanceOf("dao", "usn"), 53066190476190476190_bal);
    EXPECT_EQ(balanceOf("bob", "usn"), 100'000000000000000000_bal);
    EXPECT_EQ(runner->tokenVenue("usdt").balanceOf("alice"), Balance{499'950'000});
    EXPECT_EQ(runner->tokenVenue("usdt").balanceOf("core"), Balance{500'050'000});
    EXPECT_EQ(runner->tokenVenue("dai").balanceOf("bob"), 400'000000000000000000_bal);
    EXPECT_EQ(
        runner->issuer().market().collateralAmount("bob", "dai"), 600'000000000000000000_bal);
    EXPECT_EQ(
        balanceOf("dao", "wrap.near"), 90'000000000000000000000000_bal);

    const auto& spread = runner->issuer().config().spread;
    ASSERT_TRUE(std::holds_alternative<exchange::FixedSpreadParams>(spread));
    EXPECT_EQ(std::get<exchange::FixedSpreadParams>(spread).bps, 20u);
    EXPECT_FALSE(runner->issuer().market().registry().at("dai").enabled());
}

//-------------------------------------------------------------------------

TEST_F(ReferenceScenarioTest, Report)
{
    rapidjson::Document json;
    runner->report(json);

    ASSERT_TRUE(json.IsObject());
    ASSERT_TRUE(json.HasMember("steps"));
    EXPECT_EQ(json["steps"].Size(), 28u);
    EXPECT_FALSE(json["steps"][27]["ok"].GetBool());
    EXPECT_STREQ(json["steps"][27]["error"].GetString(), "InvalidConfiguration");
    EXPECT_EQ(json["sagas"].Size(), 8u);
    EXPECT_TRUE(json["assets"].HasMember("dai"));
    EXPECT_TRUE(json["accounts"].HasMember("bob"));
    EXPECT_TRUE(json.HasMember("ledger"));
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, StepRecordsSynchronousFailures)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file(kReferenceConfig.c_str()));
    ScenarioRunner runner{issuer::IssuerConfig::fromXML(doc.child("Issuer"))};

    pugi::xml_document ops;
    ASSERT_TRUE(ops.load_string(R"(
        <Ops>
            <Buy caller="carol" amount="1"/>
            <Buy amount="1"/>
            <Deposit asset="usdt" sender="alice" amount="1" route="sideways"/>
            <VenueFailing asset="gold"/>
            <Advance to="5000"/>
        </Ops>)"));

    std::vector<std::optional<ErrorCode>> errors;
    for (pugi::xml_node op : ops.child("Ops").children()) {
        errors.push_back(runner.step(op).error);
    }
    EXPECT_THAT(
        errors,
        ElementsAre(
            ErrorCode::InsufficientBalance,
            ErrorCode::InvalidConfiguration,
            ErrorCode::InvalidConfiguration,
            ErrorCode::UnknownAsset,
            std::nullopt));
    EXPECT_EQ(runner.host().currentTimestamp(), 5'000u);
    EXPECT_TRUE(runner.resolutions().empty());
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, EventLog)
{
    const fs::path logDir = fs::temp_directory_path() / "stablecore-scenario-tests";
    fs::remove_all(logDir);

    pugi::xml_document doc;
    auto runner = ScenarioRunner::fromConfig(kReferenceConfig, doc);
    runner->attachEventLog(logDir);
    runner->run(doc.child("Issuer").child("Script"));

    const fs::path logFile = logDir / "core.events.log";
    ASSERT_TRUE(fs::exists(logFile));
    EXPECT_GT(fs::file_size(logFile), 0u);

    fs::remove_all(logDir);
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, MissingConfigFile)
{
    pugi::xml_document doc;
    EXPECT_ERROR_CODE(
        (void)ScenarioRunner::fromConfig("does-not-exist.xml", doc),
        ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------
