#include <gtest/gtest.h>

#include <fleet/common/recordset_compat.h>

#include "common/test_helpers.h"

namespace fleet::test {

using fleet::tests::bytes;
using fleet::tests::makeParameters;

class RecordSetCompatTest : public ::testing::Test {
protected:
    Config sampleConfig() const {
        return Config{{"epochs", int64_t{3}},
                      {"lr", 0.01},
                      {"shuffle", true},
                      {"name", std::string("round-1")},
                      {"blob", bytes("\x01\x02")}};
    }
};

TEST_F(RecordSetCompatTest, GetPropertiesInsUsesConfigRecord) {
    GetPropertiesIns ins{sampleConfig()};
    auto rs = compat::toRecordSet(ins);

    EXPECT_EQ(rs.keys(), (std::vector<std::string>{"getpropertiesins.config"}));
    auto decoded = compat::fromRecordSet<GetPropertiesIns>(rs);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value(), ins);
}

TEST_F(RecordSetCompatTest, GetPropertiesResCarriesStatus) {
    GetPropertiesRes res{Status{Code::GetPropertiesNotImplemented, "not here"},
                         Properties{{"cores", int64_t{8}}}};
    auto rs = compat::toRecordSet(res);

    const auto* status = rs.findConfigs("getpropertiesres.status");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(std::get<int64_t>(*status->find("code")), 1);
    EXPECT_EQ(std::get<std::string>(*status->find("message")), "not here");

    auto decoded = compat::fromRecordSet<GetPropertiesRes>(rs);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), res);
}

TEST_F(RecordSetCompatTest, ParametersKeepTensorOrder) {
    auto params = makeParameters({"t0", "t1", "t2"});
    auto record = compat::parametersToRecord(params);

    EXPECT_EQ(record.keys(), (std::vector<std::string>{"0", "1", "2"}));
    EXPECT_EQ(record.find("1")->stype, "numpy.ndarray");
    EXPECT_EQ(compat::recordToParameters(record), params);
}

TEST_F(RecordSetCompatTest, FitRoundTrip) {
    FitIns ins{makeParameters({"w", "b"}), sampleConfig()};
    auto insRs = compat::toRecordSet(ins);
    EXPECT_NE(insRs.findParameters("fitins.parameters"), nullptr);
    EXPECT_NE(insRs.findConfigs("fitins.config"), nullptr);
    auto insBack = compat::fromRecordSet<FitIns>(insRs);
    ASSERT_TRUE(insBack);
    EXPECT_EQ(insBack.value(), ins);

    FitRes res;
    res.status = Status{Code::Ok, "Success"};
    res.parameters = makeParameters({"w2", "b2"});
    res.numExamples = 128;
    res.metrics = Metrics{{"accuracy", 0.75}};
    auto resRs = compat::toRecordSet(res);
    ASSERT_NE(resRs.findMetrics("fitres.num_examples"), nullptr);
    EXPECT_EQ(std::get<int64_t>(*resRs.findMetrics("fitres.num_examples")->find("num_examples")),
              128);
    auto resBack = compat::fromRecordSet<FitRes>(resRs);
    ASSERT_TRUE(resBack);
    EXPECT_EQ(resBack.value(), res);
}

TEST_F(RecordSetCompatTest, EvaluateRoundTrip) {
    EvaluateIns ins{makeParameters({"w"}), Config{{"batch", int64_t{32}}}};
    auto insBack = compat::fromRecordSet<EvaluateIns>(compat::toRecordSet(ins));
    ASSERT_TRUE(insBack);
    EXPECT_EQ(insBack.value(), ins);

    EvaluateRes res{Status{}, 0.25, 64, Metrics{{"f1", 0.9}}};
    auto rs = compat::toRecordSet(res);
    EXPECT_EQ(std::get<double>(*rs.findMetrics("evaluateres.loss")->find("loss")), 0.25);
    auto resBack = compat::fromRecordSet<EvaluateRes>(rs);
    ASSERT_TRUE(resBack);
    EXPECT_EQ(resBack.value(), res);
}

TEST_F(RecordSetCompatTest, GetParametersRoundTrip) {
    GetParametersRes res{Status{}, makeParameters({"a", "bb", "ccc"}, "custom")};
    auto back = compat::fromRecordSet<GetParametersRes>(compat::toRecordSet(res));
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), res);
}

TEST_F(RecordSetCompatTest, EmptyParametersKeepTensorType) {
    const Parameters empty{{}, "np"};

    auto rs = compat::toRecordSet(EvaluateIns{empty, Config{}});
    const auto* typeRec = rs.findConfigs("evaluateins.parameters.tensor_type");
    ASSERT_NE(typeRec, nullptr);
    EXPECT_EQ(std::get<std::string>(*typeRec->find("tensor_type")), "np");

    EvaluateIns evalIns{empty, Config{}};
    auto evalBack = compat::fromRecordSet<EvaluateIns>(compat::toRecordSet(evalIns));
    ASSERT_TRUE(evalBack) << evalBack.error().message;
    EXPECT_EQ(evalBack.value(), evalIns);

    FitIns fitIns{empty, Config{}};
    auto fitInsBack = compat::fromRecordSet<FitIns>(compat::toRecordSet(fitIns));
    ASSERT_TRUE(fitInsBack);
    EXPECT_EQ(fitInsBack.value(), fitIns);

    FitRes fitRes;
    fitRes.parameters = empty;
    auto fitResBack = compat::fromRecordSet<FitRes>(compat::toRecordSet(fitRes));
    ASSERT_TRUE(fitResBack);
    EXPECT_EQ(fitResBack.value(), fitRes);

    GetParametersRes paramsRes{Status{}, empty};
    auto paramsResBack = compat::fromRecordSet<GetParametersRes>(compat::toRecordSet(paramsRes));
    ASSERT_TRUE(paramsResBack);
    EXPECT_EQ(paramsResBack.value(), paramsRes);
}

TEST_F(RecordSetCompatTest, NonStringTensorTypeIsSchemaMismatch) {
    auto rs = compat::toRecordSet(FitIns{makeParameters({"w"}), Config{}});
    rs.setConfigs("fitins.parameters.tensor_type", ConfigsRecord{{"tensor_type", int64_t{7}}});
    auto decoded = compat::fromRecordSet<FitIns>(rs);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, MissingRecordIsSchemaMismatch) {
    RecordSet empty;
    auto decoded = compat::fromRecordSet<FitRes>(empty);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, DecodingAsOtherTypeIsSchemaMismatch) {
    auto rs = compat::toRecordSet(EvaluateRes{Status{}, 1.0, 1, {}});
    auto asFit = compat::fromRecordSet<FitRes>(rs);
    ASSERT_FALSE(asFit);
    EXPECT_EQ(asFit.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, WrongValueTypeIsSchemaMismatch) {
    auto rs = compat::toRecordSet(EvaluateRes{Status{}, 1.0, 1, {}});
    rs.setMetrics("evaluateres.loss", MetricsRecord{{"loss", int64_t{1}}});
    auto decoded = compat::fromRecordSet<EvaluateRes>(rs);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, UnknownStatusCodeIsSchemaMismatch) {
    auto rs = compat::toRecordSet(GetPropertiesRes{});
    rs.setConfigs("getpropertiesres.status",
                  ConfigsRecord{{"code", int64_t{42}}, {"message", std::string("?")}});
    auto decoded = compat::fromRecordSet<GetPropertiesRes>(rs);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, ListConfigValueIsNotAScalar) {
    ConfigsRecord rec{{"ok", int64_t{1}}, {"list", std::vector<int64_t>{1, 2}}};
    auto scalars = compat::recordToScalars(rec);
    ASSERT_FALSE(scalars);
    EXPECT_EQ(scalars.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(RecordSetCompatTest, TaskTypeTagsPerCall) {
    EXPECT_EQ(compat::taskTypeOf<GetPropertiesIns>(), TaskType::GetProperties);
    EXPECT_EQ(compat::taskTypeOf<GetParametersRes>(), TaskType::GetParameters);
    EXPECT_EQ(compat::taskTypeOf<FitIns>(), TaskType::Fit);
    EXPECT_EQ(compat::taskTypeOf<EvaluateRes>(), TaskType::Evaluate);
    EXPECT_EQ(to_string(TaskType::GetProperties), "get-properties");
    EXPECT_EQ(parseTaskType("evaluate").value_or(TaskType::Fit), TaskType::Evaluate);
    EXPECT_FALSE(parseTaskType("reconnect").has_value());
}

} // namespace fleet::test
